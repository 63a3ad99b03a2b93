#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace regdelta::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString defaultLogDir()
{
    const QString fromEnv = qEnvironmentVariable("REGDELTA_LOG_DIR");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty()
        ? QStringLiteral(".local/share/regdelta/logs")
        : home + QStringLiteral("/.local/share/regdelta/logs");
}

// One append-only JSON-lines file. Kept open between events and reopened
// after rotation; path.1 is the newest rotated generation.
class LogSink {
public:
    explicit LogSink(const QString &path)
        : m_file(path)
    {
    }

    bool append(const QByteArray &line)
    {
        if (m_file.isOpen() && m_file.size() >= kMaxLogSizeBytes) {
            m_file.close();
            rotate();
        }
        if (!m_file.isOpen()) {
            const QFileInfo existing(m_file.fileName());
            if (existing.exists() && existing.size() >= kMaxLogSizeBytes) {
                rotate();
            }
            if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append)) {
                return false;
            }
        }
        m_file.write(line);
        m_file.write("\n");
        m_file.flush();
        return true;
    }

private:
    void rotate()
    {
        const QString base = m_file.fileName();
        QFile::remove(base + QStringLiteral(".%1").arg(kRotatedGenerations));
        for (int gen = kRotatedGenerations - 1; gen >= 1; --gen) {
            QFile::rename(base + QStringLiteral(".%1").arg(gen),
                          base + QStringLiteral(".%1").arg(gen + 1));
        }
        QFile::rename(base, base + QStringLiteral(".1"));
    }

    QFile m_file;
};

struct LoggerState {
    std::mutex mutex;
    QString processName;
    QString logDir;
    bool traceEnabled = false;
    std::map<QString, std::unique_ptr<LogSink>> sinks;

    QString directory() const
    {
        return logDir.isEmpty() ? defaultLogDir() : logDir;
    }

    LogSink &sinkFor(const QString &suffix)
    {
        const QString path = directory() + QDir::separator() + processName + suffix;
        auto &slot = sinks[path];
        if (!slot) {
            QDir().mkpath(directory());
            slot = std::make_unique<LogSink>(path);
        }
        return *slot;
    }
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

thread_local QString t_runId;

} // namespace

void initLogging(const QString &processName, const QString &logDir, bool traceEnabled)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName.isEmpty() ? QStringLiteral("regdelta") : processName;
    s.logDir = logDir;
    s.traceEnabled = traceEnabled;
    s.sinks.clear();
}

QString currentRunId()
{
    return t_runId;
}

RunScope::RunScope(const QString &runId)
    : m_prev(t_runId)
{
    t_runId = runId;
}

RunScope::~RunScope()
{
    t_runId = m_prev;
}

QString processName()
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.processName.isEmpty()) {
        return s.processName;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("regdelta");
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context)
{
    auto &s = state();
    const QString process = processName();

    std::lock_guard<std::mutex> lock(s.mutex);
    if (level == LogLevel::Debug && !s.traceEnabled) {
        return;
    }
    if (s.processName.isEmpty()) {
        s.processName = process;
    }

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", reinterpret_cast<quintptr>(QThread::currentThreadId())},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"run", t_runId.toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    bool written = s.sinkFor(QStringLiteral(".log")).append(line);
    if (s.traceEnabled) {
        written = s.sinkFor(QStringLiteral("-trace.log")).append(line) && written;
    }
    if (!written) {
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

} // namespace regdelta::logging
