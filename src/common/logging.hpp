#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace regdelta::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// An empty logDir falls back to $REGDELTA_LOG_DIR, then ~/.local/share/regdelta/logs.
void initLogging(const QString &processName, const QString &logDir, bool traceEnabled);

// Thread-local run id linking every line written during one pipeline run.
QString currentRunId();

class RunScope {
public:
    explicit RunScope(const QString &runId);
    ~RunScope();

    RunScope(const RunScope &) = delete;
    RunScope &operator=(const RunScope &) = delete;

private:
    QString m_prev;
};

// Structured log event, one JSON object per line.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context = nlohmann::json::object());

QString processName();

} // namespace regdelta::logging

#define RLOG_DEBUG(component, where, what, ctxJson) \
    ::regdelta::logging::logEvent(::regdelta::logging::LogLevel::Debug, \
                                  (component), (where), (what), (ctxJson))

#define RLOG_INFO(component, where, what, ctxJson) \
    ::regdelta::logging::logEvent(::regdelta::logging::LogLevel::Info, \
                                  (component), (where), (what), (ctxJson))

#define RLOG_WARN(component, where, what, ctxJson) \
    ::regdelta::logging::logEvent(::regdelta::logging::LogLevel::Warn, \
                                  (component), (where), (what), (ctxJson))

#define RLOG_ERROR(component, where, what, ctxJson) \
    ::regdelta::logging::logEvent(::regdelta::logging::LogLevel::Error, \
                                  (component), (where), (what), (ctxJson))
