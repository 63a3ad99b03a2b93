#include "changelog/change_log_writer.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTemporaryDir>

#include "changelog/change_history.hpp"
#include "common/csv_utils.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/time_utils.hpp"

namespace regdelta {

namespace {

const CsvRow kCsvHeader = {
    "entity_key",
    "change_type",
    "field_changed",
    "old_value",
    "new_value",
    "detection_date",
    "entity_name",
    "state",
    "status",
};

const QFileDevice::Permissions kPartitionPermissions =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
    | QFileDevice::ReadGroup | QFileDevice::ExeGroup
    | QFileDevice::ReadOther | QFileDevice::ExeOther;

std::string cell(const FieldValue &value)
{
    return value.value_or(std::string());
}

void writeFileOrThrow(const QString &path, const QByteArray &data)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw StorageError("cannot open " + path.toStdString() + ": "
                           + file.errorString().toStdString());
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        throw StorageError("short write to " + path.toStdString());
    }
    if (!file.commit()) {
        throw StorageError("cannot commit " + path.toStdString() + ": "
                           + file.errorString().toStdString());
    }
}

QString partitionName(const std::string &date)
{
    return QString::fromStdString(compactDate(date));
}

} // namespace

ChangeLogWriter::ChangeLogWriter(const QString &logsDir, ChangeHistory &history)
    : m_logsDir(logsDir)
    , m_history(history)
{
}

QString ChangeLogWriter::runDirectory(const std::string &date) const
{
    return m_logsDir + QDir::separator() + partitionName(date);
}

QString ChangeLogWriter::csvPath(const std::string &date) const
{
    return runDirectory(date) + QDir::separator()
        + QStringLiteral("change_log_%1.csv").arg(partitionName(date));
}

QString ChangeLogWriter::jsonPath(const std::string &date) const
{
    return runDirectory(date) + QDir::separator()
        + QStringLiteral("change_log_%1.json").arg(partitionName(date));
}

bool ChangeLogWriter::hasRun(const std::string &date) const
{
    return QFileInfo::exists(runDirectory(date));
}

std::string ChangeLogWriter::toCsv(const ChangeSet &changeSet)
{
    std::string out = formatCsvRow(kCsvHeader);
    for (const auto &record : changeSet.records) {
        out += formatCsvRow({
            record.entityKey,
            toChangeTypeString(record.kind),
            record.fieldName,
            cell(record.oldValue),
            cell(record.newValue),
            record.detectionDate,
            cell(record.context.entityName),
            cell(record.context.state),
            cell(record.context.status),
        });
    }
    return out;
}

nlohmann::json ChangeLogWriter::toJson(const ChangeSet &changeSet)
{
    return nlohmann::json(changeSet);
}

QString ChangeLogWriter::write(const ChangeSet &changeSet, const std::string &date)
{
    if (!isValidCaptureDate(date)) {
        throw StorageError("invalid run date '" + date + "'");
    }
    if (changeSet.detectionDate != date) {
        throw StorageError("change set detected on '" + changeSet.detectionDate
                           + "' cannot be written as run " + date);
    }

    const QString finalDir = runDirectory(date);
    if (QFileInfo::exists(finalDir)) {
        throw DuplicateRunError("change log for " + date + " already exists at "
                                + finalDir.toStdString());
    }

    if (!QDir().mkpath(m_logsDir)) {
        throw StorageError("cannot create change log directory " + m_logsDir.toStdString());
    }

    // Staged beside the final location so the rename stays on one filesystem.
    QTemporaryDir staging(m_logsDir + QDir::separator() + QStringLiteral(".staging-XXXXXX"));
    if (!staging.isValid()) {
        throw StorageError("cannot create staging directory: "
                           + staging.errorString().toStdString());
    }

    const QString name = partitionName(date);
    writeFileOrThrow(staging.filePath(QStringLiteral("change_log_%1.csv").arg(name)),
                     QByteArray::fromStdString(toCsv(changeSet)));
    writeFileOrThrow(staging.filePath(QStringLiteral("change_log_%1.json").arg(name)),
                     QByteArray::fromStdString(
                         toJson(changeSet).dump(2, ' ', false,
                                                nlohmann::json::error_handler_t::replace)
                         + "\n"));

    // QTemporaryDir creates 0700; the published partition is world-readable.
    if (!QFile::setPermissions(staging.path(), kPartitionPermissions)) {
        throw StorageError("cannot set permissions on staged change log "
                           + staging.path().toStdString());
    }

    if (QFileInfo::exists(finalDir)) {
        throw DuplicateRunError("change log for " + date + " already exists at "
                                + finalDir.toStdString());
    }
    if (!QDir().rename(staging.path(), finalDir)) {
        throw StorageError("cannot move staged change log into " + finalDir.toStdString());
    }
    staging.setAutoRemove(false);
    return finalDir;
}

void ChangeLogWriter::appendToHistory(const ChangeSet &changeSet)
{
    m_history.append(changeSet);
}

void ChangeLogWriter::removeRun(const std::string &date)
{
    QDir dir(runDirectory(date));
    if (!dir.exists()) {
        return;
    }
    if (!dir.removeRecursively()) {
        throw StorageError("cannot remove change log " + dir.path().toStdString());
    }
}

} // namespace regdelta
