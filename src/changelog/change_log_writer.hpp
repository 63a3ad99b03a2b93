#pragma once

#include <string>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace regdelta {

class ChangeHistory;

// ChangeLogWriter persists one run's ChangeSet as a date partition:
//   <logsDir>/<YYYYMMDD>/change_log_<YYYYMMDD>.csv
//   <logsDir>/<YYYYMMDD>/change_log_<YYYYMMDD>.json
// Both files appear together or not at all.
class ChangeLogWriter {
public:
    ChangeLogWriter(const QString &logsDir, ChangeHistory &history);

    // Returns the partition directory. Throws DuplicateRunError when the
    // partition exists, StorageError when date is not the change set's
    // detection date or when staging or the final rename fails.
    QString write(const ChangeSet &changeSet, const std::string &date);

    // Delegates to ChangeHistory::append.
    void appendToHistory(const ChangeSet &changeSet);

    bool hasRun(const std::string &date) const;

    // Deletes a partition written by write(); a missing one is not an error.
    void removeRun(const std::string &date);

    QString runDirectory(const std::string &date) const;
    QString csvPath(const std::string &date) const;
    QString jsonPath(const std::string &date) const;

    static std::string toCsv(const ChangeSet &changeSet);
    static nlohmann::json toJson(const ChangeSet &changeSet);

private:
    QString m_logsDir;
    ChangeHistory &m_history;
};

} // namespace regdelta
