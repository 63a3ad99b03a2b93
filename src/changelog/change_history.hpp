#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace regdelta {

// ChangeHistory is the cumulative, append-only change log in SQLite.
// Runs are stored in detection-date order and each run keeps the record
// order of its ChangeSet.
class ChangeHistory {
public:
    explicit ChangeHistory(const std::string &dbPath);
    ~ChangeHistory();

    ChangeHistory(const ChangeHistory &) = delete;
    ChangeHistory &operator=(const ChangeHistory &) = delete;

    // One transaction. Throws DuplicateRunError when the detection date is
    // already recorded and OutOfOrderRunError when it precedes the latest run.
    void append(const ChangeSet &changeSet);

    bool hasRun(const std::string &detectionDate) const;
    std::optional<std::string> latestRunDate() const;

    // Read-only query interface.
    std::vector<RunInfo> runs() const;
    std::vector<ChangeRecord> changesForDate(const std::string &detectionDate) const;
    std::vector<ChangeRecord> changesForEntity(const EntityKey &key) const;
    std::vector<ChangeRecord> allChanges() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace regdelta
