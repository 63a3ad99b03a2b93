#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"

namespace regdelta {

// SnapshotStore is the SQLite-backed, append-only series of snapshots.
// Rows are guarded by triggers that abort any UPDATE or DELETE, so a stored
// snapshot can never change after append().
class SnapshotStore {
public:
    explicit SnapshotStore(const std::string &dbPath);
    ~SnapshotStore();

    SnapshotStore(const SnapshotStore &) = delete;
    SnapshotStore &operator=(const SnapshotStore &) = delete;

    // Throws DuplicateSnapshotError when the capture date (or id) is taken,
    // InvalidSnapshotError when records do not match the schema.
    void append(const Snapshot &snapshot);

    // (previous, current) in chronological order.
    // Throws InsufficientHistoryError with fewer than two snapshots.
    std::pair<Snapshot, Snapshot> latestPair() const;

    // Exact capture-date match; throws SnapshotNotFoundError.
    Snapshot asOf(const std::string &captureDate) const;

    bool contains(const std::string &captureDate) const;

    // Metadata only, oldest first.
    std::vector<SnapshotInfo> listSnapshots() const;

    // Runs PRAGMA integrity_check; details receives the report.
    bool integrityCheck(std::string *details = nullptr) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace regdelta
