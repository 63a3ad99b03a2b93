#pragma once

#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace regdelta {

class ChangeHistory;
class ChangeLogWriter;
class DiffEngine;
class SnapshotStore;

struct RunResult {
    ChangeSet changeSet;
    QString artifactDir;
};

// ChangePipeline drives runs end to end: load a snapshot pair, diff it,
// write the date partition, then append to history. A run that fails after
// write() removes its partition again before the error propagates.
class ChangePipeline {
public:
    ChangePipeline(SnapshotStore &store,
                   const DiffEngine &engine,
                   ChangeLogWriter &writer,
                   ChangeHistory &history);

    // Compares the two most recent snapshots.
    RunResult runLatest();

    RunResult runPair(const std::string &previousDate, const std::string &currentDate);

    // Runs every consecutive snapshot pair newer than the latest recorded
    // run, oldest first. Returns the completed runs.
    std::vector<RunResult> catchUp();

    // Diff without persisting anything.
    ChangeSet preview(const std::string &previousDate, const std::string &currentDate) const;

private:
    RunResult execute(const Snapshot &previous, const Snapshot &current);

    SnapshotStore &m_store;
    const DiffEngine &m_engine;
    ChangeLogWriter &m_writer;
    ChangeHistory &m_history;
};

} // namespace regdelta
