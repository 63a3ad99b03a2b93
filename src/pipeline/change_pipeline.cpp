#include "pipeline/change_pipeline.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

#include "changelog/change_history.hpp"
#include "changelog/change_log_writer.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/diff_engine.hpp"
#include "store/snapshot_store.hpp"

namespace regdelta {

namespace {

const QString kComponent = QStringLiteral("ChangePipeline");

QString runIdFor(const std::string &date)
{
    return QStringLiteral("run-%1").arg(QString::fromStdString(date));
}

} // namespace

ChangePipeline::ChangePipeline(SnapshotStore &store,
                               const DiffEngine &engine,
                               ChangeLogWriter &writer,
                               ChangeHistory &history)
    : m_store(store)
    , m_engine(engine)
    , m_writer(writer)
    , m_history(history)
{
}

RunResult ChangePipeline::runLatest()
{
    auto [previous, current] = m_store.latestPair();
    return execute(previous, current);
}

RunResult ChangePipeline::runPair(const std::string &previousDate,
                                  const std::string &currentDate)
{
    const Snapshot previous = m_store.asOf(previousDate);
    const Snapshot current = m_store.asOf(currentDate);
    return execute(previous, current);
}

std::vector<RunResult> ChangePipeline::catchUp()
{
    const auto snapshots = m_store.listSnapshots();
    if (snapshots.size() < 2) {
        throw InsufficientHistoryError("need at least two snapshots, found "
                                       + std::to_string(snapshots.size()));
    }

    const auto latestRun = m_history.latestRunDate();
    RLOG_INFO(kComponent,
              QStringLiteral("catchUp"),
              QStringLiteral("catch_up_start"),
              (nlohmann::json{{"snapshots", snapshots.size()},
                              {"latest_run", latestRun.value_or("")}}));

    std::vector<RunResult> results;
    for (std::size_t i = 1; i < snapshots.size(); ++i) {
        const std::string &currentDate = snapshots[i].captureDate;
        if (latestRun.has_value() && currentDate <= *latestRun) {
            continue;
        }
        results.push_back(runPair(snapshots[i - 1].captureDate, currentDate));
    }

    RLOG_INFO(kComponent,
              QStringLiteral("catchUp"),
              QStringLiteral("catch_up_done"),
              (nlohmann::json{{"runs", results.size()}}));
    return results;
}

ChangeSet ChangePipeline::preview(const std::string &previousDate,
                                  const std::string &currentDate) const
{
    const Snapshot previous = m_store.asOf(previousDate);
    const Snapshot current = m_store.asOf(currentDate);
    return m_engine.diff(previous, current);
}

RunResult ChangePipeline::execute(const Snapshot &previous, const Snapshot &current)
{
    const std::string &date = current.captureDate;
    logging::RunScope scope(runIdFor(date));

    RLOG_INFO(kComponent,
              QStringLiteral("execute"),
              QStringLiteral("run_start"),
              (nlohmann::json{{"previous", previous.id},
                              {"current", current.id},
                              {"previous_records", previous.records.size()},
                              {"current_records", current.records.size()}}));

    const auto started = std::chrono::steady_clock::now();

    RunResult result;
    try {
        result.changeSet = m_engine.diff(previous, current);
    } catch (const Error &e) {
        RLOG_ERROR(kComponent,
                   QStringLiteral("execute"),
                   QStringLiteral("diff_failed"),
                   (nlohmann::json{{"code", e.code()}, {"error", e.what()}}));
        throw;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    RLOG_DEBUG(kComponent,
               QStringLiteral("execute"),
               QStringLiteral("diff_done"),
               (nlohmann::json{{"counts", changeCounts(result.changeSet)},
                               {"elapsed_ms", elapsed.count()}}));

    // A partition the history never recorded is left over from a run that
    // failed between publish and append; it is replaced, not treated as done.
    if (m_writer.hasRun(date) && !m_history.hasRun(date)) {
        RLOG_WARN(kComponent,
                  QStringLiteral("execute"),
                  QStringLiteral("orphan_partition_removed"),
                  (nlohmann::json{{"date", date}}));
        m_writer.removeRun(date);
    }

    result.artifactDir = m_writer.write(result.changeSet, date);

    try {
        m_writer.appendToHistory(result.changeSet);
    } catch (const std::exception &e) {
        RLOG_ERROR(kComponent,
                   QStringLiteral("execute"),
                   QStringLiteral("history_append_failed"),
                   (nlohmann::json{{"date", date}, {"error", e.what()}}));
        try {
            m_writer.removeRun(date);
        } catch (const std::exception &cleanup) {
            RLOG_ERROR(kComponent,
                       QStringLiteral("execute"),
                       QStringLiteral("rollback_failed"),
                       (nlohmann::json{{"date", date}, {"error", cleanup.what()}}));
        }
        throw;
    }

    RLOG_INFO(kComponent,
              QStringLiteral("execute"),
              QStringLiteral("run_done"),
              (nlohmann::json{{"date", date},
                              {"artifact", result.artifactDir.toStdString()},
                              {"counts", changeCounts(result.changeSet)}}));
    return result;
}

} // namespace regdelta
