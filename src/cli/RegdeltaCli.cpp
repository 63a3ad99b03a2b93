#include "cli/RegdeltaCli.hpp"

#include <iostream>

#include <QDir>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "changelog/change_history.hpp"
#include "changelog/change_log_writer.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/diff_engine.hpp"
#include "pipeline/change_pipeline.hpp"
#include "query/query_interpreter.hpp"
#include "store/snapshot_builder.hpp"
#include "store/snapshot_store.hpp"

namespace regdelta {

namespace {

const QString kComponent = QStringLiteral("RegdeltaCli");

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  regdelta import --csv PATH [--date YYYY-MM-DD]\n"
        "  regdelta run [--format text|json]\n"
        "  regdelta catch-up [--format text|json]\n"
        "  regdelta diff --from YYYY-MM-DD --to YYYY-MM-DD [--format json|csv]\n"
        "  regdelta snapshots [--format markdown|json] [--check]\n"
        "  regdelta ask [--format text|json] QUERY...\n"
        "\n"
        "Options:\n"
        "  --trace    write debug lines to the trace log\n"
        "  --check    verify the snapshot database; exit 1 when it is damaged\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args, const QString &fallback)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return fallback;
    }
    return value.toLower();
}

bool checkFormat(const QString &format, const QStringList &allowed)
{
    if (allowed.contains(format)) {
        return true;
    }
    std::cerr << "Invalid format. Use " << allowed.join(QStringLiteral(" or ")).toStdString()
              << "." << std::endl;
    return false;
}

void printRunSummary(const RunResult &result)
{
    const ChangeSet &changeSet = result.changeSet;
    std::cout << "Run " << changeSet.detectionDate << " ("
              << changeSet.previousSnapshotId << " -> " << changeSet.currentSnapshotId
              << ")\n";
    std::cout << "  New incorporations: " << changeSet.count(ChangeKind::New) << "\n";
    std::cout << "  Deregistrations:    " << changeSet.count(ChangeKind::Removed) << "\n";
    std::cout << "  Field updates:      " << changeSet.count(ChangeKind::FieldUpdate) << "\n";
    std::cout << "  Change log:         " << result.artifactDir.toStdString() << "\n";
}

nlohmann::json runJson(const RunResult &result)
{
    return nlohmann::json{
        {"detection_date", result.changeSet.detectionDate},
        {"previous_snapshot", result.changeSet.previousSnapshotId},
        {"current_snapshot", result.changeSet.currentSnapshotId},
        {"counts", changeCounts(result.changeSet)},
        {"artifact", result.artifactDir.toStdString()}
    };
}

} // namespace

RegdeltaCli::RegdeltaCli(const AppConfig &config)
    : m_config(config)
{
}

int RegdeltaCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        args.push_back(arg);
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    RLOG_INFO(kComponent,
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              (nlohmann::json{{"command", command.toStdString()}}));

    try {
        return dispatch(command, args);
    } catch (const InsufficientHistoryError &e) {
        RLOG_WARN(kComponent,
                  QStringLiteral("run"),
                  QStringLiteral("insufficient_history"),
                  (nlohmann::json{{"command", command.toStdString()}, {"error", e.what()}}));
        std::cerr << "Not enough snapshots yet: " << e.what() << std::endl;
        return 2;
    } catch (const Error &e) {
        RLOG_ERROR(kComponent,
                   QStringLiteral("run"),
                   QStringLiteral("command_failed"),
                   (nlohmann::json{{"command", command.toStdString()},
                                   {"code", e.code()},
                                   {"error", e.what()}}));
        std::cerr << "Error [" << e.code() << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        RLOG_ERROR(kComponent,
                   QStringLiteral("run"),
                   QStringLiteral("command_failed"),
                   (nlohmann::json{{"command", command.toStdString()}, {"error", e.what()}}));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int RegdeltaCli::dispatch(const QString &command, const QStringList &args)
{
    if (command == QStringLiteral("import")) {
        return runImport(args);
    }
    if (command == QStringLiteral("run")) {
        return runLatest(args);
    }
    if (command == QStringLiteral("catch-up")) {
        return runCatchUp(args);
    }
    if (command == QStringLiteral("diff")) {
        return runDiff(args);
    }
    if (command == QStringLiteral("snapshots")) {
        return runSnapshots(args);
    }
    if (command == QStringLiteral("ask")) {
        return runAsk(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int RegdeltaCli::runImport(const QStringList &args)
{
    const QString csvPath = getArgValue(args, QStringLiteral("--csv"));
    if (csvPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    std::string date = getArgValue(args, QStringLiteral("--date")).toStdString();
    if (date.empty()) {
        const auto fromName = SnapshotBuilder::captureDateFromFileName(csvPath);
        if (!fromName.has_value()) {
            std::cerr << "Cannot infer capture date from file name; pass --date." << std::endl;
            return 1;
        }
        date = *fromName;
    }

    SnapshotStore store(m_config.snapshotDbPath.toStdString());
    if (store.contains(date)) {
        throw DuplicateSnapshotError("a snapshot captured on " + date + " is already stored");
    }

    const EngineConfig engineConfig = m_config.loadEngineConfig();
    SnapshotBuilder builder(engineConfig);
    const Snapshot snapshot = builder.loadCsvFile(csvPath, date);
    store.append(snapshot);

    RLOG_INFO(kComponent,
              QStringLiteral("runImport"),
              QStringLiteral("snapshot_imported"),
              (nlohmann::json{{"id", snapshot.id},
                              {"capture_date", snapshot.captureDate},
                              {"records", snapshot.records.size()},
                              {"source", snapshot.sourceRef}}));

    std::cout << "Imported " << snapshot.id << " with " << snapshot.records.size()
              << " records." << std::endl;
    return 0;
}

int RegdeltaCli::runLatest(const QStringList &args)
{
    const QString format = getFormat(args, QStringLiteral("text"));
    if (!checkFormat(format, {QStringLiteral("text"), QStringLiteral("json")})) {
        return 1;
    }

    const EngineConfig engineConfig = m_config.loadEngineConfig();
    SnapshotStore store(m_config.snapshotDbPath.toStdString());
    ChangeHistory history(m_config.historyDbPath.toStdString());
    ChangeLogWriter writer(m_config.changeLogDir, history);
    const DiffEngine engine(engineConfig);
    ChangePipeline pipeline(store, engine, writer, history);

    const RunResult result = pipeline.runLatest();
    if (format == QStringLiteral("json")) {
        std::cout << runJson(result).dump(2) << std::endl;
    } else {
        printRunSummary(result);
    }
    return 0;
}

int RegdeltaCli::runCatchUp(const QStringList &args)
{
    const QString format = getFormat(args, QStringLiteral("text"));
    if (!checkFormat(format, {QStringLiteral("text"), QStringLiteral("json")})) {
        return 1;
    }

    const EngineConfig engineConfig = m_config.loadEngineConfig();
    SnapshotStore store(m_config.snapshotDbPath.toStdString());
    ChangeHistory history(m_config.historyDbPath.toStdString());
    ChangeLogWriter writer(m_config.changeLogDir, history);
    const DiffEngine engine(engineConfig);
    ChangePipeline pipeline(store, engine, writer, history);

    const auto results = pipeline.catchUp();
    if (format == QStringLiteral("json")) {
        nlohmann::json payload = nlohmann::json::array();
        for (const auto &result : results) {
            payload.push_back(runJson(result));
        }
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    if (results.empty()) {
        std::cout << "History is up to date." << std::endl;
    }
    for (const auto &result : results) {
        printRunSummary(result);
    }
    return 0;
}

int RegdeltaCli::runDiff(const QStringList &args)
{
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    if (fromValue.isEmpty() || toValue.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args, QStringLiteral("json"));
    if (!checkFormat(format, {QStringLiteral("json"), QStringLiteral("csv")})) {
        return 1;
    }

    const EngineConfig engineConfig = m_config.loadEngineConfig();
    SnapshotStore store(m_config.snapshotDbPath.toStdString());
    const DiffEngine engine(engineConfig);

    const Snapshot previous = store.asOf(fromValue.toStdString());
    const Snapshot current = store.asOf(toValue.toStdString());
    const ChangeSet changeSet = engine.diff(previous, current);

    if (format == QStringLiteral("csv")) {
        std::cout << ChangeLogWriter::toCsv(changeSet);
    } else {
        std::cout << ChangeLogWriter::toJson(changeSet).dump(2) << std::endl;
    }
    return 0;
}

int RegdeltaCli::runSnapshots(const QStringList &args)
{
    const QString format = getFormat(args, QStringLiteral("markdown"));
    if (!checkFormat(format, {QStringLiteral("markdown"), QStringLiteral("json")})) {
        return 1;
    }

    SnapshotStore store(m_config.snapshotDbPath.toStdString());
    if (args.contains(QStringLiteral("--check"))) {
        std::string report;
        const bool healthy = store.integrityCheck(&report);
        if (!healthy) {
            RLOG_ERROR(kComponent,
                       QStringLiteral("runSnapshots"),
                       QStringLiteral("integrity_check_failed"),
                       (nlohmann::json{{"report", report}}));
        }
        std::cout << "Integrity check: " << report << std::endl;
        return healthy ? 0 : 1;
    }
    const auto snapshots = store.listSnapshots();

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["count"] = snapshots.size();
        payload["snapshots"] = snapshots;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Stored Snapshots\n\n";
    if (snapshots.empty()) {
        std::cout << "No snapshots stored.\n";
        return 0;
    }
    std::cout << "| Capture date | Id | Records | Stored at |\n";
    std::cout << "|---|---|---|---|\n";
    for (const auto &info : snapshots) {
        std::cout << "| " << info.captureDate << " | " << info.id << " | "
                  << info.recordCount << " | " << toIso8601Utc(info.createdAt) << " |\n";
    }
    return 0;
}

int RegdeltaCli::runAsk(const QStringList &args)
{
    const QString format = getFormat(args, QStringLiteral("text"));
    if (!checkFormat(format, {QStringLiteral("text"), QStringLiteral("json")})) {
        return 1;
    }

    QStringList words;
    for (int i = 2; i < args.size(); ++i) {
        if (args.at(i) == QStringLiteral("--format")) {
            ++i;
            continue;
        }
        words.push_back(args.at(i));
    }

    SnapshotStore store(m_config.snapshotDbPath.toStdString());
    ChangeHistory history(m_config.historyDbPath.toStdString());
    const QueryInterpreter interpreter(history, store);

    const QueryResponse response = interpreter.ask(words.join(QLatin1Char(' ')).toStdString());
    if (format == QStringLiteral("json")) {
        std::cout << response.data.dump(2) << std::endl;
    } else {
        std::cout << response.text << std::endl;
    }
    return 0;
}

} // namespace regdelta
