#include "changelog/change_history.hpp"

#include <chrono>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "store/sqlite_utils.hpp"

namespace regdelta {

namespace {

using sqlite::Statement;

constexpr const char *kCreateRunsTable =
    "CREATE TABLE IF NOT EXISTS runs ("
    "    detection_date TEXT PRIMARY KEY,"
    "    previous_snapshot TEXT NOT NULL,"
    "    current_snapshot TEXT NOT NULL,"
    "    record_count INTEGER NOT NULL,"
    "    appended_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateChangesTable =
    "CREATE TABLE IF NOT EXISTS changes ("
    "    detection_date TEXT NOT NULL REFERENCES runs(detection_date),"
    "    seq INTEGER NOT NULL,"
    "    entity_key TEXT NOT NULL,"
    "    change_type TEXT NOT NULL,"
    "    field_changed TEXT,"
    "    old_value TEXT,"
    "    new_value TEXT,"
    "    entity_name TEXT,"
    "    state TEXT,"
    "    status TEXT,"
    "    PRIMARY KEY (detection_date, seq)"
    ");"
    "CREATE INDEX IF NOT EXISTS changes_entity ON changes (entity_key);";

constexpr const char *kSelectChangeColumns =
    "SELECT entity_key, change_type, field_changed, old_value, new_value, "
    "detection_date, entity_name, state, status FROM changes ";

ChangeRecord readChange(sqlite3_stmt *stmt)
{
    ChangeRecord record;
    record.entityKey = sqlite::columnText(stmt, 0);
    const std::string type = sqlite::columnText(stmt, 1);
    const auto kind = parseChangeTypeString(type);
    if (!kind.has_value()) {
        throw StorageError("unknown change type in history: " + type);
    }
    record.kind = *kind;
    record.fieldName = sqlite::columnText(stmt, 2);
    record.oldValue = sqlite::columnOptionalText(stmt, 3);
    record.newValue = sqlite::columnOptionalText(stmt, 4);
    record.detectionDate = sqlite::columnText(stmt, 5);
    record.context.entityName = sqlite::columnOptionalText(stmt, 6);
    record.context.state = sqlite::columnOptionalText(stmt, 7);
    record.context.status = sqlite::columnOptionalText(stmt, 8);
    return record;
}

std::vector<ChangeRecord> readChanges(Statement &stmt)
{
    std::vector<ChangeRecord> out;
    while (stmt.step()) {
        out.push_back(readChange(stmt.get()));
    }
    return out;
}

} // namespace

struct ChangeHistory::Impl {
    sqlite3 *db = nullptr;
};

ChangeHistory::ChangeHistory(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->db = sqlite::openDatabase(dbPath);
    try {
        sqlite::execOrThrow(impl->db, kCreateRunsTable);
        sqlite::execOrThrow(impl->db, kCreateChangesTable);
    } catch (...) {
        sqlite::closeDatabase(impl->db);
        throw;
    }
}

ChangeHistory::~ChangeHistory()
{
    sqlite::closeDatabase(impl->db);
}

void ChangeHistory::append(const ChangeSet &changeSet)
{
    const std::string &date = changeSet.detectionDate;

    sqlite::Transaction tx(impl->db);

    if (hasRun(date)) {
        throw DuplicateRunError("run " + date + " is already in history");
    }
    const auto latestDate = latestRunDate();
    if (latestDate.has_value() && *latestDate > date) {
        throw OutOfOrderRunError("run " + date + " precedes latest recorded run "
                                 + *latestDate);
    }

    {
        Statement insert(impl->db,
                         "INSERT INTO runs (detection_date, previous_snapshot, "
                         "current_snapshot, record_count, appended_at) "
                         "VALUES (?, ?, ?, ?, ?);");
        sqlite::bindText(insert.get(), 1, date);
        sqlite::bindText(insert.get(), 2, changeSet.previousSnapshotId);
        sqlite::bindText(insert.get(), 3, changeSet.currentSnapshotId);
        sqlite::bindInt64(insert.get(), 4, static_cast<int64_t>(changeSet.records.size()));
        sqlite::bindInt64(insert.get(), 5,
                          sqlite::toEpochSeconds(std::chrono::system_clock::now()));
        insert.run();
    }

    Statement insertChange(impl->db,
                           "INSERT INTO changes (detection_date, seq, entity_key, "
                           "change_type, field_changed, old_value, new_value, "
                           "entity_name, state, status) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    int64_t seq = 0;
    for (const auto &record : changeSet.records) {
        sqlite3_reset(insertChange.get());
        sqlite3_clear_bindings(insertChange.get());
        sqlite::bindText(insertChange.get(), 1, date);
        sqlite::bindInt64(insertChange.get(), 2, seq++);
        sqlite::bindText(insertChange.get(), 3, record.entityKey);
        sqlite::bindText(insertChange.get(), 4, toChangeTypeString(record.kind));
        sqlite::bindOptionalText(insertChange.get(), 5,
                                 record.fieldName.empty()
                                     ? FieldValue{}
                                     : FieldValue{record.fieldName});
        sqlite::bindOptionalText(insertChange.get(), 6, record.oldValue);
        sqlite::bindOptionalText(insertChange.get(), 7, record.newValue);
        sqlite::bindOptionalText(insertChange.get(), 8, record.context.entityName);
        sqlite::bindOptionalText(insertChange.get(), 9, record.context.state);
        sqlite::bindOptionalText(insertChange.get(), 10, record.context.status);
        insertChange.run();
    }

    tx.commit();
}

bool ChangeHistory::hasRun(const std::string &detectionDate) const
{
    Statement stmt(impl->db, "SELECT 1 FROM runs WHERE detection_date = ?;");
    sqlite::bindText(stmt.get(), 1, detectionDate);
    return stmt.step();
}

std::optional<std::string> ChangeHistory::latestRunDate() const
{
    Statement stmt(impl->db, "SELECT MAX(detection_date) FROM runs;");
    stmt.step();
    return sqlite::columnOptionalText(stmt.get(), 0);
}

std::vector<RunInfo> ChangeHistory::runs() const
{
    Statement stmt(impl->db,
                   "SELECT detection_date, previous_snapshot, current_snapshot, "
                   "record_count, appended_at FROM runs ORDER BY detection_date;");
    std::vector<RunInfo> out;
    while (stmt.step()) {
        RunInfo run;
        run.detectionDate = sqlite::columnText(stmt.get(), 0);
        run.previousSnapshotId = sqlite::columnText(stmt.get(), 1);
        run.currentSnapshotId = sqlite::columnText(stmt.get(), 2);
        run.recordCount = static_cast<std::size_t>(sqlite::columnInt64(stmt.get(), 3));
        run.appendedAt = sqlite::fromEpochSeconds(sqlite::columnInt64(stmt.get(), 4));
        out.push_back(std::move(run));
    }
    return out;
}

std::vector<ChangeRecord> ChangeHistory::changesForDate(const std::string &detectionDate) const
{
    const std::string sql = std::string(kSelectChangeColumns)
        + "WHERE detection_date = ? ORDER BY seq;";
    Statement stmt(impl->db, sql.c_str());
    sqlite::bindText(stmt.get(), 1, detectionDate);
    return readChanges(stmt);
}

std::vector<ChangeRecord> ChangeHistory::changesForEntity(const EntityKey &key) const
{
    const std::string sql = std::string(kSelectChangeColumns)
        + "WHERE entity_key = ? ORDER BY detection_date, seq;";
    Statement stmt(impl->db, sql.c_str());
    sqlite::bindText(stmt.get(), 1, key);
    return readChanges(stmt);
}

std::vector<ChangeRecord> ChangeHistory::allChanges() const
{
    const std::string sql = std::string(kSelectChangeColumns)
        + "ORDER BY detection_date, seq;";
    Statement stmt(impl->db, sql.c_str());
    return readChanges(stmt);
}

} // namespace regdelta
