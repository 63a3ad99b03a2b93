#include "store/snapshot_store.hpp"

#include <set>

#include <nlohmann/json.hpp>

#include "common/csv_utils.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/time_utils.hpp"
#include "store/snapshot_builder.hpp"
#include "store/sqlite_utils.hpp"

namespace regdelta {

namespace {

using sqlite::Statement;

constexpr const char *kCreateSnapshotsTable =
    "CREATE TABLE IF NOT EXISTS snapshots ("
    "    id TEXT PRIMARY KEY,"
    "    capture_date TEXT NOT NULL UNIQUE,"
    "    created_at INTEGER NOT NULL,"
    "    schema_fields TEXT NOT NULL,"
    "    record_count INTEGER NOT NULL,"
    "    source_ref TEXT"
    ");";

constexpr const char *kCreateRecordsTable =
    "CREATE TABLE IF NOT EXISTS snapshot_records ("
    "    snapshot_id TEXT NOT NULL REFERENCES snapshots(id),"
    "    entity_key TEXT NOT NULL,"
    "    attributes TEXT NOT NULL,"
    "    PRIMARY KEY (snapshot_id, entity_key)"
    ");";

constexpr const char *kCreateImmutabilityTriggers =
    "CREATE TRIGGER IF NOT EXISTS snapshots_no_update BEFORE UPDATE ON snapshots "
    "BEGIN SELECT RAISE(ABORT, 'snapshots are immutable'); END;"
    "CREATE TRIGGER IF NOT EXISTS snapshots_no_delete BEFORE DELETE ON snapshots "
    "BEGIN SELECT RAISE(ABORT, 'snapshots are immutable'); END;"
    "CREATE TRIGGER IF NOT EXISTS snapshot_records_no_update BEFORE UPDATE ON snapshot_records "
    "BEGIN SELECT RAISE(ABORT, 'snapshot records are immutable'); END;"
    "CREATE TRIGGER IF NOT EXISTS snapshot_records_no_delete BEFORE DELETE ON snapshot_records "
    "BEGIN SELECT RAISE(ABORT, 'snapshot records are immutable'); END;";

constexpr const char *kSelectSnapshotColumns =
    "SELECT id, capture_date, created_at, schema_fields, record_count, source_ref "
    "FROM snapshots ";

SnapshotInfo readInfo(sqlite3_stmt *stmt)
{
    SnapshotInfo info;
    info.id = sqlite::columnText(stmt, 0);
    info.captureDate = sqlite::columnText(stmt, 1);
    info.createdAt = sqlite::fromEpochSeconds(sqlite::columnInt64(stmt, 2));
    info.recordCount = static_cast<std::size_t>(sqlite::columnInt64(stmt, 4));
    info.sourceRef = sqlite::columnText(stmt, 5);
    return info;
}

std::vector<std::string> parseSchema(const std::string &text, const std::string &snapshotId)
{
    const auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        throw StorageError("corrupt schema for snapshot " + snapshotId);
    }
    std::vector<std::string> schema;
    for (const auto &field : j) {
        if (!field.is_string()) {
            throw StorageError("corrupt schema for snapshot " + snapshotId);
        }
        schema.push_back(field.get<std::string>());
    }
    return schema;
}

void validateRecords(const Snapshot &snapshot)
{
    const std::set<std::string> schema(snapshot.schema.begin(), snapshot.schema.end());
    if (schema.size() != snapshot.schema.size()) {
        throw InvalidSnapshotError("snapshot " + snapshot.id + " has duplicate schema fields");
    }
    for (const auto &field : snapshot.schema) {
        if (!isValidUtf8(field)) {
            throw InvalidSnapshotError("snapshot " + snapshot.id
                                       + " has a schema field that is not valid UTF-8");
        }
    }
    for (const auto &[key, record] : snapshot.records) {
        if (key.empty()) {
            throw InvalidSnapshotError("snapshot " + snapshot.id + " has an empty entity key");
        }
        if (!isValidUtf8(key)) {
            throw InvalidSnapshotError("snapshot " + snapshot.id
                                       + " has an entity key that is not valid UTF-8");
        }
        if (record.values.size() != schema.size()) {
            throw InvalidSnapshotError("record " + key + " does not carry every schema field");
        }
        for (const auto &entry : record.values) {
            if (!schema.contains(entry.first)) {
                throw InvalidSnapshotError("record " + key + " has unknown field "
                                           + entry.first);
            }
            if (entry.second.has_value() && !isValidUtf8(*entry.second)) {
                throw InvalidSnapshotError("record " + key + " field " + entry.first
                                           + " is not valid UTF-8");
            }
        }
    }
}

} // namespace

struct SnapshotStore::Impl {
    sqlite3 *db = nullptr;

    Snapshot load(sqlite3_stmt *row) const
    {
        const SnapshotInfo info = readInfo(row);

        Snapshot snapshot;
        snapshot.id = info.id;
        snapshot.captureDate = info.captureDate;
        snapshot.createdAt = info.createdAt;
        snapshot.sourceRef = info.sourceRef;
        snapshot.schema = parseSchema(sqlite::columnText(row, 3), info.id);

        Statement stmt(db,
                       "SELECT entity_key, attributes FROM snapshot_records "
                       "WHERE snapshot_id = ? ORDER BY entity_key;");
        sqlite::bindText(stmt.get(), 1, info.id);
        while (stmt.step()) {
            const std::string key = sqlite::columnText(stmt.get(), 0);
            const auto values = nlohmann::json::parse(sqlite::columnText(stmt.get(), 1),
                                                      nullptr, false);
            if (values.is_discarded() || !values.is_array()
                || values.size() != snapshot.schema.size()) {
                throw StorageError("corrupt record " + key + " in snapshot " + info.id);
            }
            AttributeRecord record;
            for (std::size_t i = 0; i < snapshot.schema.size(); ++i) {
                record.values[snapshot.schema[i]] = fieldValueFromJson(values[i]);
            }
            snapshot.records.emplace(key, std::move(record));
        }

        if (snapshot.records.size() != info.recordCount) {
            throw StorageError("snapshot " + info.id + " record count mismatch");
        }
        return snapshot;
    }
};

SnapshotStore::SnapshotStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->db = sqlite::openDatabase(dbPath);
    try {
        sqlite::execOrThrow(impl->db, kCreateSnapshotsTable);
        sqlite::execOrThrow(impl->db, kCreateRecordsTable);
        sqlite::execOrThrow(impl->db, kCreateImmutabilityTriggers);
    } catch (...) {
        sqlite::closeDatabase(impl->db);
        throw;
    }
}

SnapshotStore::~SnapshotStore()
{
    sqlite::closeDatabase(impl->db);
}

void SnapshotStore::append(const Snapshot &snapshot)
{
    if (!isValidCaptureDate(snapshot.captureDate)) {
        throw InvalidSnapshotError("invalid capture date '" + snapshot.captureDate + "'");
    }
    if (snapshot.schema.empty()) {
        throw InvalidSnapshotError("snapshot for " + snapshot.captureDate + " has no schema");
    }
    validateRecords(snapshot);

    const std::string id = snapshot.id.empty()
        ? SnapshotBuilder::snapshotIdFor(snapshot.captureDate)
        : snapshot.id;

    sqlite::Transaction tx(impl->db);

    {
        Statement check(impl->db,
                        "SELECT capture_date FROM snapshots WHERE capture_date = ? OR id = ?;");
        sqlite::bindText(check.get(), 1, snapshot.captureDate);
        sqlite::bindText(check.get(), 2, id);
        if (check.step()) {
            throw DuplicateSnapshotError("a snapshot for " + sqlite::columnText(check.get(), 0)
                                         + " already exists (id " + id + ")");
        }
    }

    {
        Statement insert(impl->db,
                         "INSERT INTO snapshots (id, capture_date, created_at, schema_fields, "
                         "record_count, source_ref) VALUES (?, ?, ?, ?, ?, ?);");
        sqlite::bindText(insert.get(), 1, id);
        sqlite::bindText(insert.get(), 2, snapshot.captureDate);
        sqlite::bindInt64(insert.get(), 3, sqlite::toEpochSeconds(snapshot.createdAt));
        sqlite::bindText(insert.get(), 4, nlohmann::json(snapshot.schema).dump());
        sqlite::bindInt64(insert.get(), 5, static_cast<int64_t>(snapshot.records.size()));
        sqlite::bindOptionalText(insert.get(), 6,
                                 snapshot.sourceRef.empty()
                                     ? FieldValue{}
                                     : FieldValue{snapshot.sourceRef});
        insert.run();
    }

    Statement insertRecord(impl->db,
                           "INSERT INTO snapshot_records (snapshot_id, entity_key, attributes) "
                           "VALUES (?, ?, ?);");
    for (const auto &[key, record] : snapshot.records) {
        nlohmann::json values = nlohmann::json::array();
        for (const auto &field : snapshot.schema) {
            values.push_back(fieldValueToJson(record.get(field)));
        }
        sqlite3_reset(insertRecord.get());
        sqlite3_clear_bindings(insertRecord.get());
        sqlite::bindText(insertRecord.get(), 1, id);
        sqlite::bindText(insertRecord.get(), 2, key);
        sqlite::bindText(insertRecord.get(), 3, values.dump());
        insertRecord.run();
    }

    tx.commit();
}

std::pair<Snapshot, Snapshot> SnapshotStore::latestPair() const
{
    const std::string sql = std::string(kSelectSnapshotColumns)
        + "ORDER BY capture_date DESC LIMIT 2;";
    Statement stmt(impl->db, sql.c_str());

    std::vector<Snapshot> latest;
    while (stmt.step()) {
        latest.push_back(impl->load(stmt.get()));
    }
    if (latest.size() < 2) {
        throw InsufficientHistoryError("need at least two snapshots, found "
                                       + std::to_string(latest.size()));
    }
    return {std::move(latest[1]), std::move(latest[0])};
}

Snapshot SnapshotStore::asOf(const std::string &captureDate) const
{
    const std::string sql = std::string(kSelectSnapshotColumns) + "WHERE capture_date = ?;";
    Statement stmt(impl->db, sql.c_str());
    sqlite::bindText(stmt.get(), 1, captureDate);
    if (!stmt.step()) {
        throw SnapshotNotFoundError("no snapshot captured on " + captureDate);
    }
    return impl->load(stmt.get());
}

bool SnapshotStore::contains(const std::string &captureDate) const
{
    Statement stmt(impl->db, "SELECT 1 FROM snapshots WHERE capture_date = ?;");
    sqlite::bindText(stmt.get(), 1, captureDate);
    return stmt.step();
}

std::vector<SnapshotInfo> SnapshotStore::listSnapshots() const
{
    const std::string sql = std::string(kSelectSnapshotColumns) + "ORDER BY capture_date ASC;";
    Statement stmt(impl->db, sql.c_str());

    std::vector<SnapshotInfo> infos;
    while (stmt.step()) {
        infos.push_back(readInfo(stmt.get()));
    }
    return infos;
}

bool SnapshotStore::integrityCheck(std::string *details) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");
    std::string report;
    while (stmt.step()) {
        if (!report.empty()) {
            report += "\n";
        }
        report += sqlite::columnText(stmt.get(), 0);
    }
    if (details) {
        *details = report;
    }
    return report == "ok";
}

} // namespace regdelta
