#include "store/sqlite_utils.hpp"

#include <filesystem>

#include "common/errors.hpp"

namespace regdelta::sqlite {

namespace {

std::string lastError(sqlite3 *db, const std::string &fallback)
{
    const char *message = db ? sqlite3_errmsg(db) : nullptr;
    return message ? fallback + ": " + message : fallback;
}

} // namespace

Statement::Statement(sqlite3 *db, const char *sql)
    : m_db(db)
{
    if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
        throw StorageError(lastError(db, "sqlite prepare failed"));
    }
}

Statement::~Statement()
{
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

bool Statement::step()
{
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StorageError(lastError(m_db, "sqlite step failed"));
}

void Statement::run()
{
    while (step()) {
    }
}

Transaction::Transaction(sqlite3 *db)
    : m_db(db)
{
    execOrThrow(m_db, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction()
{
    if (!m_done) {
        sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit()
{
    execOrThrow(m_db, "COMMIT;");
    m_done = true;
}

sqlite3 *openDatabase(const std::string &path)
{
    const std::filesystem::path dbPath(path);
    if (dbPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            throw StorageError("cannot create directory for " + path + ": " + ec.message());
        }
    }

    sqlite3 *db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        const std::string message = lastError(db, "failed to open database " + path);
        sqlite3_close(db);
        throw StorageError(message);
    }
    sqlite3_busy_timeout(db, 5000);
    try {
        execOrThrow(db, "PRAGMA foreign_keys = ON;");
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

void closeDatabase(sqlite3 *db)
{
    if (db) {
        sqlite3_close(db);
    }
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const FieldValue &value)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, *value);
}

void bindInt64(sqlite3_stmt *stmt, int index, int64_t value)
{
    sqlite3_bind_int64(stmt, index, value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

FieldValue columnOptionalText(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(stmt, index);
}

int64_t columnInt64(sqlite3_stmt *stmt, int index)
{
    return sqlite3_column_int64(stmt, index);
}

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

} // namespace regdelta::sqlite
