#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <sqlite3.h>

#include "common/models.hpp"

namespace regdelta::sqlite {

// Owns a prepared statement for the lifetime of one query.
class Statement {
public:
    Statement(sqlite3 *db, const char *sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return m_stmt;
    }

    // Returns true while rows remain; throws StorageError on failure.
    bool step();
    // Runs a statement that yields no rows.
    void run();

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_stmt = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3 *db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:
    sqlite3 *m_db = nullptr;
    bool m_done = false;
};

sqlite3 *openDatabase(const std::string &path);
void closeDatabase(sqlite3 *db);

void execOrThrow(sqlite3 *db, const char *sql);

void bindText(sqlite3_stmt *stmt, int index, const std::string &value);
void bindOptionalText(sqlite3_stmt *stmt, int index, const FieldValue &value);
void bindInt64(sqlite3_stmt *stmt, int index, int64_t value);

std::string columnText(sqlite3_stmt *stmt, int index);
FieldValue columnOptionalText(sqlite3_stmt *stmt, int index);
int64_t columnInt64(sqlite3_stmt *stmt, int index);

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp);
std::chrono::system_clock::time_point fromEpochSeconds(int64_t value);

} // namespace regdelta::sqlite
