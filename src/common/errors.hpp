#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace regdelta {

// Base error for all regdelta failures. Carries a machine-readable code slug
// so callers (the CLI, the pipeline) can branch without string matching.
class Error : public std::runtime_error {
public:
    Error(std::string code, const std::string &message)
        : std::runtime_error(message)
        , m_code(std::move(code))
    {
    }

    const std::string &code() const noexcept
    {
        return m_code;
    }

    // Only a missing snapshot history can be retried later.
    virtual bool isRecoverable() const noexcept
    {
        return false;
    }

private:
    std::string m_code;
};

// Fewer than two snapshots are stored; the run can be retried once more
// snapshots arrive.
class InsufficientHistoryError : public Error {
public:
    explicit InsufficientHistoryError(const std::string &message)
        : Error("insufficient_history", message)
    {
    }

    bool isRecoverable() const noexcept override
    {
        return true;
    }
};

// The two snapshots (or a snapshot and the engine config) disagree on schema.
class SchemaMismatchError : public Error {
public:
    explicit SchemaMismatchError(const std::string &message)
        : Error("schema_mismatch", message)
    {
    }
};

class DuplicateSnapshotError : public Error {
public:
    explicit DuplicateSnapshotError(const std::string &message)
        : Error("duplicate_snapshot", message)
    {
    }
};

class DuplicateRunError : public Error {
public:
    explicit DuplicateRunError(const std::string &message)
        : Error("duplicate_run", message)
    {
    }
};

class SnapshotNotFoundError : public Error {
public:
    explicit SnapshotNotFoundError(const std::string &message)
        : Error("snapshot_not_found", message)
    {
    }
};

// Appending this run would place it before a run already in history.
class OutOfOrderRunError : public Error {
public:
    explicit OutOfOrderRunError(const std::string &message)
        : Error("out_of_order_run", message)
    {
    }
};

// Tabular input that cannot become a valid Snapshot (duplicate key,
// missing schema column, malformed CSV, bad capture date).
class InvalidSnapshotError : public Error {
public:
    explicit InvalidSnapshotError(const std::string &message)
        : Error("invalid_snapshot", message)
    {
    }
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string &message)
        : Error("config", message)
    {
    }
};

// SQLite or filesystem failure underneath the store, writer or history.
class StorageError : public Error {
public:
    explicit StorageError(const std::string &message)
        : Error("storage", message)
    {
    }
};

} // namespace regdelta
