#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace regdelta {

using EntityKey = std::string;

// A missing value is an explicit nullopt, never an absent map entry.
using FieldValue = std::optional<std::string>;

struct AttributeRecord {
    std::map<std::string, FieldValue> values;

    // Returns nullopt for both a null value and an unknown field.
    FieldValue get(const std::string &field) const
    {
        const auto it = values.find(field);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool operator==(const AttributeRecord &other) const = default;
};

struct Snapshot {
    std::string id;
    // Capture timestamp at day granularity, YYYY-MM-DD.
    std::string captureDate;
    std::chrono::system_clock::time_point createdAt;
    std::string sourceRef;

    // Ordered list of every field a record carries.
    std::vector<std::string> schema;
    // std::map keeps keys in ascending order for deterministic iteration.
    std::map<EntityKey, AttributeRecord> records;
};

struct SnapshotInfo {
    std::string id;
    std::string captureDate;
    std::chrono::system_clock::time_point createdAt;
    std::size_t recordCount = 0;
    std::string sourceRef;
};

struct ChangeContext {
    FieldValue entityName;
    FieldValue state;
    FieldValue status;

    bool operator==(const ChangeContext &other) const = default;
};

struct ChangeRecord {
    EntityKey entityKey;
    ChangeKind kind = ChangeKind::FieldUpdate;
    // Empty unless kind == FieldUpdate.
    std::string fieldName;
    FieldValue oldValue;
    FieldValue newValue;
    std::string detectionDate;
    ChangeContext context;

    bool operator==(const ChangeRecord &other) const = default;
};

struct ChangeSet {
    std::string previousSnapshotId;
    std::string currentSnapshotId;
    std::string detectionDate;
    std::vector<ChangeRecord> records;

    std::size_t count(ChangeKind kind) const
    {
        std::size_t total = 0;
        for (const auto &record : records) {
            if (record.kind == kind) {
                ++total;
            }
        }
        return total;
    }

    bool empty() const
    {
        return records.empty();
    }
};

struct RunInfo {
    std::string detectionDate;
    std::string previousSnapshotId;
    std::string currentSnapshotId;
    std::size_t recordCount = 0;
    std::chrono::system_clock::time_point appendedAt;
};

} // namespace regdelta
