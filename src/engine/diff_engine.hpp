#pragma once

#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "engine/value_normalizer.hpp"

namespace regdelta {

// Three-way split of the key sets of two snapshots, each part ascending.
struct KeyPartition {
    std::vector<EntityKey> appeared;
    std::vector<EntityKey> disappeared;
    std::vector<EntityKey> common;
};

// DiffEngine compares two snapshots and produces one ordered ChangeSet:
// NEW records, then REMOVED records, then FIELD_UPDATE records, each group
// ascending by entity key, field updates in tracked-field order within a key.
// The engine is pure: no I/O, no logging, no global state.
class DiffEngine {
public:
    explicit DiffEngine(const EngineConfig &config);

    // Throws SchemaMismatchError when the schemas differ or a tracked field
    // is missing from them.
    ChangeSet diff(const Snapshot &previous, const Snapshot &current) const;

    static KeyPartition partition(const Snapshot &previous, const Snapshot &current);

    // Compact JSON object of the schema fields in schema order.
    std::string canonicalText(const std::vector<std::string> &schema,
                              const AttributeRecord &record) const;

    const EngineConfig &config() const
    {
        return m_config;
    }

private:
    void checkSchemas(const Snapshot &previous, const Snapshot &current) const;

    ChangeContext contextOf(const AttributeRecord &record) const;

    std::vector<ChangeRecord> compareRange(const Snapshot &previous,
                                           const Snapshot &current,
                                           const std::vector<EntityKey> &keys,
                                           std::size_t begin,
                                           std::size_t end) const;

    std::vector<ChangeRecord> compareCommon(const Snapshot &previous,
                                            const Snapshot &current,
                                            const std::vector<EntityKey> &keys) const;

    EngineConfig m_config;
    ValueNormalizer m_normalizer;
};

} // namespace regdelta
