#include "engine/diff_engine.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <thread>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace regdelta {

namespace {

std::string joinFields(const std::vector<std::string> &fields)
{
    std::string out;
    for (const auto &field : fields) {
        if (!out.empty()) {
            out += ",";
        }
        out += field;
    }
    return "{" + out + "}";
}

} // namespace

DiffEngine::DiffEngine(const EngineConfig &config)
    : m_config(config)
    , m_normalizer(config)
{
}

KeyPartition DiffEngine::partition(const Snapshot &previous, const Snapshot &current)
{
    KeyPartition result;
    auto prevIt = previous.records.begin();
    auto curIt = current.records.begin();

    // Both maps iterate in ascending key order, so one merge pass suffices.
    while (prevIt != previous.records.end() || curIt != current.records.end()) {
        if (curIt == current.records.end()
            || (prevIt != previous.records.end() && prevIt->first < curIt->first)) {
            result.disappeared.push_back(prevIt->first);
            ++prevIt;
        } else if (prevIt == previous.records.end() || curIt->first < prevIt->first) {
            result.appeared.push_back(curIt->first);
            ++curIt;
        } else {
            result.common.push_back(curIt->first);
            ++prevIt;
            ++curIt;
        }
    }
    return result;
}

std::string DiffEngine::canonicalText(const std::vector<std::string> &schema,
                                      const AttributeRecord &record) const
{
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto &field : schema) {
        const FieldValue value = m_normalizer.normalize(field, record.get(field));
        if (value.has_value()) {
            j[field] = *value;
        } else {
            j[field] = nullptr;
        }
    }
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void DiffEngine::checkSchemas(const Snapshot &previous, const Snapshot &current) const
{
    if (previous.schema != current.schema) {
        throw SchemaMismatchError("snapshot " + previous.id + " has schema "
                                  + joinFields(previous.schema) + " but snapshot "
                                  + current.id + " has schema "
                                  + joinFields(current.schema));
    }
    for (const auto &field : m_config.trackedFields) {
        if (std::find(current.schema.begin(), current.schema.end(), field)
            == current.schema.end()) {
            throw SchemaMismatchError("tracked field " + field
                                      + " is missing from schema "
                                      + joinFields(current.schema));
        }
    }
}

ChangeContext DiffEngine::contextOf(const AttributeRecord &record) const
{
    ChangeContext context;
    context.entityName = m_normalizer.normalize(m_config.nameField,
                                                record.get(m_config.nameField));
    context.state = m_normalizer.normalize(m_config.stateField,
                                           record.get(m_config.stateField));
    context.status = m_normalizer.normalize(m_config.statusField,
                                            record.get(m_config.statusField));
    return context;
}

std::vector<ChangeRecord> DiffEngine::compareRange(const Snapshot &previous,
                                                   const Snapshot &current,
                                                   const std::vector<EntityKey> &keys,
                                                   std::size_t begin,
                                                   std::size_t end) const
{
    std::vector<ChangeRecord> out;
    for (std::size_t i = begin; i < end; ++i) {
        const EntityKey &key = keys[i];
        const AttributeRecord &before = previous.records.at(key);
        const AttributeRecord &after = current.records.at(key);

        for (const auto &field : m_config.trackedFields) {
            const FieldValue oldValue = m_normalizer.normalize(field, before.get(field));
            const FieldValue newValue = m_normalizer.normalize(field, after.get(field));
            if (oldValue == newValue) {
                continue;
            }

            ChangeRecord record;
            record.entityKey = key;
            record.kind = ChangeKind::FieldUpdate;
            record.fieldName = field;
            record.oldValue = oldValue;
            record.newValue = newValue;
            record.detectionDate = current.captureDate;
            record.context = contextOf(after);
            out.push_back(std::move(record));
        }
    }
    return out;
}

std::vector<ChangeRecord> DiffEngine::compareCommon(const Snapshot &previous,
                                                    const Snapshot &current,
                                                    const std::vector<EntityKey> &keys) const
{
    std::size_t workers = m_config.workerCount > 0
        ? static_cast<std::size_t>(m_config.workerCount)
        : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, keys.size());

    if (workers <= 1 || keys.size() < m_config.parallelThreshold) {
        return compareRange(previous, current, keys, 0, keys.size());
    }

    // Contiguous shards of the sorted key list; each task owns its output.
    const std::size_t shardSize = (keys.size() + workers - 1) / workers;
    std::vector<std::future<std::vector<ChangeRecord>>> tasks;
    for (std::size_t begin = 0; begin < keys.size(); begin += shardSize) {
        const std::size_t end = std::min(begin + shardSize, keys.size());
        tasks.push_back(std::async(std::launch::async, [&, begin, end]() {
            return compareRange(previous, current, keys, begin, end);
        }));
    }

    std::vector<ChangeRecord> merged;
    for (auto &task : tasks) {
        auto shard = task.get();
        merged.insert(merged.end(),
                      std::make_move_iterator(shard.begin()),
                      std::make_move_iterator(shard.end()));
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const ChangeRecord &a, const ChangeRecord &b) {
                         return a.entityKey < b.entityKey;
                     });
    return merged;
}

ChangeSet DiffEngine::diff(const Snapshot &previous, const Snapshot &current) const
{
    checkSchemas(previous, current);

    const KeyPartition keys = partition(previous, current);

    ChangeSet changeSet;
    changeSet.previousSnapshotId = previous.id;
    changeSet.currentSnapshotId = current.id;
    changeSet.detectionDate = current.captureDate;

    for (const auto &key : keys.appeared) {
        const AttributeRecord &record = current.records.at(key);
        ChangeRecord change;
        change.entityKey = key;
        change.kind = ChangeKind::New;
        change.newValue = canonicalText(current.schema, record);
        change.detectionDate = current.captureDate;
        change.context = contextOf(record);
        changeSet.records.push_back(std::move(change));
    }

    for (const auto &key : keys.disappeared) {
        const AttributeRecord &record = previous.records.at(key);
        ChangeRecord change;
        change.entityKey = key;
        change.kind = ChangeKind::Removed;
        change.oldValue = canonicalText(previous.schema, record);
        change.detectionDate = current.captureDate;
        change.context = contextOf(record);
        changeSet.records.push_back(std::move(change));
    }

    auto updates = compareCommon(previous, current, keys.common);
    changeSet.records.insert(changeSet.records.end(),
                             std::make_move_iterator(updates.begin()),
                             std::make_move_iterator(updates.end()));
    return changeSet;
}

} // namespace regdelta
