#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace regdelta {

inline std::string toChangeTypeString(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::New:
        return "NEW_INCORPORATION";
    case ChangeKind::Removed:
        return "DEREGISTRATION";
    case ChangeKind::FieldUpdate:
        return "FIELD_UPDATE";
    }
    return "FIELD_UPDATE";
}

inline std::optional<ChangeKind> parseChangeTypeString(const std::string &value)
{
    if (value == "NEW_INCORPORATION" || value == "NEW") {
        return ChangeKind::New;
    }
    if (value == "DEREGISTRATION" || value == "REMOVED") {
        return ChangeKind::Removed;
    }
    if (value == "FIELD_UPDATE") {
        return ChangeKind::FieldUpdate;
    }
    return std::nullopt;
}

inline std::string toRuleString(NormalizationRule rule)
{
    switch (rule) {
    case NormalizationRule::Text:
        return "text";
    case NormalizationRule::Enumeration:
        return "enumeration";
    case NormalizationRule::Numeric:
        return "numeric";
    }
    return "text";
}

inline std::optional<NormalizationRule> parseRuleString(const std::string &value)
{
    if (value == "text") {
        return NormalizationRule::Text;
    }
    if (value == "enumeration") {
        return NormalizationRule::Enumeration;
    }
    if (value == "numeric") {
        return NormalizationRule::Numeric;
    }
    return std::nullopt;
}

inline nlohmann::json fieldValueToJson(const FieldValue &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return *value;
}

inline FieldValue fieldValueFromJson(const nlohmann::json &j)
{
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.dump();
}

inline void to_json(nlohmann::json &j, const ChangeKind &kind)
{
    j = toChangeTypeString(kind);
}

inline void from_json(const nlohmann::json &j, ChangeKind &kind)
{
    const auto parsed = j.is_string()
        ? parseChangeTypeString(j.get<std::string>())
        : std::nullopt;
    kind = parsed.value_or(ChangeKind::FieldUpdate);
}

inline void to_json(nlohmann::json &j, const ChangeContext &context)
{
    j = nlohmann::json{
        {"entity_name", fieldValueToJson(context.entityName)},
        {"state", fieldValueToJson(context.state)},
        {"status", fieldValueToJson(context.status)}
    };
}

inline void from_json(const nlohmann::json &j, ChangeContext &context)
{
    context.entityName = fieldValueFromJson(j.value("entity_name", nlohmann::json()));
    context.state = fieldValueFromJson(j.value("state", nlohmann::json()));
    context.status = fieldValueFromJson(j.value("status", nlohmann::json()));
}

// NEW and DEREGISTRATION records carry the canonical record text as their
// value; the structured form additionally nests it as "record".
inline void to_json(nlohmann::json &j, const ChangeRecord &record)
{
    j = nlohmann::json{
        {"entity_key", record.entityKey},
        {"change_type", record.kind},
        {"field_changed", record.fieldName.empty()
                              ? nlohmann::json()
                              : nlohmann::json(record.fieldName)},
        {"old_value", fieldValueToJson(record.oldValue)},
        {"new_value", fieldValueToJson(record.newValue)},
        {"detection_date", record.detectionDate},
        {"context", record.context}
    };

    if (record.kind != ChangeKind::FieldUpdate) {
        const FieldValue &text = record.kind == ChangeKind::New
            ? record.newValue
            : record.oldValue;
        if (text.has_value()) {
            auto nested = nlohmann::json::parse(*text, nullptr, false);
            if (!nested.is_discarded() && nested.is_object()) {
                j["record"] = std::move(nested);
            }
        }
    }
}

inline void from_json(const nlohmann::json &j, ChangeRecord &record)
{
    record.entityKey = j.value("entity_key", "");
    if (j.contains("change_type")) {
        record.kind = j.at("change_type").get<ChangeKind>();
    } else {
        record.kind = ChangeKind::FieldUpdate;
    }
    const auto field = j.value("field_changed", nlohmann::json());
    record.fieldName = field.is_string() ? field.get<std::string>() : std::string();
    record.oldValue = fieldValueFromJson(j.value("old_value", nlohmann::json()));
    record.newValue = fieldValueFromJson(j.value("new_value", nlohmann::json()));
    record.detectionDate = j.value("detection_date", "");
    if (j.contains("context") && j.at("context").is_object()) {
        record.context = j.at("context").get<ChangeContext>();
    } else {
        record.context = ChangeContext{};
    }
}

inline nlohmann::json changeCounts(const ChangeSet &changeSet)
{
    return nlohmann::json{
        {"new_incorporations", changeSet.count(ChangeKind::New)},
        {"deregistrations", changeSet.count(ChangeKind::Removed)},
        {"field_updates", changeSet.count(ChangeKind::FieldUpdate)},
        {"total", changeSet.records.size()}
    };
}

inline void to_json(nlohmann::json &j, const ChangeSet &changeSet)
{
    j = nlohmann::json{
        {"detection_date", changeSet.detectionDate},
        {"previous_snapshot", changeSet.previousSnapshotId},
        {"current_snapshot", changeSet.currentSnapshotId},
        {"counts", changeCounts(changeSet)},
        {"changes", changeSet.records}
    };
}

inline void from_json(const nlohmann::json &j, ChangeSet &changeSet)
{
    changeSet.detectionDate = j.value("detection_date", "");
    changeSet.previousSnapshotId = j.value("previous_snapshot", "");
    changeSet.currentSnapshotId = j.value("current_snapshot", "");
    if (j.contains("changes") && j.at("changes").is_array()) {
        changeSet.records = j.at("changes").get<std::vector<ChangeRecord>>();
    } else {
        changeSet.records.clear();
    }
}

inline void to_json(nlohmann::json &j, const SnapshotInfo &info)
{
    j = nlohmann::json{
        {"id", info.id},
        {"capture_date", info.captureDate},
        {"created_at", toIso8601Utc(info.createdAt)},
        {"record_count", info.recordCount},
        {"source_ref", info.sourceRef}
    };
}

inline void to_json(nlohmann::json &j, const RunInfo &run)
{
    j = nlohmann::json{
        {"detection_date", run.detectionDate},
        {"previous_snapshot", run.previousSnapshotId},
        {"current_snapshot", run.currentSnapshotId},
        {"record_count", run.recordCount},
        {"appended_at", toIso8601Utc(run.appendedAt)}
    };
}

} // namespace regdelta
