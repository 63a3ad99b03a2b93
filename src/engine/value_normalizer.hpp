#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace regdelta {

// ValueNormalizer is the single canonical normalization applied both when a
// snapshot is built and when two values are compared. normalize() is
// idempotent: normalize(normalize(v)) == normalize(v).
class ValueNormalizer {
public:
    explicit ValueNormalizer(const EngineConfig &config);

    FieldValue normalize(const std::string &field, const FieldValue &raw) const;
    FieldValue normalizeRaw(const std::string &field, const std::string &raw) const;

    // Rule primitives, exposed for tests and for the query interpreter.
    static std::string normalizeText(const std::string &value);
    static std::string normalizeEnumeration(const std::string &value);
    // Returns nullopt when the value is not a number.
    static std::optional<std::string> canonicalNumber(const std::string &value);

private:
    bool isNullToken(const std::string &trimmed) const;

    EngineConfig m_config;
};

} // namespace regdelta
