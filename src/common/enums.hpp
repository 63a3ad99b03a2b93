#pragma once

namespace regdelta {

enum class ChangeKind {
    New,
    Removed,
    FieldUpdate
};

enum class NormalizationRule {
    Text,
    Enumeration,
    Numeric
};

} // namespace regdelta
