#include "engine/value_normalizer.hpp"

#include <algorithm>
#include <cctype>

namespace regdelta {

namespace {

bool isSpace(unsigned char c)
{
    return std::isspace(c) != 0;
}

std::string trim(const std::string &value)
{
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && isSpace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && isSpace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::string stripLeadingZeros(const std::string &digits)
{
    const auto pos = digits.find_first_not_of('0');
    if (pos == std::string::npos) {
        return "0";
    }
    return digits.substr(pos);
}

std::string stripTrailingZeros(const std::string &digits)
{
    const auto pos = digits.find_last_not_of('0');
    if (pos == std::string::npos) {
        return {};
    }
    return digits.substr(0, pos + 1);
}

bool equalsIgnoreCase(const std::string &a, const std::string &b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

ValueNormalizer::ValueNormalizer(const EngineConfig &config)
    : m_config(config)
{
}

std::string ValueNormalizer::normalizeText(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    bool pendingSpace = false;
    for (char c : value) {
        if (isSpace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string ValueNormalizer::normalizeEnumeration(const std::string &value)
{
    std::string out = normalizeText(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

std::optional<std::string> ValueNormalizer::canonicalNumber(const std::string &value)
{
    // Drop grouping separators: "1,00,000", "1_000", "1 000".
    std::string s;
    s.reserve(value.size());
    for (char c : value) {
        if (c == ',' || c == '_' || isSpace(static_cast<unsigned char>(c))) {
            continue;
        }
        s.push_back(c);
    }
    if (s.empty()) {
        return std::nullopt;
    }

    std::size_t pos = 0;
    bool negative = false;
    if (s[pos] == '+' || s[pos] == '-') {
        negative = s[pos] == '-';
        ++pos;
    }

    std::string intDigits;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        intDigits.push_back(s[pos++]);
    }
    std::string fracDigits;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            fracDigits.push_back(s[pos++]);
        }
    }
    if (intDigits.empty() && fracDigits.empty()) {
        return std::nullopt;
    }

    long exponent = 0;
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        ++pos;
        bool expNegative = false;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
            expNegative = s[pos] == '-';
            ++pos;
        }
        std::string expDigits;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            expDigits.push_back(s[pos++]);
        }
        if (expDigits.empty() || expDigits.size() > 4) {
            return std::nullopt;
        }
        exponent = std::stol(expDigits);
        if (expNegative) {
            exponent = -exponent;
        }
    }
    if (pos != s.size()) {
        return std::nullopt;
    }

    // Shift the decimal point by the exponent on the digit string itself so
    // no precision is lost to floating point.
    std::string digits = intDigits + fracDigits;
    long pointIndex = static_cast<long>(intDigits.size()) + exponent;
    if (pointIndex < 0) {
        digits.insert(0, static_cast<std::size_t>(-pointIndex), '0');
        pointIndex = 0;
    } else if (pointIndex > static_cast<long>(digits.size())) {
        digits.append(static_cast<std::size_t>(pointIndex) - digits.size(), '0');
    }

    const std::string whole = stripLeadingZeros(
        digits.substr(0, static_cast<std::size_t>(pointIndex)));
    const std::string fraction = stripTrailingZeros(
        digits.substr(static_cast<std::size_t>(pointIndex)));

    std::string out = whole;
    if (!fraction.empty()) {
        out += "." + fraction;
    }
    if (negative && out != "0") {
        out.insert(0, "-");
    }
    return out;
}

bool ValueNormalizer::isNullToken(const std::string &trimmed) const
{
    if (trimmed.empty()) {
        return true;
    }
    // Case-insensitive so that upper-casing a value can never turn it into
    // a null token on a second pass.
    return std::any_of(m_config.nullTokens.begin(), m_config.nullTokens.end(),
                       [&trimmed](const std::string &token) {
                           return equalsIgnoreCase(token, trimmed);
                       });
}

FieldValue ValueNormalizer::normalizeRaw(const std::string &field, const std::string &raw) const
{
    const std::string trimmed = trim(raw);
    if (isNullToken(trimmed)) {
        return std::nullopt;
    }

    switch (m_config.ruleFor(field)) {
    case NormalizationRule::Enumeration:
        return normalizeEnumeration(trimmed);
    case NormalizationRule::Numeric: {
        auto number = canonicalNumber(trimmed);
        if (number.has_value()) {
            return number;
        }
        return normalizeText(trimmed);
    }
    case NormalizationRule::Text:
        return normalizeText(trimmed);
    }
    return normalizeText(trimmed);
}

FieldValue ValueNormalizer::normalize(const std::string &field, const FieldValue &raw) const
{
    if (!raw.has_value()) {
        return std::nullopt;
    }
    return normalizeRaw(field, *raw);
}

} // namespace regdelta
