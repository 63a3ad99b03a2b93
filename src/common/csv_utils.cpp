#include "common/csv_utils.hpp"

#include <QUtf8StringView>

namespace regdelta {

std::optional<std::vector<CsvRow>> parseCsv(const std::string &text, std::string *error)
{
    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;
    std::size_t line = 1;

    std::size_t i = 0;
    if (text.rfind("\xEF\xBB\xBF", 0) == 0) {
        i = 3;
    }

    auto endField = [&]() {
        row.push_back(std::move(field));
        field.clear();
        fieldStarted = false;
    };
    auto endRow = [&]() {
        endField();
        // Skip blank lines entirely.
        if (!(row.size() == 1 && row.front().empty())) {
            rows.push_back(std::move(row));
        }
        row.clear();
    };

    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
        case '"':
            if (!fieldStarted && field.empty()) {
                inQuotes = true;
                fieldStarted = true;
            } else {
                field.push_back(c);
            }
            break;
        case ',':
            endField();
            break;
        case '\r':
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                break;
            }
            endRow();
            ++line;
            break;
        case '\n':
            endRow();
            ++line;
            break;
        default:
            field.push_back(c);
            fieldStarted = true;
            break;
        }
    }

    if (inQuotes) {
        if (error) {
            *error = "unterminated quoted field starting before line " + std::to_string(line);
        }
        return std::nullopt;
    }
    if (fieldStarted || !field.empty() || !row.empty()) {
        endRow();
    }
    return rows;
}

bool isValidUtf8(const std::string &value)
{
    return QUtf8StringView(value.data(), qsizetype(value.size())).isValidUtf8();
}

std::string escapeCsvField(const std::string &value)
{
    const bool needsQuotes = value.find_first_of(",\"\r\n") != std::string::npos
        || (!value.empty() && (value.front() == ' ' || value.back() == ' '));
    if (!needsQuotes) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out.push_back(c);
        }
    }
    out += "\"";
    return out;
}

std::string formatCsvRow(const CsvRow &row)
{
    std::string out;
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out += escapeCsvField(row[i]);
    }
    out += "\r\n";
    return out;
}

} // namespace regdelta
