#pragma once

#include <optional>
#include <string>
#include <vector>

namespace regdelta {

using CsvRow = std::vector<std::string>;

// RFC 4180 parsing: quoted fields may contain separators, doubled quotes and
// line breaks. Accepts LF or CRLF line endings and a leading UTF-8 BOM.
// Returns nullopt and fills *error on unterminated quotes.
std::optional<std::vector<CsvRow>> parseCsv(const std::string &text, std::string *error);

// True when every byte sequence in value is well-formed UTF-8.
bool isValidUtf8(const std::string &value);

std::string escapeCsvField(const std::string &value);
std::string formatCsvRow(const CsvRow &row);

} // namespace regdelta
