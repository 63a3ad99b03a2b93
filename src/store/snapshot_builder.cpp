#include "store/snapshot_builder.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

#include "common/errors.hpp"
#include "common/time_utils.hpp"

namespace regdelta {

namespace {

std::string canonicalColumnName(const std::string &name)
{
    std::string out = ValueNormalizer::normalizeText(name);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

} // namespace

SnapshotBuilder::SnapshotBuilder(const EngineConfig &config)
    : m_config(config)
    , m_normalizer(config)
{
}

std::string SnapshotBuilder::snapshotIdFor(const std::string &captureDate)
{
    return "snapshot-" + compactDate(captureDate);
}

Snapshot SnapshotBuilder::build(const std::string &captureDate,
                                const CsvRow &header,
                                const std::vector<CsvRow> &rows,
                                const std::string &sourceRef) const
{
    if (!isValidCaptureDate(captureDate)) {
        throw InvalidSnapshotError("invalid capture date '" + captureDate
                                   + "', expected YYYY-MM-DD");
    }

    std::vector<std::string> columns;
    columns.reserve(header.size());
    std::set<std::string> seen;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const std::string &raw = header[i];
        if (!isValidUtf8(raw)) {
            throw InvalidSnapshotError("header column " + std::to_string(i + 1)
                                       + " is not valid UTF-8");
        }
        const std::string name = canonicalColumnName(raw);
        if (name.empty()) {
            throw InvalidSnapshotError("empty column name in header");
        }
        if (!seen.insert(name).second) {
            throw InvalidSnapshotError("duplicate column '" + name + "' in header");
        }
        columns.push_back(name);
    }

    const auto keyIt = std::find(columns.begin(), columns.end(), m_config.keyField);
    if (keyIt == columns.end()) {
        throw InvalidSnapshotError("key column '" + m_config.keyField + "' missing from header");
    }
    const auto keyIndex = static_cast<std::size_t>(keyIt - columns.begin());

    Snapshot snapshot;
    snapshot.id = snapshotIdFor(captureDate);
    snapshot.captureDate = captureDate;
    snapshot.createdAt = std::chrono::system_clock::now();
    snapshot.sourceRef = sourceRef;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i != keyIndex) {
            snapshot.schema.push_back(columns[i]);
        }
    }

    std::size_t rowNumber = 1;
    for (const auto &row : rows) {
        ++rowNumber;
        if (row.size() != columns.size()) {
            throw InvalidSnapshotError("row " + std::to_string(rowNumber) + " has "
                                       + std::to_string(row.size()) + " cells, expected "
                                       + std::to_string(columns.size()));
        }
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (!isValidUtf8(row[i])) {
                throw InvalidSnapshotError("row " + std::to_string(rowNumber) + " column "
                                           + columns[i] + " is not valid UTF-8");
            }
        }

        const std::string key = ValueNormalizer::normalizeText(row[keyIndex]);
        if (key.empty()) {
            throw InvalidSnapshotError("row " + std::to_string(rowNumber)
                                       + " has an empty " + m_config.keyField);
        }

        AttributeRecord record;
        for (std::size_t i = 0; i < columns.size(); ++i) {
            if (i == keyIndex) {
                continue;
            }
            record.values[columns[i]] = m_normalizer.normalizeRaw(columns[i], row[i]);
        }

        if (!snapshot.records.emplace(key, std::move(record)).second) {
            throw InvalidSnapshotError("duplicate " + m_config.keyField + " '" + key
                                       + "' at row " + std::to_string(rowNumber));
        }
    }

    return snapshot;
}

Snapshot SnapshotBuilder::buildFromCsv(const std::string &captureDate,
                                       const std::string &csvText,
                                       const std::string &sourceRef) const
{
    std::string error;
    auto rows = parseCsv(csvText, &error);
    if (!rows.has_value()) {
        throw InvalidSnapshotError("malformed CSV: " + error);
    }
    if (rows->empty()) {
        throw InvalidSnapshotError("CSV has no header row");
    }

    const CsvRow header = rows->front();
    rows->erase(rows->begin());
    return build(captureDate, header, *rows, sourceRef);
}

Snapshot SnapshotBuilder::loadCsvFile(const QString &path, const std::string &captureDate) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw InvalidSnapshotError("cannot open snapshot file: " + path.toStdString());
    }
    const QByteArray data = file.readAll();
    return buildFromCsv(captureDate, data.toStdString(),
                        QFileInfo(path).absoluteFilePath().toStdString());
}

std::optional<std::string> SnapshotBuilder::captureDateFromFileName(const QString &path)
{
    static const QRegularExpression pattern(QStringLiteral("^snapshot_(\\d{8})\\.csv$"));
    const auto match = pattern.match(QFileInfo(path).fileName());
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const std::string date = expandCompactDate(match.captured(1).toStdString());
    if (!isValidCaptureDate(date)) {
        return std::nullopt;
    }
    return date;
}

} // namespace regdelta
