#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "common/config.hpp"
#include "common/csv_utils.hpp"
#include "common/models.hpp"
#include "engine/value_normalizer.hpp"

namespace regdelta {

/**
 * Builds an immutable Snapshot from normalized tabular rows:
 * - header names are trimmed and upper-cased; the key column is required
 * - every record carries every schema field (empty cells become nulls)
 * - every value passes through the same ValueNormalizer the DiffEngine uses
 *
 * Duplicate keys, duplicate columns, ragged rows and invalid capture dates
 * throw InvalidSnapshotError. Nothing is persisted here.
 */
class SnapshotBuilder {
public:
    explicit SnapshotBuilder(const EngineConfig &config);

    Snapshot build(const std::string &captureDate,
                   const CsvRow &header,
                   const std::vector<CsvRow> &rows,
                   const std::string &sourceRef = {}) const;

    Snapshot buildFromCsv(const std::string &captureDate,
                          const std::string &csvText,
                          const std::string &sourceRef = {}) const;

    Snapshot loadCsvFile(const QString &path, const std::string &captureDate) const;

    // "snapshot_20240101.csv" -> "2024-01-01"; nullopt for any other name.
    static std::optional<std::string> captureDateFromFileName(const QString &path);

    static std::string snapshotIdFor(const std::string &captureDate);

private:
    EngineConfig m_config;
    ValueNormalizer m_normalizer;
};

} // namespace regdelta
