#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace regdelta {

// Everything the snapshot builder and diff engine need to know about the
// registry schema. Passed explicitly at construction, never read globally.
struct EngineConfig {
    std::string keyField = "CIN";

    // Canonical comparison order for field updates.
    std::vector<std::string> trackedFields;

    // Columns copied into every change record's context.
    std::string nameField = "COMPANY_NAME";
    std::string stateField = "STATE";
    std::string statusField = "COMPANY_STATUS";

    // Fields without an entry use NormalizationRule::Text.
    std::map<std::string, NormalizationRule> fieldRules;

    // Raw values that mean "no value" after trimming (matched case-insensitively).
    std::vector<std::string> nullTokens;

    // 0 = std::thread::hardware_concurrency().
    int workerCount = 0;
    // Below this many common keys, field comparison stays on the calling thread.
    std::size_t parallelThreshold = 4096;

    NormalizationRule ruleFor(const std::string &field) const;

    // The company-registry schema the pipeline was built for.
    static EngineConfig defaults();

    // Missing keys keep their defaults(); malformed values throw ConfigError.
    static EngineConfig fromJson(const nlohmann::json &j);
    static EngineConfig loadFromFile(const QString &path);

    nlohmann::json toJson() const;
};

// Process-level settings for the CLI, read from REGDELTA_* variables.
struct AppConfig {
    QString dataDir;
    QString snapshotDbPath;
    QString historyDbPath;
    QString changeLogDir;
    QString logDir;
    QString engineConfigPath;
    bool traceEnabled = false;

    static AppConfig fromEnvironment();

    // Reads engineConfigPath when set, otherwise EngineConfig::defaults().
    EngineConfig loadEngineConfig() const;
};

} // namespace regdelta
