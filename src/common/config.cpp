#include "common/config.hpp"

#include <QFile>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace regdelta {

namespace {

std::vector<std::string> readStringList(const nlohmann::json &j, const char *key)
{
    const auto &value = j.at(key);
    if (!value.is_array()) {
        throw ConfigError(std::string("config key '") + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    for (const auto &item : value) {
        if (!item.is_string()) {
            throw ConfigError(std::string("config key '") + key + "' must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::string readString(const nlohmann::json &j, const char *key)
{
    const auto &value = j.at(key);
    if (!value.is_string() || value.get<std::string>().empty()) {
        throw ConfigError(std::string("config key '") + key + "' must be a non-empty string");
    }
    return value.get<std::string>();
}

void validate(const EngineConfig &config)
{
    if (config.keyField.empty()) {
        throw ConfigError("keyField must not be empty");
    }
    if (config.trackedFields.empty()) {
        throw ConfigError("trackedFields must list at least one field");
    }
    for (std::size_t i = 0; i < config.trackedFields.size(); ++i) {
        const auto &field = config.trackedFields[i];
        if (field == config.keyField) {
            throw ConfigError("the key field '" + field + "' cannot be tracked");
        }
        for (std::size_t j = i + 1; j < config.trackedFields.size(); ++j) {
            if (config.trackedFields[j] == field) {
                throw ConfigError("tracked field '" + field + "' listed twice");
            }
        }
    }
    if (config.workerCount < 0) {
        throw ConfigError("workerCount must be >= 0");
    }
}

QString envOr(const char *name, const QString &fallback)
{
    const QString value = qEnvironmentVariable(name);
    return value.isEmpty() ? fallback : value;
}

} // namespace

NormalizationRule EngineConfig::ruleFor(const std::string &field) const
{
    const auto it = fieldRules.find(field);
    if (it == fieldRules.end()) {
        return NormalizationRule::Text;
    }
    return it->second;
}

EngineConfig EngineConfig::defaults()
{
    EngineConfig config;
    config.keyField = "CIN";
    config.trackedFields = {
        "COMPANY_NAME",
        "COMPANY_CLASS",
        "COMPANY_STATUS",
        "AUTHORIZED_CAPITAL",
        "PAIDUP_CAPITAL",
        "PRINCIPAL_BUSINESS_ACTIVITY",
        "REGISTERED_OFFICE_ADDRESS",
    };
    config.nameField = "COMPANY_NAME";
    config.stateField = "STATE";
    config.statusField = "COMPANY_STATUS";
    config.fieldRules = {
        {"COMPANY_NAME", NormalizationRule::Enumeration},
        {"COMPANY_CLASS", NormalizationRule::Enumeration},
        {"COMPANY_STATUS", NormalizationRule::Enumeration},
        {"AUTHORIZED_CAPITAL", NormalizationRule::Numeric},
        {"PAIDUP_CAPITAL", NormalizationRule::Numeric},
    };
    config.nullTokens = {"", "nan", "none", "null", "n/a"};
    return config;
}

EngineConfig EngineConfig::fromJson(const nlohmann::json &j)
{
    if (!j.is_object()) {
        throw ConfigError("engine config must be a JSON object");
    }

    EngineConfig config = defaults();
    try {
        if (j.contains("keyField")) {
            config.keyField = readString(j, "keyField");
        }
        if (j.contains("trackedFields")) {
            config.trackedFields = readStringList(j, "trackedFields");
        }
        if (j.contains("nameField")) {
            config.nameField = readString(j, "nameField");
        }
        if (j.contains("stateField")) {
            config.stateField = readString(j, "stateField");
        }
        if (j.contains("statusField")) {
            config.statusField = readString(j, "statusField");
        }
        if (j.contains("nullTokens")) {
            config.nullTokens = readStringList(j, "nullTokens");
        }
        if (j.contains("fieldRules")) {
            const auto &rules = j.at("fieldRules");
            if (!rules.is_object()) {
                throw ConfigError("fieldRules must map field names to rule names");
            }
            config.fieldRules.clear();
            for (const auto &item : rules.items()) {
                if (!item.value().is_string()) {
                    throw ConfigError("rule for field '" + item.key() + "' must be a string");
                }
                const auto rule = parseRuleString(item.value().get<std::string>());
                if (!rule.has_value()) {
                    throw ConfigError("unknown normalization rule '"
                                      + item.value().get<std::string>()
                                      + "' for field '" + item.key() + "'");
                }
                config.fieldRules[item.key()] = *rule;
            }
        }
        if (j.contains("workerCount")) {
            config.workerCount = j.at("workerCount").get<int>();
        }
        if (j.contains("parallelThreshold")) {
            config.parallelThreshold = j.at("parallelThreshold").get<std::size_t>();
        }
    } catch (const nlohmann::json::exception &ex) {
        throw ConfigError(std::string("invalid engine config: ") + ex.what());
    }

    validate(config);
    return config;
}

EngineConfig EngineConfig::loadFromFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("cannot open engine config: " + path.toStdString());
    }
    const QByteArray data = file.readAll();
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError("engine config is not valid JSON (" + path.toStdString()
                          + "): " + ex.what());
    }
    return fromJson(parsed);
}

nlohmann::json EngineConfig::toJson() const
{
    nlohmann::json rules = nlohmann::json::object();
    for (const auto &[field, rule] : fieldRules) {
        rules[field] = toRuleString(rule);
    }
    return nlohmann::json{
        {"keyField", keyField},
        {"trackedFields", trackedFields},
        {"nameField", nameField},
        {"stateField", stateField},
        {"statusField", statusField},
        {"fieldRules", rules},
        {"nullTokens", nullTokens},
        {"workerCount", workerCount},
        {"parallelThreshold", parallelThreshold}
    };
}

AppConfig AppConfig::fromEnvironment()
{
    AppConfig config;

    const QString home = qEnvironmentVariable("HOME");
    const QString defaultData = home.isEmpty()
        ? QStringLiteral(".local/share/regdelta")
        : home + QStringLiteral("/.local/share/regdelta");

    config.dataDir = envOr("REGDELTA_DATA_DIR", defaultData);
    config.snapshotDbPath = envOr("REGDELTA_DB_PATH",
                                  config.dataDir + QStringLiteral("/snapshots.db"));
    config.historyDbPath = envOr("REGDELTA_HISTORY_DB_PATH",
                                 config.dataDir + QStringLiteral("/history.db"));
    config.changeLogDir = envOr("REGDELTA_CHANGE_LOG_DIR",
                                config.dataDir + QStringLiteral("/change_logs"));
    config.logDir = envOr("REGDELTA_LOG_DIR", config.dataDir + QStringLiteral("/logs"));
    config.engineConfigPath = qEnvironmentVariable("REGDELTA_CONFIG");
    config.traceEnabled = qEnvironmentVariableIntValue("REGDELTA_TRACE") == 1;
    return config;
}

EngineConfig AppConfig::loadEngineConfig() const
{
    if (engineConfigPath.isEmpty()) {
        return EngineConfig::defaults();
    }
    return EngineConfig::loadFromFile(engineConfigPath);
}

} // namespace regdelta
