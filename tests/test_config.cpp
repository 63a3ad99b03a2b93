#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void testDefaults();
    void testFromJsonOverrides();
    void testFromJsonRejectsBadValues();
    void testLoadFromFile();
    void testToJsonRoundTrip();
    void testAppConfigFromEnvironment();

private:
    QTemporaryDir m_tempDir;
};

void ConfigTests::testDefaults()
{
    const auto config = regdelta::EngineConfig::defaults();
    QCOMPARE(QString::fromStdString(config.keyField), QStringLiteral("CIN"));
    QCOMPARE(config.trackedFields.size(), static_cast<size_t>(7));
    QCOMPARE(QString::fromStdString(config.trackedFields.front()), QStringLiteral("COMPANY_NAME"));
    QCOMPARE(config.ruleFor("AUTHORIZED_CAPITAL"), regdelta::NormalizationRule::Numeric);
    QCOMPARE(config.ruleFor("COMPANY_STATUS"), regdelta::NormalizationRule::Enumeration);
    QCOMPARE(config.ruleFor("REGISTERED_OFFICE_ADDRESS"), regdelta::NormalizationRule::Text);
    QCOMPARE(config.workerCount, 0);
}

void ConfigTests::testFromJsonOverrides()
{
    const auto config = regdelta::EngineConfig::fromJson(nlohmann::json{
        {"keyField", "ID"},
        {"trackedFields", {"NAME", "STATUS"}},
        {"fieldRules", {{"STATUS", "enumeration"}}},
        {"workerCount", 4},
        {"parallelThreshold", 10}
    });
    QCOMPARE(QString::fromStdString(config.keyField), QStringLiteral("ID"));
    QCOMPARE(config.trackedFields.size(), static_cast<size_t>(2));
    QCOMPARE(config.ruleFor("STATUS"), regdelta::NormalizationRule::Enumeration);
    QCOMPARE(config.ruleFor("AUTHORIZED_CAPITAL"), regdelta::NormalizationRule::Text);
    QCOMPARE(config.workerCount, 4);
    QCOMPARE(config.parallelThreshold, static_cast<size_t>(10));
    // Unspecified keys keep their defaults.
    QCOMPARE(QString::fromStdString(config.stateField), QStringLiteral("STATE"));
}

void ConfigTests::testFromJsonRejectsBadValues()
{
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError,
                             regdelta::EngineConfig::fromJson(nlohmann::json::array()));
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError,
                             regdelta::EngineConfig::fromJson(
                                 nlohmann::json{{"trackedFields", nlohmann::json::array()}}));
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError,
                             regdelta::EngineConfig::fromJson(
                                 nlohmann::json{{"trackedFields", {"A", "A"}}}));
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError,
                             regdelta::EngineConfig::fromJson(
                                 nlohmann::json{{"trackedFields", {"CIN"}}}));
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError,
                             regdelta::EngineConfig::fromJson(
                                 nlohmann::json{{"fieldRules", {{"A", "fuzzy"}}}}));
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError,
                             regdelta::EngineConfig::fromJson(
                                 nlohmann::json{{"workerCount", "many"}}));
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError,
                             regdelta::EngineConfig::fromJson(
                                 nlohmann::json{{"workerCount", -1}}));
}

void ConfigTests::testLoadFromFile()
{
    QVERIFY(m_tempDir.isValid());
    const QString path = m_tempDir.filePath(QStringLiteral("engine.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"trackedFields": ["COMPANY_STATUS"], "nullTokens": ["-"]})");
    file.close();

    const auto config = regdelta::EngineConfig::loadFromFile(path);
    QCOMPARE(config.trackedFields.size(), static_cast<size_t>(1));
    QCOMPARE(config.nullTokens.size(), static_cast<size_t>(1));

    const QString broken = m_tempDir.filePath(QStringLiteral("broken.json"));
    QFile brokenFile(broken);
    QVERIFY(brokenFile.open(QIODevice::WriteOnly));
    brokenFile.write("{not json");
    brokenFile.close();
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError, regdelta::EngineConfig::loadFromFile(broken));
    QVERIFY_THROWS_EXCEPTION(regdelta::ConfigError,
                             regdelta::EngineConfig::loadFromFile(
                                 m_tempDir.filePath(QStringLiteral("missing.json"))));
}

void ConfigTests::testToJsonRoundTrip()
{
    auto config = regdelta::EngineConfig::defaults();
    config.workerCount = 3;
    const auto parsed = regdelta::EngineConfig::fromJson(config.toJson());
    QVERIFY(parsed.trackedFields == config.trackedFields);
    QVERIFY(parsed.fieldRules == config.fieldRules);
    QVERIFY(parsed.nullTokens == config.nullTokens);
    QCOMPARE(parsed.workerCount, 3);
}

void ConfigTests::testAppConfigFromEnvironment()
{
    QVERIFY(m_tempDir.isValid());
    const QByteArray dataDir = m_tempDir.filePath(QStringLiteral("data")).toUtf8();
    qputenv("REGDELTA_DATA_DIR", dataDir);
    qputenv("REGDELTA_TRACE", "1");
    qunsetenv("REGDELTA_DB_PATH");
    qunsetenv("REGDELTA_CONFIG");

    const auto config = regdelta::AppConfig::fromEnvironment();
    QCOMPARE(config.dataDir, QString::fromUtf8(dataDir));
    QCOMPARE(config.snapshotDbPath, QString::fromUtf8(dataDir) + QStringLiteral("/snapshots.db"));
    QCOMPARE(config.changeLogDir, QString::fromUtf8(dataDir) + QStringLiteral("/change_logs"));
    QVERIFY(config.traceEnabled);
    QCOMPARE(config.loadEngineConfig().trackedFields.size(), static_cast<size_t>(7));

    qunsetenv("REGDELTA_DATA_DIR");
    qunsetenv("REGDELTA_TRACE");
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
