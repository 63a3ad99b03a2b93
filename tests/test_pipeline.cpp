#include <QtTest/QtTest>

#include <QDir>
#include <QTemporaryDir>

#include <memory>

#include "changelog/change_history.hpp"
#include "changelog/change_log_writer.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "engine/diff_engine.hpp"
#include "pipeline/change_pipeline.hpp"
#include "store/snapshot_builder.hpp"
#include "store/snapshot_store.hpp"

namespace {

const char *kHeader = "CIN,COMPANY_NAME,COMPANY_CLASS,COMPANY_STATUS,AUTHORIZED_CAPITAL,"
                      "PAIDUP_CAPITAL,PRINCIPAL_BUSINESS_ACTIVITY,REGISTERED_OFFICE_ADDRESS,"
                      "STATE\n";

std::string row(const std::string &cin, const std::string &capital,
                const std::string &status = "Active")
{
    return cin + ",Company " + cin + ",Private," + status + "," + capital
        + ",1000,Services,\"1 Main St, Pune\",Maharashtra\n";
}

} // namespace

class PipelineTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testRunLatestWritesAndRecords();
    void testSingleSnapshotIsInsufficient();
    void testRepeatedRunIsDuplicate();
    void testSchemaMismatchLeavesNoTrace();
    void testHistoryFailureRemovesArtifact();
    void testOrphanPartitionIsReplaced();
    void testCatchUpRunsPendingPairsInOrder();
    void testPreviewDoesNotPersist();

private:
    QTemporaryDir m_tempDir;
    int m_counter = 0;
    QString m_root;

    regdelta::EngineConfig m_config = regdelta::EngineConfig::defaults();
    std::unique_ptr<regdelta::SnapshotStore> m_store;
    std::unique_ptr<regdelta::ChangeHistory> m_history;
    std::unique_ptr<regdelta::ChangeLogWriter> m_writer;
    std::unique_ptr<regdelta::DiffEngine> m_engine;
    std::unique_ptr<regdelta::ChangePipeline> m_pipeline;

    void importCsv(const std::string &date, const std::string &body)
    {
        const regdelta::SnapshotBuilder builder(m_config);
        m_store->append(builder.buildFromCsv(date, kHeader + body));
    }

    QString logsDir() const
    {
        return m_root + QStringLiteral("/change_logs");
    }
};

void PipelineTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    regdelta::logging::initLogging(QStringLiteral("regdelta-test"),
                                   m_tempDir.filePath(QStringLiteral("logs")),
                                   true);
}

void PipelineTests::init()
{
    m_root = m_tempDir.filePath(QStringLiteral("case-%1").arg(++m_counter));
    QVERIFY(QDir().mkpath(m_root));
    m_store = std::make_unique<regdelta::SnapshotStore>((m_root + "/snapshots.db").toStdString());
    m_history = std::make_unique<regdelta::ChangeHistory>((m_root + "/history.db").toStdString());
    m_writer = std::make_unique<regdelta::ChangeLogWriter>(logsDir(), *m_history);
    m_engine = std::make_unique<regdelta::DiffEngine>(m_config);
    m_pipeline = std::make_unique<regdelta::ChangePipeline>(*m_store, *m_engine,
                                                            *m_writer, *m_history);
}

void PipelineTests::cleanup()
{
    m_pipeline.reset();
    m_engine.reset();
    m_writer.reset();
    m_history.reset();
    m_store.reset();
}

void PipelineTests::testRunLatestWritesAndRecords()
{
    importCsv("2024-01-01", row("K1", "100000"));
    importCsv("2024-01-02", row("K1", "200000") + row("K2", "50000"));

    const auto result = m_pipeline->runLatest();
    QCOMPARE(result.changeSet.records.size(), static_cast<size_t>(2));
    QCOMPARE(result.changeSet.count(regdelta::ChangeKind::New), static_cast<size_t>(1));
    QCOMPARE(result.changeSet.count(regdelta::ChangeKind::FieldUpdate), static_cast<size_t>(1));
    QCOMPARE(result.artifactDir, logsDir() + QStringLiteral("/20240102"));
    QVERIFY(QFile::exists(m_writer->csvPath("2024-01-02")));
    QVERIFY(QFile::exists(m_writer->jsonPath("2024-01-02")));

    const auto recorded = m_history->changesForDate("2024-01-02");
    QVERIFY(recorded == result.changeSet.records);
}

void PipelineTests::testSingleSnapshotIsInsufficient()
{
    importCsv("2024-01-01", row("K1", "100000"));
    QVERIFY_THROWS_EXCEPTION(regdelta::InsufficientHistoryError, m_pipeline->runLatest());
    QVERIFY_THROWS_EXCEPTION(regdelta::InsufficientHistoryError, m_pipeline->catchUp());
    QVERIFY(!QDir(logsDir()).exists());
    QVERIFY(m_history->runs().empty());
}

void PipelineTests::testRepeatedRunIsDuplicate()
{
    importCsv("2024-01-01", row("K1", "100000"));
    importCsv("2024-01-02", row("K1", "100000"));

    const auto first = m_pipeline->runLatest();
    QVERIFY(first.changeSet.empty());
    QVERIFY(m_history->hasRun("2024-01-02"));

    QVERIFY_THROWS_EXCEPTION(regdelta::DuplicateRunError, m_pipeline->runLatest());
    QCOMPARE(m_history->runs().size(), static_cast<size_t>(1));
}

void PipelineTests::testSchemaMismatchLeavesNoTrace()
{
    importCsv("2024-01-01", row("K1", "100000"));
    const regdelta::SnapshotBuilder builder(m_config);
    m_store->append(builder.buildFromCsv("2024-01-02", "CIN,COMPANY_NAME\nK1,Company K1\n"));

    QVERIFY_THROWS_EXCEPTION(regdelta::SchemaMismatchError, m_pipeline->runLatest());
    QVERIFY(!m_writer->hasRun("2024-01-02"));
    QVERIFY(m_history->runs().empty());
}

void PipelineTests::testHistoryFailureRemovesArtifact()
{
    importCsv("2024-01-01", row("K1", "100000"));
    importCsv("2024-01-02", row("K1", "200000"));

    // A later run already in history makes the append for 2024-01-02 fail.
    regdelta::ChangeSet later;
    later.detectionDate = "2024-01-09";
    later.previousSnapshotId = "x";
    later.currentSnapshotId = "y";
    m_history->append(later);

    QVERIFY_THROWS_EXCEPTION(regdelta::OutOfOrderRunError, m_pipeline->runLatest());
    QVERIFY(!m_writer->hasRun("2024-01-02"));
    QVERIFY(!m_history->hasRun("2024-01-02"));
}

void PipelineTests::testOrphanPartitionIsReplaced()
{
    importCsv("2024-01-01", row("K1", "100000"));
    importCsv("2024-01-02", row("K1", "200000"));
    importCsv("2024-01-03", row("K1", "300000"));

    // Published but never recorded, as after a crash before the history append.
    m_writer->write(m_pipeline->preview("2024-01-01", "2024-01-02"), "2024-01-02");
    QVERIFY(m_writer->hasRun("2024-01-02"));
    QVERIFY(!m_history->hasRun("2024-01-02"));

    const auto results = m_pipeline->catchUp();
    QCOMPARE(results.size(), static_cast<size_t>(2));
    QVERIFY(m_history->hasRun("2024-01-02"));
    QVERIFY(m_history->hasRun("2024-01-03"));
    QVERIFY(m_writer->hasRun("2024-01-02"));
    QCOMPARE(m_history->changesForDate("2024-01-02").size(), static_cast<size_t>(1));
}

void PipelineTests::testCatchUpRunsPendingPairsInOrder()
{
    importCsv("2024-01-01", row("K1", "100"));
    importCsv("2024-01-02", row("K1", "200"));
    importCsv("2024-01-03", row("K1", "200") + row("K2", "5"));
    importCsv("2024-01-04", row("K2", "5", "Strike Off"));

    // The first pair is already recorded; catch-up starts after it.
    m_pipeline->runPair("2024-01-01", "2024-01-02");

    const auto results = m_pipeline->catchUp();
    QCOMPARE(results.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(results[0].changeSet.detectionDate),
             QStringLiteral("2024-01-03"));
    QCOMPARE(QString::fromStdString(results[1].changeSet.detectionDate),
             QStringLiteral("2024-01-04"));
    QCOMPARE(results[1].changeSet.count(regdelta::ChangeKind::Removed), static_cast<size_t>(1));
    QCOMPARE(results[1].changeSet.count(regdelta::ChangeKind::FieldUpdate),
             static_cast<size_t>(1));

    const auto runs = m_history->runs();
    QCOMPARE(runs.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(runs.back().currentSnapshotId),
             QStringLiteral("snapshot-20240104"));

    QVERIFY(m_pipeline->catchUp().empty());
}

void PipelineTests::testPreviewDoesNotPersist()
{
    importCsv("2024-01-01", row("K1", "100"));
    importCsv("2024-01-02", row("K1", "300"));

    const auto changeSet = m_pipeline->preview("2024-01-01", "2024-01-02");
    QCOMPARE(changeSet.records.size(), static_cast<size_t>(1));
    QVERIFY(!m_writer->hasRun("2024-01-02"));
    QVERIFY(m_history->runs().empty());
    QVERIFY_THROWS_EXCEPTION(regdelta::SnapshotNotFoundError,
                             m_pipeline->preview("2024-01-01", "2024-02-01"));
}

QTEST_MAIN(PipelineTests)
#include "test_pipeline.moc"
