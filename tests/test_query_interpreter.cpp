#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <limits>
#include <memory>

#include "changelog/change_history.hpp"
#include "query/query_interpreter.hpp"
#include "store/snapshot_store.hpp"

namespace {

regdelta::ChangeRecord change(regdelta::ChangeKind kind,
                              const std::string &key,
                              const std::string &field,
                              const std::string &date,
                              const std::string &state)
{
    regdelta::ChangeRecord record;
    record.entityKey = key;
    record.kind = kind;
    record.fieldName = field;
    record.detectionDate = date;
    if (kind == regdelta::ChangeKind::FieldUpdate) {
        record.oldValue = "1";
        record.newValue = "2";
    } else if (kind == regdelta::ChangeKind::New) {
        record.newValue = "{}";
        record.context.entityName = "NEW CO";
    } else {
        record.oldValue = "{}";
    }
    record.context.state = state;
    return record;
}

} // namespace

class QueryInterpreterTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testParseCount();
    void testParseList();
    void testParseEntityHistory();
    void testParseSummaryAndSnapshots();
    void testParseFallsBackToHelp();
    void testParseStateFilter();
    void testParseCompanyWordIsNotEntityLookup();
    void testParseOversizedLimit();
    void testExecuteCount();
    void testExecuteList();
    void testExecuteStateFilter();
    void testExecuteEntityHistory();
    void testExecuteRunSummary();
    void testExecuteSnapshotStats();

private:
    QTemporaryDir m_tempDir;
    std::unique_ptr<regdelta::ChangeHistory> m_history;
    std::unique_ptr<regdelta::SnapshotStore> m_store;
};

void QueryInterpreterTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_history = std::make_unique<regdelta::ChangeHistory>(
        m_tempDir.filePath(QStringLiteral("history.db")).toStdString());
    m_store = std::make_unique<regdelta::SnapshotStore>(
        m_tempDir.filePath(QStringLiteral("snapshots.db")).toStdString());

    using regdelta::ChangeKind;
    regdelta::ChangeSet first;
    first.detectionDate = "2024-01-02";
    first.previousSnapshotId = "snapshot-20240101";
    first.currentSnapshotId = "snapshot-20240102";
    first.records = {
        change(ChangeKind::New, "K2", "", "2024-01-02", "Karnataka"),
        change(ChangeKind::New, "K3", "", "2024-01-02", "Tamil Nadu"),
        change(ChangeKind::FieldUpdate, "K1", "AUTHORIZED_CAPITAL", "2024-01-02", "Maharashtra"),
        change(ChangeKind::FieldUpdate, "K1", "COMPANY_STATUS", "2024-01-02", "Maharashtra"),
    };
    m_history->append(first);

    regdelta::ChangeSet second;
    second.detectionDate = "2024-01-03";
    second.previousSnapshotId = "snapshot-20240102";
    second.currentSnapshotId = "snapshot-20240103";
    second.records = {
        change(ChangeKind::Removed, "K1", "", "2024-01-03", "Maharashtra"),
        change(ChangeKind::FieldUpdate, "K2", "AUTHORIZED_CAPITAL", "2024-01-03", "karnataka"),
    };
    m_history->append(second);

    for (const std::string date : {"2024-01-01", "2024-01-02", "2024-01-03"}) {
        regdelta::Snapshot snapshot;
        snapshot.id = "snapshot-" + date;
        snapshot.captureDate = date;
        snapshot.schema = {"COMPANY_NAME"};
        snapshot.records["K1"].values["COMPANY_NAME"] = "ACME";
        m_store->append(snapshot);
    }
}

void QueryInterpreterTests::testParseCount()
{
    const auto command = regdelta::parseQuery("How many new incorporations on 2024-01-02?");
    QVERIFY(std::holds_alternative<regdelta::CountChanges>(command));
    const auto &count = std::get<regdelta::CountChanges>(command);
    QCOMPARE(count.filter.kind.value(), regdelta::ChangeKind::New);
    QCOMPARE(QString::fromStdString(count.filter.date.value()), QStringLiteral("2024-01-02"));

    const auto compact = regdelta::parseQuery("count deregistrations 20240103");
    QVERIFY(compact == regdelta::QueryCommand(regdelta::CountChanges{
                           {regdelta::ChangeKind::Removed, std::string("2024-01-03"),
                            std::nullopt}}));
}

void QueryInterpreterTests::testParseList()
{
    const auto command = regdelta::parseQuery("list updates field authorized_capital top 5");
    QVERIFY(std::holds_alternative<regdelta::ListChanges>(command));
    const auto &list = std::get<regdelta::ListChanges>(command);
    QCOMPARE(list.filter.kind.value(), regdelta::ChangeKind::FieldUpdate);
    QCOMPARE(QString::fromStdString(list.filter.field.value()),
             QStringLiteral("AUTHORIZED_CAPITAL"));
    QCOMPARE(list.limit, static_cast<size_t>(5));
    QVERIFY(!list.filter.date.has_value());
}

void QueryInterpreterTests::testParseEntityHistory()
{
    const auto command = regdelta::parseQuery("show history of U12345MH2020PTC123456");
    QVERIFY(command == regdelta::QueryCommand(
                           regdelta::EntityHistory{"U12345MH2020PTC123456"}));
}

void QueryInterpreterTests::testParseSummaryAndSnapshots()
{
    QVERIFY(regdelta::parseQuery("summary")
            == regdelta::QueryCommand(regdelta::RunSummary{}));
    QVERIFY(regdelta::parseQuery("Summarize 2024-01-02")
            == regdelta::QueryCommand(regdelta::RunSummary{std::string("2024-01-02")}));
    QVERIFY(std::holds_alternative<regdelta::SnapshotStats>(
        regdelta::parseQuery("how many snapshots are stored")));
}

void QueryInterpreterTests::testParseFallsBackToHelp()
{
    QVERIFY(std::holds_alternative<regdelta::Help>(regdelta::parseQuery("")));
    QVERIFY(std::holds_alternative<regdelta::Help>(regdelta::parseQuery("help")));
    QVERIFY(std::holds_alternative<regdelta::Help>(regdelta::parseQuery("tell me a joke")));
}

void QueryInterpreterTests::testParseStateFilter()
{
    const auto command =
        regdelta::parseQuery("How many new incorporations in Tamil Nadu on 2024-01-02?");
    regdelta::CountChanges expected;
    expected.filter.kind = regdelta::ChangeKind::New;
    expected.filter.date = "2024-01-02";
    expected.filter.state = "Tamil Nadu";
    QVERIFY(command == regdelta::QueryCommand(expected));

    const auto list = regdelta::parseQuery("list deregistrations in New Delhi top 3");
    QVERIFY(std::holds_alternative<regdelta::ListChanges>(list));
    const auto &parsed = std::get<regdelta::ListChanges>(list);
    QCOMPARE(parsed.filter.kind.value(), regdelta::ChangeKind::Removed);
    QCOMPARE(QString::fromStdString(parsed.filter.state.value()), QStringLiteral("New Delhi"));
    QCOMPARE(parsed.limit, static_cast<size_t>(3));

    const auto total = regdelta::parseQuery("count updates in total");
    QVERIFY(!std::get<regdelta::CountChanges>(total).filter.state.has_value());
}

void QueryInterpreterTests::testParseCompanyWordIsNotEntityLookup()
{
    const auto command = regdelta::parseQuery("how many new company incorporations on 2024-01-02");
    regdelta::CountChanges expected;
    expected.filter.kind = regdelta::ChangeKind::New;
    expected.filter.date = "2024-01-02";
    QVERIFY(command == regdelta::QueryCommand(expected));

    QVERIFY(regdelta::parseQuery("company L17110MH1973PLC019786")
            == regdelta::QueryCommand(regdelta::EntityHistory{"L17110MH1973PLC019786"}));
}

void QueryInterpreterTests::testParseOversizedLimit()
{
    const auto command = regdelta::parseQuery("list updates top 99999999999999999999");
    QVERIFY(std::holds_alternative<regdelta::ListChanges>(command));
    QCOMPARE(std::get<regdelta::ListChanges>(command).limit,
             std::numeric_limits<std::size_t>::max());

    const regdelta::QueryInterpreter interpreter(*m_history, *m_store);
    const auto response = interpreter.execute(command);
    QCOMPARE(response.data.at("changes").size(), static_cast<size_t>(3));
}

void QueryInterpreterTests::testExecuteCount()
{
    const regdelta::QueryInterpreter interpreter(*m_history, *m_store);

    auto response = interpreter.ask("how many new incorporations on 2024-01-02");
    QCOMPARE(response.data.at("count").get<int>(), 2);
    QCOMPARE(QString::fromStdString(response.text),
             QStringLiteral("2 new incorporations on 2024-01-02."));

    response = interpreter.execute(regdelta::CountChanges{});
    QCOMPARE(response.data.at("count").get<int>(), 6);

    regdelta::CountChanges byField;
    byField.filter.field = "AUTHORIZED_CAPITAL";
    response = interpreter.execute(byField);
    QCOMPARE(response.data.at("count").get<int>(), 2);
}

void QueryInterpreterTests::testExecuteList()
{
    const regdelta::QueryInterpreter interpreter(*m_history, *m_store);

    regdelta::ListChanges list;
    list.filter.kind = regdelta::ChangeKind::FieldUpdate;
    list.limit = 2;
    const auto response = interpreter.execute(list);
    QCOMPARE(response.data.at("total").get<int>(), 3);
    QCOMPARE(response.data.at("changes").size(), static_cast<size_t>(2));
    QVERIFY(QString::fromStdString(response.text).startsWith("Showing 2 of 3 field updates:"));
    QVERIFY(QString::fromStdString(response.text)
                .contains("2024-01-02 FIELD_UPDATE K1 AUTHORIZED_CAPITAL: 1 -> 2"));

    regdelta::ListChanges none;
    none.filter.date = "2030-01-01";
    QCOMPARE(QString::fromStdString(interpreter.execute(none).text),
             QStringLiteral("No matching changes."));
}

void QueryInterpreterTests::testExecuteStateFilter()
{
    const regdelta::QueryInterpreter interpreter(*m_history, *m_store);

    regdelta::CountChanges byState;
    byState.filter.state = "KARNATAKA";
    auto response = interpreter.execute(byState);
    QCOMPARE(response.data.at("count").get<int>(), 2);
    QCOMPARE(QString::fromStdString(response.data.at("filter").at("state").get<std::string>()),
             QStringLiteral("KARNATAKA"));

    response = interpreter.ask("how many new incorporations in Karnataka on 2024-01-02");
    QCOMPARE(QString::fromStdString(response.text),
             QStringLiteral("1 new incorporations in Karnataka on 2024-01-02."));

    regdelta::ListChanges list;
    list.filter.state = "tamil  nadu";
    response = interpreter.execute(list);
    QCOMPARE(response.data.at("total").get<int>(), 1);
    QVERIFY(QString::fromStdString(response.text)
                .startsWith("Showing 1 of 1 changes in tamil  nadu:"));

    list.filter.state = "Goa";
    QCOMPARE(QString::fromStdString(interpreter.execute(list).text),
             QStringLiteral("No matching changes in Goa."));
}

void QueryInterpreterTests::testExecuteEntityHistory()
{
    const regdelta::QueryInterpreter interpreter(*m_history, *m_store);

    const auto response = interpreter.execute(regdelta::EntityHistory{"K1"});
    QCOMPARE(response.data.at("changes").size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(
                 response.data.at("changes").back().at("change_type").get<std::string>()),
             QStringLiteral("DEREGISTRATION"));

    const auto unknown = interpreter.execute(regdelta::EntityHistory{"K404"});
    QCOMPARE(QString::fromStdString(unknown.text), QStringLiteral("No recorded changes for K404."));
}

void QueryInterpreterTests::testExecuteRunSummary()
{
    const regdelta::QueryInterpreter interpreter(*m_history, *m_store);

    const auto latest = interpreter.execute(regdelta::RunSummary{});
    QCOMPARE(QString::fromStdString(latest.data.at("run").get<std::string>()),
             QStringLiteral("2024-01-03"));
    QCOMPARE(latest.data.at("counts").at("deregistrations").get<int>(), 1);

    const auto first = interpreter.execute(regdelta::RunSummary{std::string("2024-01-02")});
    QCOMPARE(first.data.at("field_change_breakdown").at("COMPANY_STATUS").get<int>(), 1);
    QVERIFY(QString::fromStdString(first.text)
                .startsWith("Run 2024-01-02: 2 new incorporations, 0 deregistrations, "
                            "2 field updates."));

    const std::vector<std::string> states = {"Karnataka", "Maharashtra", "Tamil Nadu"};
    QVERIFY(first.data.at("affected_states").get<std::vector<std::string>>() == states);
    QCOMPARE(first.data.at("state_breakdown").at("Maharashtra").get<int>(), 2);
    QVERIFY(QString::fromStdString(first.text)
                .endsWith("Affected states: Karnataka, Maharashtra, Tamil Nadu"));

    const auto missing = interpreter.execute(regdelta::RunSummary{std::string("2023-12-31")});
    QVERIFY(missing.data.at("run").is_null());
}

void QueryInterpreterTests::testExecuteSnapshotStats()
{
    const regdelta::QueryInterpreter interpreter(*m_history, *m_store);

    const auto response = interpreter.ask("snapshots");
    QCOMPARE(response.data.at("count").get<int>(), 3);
    QCOMPARE(QString::fromStdString(response.data.at("latest").get<std::string>()),
             QStringLiteral("2024-01-03"));
    QCOMPARE(QString::fromStdString(response.text),
             QStringLiteral("3 snapshots from 2024-01-01 to 2024-01-03; latest has 1 records."));
}

QTEST_MAIN(QueryInterpreterTests)
#include "test_query_interpreter.moc"
