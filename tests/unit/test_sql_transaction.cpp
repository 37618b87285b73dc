#include "../common/test_base.h"
#include "../../src/core/persistence/migrations.h"
#include "../../src/core/persistence/schema_constants.h"
#include "../../src/core/persistence/schema_validator.h"
#include "../../src/core/persistence/sql_executor.h"

#include <QtTest>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QTemporaryFile>

using namespace cutline;

class TestSqlTransaction : public TestBase
{
    Q_OBJECT

private slots:
    void testTransactionRollback();
    void testTriggerBodyStaysOneStatement();
    void testSchemaAppliesToEmptyDatabase();
    void testUpgradeFromVersionOne();
    void testRefusesNewerDatabase();
    void testInputJsonIsImmutable();
};

void TestSqlTransaction::testTransactionRollback()
{
    QSqlDatabase db = SqlExecutor::createConnection(":memory:", "rollback_db");
    QVERIFY(db.isOpen());

    {
        QSqlQuery query(db);
        QVERIFY(query.exec("CREATE TABLE test (id INTEGER PRIMARY KEY, val TEXT);"));
    }

    QTemporaryFile scriptFile;
    QVERIFY(scriptFile.open());
    const QString scriptPath = scriptFile.fileName();
    {
        QTextStream stream(&scriptFile);
        stream << "INSERT INTO test (id, val) VALUES (1, 'A');\n";
        stream << "---- GO ----\n";
        stream << "INSERT INTO test (id, val) VALUES (2, 'B');\n";
        stream << "---- GO ----\n";
        stream << "INSERT INTO test (id, val) VALUES (1, 'C');\n"; // Duplicate key
    }
    scriptFile.close();

    // Fails on the duplicate key and leaves nothing behind
    QVERIFY(!SqlExecutor::executeSqlScript(db, scriptPath));

    {
        QSqlQuery query(db);
        QVERIFY(query.exec("SELECT COUNT(*) FROM test;"));
        QVERIFY(query.next());
        QCOMPARE(query.value(0).toInt(), 0);
    }

    db = QSqlDatabase();
    SqlExecutor::closeConnection("rollback_db");
}

void TestSqlTransaction::testTriggerBodyStaysOneStatement()
{
    const QString script =
        "-- header comment\n"
        "CREATE TABLE t (a TEXT);\n"
        "CREATE TRIGGER t_guard\n"
        "BEFORE UPDATE OF a ON t\n"
        "BEGIN\n"
        "    SELECT RAISE(ABORT, 'no');  -- inline\n"
        "END;\n"
        "PRAGMA journal_mode = WAL;\n"
        "INSERT INTO t (a) VALUES ('x');\n";

    const QStringList statements = SqlExecutor::parseStatementsFromScript(script);
    QCOMPARE(statements.size(), 3);
    QVERIFY(statements[1].startsWith("CREATE TRIGGER t_guard"));
    QVERIFY(statements[1].endsWith("END;"));
    QVERIFY(statements[1].contains("RAISE(ABORT, 'no');"));
    QCOMPARE(statements[2], QString("INSERT INTO t (a) VALUES ('x');"));
}

void TestSqlTransaction::testSchemaAppliesToEmptyDatabase()
{
    QSqlDatabase db = SqlExecutor::createConnection(freshDatabasePath("fresh"), "fresh_db");
    QVERIFY(db.isOpen());

    QCOMPARE(SchemaValidator::getCurrentSchemaVersion(db), 0);
    QVERIFY(Migrations::applyMigrations(db));
    QCOMPARE(SchemaValidator::getCurrentSchemaVersion(db), schema::CURRENT_SCHEMA_VERSION);
    QVERIFY(SchemaValidator::validateSchema(db));
    QCOMPARE(SchemaValidator::journalMode(db), QString("WAL"));

    // Re-running is a no-op
    QVERIFY(Migrations::applyMigrations(db));

    db = QSqlDatabase();
    SqlExecutor::closeConnection("fresh_db");
}

void TestSqlTransaction::testUpgradeFromVersionOne()
{
    QSqlDatabase db = SqlExecutor::createConnection(freshDatabasePath("v1"), "v1_db");
    QVERIFY(db.isOpen());

    QVERIFY(SqlExecutor::applyMigrationVersion(db, schema::INITIAL_SCHEMA_VERSION));
    QCOMPARE(SchemaValidator::getCurrentSchemaVersion(db), 1);

    {
        QSqlQuery query(db);
        QVERIFY2(query.exec("INSERT INTO jobs (id, state, input_json, created_at) "
                            "VALUES ('old-job', 'queued', '{}', 1)"),
                 qPrintable(query.lastError().text()));
    }

    QVERIFY(Migrations::applyMigrations(db));
    QCOMPARE(SchemaValidator::getCurrentSchemaVersion(db), schema::CURRENT_SCHEMA_VERSION);

    {
        QSqlQuery query(db);
        QVERIFY(query.exec("SELECT id, variation_id FROM jobs"));
        QVERIFY(query.next());
        QCOMPARE(query.value(0).toString(), QString("old-job"));
        QVERIFY(query.value(1).isNull());
    }

    db = QSqlDatabase();
    SqlExecutor::closeConnection("v1_db");
}

void TestSqlTransaction::testRefusesNewerDatabase()
{
    QSqlDatabase db = SqlExecutor::createConnection(freshDatabasePath("future"), "future_db");
    QVERIFY(db.isOpen());
    QVERIFY(Migrations::applyMigrations(db));

    {
        QSqlQuery query(db);
        QVERIFY(query.exec("INSERT INTO schema_version (version, applied_at) VALUES (99, 0)"));
    }

    QVERIFY(!Migrations::applyMigrations(db));

    db = QSqlDatabase();
    SqlExecutor::closeConnection("future_db");
}

void TestSqlTransaction::testInputJsonIsImmutable()
{
    QSqlDatabase db = SqlExecutor::createConnection(freshDatabasePath("immutable"), "immutable_db");
    QVERIFY(db.isOpen());
    QVERIFY(Migrations::applyMigrations(db));

    QSqlQuery query(db);
    QVERIFY(query.exec("INSERT INTO jobs (id, state, input_json, created_at) VALUES ('j1', 'queued', '{\"a\":1}', 1)"));

    QVERIFY(!query.exec("UPDATE jobs SET input_json = '{\"a\":2}' WHERE id = 'j1'"));
    QVERIFY(query.lastError().text().contains("immutable"));

    // Other columns stay writable
    QVERIFY(query.exec("UPDATE jobs SET progress_pct = 5 WHERE id = 'j1'"));

    QVERIFY(query.exec("SELECT input_json FROM jobs WHERE id = 'j1'"));
    QVERIFY(query.next());
    QCOMPARE(query.value(0).toString(), QString("{\"a\":1}"));

    query = QSqlQuery();
    db = QSqlDatabase();
    SqlExecutor::closeConnection("immutable_db");
}

QTEST_GUILESS_MAIN(TestSqlTransaction)
#include "test_sql_transaction.moc"
