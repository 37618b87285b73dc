#include "sql_executor.h"
#include "schema_constants.h"

#include <QFile>
#include <QTextStream>
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>
#include <QThread>
#include <QUuid>

Q_LOGGING_CATEGORY(cutlineSqlExecutor, "cutline.sql.executor")

namespace cutline {

bool SqlExecutor::executeSqlScript(QSqlDatabase& database, const QString& scriptPath, bool ownTransaction)
{
    qCDebug(cutlineSqlExecutor, "Executing SQL script: %s", qPrintable(scriptPath));

    // Algorithm: Load file → Parse statements → Execute batch → Commit or roll back
    QString script = loadScriptFromFile(scriptPath);
    if (script.isEmpty()) {
        return false;
    }

    QStringList statements = parseStatementsFromScript(script);
    if (statements.isEmpty()) {
        qCWarning(cutlineSqlExecutor, "No executable statements found in script");
        return false;
    }

    if (!ownTransaction) {
        if (!executeStatementBatch(database, statements)) {
            return false;
        }
        qCDebug(cutlineSqlExecutor, "SQL script executed in caller transaction: %s", qPrintable(scriptPath));
        return true;
    }

    if (!database.transaction()) {
        qCCritical(cutlineSqlExecutor, "Failed to begin transaction: %s",
                   qPrintable(database.lastError().text()));
        return false;
    }

    if (!executeStatementBatch(database, statements)) {
        if (!database.rollback()) {
            qCCritical(cutlineSqlExecutor, "Rollback failed: %s", qPrintable(database.lastError().text()));
        }
        return false;
    }

    if (!database.commit()) {
        qCCritical(cutlineSqlExecutor, "Commit failed: %s", qPrintable(database.lastError().text()));
        database.rollback();
        return false;
    }

    qCDebug(cutlineSqlExecutor, "SQL script executed successfully: %s", qPrintable(scriptPath));
    return true;
}

bool SqlExecutor::applyMigrationVersion(QSqlDatabase& database, int version, bool ownTransaction)
{
    qCDebug(cutlineSqlExecutor, "Applying migration version: %d", version);

    // Algorithm: Resolve path → Load script → Execute → Log result
    QString scriptPath = resolveMigrationPath(version);

    if (scriptPath.isEmpty()) {
        qCCritical(cutlineSqlExecutor, "Migration file not found for version %d", version);
        return false;
    }

    bool success = executeSqlScript(database, scriptPath, ownTransaction);

    if (success) {
        qCInfo(cutlineSqlExecutor, "Migration version %d applied successfully", version);
    } else {
        qCCritical(cutlineSqlExecutor, "Failed to apply migration version %d", version);
    }

    return success;
}

QSqlDatabase SqlExecutor::createConnection(const QString& databasePath, const QString& connectionName)
{
    // Algorithm: Register name → Open → WAL + busy timeout → Verify
    const QString name = connectionName.isEmpty() ? generateConnectionName() : connectionName;

    {
        QSqlDatabase database = QSqlDatabase::addDatabase("QSQLITE", name);
        database.setDatabaseName(databasePath);
        database.setConnectOptions(QString("QSQLITE_BUSY_TIMEOUT=%1").arg(schema::BUSY_TIMEOUT_MS));

        bool ok = database.open();
        if (!ok) {
            qCCritical(cutlineSqlExecutor, "Failed to open database %s: %s",
                       qPrintable(databasePath), qPrintable(database.lastError().text()));
        }

        if (ok) {
            QSqlQuery query(database);
            const QStringList pragmas = {
                QString(schema::SET_BUSY_TIMEOUT).arg(schema::BUSY_TIMEOUT_MS),
                schema::SET_WAL_MODE,
                schema::SET_SYNCHRONOUS_NORMAL
            };
            for (const QString& pragma : pragmas) {
                // Switching a fresh file to WAL can report busy without waiting
                // while another connection opens the same file
                int attempts = 0;
                while (!query.exec(pragma) && query.lastError().nativeErrorCode() == "5" &&
                       ++attempts < schema::PRAGMA_BUSY_RETRIES) {
                    QThread::msleep(schema::PRAGMA_BUSY_RETRY_MS);
                }
                if (!query.isActive()) {
                    qCCritical(cutlineSqlExecutor, "Failed to apply '%s': %s",
                               qPrintable(pragma), qPrintable(query.lastError().text()));
                    ok = false;
                    break;
                }
            }
        }

        if (ok) {
            qCDebug(cutlineSqlExecutor, "Connection created: %s", qPrintable(name));
            return database;
        }
        database.close();
    }

    QSqlDatabase::removeDatabase(name);
    return QSqlDatabase();
}

void SqlExecutor::closeConnection(const QString& connectionName)
{
    if (connectionName.isEmpty() || !QSqlDatabase::contains(connectionName)) {
        return;
    }

    {
        QSqlDatabase database = QSqlDatabase::database(connectionName, false);
        database.close();
    }
    QSqlDatabase::removeDatabase(connectionName);
    qCDebug(cutlineSqlExecutor, "Connection closed: %s", qPrintable(connectionName));
}

QString SqlExecutor::loadScriptFromFile(const QString& scriptPath)
{
    QFile file(scriptPath);

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCCritical(cutlineSqlExecutor, "Failed to open SQL script: %s", qPrintable(scriptPath));
        return QString();
    }

    QTextStream stream(&file);
    QString script = stream.readAll();

    if (script.isEmpty()) {
        qCWarning(cutlineSqlExecutor, "Empty SQL script: %s", qPrintable(scriptPath));
    }

    return script;
}

QStringList SqlExecutor::parseStatementsFromScript(const QString& script)
{
    qCDebug(cutlineSqlExecutor, "Parsing SQL script with %lld characters", static_cast<long long>(script.length()));

    QStringList cleanStatements;
    QString currentStatement;
    const QStringList lines = script.split('\n');
    bool inTrigger = false;
    int blockDepth = 0;

    for (const QString& line : lines) {
        QString trimmedLine = line.trimmed();

        // Skip empty lines and full-line comments
        if (trimmedLine.isEmpty() || trimmedLine.startsWith("--")) {
            continue;
        }

        // Remove inline comments (-- comment)
        int commentPos = trimmedLine.indexOf("--");
        if (commentPos >= 0) {
            trimmedLine = trimmedLine.left(commentPos).trimmed();
            if (trimmedLine.isEmpty()) {
                continue;
            }
        }

        // Journal mode cannot change inside a transaction; connections set it
        const QString upperLine = trimmedLine.toUpper();
        if (upperLine.startsWith("PRAGMA JOURNAL_MODE") || upperLine.startsWith("PRAGMA SYNCHRONOUS")) {
            qCDebug(cutlineSqlExecutor, "Skipping pragma in transaction: %s", qPrintable(trimmedLine));
            continue;
        }

        if (currentStatement.isEmpty()) {
            currentStatement = trimmedLine;
        } else {
            currentStatement += " " + trimmedLine;
        }

        if (!inTrigger && currentStatement.toUpper().startsWith("CREATE TRIGGER")) {
            inTrigger = true;
        }

        // CASE ... END inside a trigger body closes with END, not END;
        if (inTrigger) {
            if (upperLine == "BEGIN" || upperLine.endsWith(" BEGIN")) {
                blockDepth++;
            } else if (upperLine == "END" || upperLine == "END;") {
                blockDepth--;
            }
        }

        if (trimmedLine.endsWith(';') && (!inTrigger || blockDepth <= 0)) {
            const QString completeStatement = currentStatement.trimmed();
            if (!completeStatement.isEmpty()) {
                qCDebug(cutlineSqlExecutor, "Adding statement: %s", qPrintable(completeStatement.left(50) + "..."));
                cleanStatements.append(completeStatement);
            }
            currentStatement.clear();
            inTrigger = false;
            blockDepth = 0;
        }
    }

    // Handle any remaining statement without semicolon
    if (!currentStatement.trimmed().isEmpty()) {
        cleanStatements.append(currentStatement.trimmed());
    }

    qCDebug(cutlineSqlExecutor, "Parsed %lld SQL statements", static_cast<long long>(cleanStatements.size()));
    return cleanStatements;
}

bool SqlExecutor::executeStatementBatch(QSqlDatabase& database, const QStringList& statements)
{
    QSqlQuery query(database);

    for (int i = 0; i < statements.size(); ++i) {
        const QString& statement = statements[i];
        qCDebug(cutlineSqlExecutor, "Statement %d: %s", (i + 1), qPrintable(statement.left(50) + "..."));

        if (!query.exec(statement)) {
            qCCritical(cutlineSqlExecutor, "SQL execution failed: %s Full Statement: %s",
                       qPrintable(query.lastError().text()), qPrintable(statement));
            return false;
        }
    }

    return true;
}

QString SqlExecutor::resolveMigrationPath(int version)
{
    if (version == schema::INITIAL_SCHEMA_VERSION) {
        // Check resource path first, then development path
        if (QFile::exists(schema::RESOURCE_SCHEMA_PATH)) {
            return schema::RESOURCE_SCHEMA_PATH;
        }
        if (QFile::exists(schema::DEV_SCHEMA_PATH)) {
            return schema::DEV_SCHEMA_PATH;
        }
        return QString();
    }

    QString resourcePath = QString(schema::MIGRATION_RESOURCE_PATTERN).arg(version);
    if (QFile::exists(resourcePath)) {
        return resourcePath;
    }

    QString devPath = QString(schema::MIGRATION_DEV_PATTERN).arg(version);
    if (QFile::exists(devPath)) {
        return devPath;
    }

    return QString();
}

QString SqlExecutor::generateConnectionName()
{
    return QString(schema::CONNECTION_PREFIX) + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace cutline
