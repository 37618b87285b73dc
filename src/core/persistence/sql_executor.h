#pragma once

#include <QString>
#include <QStringList>
#include <QSqlDatabase>

namespace cutline {

/**
 * SQL script execution utilities
 * Handles script loading, statement splitting and connection setup
 */
class SqlExecutor
{
public:
    /**
     * Execute SQL script from file or resource path in one transaction
     * Algorithm: Load file → Parse statements → Execute batch → Commit or roll back
     * With ownTransaction false the caller already holds an open transaction
     * and decides whether it commits.
     */
    static bool executeSqlScript(QSqlDatabase& database, const QString& scriptPath,
                                 bool ownTransaction = true);

    /**
     * Apply specific migration version
     * Algorithm: Resolve path → Load script → Execute → Log result
     */
    static bool applyMigrationVersion(QSqlDatabase& database, int version, bool ownTransaction = true);

    /**
     * Open a SQLite connection configured for concurrent workers
     * Algorithm: Register name → Open → WAL + busy timeout → Verify
     * Returns an invalid QSqlDatabase on failure; the name is not left registered.
     */
    static QSqlDatabase createConnection(const QString& databasePath,
                                         const QString& connectionName = QString());

    /**
     * Close and unregister a connection created by createConnection
     */
    static void closeConnection(const QString& connectionName);

    /**
     * Split a script into executable statements
     * Comments are dropped and CREATE TRIGGER bodies stay in one statement.
     */
    static QStringList parseStatementsFromScript(const QString& script);

private:
    static QString loadScriptFromFile(const QString& scriptPath);
    static bool executeStatementBatch(QSqlDatabase& database, const QStringList& statements);
    static QString resolveMigrationPath(int version);
    static QString generateConnectionName();
};

} // namespace cutline
