#pragma once

#include <QString>
#include <QSqlDatabase>

namespace cutline {

/**
 * Schema validation utilities
 * Checks the tables and triggers the job store depends on
 */
class SchemaValidator
{
public:
    /**
     * Validate database schema completeness
     * Algorithm: Check tables → Check triggers → Report journal mode
     */
    static bool validateSchema(const QSqlDatabase& database);

    /**
     * Get current schema version from database
     * Algorithm: Check table exists → Query max version → Return result
     * Returns 0 for an empty database.
     */
    static int getCurrentSchemaVersion(const QSqlDatabase& database);

    /**
     * Current journal mode, upper-cased (WAL for file databases)
     */
    static QString journalMode(const QSqlDatabase& database);

private:
    static bool checkRequiredTablesExist(const QSqlDatabase& database);
    static bool checkRequiredTriggersExist(const QSqlDatabase& database);
};

} // namespace cutline
