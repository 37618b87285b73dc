#pragma once

#include <QString>
#include <QSqlDatabase>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(cutlineMigrations)

namespace cutline {

/**
 * Database migration system for the job database
 * Single responsibility: bring a connection to CURRENT_SCHEMA_VERSION or refuse it
 */
class Migrations
{
public:
    /**
     * Apply all pending migrations to database
     * Algorithm: Validate connection → Check versions → Apply updates → Verify results
     * Empty database: schema.sql, then every later migration in order.
     * Newer database than this binary: refused.
     * Pending versions are applied under one BEGIN IMMEDIATE write lock, so
     * processes opening the same fresh file concurrently apply each version once.
     */
    static bool applyMigrations(QSqlDatabase& database);

    // Version information for migration planning
    struct VersionInfo {
        int current = 0;
        int target = 0;
        bool upgradeNeeded = false;
        bool isDowngrade = false;
    };

    static VersionInfo determineVersionUpgrade(const QSqlDatabase& database);

private:
    static bool validateDatabaseConnection(const QSqlDatabase& database);
    static bool applyPendingMigrationsLocked(QSqlDatabase& database);
    static bool applyMigrationsInSequence(QSqlDatabase& database, int fromVersion, int toVersion);
};

} // namespace cutline
