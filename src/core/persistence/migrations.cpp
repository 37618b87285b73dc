#include "migrations.h"
#include "schema_constants.h"
#include "schema_validator.h"
#include "sql_executor.h"

#include <QSqlError>
#include <QSqlQuery>

Q_LOGGING_CATEGORY(cutlineMigrations, "cutline.migrations")

namespace cutline {

bool Migrations::applyMigrations(QSqlDatabase& database)
{
    qCInfo(cutlineMigrations, "Applying migrations to %s", qPrintable(database.databaseName()));

    // Algorithm: Validate connection → Check versions → Apply updates → Verify results
    if (!validateDatabaseConnection(database)) {
        return false;
    }

    VersionInfo versions = determineVersionUpgrade(database);
    if (versions.isDowngrade) {
        qCCritical(cutlineMigrations, "Database version %d is newer than supported version %d",
                   versions.current, versions.target);
        return false;
    }

    if (versions.upgradeNeeded && !applyPendingMigrationsLocked(database)) {
        return false;
    }

    return SchemaValidator::validateSchema(database);
}

Migrations::VersionInfo Migrations::determineVersionUpgrade(const QSqlDatabase& database)
{
    VersionInfo info;
    info.current = SchemaValidator::getCurrentSchemaVersion(database);
    info.target = schema::CURRENT_SCHEMA_VERSION;

    qCDebug(cutlineMigrations, "Schema version: %d → %d", info.current, info.target);

    if (info.current > info.target) {
        info.isDowngrade = true;
    } else if (info.current < info.target) {
        info.upgradeNeeded = true;
    }

    return info;
}

bool Migrations::validateDatabaseConnection(const QSqlDatabase& database)
{
    if (!database.isOpen()) {
        qCCritical(cutlineMigrations, "Database not open for migrations");
        return false;
    }

    return true;
}

bool Migrations::applyPendingMigrationsLocked(QSqlDatabase& database)
{
    QSqlQuery lock(database);
    if (!lock.exec("BEGIN IMMEDIATE")) {
        qCCritical(cutlineMigrations, "Failed to lock database for migration: %s",
                   qPrintable(lock.lastError().text()));
        return false;
    }

    // Another opener may have migrated while this one waited for the lock
    const VersionInfo versions = determineVersionUpgrade(database);
    bool ok = true;
    if (versions.isDowngrade) {
        qCCritical(cutlineMigrations, "Database version %d is newer than supported version %d",
                   versions.current, versions.target);
        ok = false;
    } else if (versions.upgradeNeeded) {
        ok = applyMigrationsInSequence(database, versions.current + 1, versions.target);
    } else {
        qCDebug(cutlineMigrations, "Schema already current after acquiring lock");
    }

    if (ok && !lock.exec("COMMIT")) {
        qCCritical(cutlineMigrations, "Migration commit failed: %s", qPrintable(lock.lastError().text()));
        ok = false;
    }

    if (!ok) {
        QSqlQuery rollback(database);
        if (!rollback.exec("ROLLBACK")) {
            qCWarning(cutlineMigrations, "Migration rollback failed: %s",
                      qPrintable(rollback.lastError().text()));
        }
    }
    return ok;
}

bool Migrations::applyMigrationsInSequence(QSqlDatabase& database, int fromVersion, int toVersion)
{
    // Version 1 is the base schema script; each later version is its own file
    for (int version = qMax(fromVersion, schema::INITIAL_SCHEMA_VERSION); version <= toVersion; ++version) {
        if (!SqlExecutor::applyMigrationVersion(database, version, false)) {
            qCCritical(cutlineMigrations, "Migration stopped at version %d", version);
            return false;
        }
    }

    qCInfo(cutlineMigrations, "Database migrated to version %d", toVersion);
    return true;
}

} // namespace cutline
