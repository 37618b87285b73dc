#include "schema_validator.h"
#include "schema_constants.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cutlineSchemaValidator, "cutline.schema.validator")

namespace cutline {

bool SchemaValidator::validateSchema(const QSqlDatabase& database)
{
    qCDebug(cutlineSchemaValidator, "Validating database schema");

    // Algorithm: Check tables → Check triggers → Report journal mode
    if (!checkRequiredTablesExist(database)) {
        return false;
    }

    if (!checkRequiredTriggersExist(database)) {
        return false;
    }

    const QString mode = journalMode(database);
    if (mode != schema::WAL_JOURNAL_MODE) {
        // In-memory databases cannot use WAL
        qCDebug(cutlineSchemaValidator, "Journal mode: %s", qPrintable(mode));
    }

    qCDebug(cutlineSchemaValidator, "Schema validation successful");
    return true;
}

int SchemaValidator::getCurrentSchemaVersion(const QSqlDatabase& database)
{
    // Algorithm: Check table exists → Query max version → Return result
    QSqlQuery query(database);

    if (!query.exec(schema::CHECK_SCHEMA_TABLE)) {
        return 0;
    }

    if (!query.next()) {
        return 0; // No schema version table
    }

    if (!query.exec(schema::GET_MAX_VERSION)) {
        qCWarning(cutlineSchemaValidator, "Failed to query schema version: %s", qPrintable(query.lastError().text()));
        return 0;
    }

    if (query.next()) {
        return query.value(0).toInt();
    }

    return 0;
}

QString SchemaValidator::journalMode(const QSqlDatabase& database)
{
    QSqlQuery query(database);

    if (!query.exec(schema::CHECK_JOURNAL_MODE) || !query.next()) {
        qCWarning(cutlineSchemaValidator, "Failed to check journal mode");
        return QString();
    }

    return query.value(0).toString().toUpper();
}

bool SchemaValidator::checkRequiredTablesExist(const QSqlDatabase& database)
{
    const QStringList existingTables = database.tables();

    for (int i = 0; i < schema::REQUIRED_TABLES_COUNT; ++i) {
        const QString table = schema::REQUIRED_TABLES[i];
        if (!existingTables.contains(table)) {
            qCCritical(cutlineSchemaValidator, "Required table missing: %s", qPrintable(table));
            return false;
        }
    }

    return true;
}

bool SchemaValidator::checkRequiredTriggersExist(const QSqlDatabase& database)
{
    QSqlQuery query(database);
    query.prepare(schema::CHECK_TRIGGER);

    for (int i = 0; i < schema::REQUIRED_TRIGGERS_COUNT; ++i) {
        const QString trigger = schema::REQUIRED_TRIGGERS[i];
        query.bindValue(0, trigger);
        if (!query.exec()) {
            qCCritical(cutlineSchemaValidator, "Failed to look up trigger %s: %s",
                       qPrintable(trigger), qPrintable(query.lastError().text()));
            return false;
        }
        if (!query.next()) {
            qCCritical(cutlineSchemaValidator, "Required trigger missing: %s", qPrintable(trigger));
            return false;
        }
    }

    return true;
}

} // namespace cutline
