#include "job_store.h"
#include "migrations.h"
#include "sql_executor.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>

Q_LOGGING_CATEGORY(cutlineStore, "cutline.store")

namespace cutline {

namespace {

const char* const JOB_COLUMNS =
    "id, state, input_json, progress_pct, output_json, error_json, "
    "created_at, started_at, completed_at, worker_owner, variation_id, project_id";

// Candidates examined per claim round; losers move on to the next one
const int CLAIM_BATCH = 8;

qint64 nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

QString compactJson(const QJsonObject& object)
{
    return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
}

StoreError queryError(const QSqlQuery& query, const QString& context)
{
    const QString message = QString("%1: %2").arg(context, query.lastError().text());
    qCWarning(cutlineStore, "%s", qPrintable(message));
    return StoreError::database(message.toStdString());
}

QString quotedStates(const QVector<JobState>& states)
{
    QStringList quoted;
    for (JobState state : states) {
        quoted << QString("'%1'").arg(jobStateToString(state));
    }
    return quoted.join(", ");
}

const QVector<JobState>& inFlightStates()
{
    static const QVector<JobState> states = {
        JobState::Preparing, JobState::Downloading, JobState::Encoding, JobState::Finalizing
    };
    return states;
}

} // namespace

JobStore::JobStore(const QString& databasePath)
    : m_databasePath(databasePath)
{
}

JobStore::~JobStore()
{
    close();
}

Result<void> JobStore::open()
{
    if (isOpen()) {
        return Result<void>();
    }

    // Algorithm: Create connection → Apply migrations → Validate
    if (m_databasePath != ":memory:") {
        QDir().mkpath(QFileInfo(m_databasePath).absolutePath());
    }

    QSqlDatabase db = SqlExecutor::createConnection(m_databasePath);
    if (!db.isValid() || !db.isOpen()) {
        return StoreError::database("cannot open database " + m_databasePath.toStdString());
    }
    m_connectionName = db.connectionName();

    if (!Migrations::applyMigrations(db)) {
        db = QSqlDatabase();
        close();
        return StoreError::database("schema migration failed for " + m_databasePath.toStdString());
    }

    qCInfo(cutlineStore, "Job store open: %s", qPrintable(m_databasePath));
    return Result<void>();
}

void JobStore::close()
{
    if (m_connectionName.isEmpty()) {
        return;
    }
    SqlExecutor::closeConnection(m_connectionName);
    m_connectionName.clear();
}

bool JobStore::isOpen() const
{
    return !m_connectionName.isEmpty() && QSqlDatabase::database(m_connectionName, false).isOpen();
}

QSqlDatabase JobStore::database() const
{
    return QSqlDatabase::database(m_connectionName, false);
}

Result<Job> JobStore::insert(const Job& job)
{
    if (!job.isValid()) {
        return StoreError::database("cannot insert a job without an id");
    }

    QSqlDatabase db = database();
    QSqlQuery query(db);
    query.prepare(
        "INSERT INTO jobs (id, state, input_json, progress_pct, created_at, variation_id, project_id) "
        "VALUES (?, 'queued', ?, 0, ?, ?, ?)");
    query.addBindValue(job.id());
    query.addBindValue(compactJson(job.input()));
    query.addBindValue(nowMs());
    query.addBindValue(job.variationId().isEmpty() ? QVariant() : QVariant(job.variationId()));
    query.addBindValue(job.projectId().isEmpty() ? QVariant() : QVariant(job.projectId()));

    if (!query.exec()) {
        const QString context = QString("insert %1").arg(job.id());
        Result<Job> existing = get(job.id());
        if (existing.is_ok()) {
            qCWarning(cutlineStore, "Duplicate job id: %s", qPrintable(job.id()));
            return StoreError::duplicate_id(job.id().toStdString());
        }
        return queryError(query, context);
    }

    qCInfo(cutlineStore, "Job %s queued", qPrintable(job.id()));
    return get(job.id());
}

Result<Job> JobStore::get(const QString& id)
{
    QSqlDatabase db = database();
    QSqlQuery query(db);
    query.prepare(QString("SELECT %1 FROM jobs WHERE id = ?").arg(JOB_COLUMNS));
    query.addBindValue(id);

    if (!query.exec()) {
        return queryError(query, QString("get %1").arg(id));
    }
    if (!query.next()) {
        return StoreError::not_found(id.toStdString());
    }
    return Job::fromQuery(query);
}

Result<std::optional<Job>> JobStore::claimNext(const QString& workerOwner)
{
    QSqlDatabase db = database();

    // Algorithm: Select candidates → Conditional UPDATE each → First affected row wins
    for (;;) {
        QStringList candidates;
        {
            QSqlQuery select(db);
            select.prepare("SELECT id FROM jobs WHERE state = 'queued' ORDER BY seq ASC LIMIT ?");
            select.addBindValue(CLAIM_BATCH);
            if (!select.exec()) {
                return queryError(select, "select claim candidates");
            }
            while (select.next()) {
                candidates << select.value(0).toString();
            }
            // Release the read snapshot before writing
            select.finish();
        }

        if (candidates.isEmpty()) {
            return std::optional<Job>();
        }

        for (const QString& candidate : candidates) {
            QSqlQuery update(db);
            update.prepare(
                "UPDATE jobs SET state = 'preparing', worker_owner = ?, "
                "started_at = COALESCE(started_at, ?) "
                "WHERE id = ? AND state = 'queued'");
            update.addBindValue(workerOwner);
            update.addBindValue(nowMs());
            update.addBindValue(candidate);

            if (!update.exec()) {
                return queryError(update, QString("claim %1").arg(candidate));
            }
            if (update.numRowsAffected() != 1) {
                qCDebug(cutlineStore, "Lost claim race for %s", qPrintable(candidate));
                continue;
            }

            Result<Job> claimed = get(candidate);
            if (claimed.is_error()) {
                return claimed.error();
            }
            qCInfo(cutlineStore, "Job %s claimed by %s", qPrintable(candidate), qPrintable(workerOwner));
            return std::optional<Job>(claimed.value());
        }
    }
}

Result<void> JobStore::advanceState(const QString& id, JobState state)
{
    if (state == JobState::Queued || isTerminalState(state)) {
        return StoreError::invalid_transition(
            "advanceState cannot write " + jobStateToString(state).toStdString());
    }

    // Allowed sources: claimed states at or before the target
    QVector<JobState> allowed;
    for (JobState candidate : inFlightStates()) {
        if (static_cast<int>(candidate) <= static_cast<int>(state)) {
            allowed << candidate;
        }
    }

    QSqlDatabase db = database();
    QSqlQuery query(db);
    query.prepare(QString("UPDATE jobs SET state = ? WHERE id = ? AND state IN (%1)").arg(quotedStates(allowed)));
    query.addBindValue(jobStateToString(state));
    query.addBindValue(id);

    if (!query.exec()) {
        return queryError(query, QString("advance %1").arg(id));
    }
    if (query.numRowsAffected() == 1) {
        qCInfo(cutlineStore, "Job %s -> %s", qPrintable(id), qPrintable(jobStateToString(state)));
        return Result<void>();
    }

    Result<Job> current = get(id);
    if (current.is_error()) {
        return current.error();
    }
    return StoreError::invalid_transition(
        QString("job %1 cannot move from %2 to %3")
            .arg(id, jobStateToString(current.value().state()), jobStateToString(state))
            .toStdString());
}

Result<void> JobStore::updateProgress(const QString& id, int pct)
{
    const int clamped = qBound(0, pct, 100);

    QSqlDatabase db = database();
    QSqlQuery query(db);
    query.prepare("UPDATE jobs SET progress_pct = ? WHERE id = ? AND state = 'encoding' AND progress_pct < ?");
    query.addBindValue(clamped);
    query.addBindValue(id);
    query.addBindValue(clamped);

    if (!query.exec()) {
        return queryError(query, QString("progress %1").arg(id));
    }
    return Result<void>();
}

Result<bool> JobStore::markDone(const QString& id, const JobOutput& output)
{
    return applyTerminalWrite(id, JobState::Done, compactJson(output.toJson()), QString());
}

Result<bool> JobStore::markFail(const QString& id, const JobError& error)
{
    return applyTerminalWrite(id, JobState::Failed, QString(), compactJson(error.toJson()));
}

Result<bool> JobStore::applyTerminalWrite(const QString& id, JobState state,
                                          const QString& outputJson, const QString& errorJson)
{
    QSqlDatabase db = database();
    QSqlQuery query(db);
    query.prepare(
        "UPDATE jobs SET state = ?, output_json = ?, error_json = ?, "
        "progress_pct = CASE WHEN ? THEN 100 ELSE progress_pct END, "
        "completed_at = ?, worker_owner = NULL "
        "WHERE id = ? AND state NOT IN ('done', 'failed')");
    query.addBindValue(jobStateToString(state));
    query.addBindValue(outputJson.isEmpty() ? QVariant() : QVariant(outputJson));
    query.addBindValue(errorJson.isEmpty() ? QVariant() : QVariant(errorJson));
    query.addBindValue(state == JobState::Done ? 1 : 0);
    query.addBindValue(nowMs());
    query.addBindValue(id);

    if (!query.exec()) {
        return queryError(query, QString("terminal write %1").arg(id));
    }
    if (query.numRowsAffected() == 1) {
        qCInfo(cutlineStore, "Job %s is %s", qPrintable(id), qPrintable(jobStateToString(state)));
        return true;
    }

    Result<Job> current = get(id);
    if (current.is_error()) {
        return current.error();
    }
    qCInfo(cutlineStore, "Terminal write to %s ignored; already %s",
           qPrintable(id), qPrintable(jobStateToString(current.value().state())));
    return false;
}

Result<int> JobStore::recoverOrphans()
{
    QSqlDatabase db = database();
    if (!db.transaction()) {
        return StoreError::database("recoverOrphans: " + db.lastError().text().toStdString());
    }

    QSqlQuery query(db);
    query.prepare(QString(
        "UPDATE jobs SET state = 'failed', error_json = ?, output_json = NULL, "
        "completed_at = ?, worker_owner = NULL WHERE state IN (%1)").arg(quotedStates(inFlightStates())));
    query.addBindValue(compactJson(JobError::systemRestart().toJson()));
    query.addBindValue(nowMs());

    if (!query.exec()) {
        StoreError error = queryError(query, "recoverOrphans");
        query.finish();
        db.rollback();
        return error;
    }
    const int count = query.numRowsAffected();
    query.finish();

    if (!db.commit()) {
        const std::string message = db.lastError().text().toStdString();
        db.rollback();
        return StoreError::database("recoverOrphans commit: " + message);
    }

    if (count > 0) {
        qCWarning(cutlineStore, "Recovered %d orphaned job(s) as failed", count);
    } else {
        qCDebug(cutlineStore, "No orphaned jobs");
    }
    return count;
}

Result<QVector<Job>> JobStore::listJobs(int limit)
{
    QSqlDatabase db = database();
    QSqlQuery query(db);
    query.prepare(QString("SELECT %1 FROM jobs ORDER BY seq DESC LIMIT ?").arg(JOB_COLUMNS));
    query.addBindValue(limit > 0 ? limit : -1);

    if (!query.exec()) {
        return queryError(query, "list jobs");
    }

    QVector<Job> jobs;
    while (query.next()) {
        jobs.append(Job::fromQuery(query));
    }
    return jobs;
}

} // namespace cutline
