#pragma once

#include "cutline/result.hpp"
#include "../models/job.h"

#include <QString>
#include <QVector>
#include <QSqlDatabase>
#include <optional>

namespace cutline {

/**
 * Durable job table on SQLite
 *
 * One store owns one named connection and must be used from the thread that
 * opened it. Processes and threads coordinate only through conditional
 * UPDATEs: a claim or terminal write succeeds iff it changed exactly one row.
 */
class JobStore
{
public:
    explicit JobStore(const QString& databasePath);
    ~JobStore();

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /**
     * Open the connection and bring the schema to the current version
     * Algorithm: Create connection → Apply migrations → Validate
     */
    Result<void> open();
    void close();
    bool isOpen() const;

    QString databasePath() const { return m_databasePath; }
    QSqlDatabase database() const;

    /**
     * Insert a new queued row; created_at is stamped here
     * Returns the row as stored.
     */
    Result<Job> insert(const Job& job);

    Result<Job> get(const QString& id);

    /**
     * Claim the earliest inserted queued job (lowest seq) for workerOwner
     * Algorithm: Select candidates → Conditional UPDATE each → First affected row wins
     * Empty optional means the queue is empty.
     */
    Result<std::optional<Job>> claimNext(const QString& workerOwner);

    /**
     * Move a claimed job forward through preparing/downloading/encoding/finalizing
     * Re-applying the current state is a no-op. queued, done and failed are
     * rejected, as is any backwards move or a write to a terminal row.
     */
    Result<void> advanceState(const QString& id, JobState state);

    /**
     * Best-effort progress write; only increases, only while encoding
     */
    Result<void> updateProgress(const QString& id, int pct);

    /**
     * Terminal writes. First writer wins: value() is false when the row was
     * already terminal and nothing changed.
     */
    Result<bool> markDone(const QString& id, const JobOutput& output);
    Result<bool> markFail(const QString& id, const JobError& error);

    /**
     * Fail every claimed, non-terminal row with SystemRestart in one transaction
     * Returns the number of rows failed.
     */
    Result<int> recoverOrphans();

    // Newest insert first, by seq
    Result<QVector<Job>> listJobs(int limit);

private:
    Result<bool> applyTerminalWrite(const QString& id, JobState state,
                                    const QString& outputJson, const QString& errorJson);

    QString m_databasePath;
    QString m_connectionName;
};

} // namespace cutline
