#pragma once

#include "cutline/result.hpp"
#include "../assets/asset_fetcher.h"
#include "../common/worker_config.h"
#include "../models/execution_plan.h"
#include "../models/job.h"
#include "../persistence/job_store.h"
#include "../render/plan_compiler.h"
#include "encoder_process.h"
#include "watchdog.h"

#include <QObject>
#include <QString>
#include <QTimer>
#include <optional>

namespace cutline {

/**
 * Single-job render worker
 *
 * Claims one job at a time and drives it to exactly one terminal write:
 * preparing → downloading → encoding → finalizing → done, or failed from any
 * of them. The watchdog only signals; this class owns the in-flight job and
 * is the only writer of its outcome.
 */
class RenderWorker : public QObject
{
    Q_OBJECT

public:
    explicit RenderWorker(const WorkerConfig& config, QObject* parent = nullptr);
    ~RenderWorker() override;

    /**
     * Open the store, fail orphans of a previous run, then start polling
     * Algorithm: Open store → Recover orphans → Schedule first poll
     */
    Result<void> start();

    // Stop scheduling polls; a job in flight still finishes
    void stop();

    /**
     * Claim and run at most one job
     * Returns true when a job was processed.
     */
    bool pollOnce();

    bool isRunning() const { return m_running; }
    QString inFlightJobId() const { return m_inFlightJobId; }
    int recoveredOrphans() const { return m_recoveredOrphans; }

    JobStore& store() { return m_store; }
    const WorkerConfig& config() const { return m_config; }

signals:
    void jobClaimed(const QString& jobId);
    void stateChanged(const QString& jobId, cutline::JobState state);
    void progressChanged(const QString& jobId, int percent);
    void jobFinished(const QString& jobId, cutline::JobState state);

private slots:
    void onPollTimer();
    void onWatchdogExpired(const QString& jobId, const QString& reason);
    void onEncoderProgress(int percent);

private:
    void runPipeline(const Job& job);
    Result<JobOutput, JobError> executeStages(const Job& job);

    std::optional<JobError> enterState(const QString& jobId, JobState state, JobErrorCode failureCode);
    Result<JobOutput, JobError> finalizeOutput(const QString& outputPath, const ExecutionPlan& plan);

    WorkerConfig m_config;
    JobStore m_store;
    AssetFetcher m_fetcher;
    PlanCompiler m_compiler;
    EncoderProcess m_encoder;
    Watchdog m_watchdog;
    QTimer m_pollTimer;

    bool m_running = false;
    int m_recoveredOrphans = 0;
    QString m_inFlightJobId;
    std::optional<JobError> m_timeout;
};

} // namespace cutline
