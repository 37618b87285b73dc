#include "render_worker.h"
#include "../render/encoder_error_parser.h"

#include <media_probe/probe.h>

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cutlineWorker, "cutline.worker")

namespace cutline {

RenderWorker::RenderWorker(const WorkerConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_store(config.databasePath)
    , m_fetcher(config.tempDir, config.downloadTimeoutMs)
    , m_compiler(config.encoderProgram)
    , m_watchdog(config.watchdogIntervalMs, config.maxRuntimeMs, config.stallTimeoutMs)
{
    if (m_config.workerOwner.isEmpty()) {
        m_config.workerOwner = WorkerConfig::defaultWorkerOwner();
    }

    m_pollTimer.setSingleShot(true);
    connect(&m_pollTimer, &QTimer::timeout, this, &RenderWorker::onPollTimer);
    connect(&m_watchdog, &Watchdog::expired, this, &RenderWorker::onWatchdogExpired);
    connect(&m_encoder, &EncoderProcess::progressChanged, this, &RenderWorker::onEncoderProgress);
    connect(&m_encoder, &EncoderProcess::outputActivity, &m_watchdog, &Watchdog::noteActivity);
}

RenderWorker::~RenderWorker()
{
    stop();
}

Result<void> RenderWorker::start()
{
    if (m_running) {
        return Result<void>();
    }

    // Algorithm: Open store → Recover orphans → Schedule first poll
    Result<void> opened = m_store.open();
    if (opened.is_error()) {
        qCCritical(cutlineWorker, "Cannot open job store: %s", opened.error().message.c_str());
        return opened;
    }

    Result<int> recovered = m_store.recoverOrphans();
    if (recovered.is_error()) {
        qCCritical(cutlineWorker, "Orphan recovery failed: %s", recovered.error().message.c_str());
        return recovered.error();
    }
    m_recoveredOrphans = recovered.value();

    m_running = true;
    m_pollTimer.start(0);
    qCInfo(cutlineWorker, "Worker %s started (poll %dms, ceiling %lldms, %d orphan(s) recovered)",
           qPrintable(m_config.workerOwner), m_config.pollIntervalMs,
           static_cast<long long>(m_config.maxRuntimeMs), m_recoveredOrphans);
    return Result<void>();
}

void RenderWorker::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;
    m_pollTimer.stop();
    qCInfo(cutlineWorker, "Worker %s stopping", qPrintable(m_config.workerOwner));
}

void RenderWorker::onPollTimer()
{
    if (!m_running) {
        return;
    }

    const bool processed = pollOnce();

    // A finished job means the queue may hold more; poll again immediately
    if (m_running) {
        m_pollTimer.start(processed ? 0 : m_config.pollIntervalMs);
    }
}

bool RenderWorker::pollOnce()
{
    if (!m_inFlightJobId.isEmpty()) {
        return false;
    }

    if (!m_store.isOpen()) {
        Result<void> opened = m_store.open();
        if (opened.is_error()) {
            qCWarning(cutlineWorker, "Poll skipped: %s", opened.error().message.c_str());
            return false;
        }
    }

    Result<std::optional<Job>> claimed = m_store.claimNext(m_config.workerOwner);
    if (claimed.is_error()) {
        qCWarning(cutlineWorker, "Claim failed, retrying next tick: %s", claimed.error().message.c_str());
        return false;
    }
    if (!claimed.value()) {
        return false;
    }

    runPipeline(*claimed.value());
    return true;
}

void RenderWorker::runPipeline(const Job& job)
{
    const QString jobId = job.id();
    m_inFlightJobId = jobId;
    m_timeout.reset();
    m_watchdog.arm(jobId);

    qCInfo(cutlineWorker, "Job %s claimed", qPrintable(jobId));
    emit jobClaimed(jobId);
    emit stateChanged(jobId, JobState::Preparing);

    Result<JobOutput, JobError> outcome = executeStages(job);
    m_watchdog.disarm();

    // A recorded timeout wins over whatever the interrupted stage reported
    JobState finalState = JobState::Done;
    Result<bool> written = false;
    if (m_timeout) {
        finalState = JobState::Failed;
        written = m_store.markFail(jobId, *m_timeout);
        qCWarning(cutlineWorker, "Job %s failed: %s (%s)", qPrintable(jobId),
                  qPrintable(jobErrorCodeToString(m_timeout->code)), qPrintable(m_timeout->message));
    } else if (outcome.is_error()) {
        finalState = JobState::Failed;
        written = m_store.markFail(jobId, outcome.error());
        qCWarning(cutlineWorker, "Job %s failed: %s (%s)", qPrintable(jobId),
                  qPrintable(jobErrorCodeToString(outcome.error().code)), qPrintable(outcome.error().message));
    } else {
        written = m_store.markDone(jobId, outcome.value());
        qCInfo(cutlineWorker, "Job %s done: %s", qPrintable(jobId), qPrintable(outcome.value().outputUrl));
    }

    if (written.is_error()) {
        qCCritical(cutlineWorker, "Terminal write for %s failed: %s", qPrintable(jobId), written.error().message.c_str());
    } else if (!written.value()) {
        qCWarning(cutlineWorker, "Job %s was already terminal; outcome discarded", qPrintable(jobId));
    }

    m_inFlightJobId.clear();
    m_timeout.reset();
    emit jobFinished(jobId, finalState);
}

Result<JobOutput, JobError> RenderWorker::executeStages(const Job& job)
{
    const QString jobId = job.id();

    // preparing
    Result<ExecutionPlan, JobError> parsed =
        ExecutionPlan::fromJobInput(job.input(), m_config.defaultWidth, m_config.defaultHeight);
    if (parsed.is_error()) {
        return parsed.error();
    }
    const ExecutionPlan& plan = parsed.value();

    // downloading
    if (std::optional<JobError> error = enterState(jobId, JobState::Downloading, JobErrorCode::AssetDownload)) {
        return *error;
    }
    Result<QHash<QString, QString>, JobError> resolved = m_fetcher.resolve(jobAssetUrls(job.input(), plan));
    if (m_timeout) {
        return *m_timeout;
    }
    if (resolved.is_error()) {
        return resolved.error();
    }

    // encoding
    if (std::optional<JobError> error = enterState(jobId, JobState::Encoding, JobErrorCode::EncoderExec)) {
        return *error;
    }

    const QString outputPath = QDir(m_config.outputDir).filePath(jobId + ".mp4");
    Result<EncoderCommand, JobError> command = m_compiler.compile(plan, resolved.value(), outputPath);
    if (command.is_error()) {
        return command.error();
    }

    if (!QDir().mkpath(m_config.outputDir)) {
        return JobError::encoderSpawn(QString("cannot create output directory %1").arg(m_config.outputDir));
    }

    m_watchdog.setStallTrackingEnabled(true);
    const EncoderRun run = m_encoder.run(command.value(), PlanCompiler::expectedDurationMs(plan));
    m_watchdog.setStallTrackingEnabled(false);

    if (m_timeout) {
        return *m_timeout;
    }
    if (run.outcome == EncoderRun::Outcome::FailedToStart) {
        return JobError::encoderSpawn(QString("cannot start %1: %2").arg(command.value().program, run.startError));
    }
    if (!run.succeeded()) {
        const EncoderDiagnosis diagnosis = EncoderErrorParser::classify(run.outputTail);
        const QString how = run.outcome == EncoderRun::Outcome::Crashed
            ? QStringLiteral("encoder crashed")
            : QString("encoder exited with code %1").arg(run.exitCode);
        return JobError::encoderExec(QString("%1: %2").arg(how, diagnosis.summary), diagnosis.toJson());
    }

    // finalizing
    if (std::optional<JobError> error = enterState(jobId, JobState::Finalizing, JobErrorCode::EncoderExec)) {
        return *error;
    }
    return finalizeOutput(outputPath, plan);
}

std::optional<JobError> RenderWorker::enterState(const QString& jobId, JobState state, JobErrorCode failureCode)
{
    if (m_timeout) {
        return m_timeout;
    }

    Result<void> advanced = m_store.advanceState(jobId, state);
    if (advanced.is_error()) {
        const QString message = QString("cannot enter %1: %2")
                                    .arg(jobStateToString(state), QString::fromStdString(advanced.error().message));
        return JobError{failureCode, message, {}};
    }

    qCInfo(cutlineWorker, "Job %s -> %s", qPrintable(jobId), qPrintable(jobStateToString(state)));
    emit stateChanged(jobId, state);
    return std::nullopt;
}

Result<JobOutput, JobError> RenderWorker::finalizeOutput(const QString& outputPath, const ExecutionPlan& plan)
{
    const QFileInfo info(outputPath);
    if (!info.exists() || info.size() <= 0) {
        return JobError::encoderExec(QString("encoder reported success but %1 is missing or empty").arg(outputPath));
    }

    JobOutput output;
    output.outputPath = info.absoluteFilePath();
    output.outputUrl = QString("%1/%2").arg(m_config.publicUrlPrefix, info.fileName());
    output.fileSize = info.size();

    Result<media::MediaInfo, media::ProbeError> probed = media::probe(outputPath.toStdString());
    if (probed.is_ok() && probed.value().duration_us > 0) {
        output.durationMs = probed.value().duration_ms();
    } else {
        output.durationMs = PlanCompiler::expectedDurationMs(plan);
        qCWarning(cutlineWorker, "Probe could not measure %s (%s); using planned duration %lldms",
                  qPrintable(outputPath),
                  probed.is_error() ? probed.error().message.c_str() : "no duration",
                  static_cast<long long>(output.durationMs));
    }
    return output;
}

void RenderWorker::onWatchdogExpired(const QString& jobId, const QString& reason)
{
    // A late signal for a job that already finished is stale
    if (jobId != m_inFlightJobId || m_timeout) {
        qCDebug(cutlineWorker, "Ignoring watchdog signal for %s", qPrintable(jobId));
        return;
    }

    m_timeout = JobError::timeout(reason);
    m_encoder.kill();
    m_fetcher.abort();
}

void RenderWorker::onEncoderProgress(int percent)
{
    if (m_inFlightJobId.isEmpty()) {
        return;
    }

    Result<void> written = m_store.updateProgress(m_inFlightJobId, percent);
    if (written.is_error()) {
        qCWarning(cutlineWorker, "Progress write for %s failed: %s",
                  qPrintable(m_inFlightJobId), written.error().message.c_str());
        return;
    }
    emit progressChanged(m_inFlightJobId, percent);
}

} // namespace cutline
