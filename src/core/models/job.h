#pragma once

#include <QString>
#include <QJsonObject>
#include <QMetaType>
#include <QSqlQuery>
#include <optional>

namespace cutline {

/**
 * Pipeline states in order. done and failed are terminal.
 */
enum class JobState {
    Queued,
    Preparing,
    Downloading,
    Encoding,
    Finalizing,
    Done,
    Failed
};

QString jobStateToString(JobState state);
std::optional<JobState> jobStateFromString(const QString& text);
bool isTerminalState(JobState state);

/**
 * Stable failure codes persisted in error_json
 */
enum class JobErrorCode {
    Validation,
    AssetDownload,
    EncoderSpawn,
    EncoderExec,
    Timeout,
    SystemRestart
};

QString jobErrorCodeToString(JobErrorCode code);
std::optional<JobErrorCode> jobErrorCodeFromString(const QString& text);

struct JobError {
    JobErrorCode code = JobErrorCode::EncoderExec;
    QString message;
    QJsonObject detail;

    static JobError validation(const QString& message) { return {JobErrorCode::Validation, message, {}}; }
    static JobError assetDownload(const QString& message) { return {JobErrorCode::AssetDownload, message, {}}; }
    static JobError encoderSpawn(const QString& message) { return {JobErrorCode::EncoderSpawn, message, {}}; }
    static JobError encoderExec(const QString& message, const QJsonObject& detail = {}) {
        return {JobErrorCode::EncoderExec, message, detail};
    }
    static JobError timeout(const QString& message) { return {JobErrorCode::Timeout, message, {}}; }
    static JobError systemRestart() {
        return {JobErrorCode::SystemRestart, QStringLiteral("Job failed due to system crash/restart"), {}};
    }

    QJsonObject toJson() const;
    static std::optional<JobError> fromJson(const QJsonObject& json);
};

struct JobOutput {
    QString outputPath;
    QString outputUrl;
    qint64 fileSize = 0;
    qint64 durationMs = 0;

    QJsonObject toJson() const;
    static JobOutput fromJson(const QJsonObject& json);
};

/**
 * Job entity - one render request and its lifecycle
 * Rows are written only through JobStore; this class is a value snapshot.
 */
class Job
{
public:
    Job() = default;

    /**
     * Create new queued job with generated ID
     * Algorithm: Generate UUID → Attach input → Default lifecycle fields
     */
    static Job create(const QJsonObject& input);

    /**
     * Create queued job with specific ID (for tests and replays)
     */
    static Job createWithId(const QString& id, const QJsonObject& input);

    /**
     * Construct from a row selected with JobStore's column list
     */
    static Job fromQuery(const QSqlQuery& query);

    QString id() const { return m_id; }
    JobState state() const { return m_state; }
    QJsonObject input() const { return m_input; }
    int progressPct() const { return m_progressPct; }

    const std::optional<JobOutput>& output() const { return m_output; }
    const std::optional<JobError>& error() const { return m_error; }

    qint64 createdAt() const { return m_createdAt; }
    qint64 startedAt() const { return m_startedAt; }
    qint64 completedAt() const { return m_completedAt; }
    QString workerOwner() const { return m_workerOwner; }

    QString variationId() const { return m_variationId; }
    QString projectId() const { return m_projectId; }
    void setVariationId(const QString& id) { m_variationId = id; }
    void setProjectId(const QString& id) { m_projectId = id; }

    bool isValid() const { return !m_id.isEmpty(); }
    bool isTerminal() const { return isTerminalState(m_state); }

    // Status document returned verbatim to pollers
    QJsonObject toJson() const;

private:
    QString m_id;
    JobState m_state = JobState::Queued;
    QJsonObject m_input;
    int m_progressPct = 0;
    std::optional<JobOutput> m_output;
    std::optional<JobError> m_error;
    qint64 m_createdAt = 0;
    qint64 m_startedAt = 0;
    qint64 m_completedAt = 0;
    QString m_workerOwner;
    QString m_variationId;
    QString m_projectId;
};

} // namespace cutline

Q_DECLARE_METATYPE(cutline::JobState)
