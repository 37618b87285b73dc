#include "job.h"

#include <QUuid>
#include <QJsonDocument>
#include <QVariant>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cutlineJob, "cutline.models.job")

namespace cutline {

namespace {

QJsonObject parseObject(const QString& text, const char* column)
{
    if (text.isEmpty()) {
        return QJsonObject();
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(cutlineJob, "Invalid JSON in column %s: %s", column, qPrintable(error.errorString()));
        return QJsonObject();
    }
    return doc.object();
}

} // namespace

QString jobStateToString(JobState state)
{
    switch (state) {
    case JobState::Queued:      return QStringLiteral("queued");
    case JobState::Preparing:   return QStringLiteral("preparing");
    case JobState::Downloading: return QStringLiteral("downloading");
    case JobState::Encoding:    return QStringLiteral("encoding");
    case JobState::Finalizing:  return QStringLiteral("finalizing");
    case JobState::Done:        return QStringLiteral("done");
    case JobState::Failed:      return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

std::optional<JobState> jobStateFromString(const QString& text)
{
    static const JobState all[] = {
        JobState::Queued, JobState::Preparing, JobState::Downloading, JobState::Encoding,
        JobState::Finalizing, JobState::Done, JobState::Failed
    };
    for (JobState state : all) {
        if (jobStateToString(state) == text) {
            return state;
        }
    }
    return std::nullopt;
}

bool isTerminalState(JobState state)
{
    return state == JobState::Done || state == JobState::Failed;
}

QString jobErrorCodeToString(JobErrorCode code)
{
    switch (code) {
    case JobErrorCode::Validation:    return QStringLiteral("Validation");
    case JobErrorCode::AssetDownload: return QStringLiteral("AssetDownload");
    case JobErrorCode::EncoderSpawn:  return QStringLiteral("EncoderSpawn");
    case JobErrorCode::EncoderExec:   return QStringLiteral("EncoderExec");
    case JobErrorCode::Timeout:       return QStringLiteral("Timeout");
    case JobErrorCode::SystemRestart: return QStringLiteral("SystemRestart");
    }
    return QStringLiteral("Unknown");
}

std::optional<JobErrorCode> jobErrorCodeFromString(const QString& text)
{
    static const JobErrorCode all[] = {
        JobErrorCode::Validation, JobErrorCode::AssetDownload, JobErrorCode::EncoderSpawn,
        JobErrorCode::EncoderExec, JobErrorCode::Timeout, JobErrorCode::SystemRestart
    };
    for (JobErrorCode code : all) {
        if (jobErrorCodeToString(code) == text) {
            return code;
        }
    }
    return std::nullopt;
}

QJsonObject JobError::toJson() const
{
    QJsonObject json;
    json["code"] = jobErrorCodeToString(code);
    json["message"] = message;
    if (!detail.isEmpty()) {
        json["detail"] = detail;
    }
    return json;
}

std::optional<JobError> JobError::fromJson(const QJsonObject& json)
{
    std::optional<JobErrorCode> code = jobErrorCodeFromString(json.value("code").toString());
    if (!code) {
        return std::nullopt;
    }

    JobError error;
    error.code = *code;
    error.message = json.value("message").toString();
    error.detail = json.value("detail").toObject();
    return error;
}

QJsonObject JobOutput::toJson() const
{
    QJsonObject json;
    json["output_path"] = outputPath;
    json["output_url"] = outputUrl;
    json["file_size"] = fileSize;
    json["duration_ms"] = durationMs;
    return json;
}

JobOutput JobOutput::fromJson(const QJsonObject& json)
{
    JobOutput output;
    output.outputPath = json.value("output_path").toString();
    output.outputUrl = json.value("output_url").toString();
    output.fileSize = json.value("file_size").toVariant().toLongLong();
    output.durationMs = json.value("duration_ms").toVariant().toLongLong();
    return output;
}

Job Job::create(const QJsonObject& input)
{
    // Algorithm: Generate UUID → Attach input → Default lifecycle fields
    QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    return createWithId(id, input);
}

Job Job::createWithId(const QString& id, const QJsonObject& input)
{
    Job job;
    job.m_id = id;
    job.m_state = JobState::Queued;
    job.m_input = input;
    job.m_variationId = input.value("variation_id").toString();
    job.m_projectId = input.value("project_id").toString();

    qCDebug(cutlineJob, "Created job: %s", qPrintable(id));
    return job;
}

Job Job::fromQuery(const QSqlQuery& query)
{
    Job job;
    job.m_id = query.value("id").toString();

    const QString stateText = query.value("state").toString();
    std::optional<JobState> state = jobStateFromString(stateText);
    if (!state) {
        qCWarning(cutlineJob, "Unknown state '%s' for job %s", qPrintable(stateText), qPrintable(job.m_id));
    }
    job.m_state = state.value_or(JobState::Failed);

    job.m_input = parseObject(query.value("input_json").toString(), "input_json");
    job.m_progressPct = query.value("progress_pct").toInt();

    const QString outputText = query.value("output_json").toString();
    if (!outputText.isEmpty()) {
        job.m_output = JobOutput::fromJson(parseObject(outputText, "output_json"));
    }

    const QString errorText = query.value("error_json").toString();
    if (!errorText.isEmpty()) {
        job.m_error = JobError::fromJson(parseObject(errorText, "error_json"));
    }

    job.m_createdAt = query.value("created_at").toLongLong();
    job.m_startedAt = query.value("started_at").toLongLong();
    job.m_completedAt = query.value("completed_at").toLongLong();
    job.m_workerOwner = query.value("worker_owner").toString();
    job.m_variationId = query.value("variation_id").toString();
    job.m_projectId = query.value("project_id").toString();
    return job;
}

QJsonObject Job::toJson() const
{
    QJsonObject json;
    json["id"] = m_id;
    json["state"] = jobStateToString(m_state);
    json["progress_pct"] = m_progressPct;
    json["created_at"] = m_createdAt;
    json["started_at"] = m_startedAt > 0 ? QJsonValue(m_startedAt) : QJsonValue();
    json["completed_at"] = m_completedAt > 0 ? QJsonValue(m_completedAt) : QJsonValue();
    json["output"] = m_output ? QJsonValue(m_output->toJson()) : QJsonValue();
    json["error"] = m_error ? QJsonValue(m_error->toJson()) : QJsonValue();

    if (!m_workerOwner.isEmpty()) {
        json["worker_owner"] = m_workerOwner;
    }
    if (!m_variationId.isEmpty()) {
        json["variation_id"] = m_variationId;
    }
    if (!m_projectId.isEmpty()) {
        json["project_id"] = m_projectId;
    }
    return json;
}

} // namespace cutline
