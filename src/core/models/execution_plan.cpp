#include "execution_plan.h"

#include <QJsonArray>
#include <QJsonValue>
#include <QLoggingCategory>
#include <cmath>
#include <limits>

Q_LOGGING_CATEGORY(cutlinePlan, "cutline.plan")

namespace cutline {

namespace {

// Timeline fields above this cannot be summed or formatted safely (~31 years)
const qint64 MAX_TIME_MS = 1000000000000LL;
const qint64 MAX_INT_FIELD = std::numeric_limits<int>::max();

// Reads an integral millisecond/pixel field; absent fields use the fallback
bool readInteger(const QJsonObject& json, const char* key, qint64& out, bool required, QString& error,
                 qint64 maximum = MAX_TIME_MS)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        if (required) {
            error = QString("missing field '%1'").arg(key);
            return false;
        }
        return true;
    }
    if (!value.isDouble()) {
        error = QString("field '%1' must be a number").arg(key);
        return false;
    }
    const double number = value.toDouble();
    if (!std::isfinite(number) || number < 0) {
        error = QString("field '%1' must be a non-negative number").arg(key);
        return false;
    }
    if (number > static_cast<double>(maximum)) {
        error = QString("field '%1' must not exceed %2").arg(key).arg(maximum);
        return false;
    }
    out = static_cast<qint64>(std::llround(number));
    return true;
}

bool readString(const QJsonObject& json, const char* key, QString& out, bool required, QString& error)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        if (required) {
            error = QString("missing field '%1'").arg(key);
            return false;
        }
        return true;
    }
    if (!value.isString()) {
        error = QString("field '%1' must be a string").arg(key);
        return false;
    }
    out = value.toString();
    if (required && out.isEmpty()) {
        error = QString("field '%1' must not be empty").arg(key);
        return false;
    }
    return true;
}

// x/y accept either a number or an encoder expression
bool readPosition(const QJsonObject& json, const char* key, QString& out, QString& error)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (value.isDouble()) {
        out = QString::number(value.toDouble());
        return true;
    }
    if (value.isString() && !value.toString().isEmpty()) {
        out = value.toString();
        return true;
    }
    error = QString("field '%1' must be a number or expression").arg(key);
    return false;
}

bool readArray(const QJsonObject& json, const char* key, QJsonArray& out, QString& error)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isArray()) {
        error = QString("'%1' must be an array").arg(key);
        return false;
    }
    out = value.toArray();
    return true;
}

bool parseSegment(const QJsonValue& value, TimelineSegment& segment, QString& error)
{
    if (!value.isObject()) {
        error = "timeline entry must be an object";
        return false;
    }
    const QJsonObject json = value.toObject();
    return readString(json, "asset_url", segment.assetUrl, true, error)
        && readInteger(json, "trim_start_ms", segment.trimStartMs, true, error)
        && readInteger(json, "trim_end_ms", segment.trimEndMs, true, error);
}

bool parseAudioTrack(const QJsonValue& value, AudioTrack& track, QString& error)
{
    if (!value.isObject()) {
        error = "audio track must be an object";
        return false;
    }
    const QJsonObject json = value.toObject();
    if (!readString(json, "asset_url", track.assetUrl, true, error)
        || !readInteger(json, "trim_start_ms", track.trimStartMs, false, error)
        || !readInteger(json, "trim_end_ms", track.trimEndMs, false, error)
        || !readInteger(json, "timeline_start_ms", track.timelineStartMs, true, error)
        || !readInteger(json, "timeline_end_ms", track.timelineEndMs, true, error)) {
        return false;
    }

    const QJsonValue volume = json.value("volume");
    if (!volume.isUndefined() && !volume.isNull()) {
        if (!volume.isDouble() || volume.toDouble() < 0) {
            error = "field 'volume' must be a non-negative number";
            return false;
        }
        track.volume = volume.toDouble();
    }
    return true;
}

bool parseOverlay(const QJsonValue& value, TextOverlay& overlay, QString& error)
{
    if (!value.isObject()) {
        error = "text overlay must be an object";
        return false;
    }
    const QJsonObject json = value.toObject();

    qint64 fontSize = overlay.fontSize;
    if (!readString(json, "content", overlay.content, true, error)
        || !readInteger(json, "timeline_start_ms", overlay.timelineStartMs, true, error)
        || !readInteger(json, "timeline_end_ms", overlay.timelineEndMs, true, error)
        || !readPosition(json, "x", overlay.x, error)
        || !readPosition(json, "y", overlay.y, error)
        || !readInteger(json, "font_size", fontSize, false, error, MAX_INT_FIELD)
        || !readString(json, "color", overlay.color, false, error)
        || !readString(json, "font_file", overlay.fontFile, false, error)
        || !readString(json, "box_color", overlay.boxColor, false, error)) {
        return false;
    }
    overlay.fontSize = static_cast<int>(fontSize);

    const QJsonValue box = json.value("box");
    if (!box.isUndefined() && !box.isNull()) {
        if (!box.isBool()) {
            error = "field 'box' must be a boolean";
            return false;
        }
        overlay.box = box.toBool();
    }
    return true;
}

bool parseOutputFormat(const QJsonValue& value, OutputFormat& format, QString& error)
{
    if (!value.isObject()) {
        error = "output_format must be an object";
        return false;
    }
    const QJsonObject json = value.toObject();
    qint64 width = 0;
    qint64 height = 0;
    if (!readInteger(json, "width", width, true, error, MAX_INT_FIELD)
        || !readInteger(json, "height", height, true, error, MAX_INT_FIELD)) {
        return false;
    }
    format.width = static_cast<int>(width);
    format.height = static_cast<int>(height);
    return true;
}

JobError invalid(const QString& message)
{
    qCWarning(cutlinePlan, "Rejected plan: %s", qPrintable(message));
    return JobError::validation(message);
}

} // namespace

Result<ExecutionPlan, JobError> ExecutionPlan::fromJson(const QJsonObject& json)
{
    // Algorithm: Read timeline → Read optional audio/overlays → Read output format
    ExecutionPlan plan;
    QString error;

    QJsonArray timeline;
    if (!json.contains("timeline")) {
        return invalid("plan is missing 'timeline'");
    }
    if (!readArray(json, "timeline", timeline, error)) {
        return invalid(error);
    }
    for (int i = 0; i < timeline.size(); ++i) {
        TimelineSegment segment;
        if (!parseSegment(timeline.at(i), segment, error)) {
            return invalid(QString("timeline[%1]: %2").arg(i).arg(error));
        }
        plan.timeline.append(segment);
    }

    QJsonArray audioTracks;
    if (!readArray(json, "audio_tracks", audioTracks, error)) {
        return invalid(error);
    }
    for (int i = 0; i < audioTracks.size(); ++i) {
        AudioTrack track;
        if (!parseAudioTrack(audioTracks.at(i), track, error)) {
            return invalid(QString("audio_tracks[%1]: %2").arg(i).arg(error));
        }
        plan.audioTracks.append(track);
    }

    QJsonArray overlays;
    if (!readArray(json, "text_overlays", overlays, error)) {
        return invalid(error);
    }
    for (int i = 0; i < overlays.size(); ++i) {
        TextOverlay overlay;
        if (!parseOverlay(overlays.at(i), overlay, error)) {
            return invalid(QString("text_overlays[%1]: %2").arg(i).arg(error));
        }
        plan.textOverlays.append(overlay);
    }

    if (!json.contains("output_format")) {
        return invalid("plan is missing 'output_format'");
    }
    if (!parseOutputFormat(json.value("output_format"), plan.outputFormat, error)) {
        return invalid(error);
    }

    return plan;
}

Result<ExecutionPlan, JobError> ExecutionPlan::fromJobInput(const QJsonObject& input,
                                                            int defaultWidth, int defaultHeight)
{
    const QJsonValue planValue = input.value("plan");
    if (planValue.isObject()) {
        QJsonObject planJson = planValue.toObject();
        if (!planJson.contains("output_format") && input.value("output_format").isObject()) {
            planJson["output_format"] = input.value("output_format");
        }
        return fromJson(planJson);
    }
    if (!planValue.isUndefined() && !planValue.isNull()) {
        return invalid("'plan' must be an object");
    }

    // Legacy single-source input
    QString error;
    TimelineSegment segment;
    if (!readString(input, "source_url", segment.assetUrl, true, error)) {
        return invalid(QString("input has no plan and %1").arg(error));
    }

    const QJsonValue trim = input.value("trim");
    if (!trim.isObject()) {
        return invalid("legacy input requires a 'trim' object");
    }
    if (!readInteger(trim.toObject(), "start_ms", segment.trimStartMs, true, error)
        || !readInteger(trim.toObject(), "end_ms", segment.trimEndMs, true, error)) {
        return invalid(QString("trim: %1").arg(error));
    }

    ExecutionPlan plan;
    plan.timeline.append(segment);
    plan.outputFormat.width = defaultWidth;
    plan.outputFormat.height = defaultHeight;

    if (input.contains("output_format") && !parseOutputFormat(input.value("output_format"), plan.outputFormat, error)) {
        return invalid(error);
    }

    qCDebug(cutlinePlan, "Synthesized one-segment plan for %s", qPrintable(segment.assetUrl));
    return plan;
}

QStringList ExecutionPlan::assetUrls() const
{
    QStringList urls;
    for (const TimelineSegment& segment : timeline) {
        if (!urls.contains(segment.assetUrl)) {
            urls.append(segment.assetUrl);
        }
    }
    for (const AudioTrack& track : audioTracks) {
        if (!urls.contains(track.assetUrl)) {
            urls.append(track.assetUrl);
        }
    }
    return urls;
}

QStringList jobAssetUrls(const QJsonObject& input, const ExecutionPlan& plan)
{
    QStringList urls;
    const QString sourceUrl = input.value("source_url").toString();
    if (!sourceUrl.isEmpty()) {
        urls.append(sourceUrl);
    }
    for (const QString& url : plan.assetUrls()) {
        if (!urls.contains(url)) {
            urls.append(url);
        }
    }
    return urls;
}

} // namespace cutline
