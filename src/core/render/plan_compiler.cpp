#include "plan_compiler.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cutlineCompiler, "cutline.compiler")

namespace cutline {

namespace {

// Input registry: one -i per distinct local path, first-seen order
class InputTable
{
public:
    int indexFor(const QString& path)
    {
        const int existing = m_paths.indexOf(path);
        if (existing >= 0) {
            return existing;
        }
        m_paths.append(path);
        return m_paths.size() - 1;
    }

    QStringList arguments() const
    {
        QStringList args;
        for (const QString& path : m_paths) {
            args << "-i" << path;
        }
        return args;
    }

private:
    QStringList m_paths;
};

QString formatVolume(double volume)
{
    return QString::number(volume, 'g', 6);
}

} // namespace

PlanCompiler::PlanCompiler(const QString& encoderProgram)
    : m_program(encoderProgram)
{
}

Result<EncoderCommand, JobError> PlanCompiler::compile(const ExecutionPlan& plan,
                                                       const QHash<QString, QString>& localPaths,
                                                       const QString& outputPath) const
{
    if (std::optional<JobError> error = validate(plan, localPaths)) {
        qCWarning(cutlineCompiler, "Plan rejected: %s", qPrintable(error->message));
        return *error;
    }

    const int width = plan.outputFormat.width;
    const int height = plan.outputFormat.height;

    InputTable inputs;
    QStringList filters;

    // Segment chains: trim, rebase timestamps, letterbox into the output frame
    QString concatInputs;
    for (int i = 0; i < plan.timeline.size(); ++i) {
        const TimelineSegment& segment = plan.timeline[i];
        const int input = inputs.indexFor(localPaths.value(segment.assetUrl));
        const QString tag = QString("v%1").arg(i);

        filters << QString("[%1:v]trim=start=%2:end=%3,setpts=PTS-STARTPTS,"
                           "scale=%4:%5:force_original_aspect_ratio=decrease,"
                           "pad=%4:%5:(ow-iw)/2:(oh-ih)/2,setsar=1[%6]")
                       .arg(input)
                       .arg(formatSeconds(segment.trimStartMs), formatSeconds(segment.trimEndMs))
                       .arg(width)
                       .arg(height)
                       .arg(tag);
        concatInputs += QString("[%1]").arg(tag);
    }

    filters << QString("%1concat=n=%2:v=1:a=0[main_v]").arg(concatInputs).arg(plan.timeline.size());
    QString videoTag = QStringLiteral("main_v");

    // Overlays chain onto the running video tag in array order
    for (int i = 0; i < plan.textOverlays.size(); ++i) {
        const TextOverlay& overlay = plan.textOverlays[i];
        const QString nextTag = QString("v_txt_%1").arg(i);

        QString filter = QString("[%1]drawtext=").arg(videoTag);
        if (!overlay.fontFile.isEmpty()) {
            filter += QString("fontfile=%1:").arg(escapeFilterOption(overlay.fontFile));
        }
        // Single-pass arg(): user text may itself contain %N
        filter += QString("text='%1':fontsize=%2:fontcolor=%3:x=%4:y=%5:")
                      .arg(escapeDrawText(overlay.content), QString::number(overlay.fontSize),
                           escapeFilterOption(overlay.color), escapeFilterOption(overlay.x),
                           escapeFilterOption(overlay.y));
        if (overlay.box) {
            filter += QString("box=1:boxcolor=%1:boxborderw=5:").arg(escapeFilterOption(overlay.boxColor));
        }
        filter += QString("enable='between(t,%1,%2)'[%3]")
                      .arg(formatSeconds(overlay.timelineStartMs), formatSeconds(overlay.timelineEndMs), nextTag);

        filters << filter;
        videoTag = nextTag;
    }

    // Audio: each track trimmed, placed on the timeline, then mixed
    QString mixInputs;
    for (int i = 0; i < plan.audioTracks.size(); ++i) {
        const AudioTrack& track = plan.audioTracks[i];
        const int input = inputs.indexFor(localPaths.value(track.assetUrl));
        const QString tag = QString("a_track_%1").arg(i);

        qint64 durationMs = track.timelineEndMs - track.timelineStartMs;
        if (track.trimEndMs > 0) {
            durationMs = qMin(durationMs, track.trimEndMs - track.trimStartMs);
        }

        filters << QString("[%1:a]atrim=start=%2:duration=%3,asetpts=PTS-STARTPTS,"
                           "adelay=%4|%4,volume=%5[%6]")
                       .arg(input)
                       .arg(formatSeconds(track.trimStartMs), formatSeconds(durationMs))
                       .arg(track.timelineStartMs)
                       .arg(formatVolume(track.volume), tag);
        mixInputs += QString("[%1]").arg(tag);
    }

    const bool hasAudio = !plan.audioTracks.isEmpty();
    if (hasAudio) {
        filters << QString("%1amix=inputs=%2:duration=longest[mixed_a]").arg(mixInputs).arg(plan.audioTracks.size());
    }

    EncoderCommand command;
    command.program = m_program;
    command.arguments << "-hide_banner" << "-y";
    command.arguments << inputs.arguments();
    command.arguments << "-filter_complex" << filters.join(';');
    command.arguments << "-map" << QString("[%1]").arg(videoTag);
    if (hasAudio) {
        command.arguments << "-map" << "[mixed_a]";
    }
    command.arguments << "-c:v" << "libx264" << "-preset" << "fast" << "-pix_fmt" << "yuv420p";
    if (hasAudio) {
        command.arguments << "-c:a" << "aac" << "-b:a" << "192k";
    }
    command.arguments << "-movflags" << "+faststart" << outputPath;

    qCDebug(cutlineCompiler, "Compiled %lld segment(s), %lld overlay(s), %lld audio track(s)",
            static_cast<long long>(plan.timeline.size()),
            static_cast<long long>(plan.textOverlays.size()),
            static_cast<long long>(plan.audioTracks.size()));
    return command;
}

std::optional<JobError> PlanCompiler::validate(const ExecutionPlan& plan,
                                               const QHash<QString, QString>& localPaths)
{
    if (plan.timeline.isEmpty()) {
        return JobError::validation("plan timeline is empty");
    }

    if (plan.outputFormat.width <= 0 || plan.outputFormat.height <= 0) {
        return JobError::validation(QString("invalid output size %1x%2")
                                        .arg(plan.outputFormat.width)
                                        .arg(plan.outputFormat.height));
    }

    for (int i = 0; i < plan.timeline.size(); ++i) {
        const TimelineSegment& segment = plan.timeline[i];
        if (segment.trimEndMs <= segment.trimStartMs) {
            return JobError::validation(QString("timeline[%1] ends at %2ms, not after its start %3ms")
                                            .arg(i).arg(segment.trimEndMs).arg(segment.trimStartMs));
        }
        if (localPaths.value(segment.assetUrl).isEmpty()) {
            return JobError::validation(QString("timeline[%1] asset was not resolved: %2")
                                            .arg(i).arg(segment.assetUrl));
        }
    }

    for (int i = 0; i < plan.audioTracks.size(); ++i) {
        const AudioTrack& track = plan.audioTracks[i];
        if (track.timelineEndMs <= track.timelineStartMs) {
            return JobError::validation(QString("audio_tracks[%1] placement window is empty").arg(i));
        }
        if (track.trimEndMs > 0 && track.trimEndMs <= track.trimStartMs) {
            return JobError::validation(QString("audio_tracks[%1] trim window is empty").arg(i));
        }
        if (localPaths.value(track.assetUrl).isEmpty()) {
            return JobError::validation(QString("audio_tracks[%1] asset was not resolved: %2")
                                            .arg(i).arg(track.assetUrl));
        }
    }

    for (int i = 0; i < plan.textOverlays.size(); ++i) {
        const TextOverlay& overlay = plan.textOverlays[i];
        if (overlay.timelineEndMs <= overlay.timelineStartMs) {
            return JobError::validation(QString("text_overlays[%1] window is empty").arg(i));
        }
    }

    return std::nullopt;
}

qint64 PlanCompiler::expectedDurationMs(const ExecutionPlan& plan)
{
    qint64 total = 0;
    for (const TimelineSegment& segment : plan.timeline) {
        total += qMax<qint64>(0, segment.durationMs());
    }
    return total;
}

QString PlanCompiler::formatSeconds(qint64 ms)
{
    QString text = QString("%1.%2").arg(ms / 1000).arg(ms % 1000, 3, 10, QChar('0'));
    while (text.endsWith('0')) {
        text.chop(1);
    }
    if (text.endsWith('.')) {
        text.chop(1);
    }
    return text;
}

QString PlanCompiler::escapeDrawText(const QString& text)
{
    QString escaped;
    escaped.reserve(text.size() + 8);
    for (const QChar ch : text) {
        if (ch == '\\') {
            escaped += QStringLiteral("\\\\");
        } else if (ch == ':') {
            escaped += QStringLiteral("\\:");
        } else if (ch == '%') {
            escaped += QStringLiteral("\\%");
        } else if (ch == '\'') {
            escaped += QStringLiteral("'\\\\''");
        } else {
            escaped += ch;
        }
    }
    return escaped;
}

QString PlanCompiler::escapeFilterOption(const QString& value)
{
    QString optionLevel;
    optionLevel.reserve(value.size() + 4);
    for (const QChar ch : value) {
        if (ch == '\\' || ch == '\'' || ch == ':') {
            optionLevel += '\\';
        }
        optionLevel += ch;
    }

    QString graphLevel;
    graphLevel.reserve(optionLevel.size() + 4);
    for (const QChar ch : optionLevel) {
        if (ch == '\\' || ch == '\'' || ch == '[' || ch == ']' || ch == ',' || ch == ';') {
            graphLevel += '\\';
        }
        graphLevel += ch;
    }
    return graphLevel;
}

} // namespace cutline
