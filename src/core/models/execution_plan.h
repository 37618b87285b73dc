#pragma once

#include "cutline/result.hpp"
#include "job.h"

#include <QString>
#include <QStringList>
#include <QVector>
#include <QJsonObject>

namespace cutline {

struct TimelineSegment {
    QString assetUrl;
    qint64 trimStartMs = 0;
    qint64 trimEndMs = 0;

    qint64 durationMs() const { return trimEndMs - trimStartMs; }
};

// Placement of an audio source on the output timeline
struct AudioTrack {
    QString assetUrl;
    qint64 trimStartMs = 0;
    qint64 trimEndMs = 0;          // 0 = play until the placement window closes
    qint64 timelineStartMs = 0;
    qint64 timelineEndMs = 0;
    double volume = 1.0;
};

struct TextOverlay {
    QString content;
    qint64 timelineStartMs = 0;
    qint64 timelineEndMs = 0;
    QString x = QStringLiteral("(w-text_w)/2");
    QString y = QStringLiteral("h-text_h-h/8");
    int fontSize = 64;
    QString color = QStringLiteral("white");
    QString fontFile;
    bool box = false;
    QString boxColor = QStringLiteral("black@0.5");
};

struct OutputFormat {
    int width = 0;
    int height = 0;
};

/**
 * Declarative render description compiled by PlanCompiler
 * fromJson checks structure only; time windows and sizes are checked at compile time.
 */
struct ExecutionPlan {
    QVector<TimelineSegment> timeline;
    QVector<AudioTrack> audioTracks;
    QVector<TextOverlay> textOverlays;
    OutputFormat outputFormat;

    /**
     * Parse a plan document
     * Algorithm: Read timeline → Read optional audio/overlays → Read output format
     */
    static Result<ExecutionPlan, JobError> fromJson(const QJsonObject& json);

    /**
     * Build the plan for a job input
     * A plan-less input with source_url + trim becomes a one-segment plan.
     */
    static Result<ExecutionPlan, JobError> fromJobInput(const QJsonObject& input,
                                                        int defaultWidth, int defaultHeight);

    // Distinct asset URLs, timeline first then audio, first-seen order
    QStringList assetUrls() const;
};

/**
 * Every URL a job needs: legacy source_url first, then the plan's assets
 */
QStringList jobAssetUrls(const QJsonObject& input, const ExecutionPlan& plan);

} // namespace cutline
