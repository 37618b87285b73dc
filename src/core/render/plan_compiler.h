#pragma once

#include "cutline/result.hpp"
#include "../models/execution_plan.h"
#include "../models/job.h"

#include <QHash>
#include <QString>
#include <QStringList>

namespace cutline {

struct EncoderCommand {
    QString program;
    QStringList arguments;
};

/**
 * Compiles an ExecutionPlan into one encoder invocation
 *
 * Pure and deterministic: the same plan, path map and output path always give
 * byte-identical arguments. Every asset URL must already map to a local file.
 */
class PlanCompiler
{
public:
    explicit PlanCompiler(const QString& encoderProgram = QStringLiteral("ffmpeg"));

    /**
     * Algorithm: Validate → Register inputs → Segment chains → Concat →
     *            Overlays → Audio chains + mix → Output arguments
     */
    Result<EncoderCommand, JobError> compile(const ExecutionPlan& plan,
                                             const QHash<QString, QString>& localPaths,
                                             const QString& outputPath) const;

    // Sum of the segment windows; the progress denominator
    static qint64 expectedDurationMs(const ExecutionPlan& plan);

    // Milliseconds as seconds, at most 3 decimals, trailing zeros stripped
    static QString formatSeconds(qint64 ms);

    // Escape text for a single-quoted drawtext value
    static QString escapeDrawText(const QString& text);

    /**
     * Escape an unquoted filter option value at both levels: the option
     * parser (backslash, quote, colon) and then the filtergraph parser
     * (backslash, quote, brackets, comma, semicolon)
     */
    static QString escapeFilterOption(const QString& value);

private:
    static std::optional<JobError> validate(const ExecutionPlan& plan,
                                            const QHash<QString, QString>& localPaths);

    QString m_program;
};

} // namespace cutline
