#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace cutline {

/**
 * Incremental parser for encoder status output
 *
 * Output arrives in arbitrary chunks; lines end in \r (status updates) or \n.
 * "Duration: HH:MM:SS.xx" supplies the denominator when none was given up front,
 * "time=HH:MM:SS.xx" supplies the position. percent() never decreases and stays
 * below 100 until the job is finalized.
 */
class EncoderProgress
{
public:
    explicit EncoderProgress(qint64 expectedDurationMs = 0);

    // Returns true when percent() increased
    bool consume(const QByteArray& chunk);

    int percent() const { return m_percent; }
    qint64 positionMs() const { return m_positionMs; }
    qint64 denominatorMs() const;

    static std::optional<qint64> parseTimestampMs(const QString& text);

private:
    bool consumeLine(const QString& line);

    QByteArray m_pending;
    qint64 m_expectedDurationMs = 0;
    qint64 m_reportedDurationMs = 0;
    qint64 m_positionMs = 0;
    int m_percent = 0;
};

} // namespace cutline
