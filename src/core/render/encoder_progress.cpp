#include "encoder_progress.h"

#include <QRegularExpression>
#include <QStringList>

namespace cutline {

namespace {

const int MAX_RUNNING_PERCENT = 99;

// Unterminated status lines are bounded; anything longer is noise
const int MAX_PENDING_BYTES = 64 * 1024;

} // namespace

EncoderProgress::EncoderProgress(qint64 expectedDurationMs)
    : m_expectedDurationMs(expectedDurationMs)
{
}

qint64 EncoderProgress::denominatorMs() const
{
    return m_expectedDurationMs > 0 ? m_expectedDurationMs : m_reportedDurationMs;
}

bool EncoderProgress::consume(const QByteArray& chunk)
{
    m_pending.append(chunk);

    bool increased = false;
    int start = 0;
    for (int i = 0; i < m_pending.size(); ++i) {
        const char ch = m_pending.at(i);
        if (ch != '\r' && ch != '\n') {
            continue;
        }
        if (i > start) {
            increased |= consumeLine(QString::fromUtf8(m_pending.constData() + start, i - start));
        }
        start = i + 1;
    }
    m_pending.remove(0, start);

    if (m_pending.size() > MAX_PENDING_BYTES) {
        m_pending.clear();
    }
    return increased;
}

bool EncoderProgress::consumeLine(const QString& line)
{
    static const QRegularExpression durationPattern(QStringLiteral("Duration:\\s*(\\d+:\\d{2}:\\d{2}(?:\\.\\d+)?)"));
    static const QRegularExpression timePattern(QStringLiteral("time=\\s*(\\d+:\\d{2}:\\d{2}(?:\\.\\d+)?)"));

    const QRegularExpressionMatch durationMatch = durationPattern.match(line);
    if (durationMatch.hasMatch() && m_reportedDurationMs == 0) {
        if (std::optional<qint64> ms = parseTimestampMs(durationMatch.captured(1))) {
            m_reportedDurationMs = *ms;
        }
    }

    const QRegularExpressionMatch timeMatch = timePattern.match(line);
    if (!timeMatch.hasMatch()) {
        return false;
    }
    std::optional<qint64> position = parseTimestampMs(timeMatch.captured(1));
    if (!position) {
        return false;
    }
    m_positionMs = *position;

    const qint64 denominator = denominatorMs();
    if (denominator <= 0) {
        return false;
    }

    const int pct = static_cast<int>(qBound<qint64>(0, (m_positionMs * 100) / denominator, MAX_RUNNING_PERCENT));
    if (pct <= m_percent) {
        return false;
    }
    m_percent = pct;
    return true;
}

std::optional<qint64> EncoderProgress::parseTimestampMs(const QString& text)
{
    const QStringList parts = text.trimmed().split(':');
    if (parts.size() != 3) {
        return std::nullopt;
    }

    bool okHours = false;
    bool okMinutes = false;
    bool okSeconds = false;
    const qint64 hours = parts[0].toLongLong(&okHours);
    const qint64 minutes = parts[1].toLongLong(&okMinutes);
    const double seconds = parts[2].toDouble(&okSeconds);
    if (!okHours || !okMinutes || !okSeconds || hours < 0 || minutes < 0 || seconds < 0) {
        return std::nullopt;
    }

    return (hours * 3600 + minutes * 60) * 1000 + qRound64(seconds * 1000.0);
}

} // namespace cutline
