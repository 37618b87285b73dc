#include "watchdog.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cutlineWatchdog, "cutline.watchdog")

namespace cutline {

Watchdog::Watchdog(int intervalMs, qint64 maxRuntimeMs, qint64 stallTimeoutMs, QObject* parent)
    : QObject(parent)
    , m_maxRuntimeMs(maxRuntimeMs)
    , m_stallTimeoutMs(stallTimeoutMs)
{
    m_timer.setInterval(intervalMs);
    connect(&m_timer, &QTimer::timeout, this, &Watchdog::check);
}

void Watchdog::arm(const QString& jobId)
{
    m_jobId = jobId;
    m_fired = false;
    m_stallTracking = false;
    m_sinceArmed.start();
    m_sinceActivity.start();
    m_timer.start();
    qCDebug(cutlineWatchdog, "Armed for %s (ceiling %lldms)", qPrintable(jobId), static_cast<long long>(m_maxRuntimeMs));
}

void Watchdog::disarm()
{
    m_timer.stop();
    if (!m_jobId.isEmpty()) {
        qCDebug(cutlineWatchdog, "Disarmed for %s after %lldms", qPrintable(m_jobId), static_cast<long long>(elapsedMs()));
    }
    m_jobId.clear();
    m_stallTracking = false;
}

void Watchdog::setStallTrackingEnabled(bool enabled)
{
    m_stallTracking = enabled;
    m_sinceActivity.start();
}

void Watchdog::noteActivity()
{
    m_sinceActivity.start();
}

qint64 Watchdog::elapsedMs() const
{
    return m_sinceArmed.isValid() ? m_sinceArmed.elapsed() : 0;
}

void Watchdog::check()
{
    if (m_jobId.isEmpty() || m_fired) {
        return;
    }

    const qint64 elapsed = elapsedMs();
    if (elapsed > m_maxRuntimeMs) {
        fire(QString("Job exceeded max runtime of %1ms").arg(m_maxRuntimeMs));
        return;
    }

    if (m_stallTracking && m_stallTimeoutMs > 0 && m_sinceActivity.elapsed() > m_stallTimeoutMs) {
        fire(QString("Encoder produced no output for %1ms").arg(m_stallTimeoutMs));
    }
}

void Watchdog::fire(const QString& reason)
{
    m_fired = true;
    m_timer.stop();
    qCWarning(cutlineWatchdog, "Job %s: %s", qPrintable(m_jobId), qPrintable(reason));
    emit expired(m_jobId, reason);
}

} // namespace cutline
