#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QTimer>

namespace cutline {

/**
 * Per-job runtime ceiling
 *
 * Checks every interval while armed. A breach emits expired() once and stops
 * the timer; the receiver decides what to kill. The watchdog writes nothing.
 */
class Watchdog : public QObject
{
    Q_OBJECT

public:
    Watchdog(int intervalMs, qint64 maxRuntimeMs, qint64 stallTimeoutMs, QObject* parent = nullptr);

    void arm(const QString& jobId);
    void disarm();

    // Stall checks run only while enabled (the encoder is running)
    void setStallTrackingEnabled(bool enabled);
    void noteActivity();

    bool isArmed() const { return !m_jobId.isEmpty(); }
    QString jobId() const { return m_jobId; }
    qint64 elapsedMs() const;

signals:
    void expired(const QString& jobId, const QString& reason);

private slots:
    void check();

private:
    void fire(const QString& reason);

    QTimer m_timer;
    QElapsedTimer m_sinceArmed;
    QElapsedTimer m_sinceActivity;
    QString m_jobId;
    qint64 m_maxRuntimeMs;
    qint64 m_stallTimeoutMs;
    bool m_stallTracking = false;
    bool m_fired = false;
};

} // namespace cutline
