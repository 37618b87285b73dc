#pragma once

#include "../render/encoder_progress.h"
#include "../render/plan_compiler.h"

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QString>

namespace cutline {

struct EncoderRun {
    enum class Outcome {
        Exited,         // ran to completion; see exitCode
        FailedToStart,
        Crashed,        // signal, including our own kill()
    };

    Outcome outcome = Outcome::Exited;
    int exitCode = -1;
    QString startError;
    QString outputTail;  // last bytes of merged stdout/stderr

    bool succeeded() const { return outcome == Outcome::Exited && exitCode == 0; }
};

/**
 * Runs one encoder invocation to completion
 *
 * stdout and stderr are merged. run() blocks on a local event loop until the
 * process exits, fails to start, or is killed, so other timers on the thread
 * keep firing and may call kill().
 */
class EncoderProcess : public QObject
{
    Q_OBJECT

public:
    static constexpr int OUTPUT_TAIL_BYTES = 4096;

    explicit EncoderProcess(QObject* parent = nullptr);
    ~EncoderProcess() override;

    EncoderRun run(const EncoderCommand& command, qint64 expectedDurationMs);

    bool isRunning() const { return m_process.state() != QProcess::NotRunning; }

public slots:
    // SIGKILL; run() then returns Crashed
    void kill();

signals:
    void progressChanged(int percent);
    void outputActivity();

private:
    void readOutput();

    QProcess m_process;
    EncoderProgress m_progress;
    QByteArray m_tail;
};

} // namespace cutline
