#include "encoder_process.h"

#include <QEventLoop>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cutlineEncoder, "cutline.encoder")

namespace cutline {

EncoderProcess::EncoderProcess(QObject* parent)
    : QObject(parent)
{
    m_process.setProcessChannelMode(QProcess::MergedChannels);
    connect(&m_process, &QProcess::readyReadStandardOutput, this, &EncoderProcess::readOutput);
}

EncoderProcess::~EncoderProcess()
{
    if (isRunning()) {
        m_process.kill();
        m_process.waitForFinished(1000);
    }
}

EncoderRun EncoderProcess::run(const EncoderCommand& command, qint64 expectedDurationMs)
{
    m_progress = EncoderProgress(expectedDurationMs);
    m_tail.clear();

    EncoderRun result;
    bool startFailed = false;

    QEventLoop loop;
    QMetaObject::Connection finishedConnection = connect(
        &m_process, qOverload<int, QProcess::ExitStatus>(&QProcess::finished), &loop, &QEventLoop::quit);
    QMetaObject::Connection errorConnection = connect(
        &m_process, &QProcess::errorOccurred, &loop, [&loop, &startFailed](QProcess::ProcessError error) {
            if (error == QProcess::FailedToStart) {
                startFailed = true;
                loop.quit();
            }
        });

    qCInfo(cutlineEncoder, "Starting %s with %lld argument(s)",
           qPrintable(command.program), static_cast<long long>(command.arguments.size()));
    qCDebug(cutlineEncoder, "Arguments: %s", qPrintable(command.arguments.join(' ')));

    m_process.start(command.program, command.arguments, QIODevice::ReadOnly);
    if (!startFailed && m_process.state() != QProcess::NotRunning) {
        loop.exec();
    } else if (m_process.error() == QProcess::FailedToStart) {
        startFailed = true;
    }

    disconnect(finishedConnection);
    disconnect(errorConnection);

    if (startFailed) {
        result.outcome = EncoderRun::Outcome::FailedToStart;
        result.startError = m_process.errorString();
        qCWarning(cutlineEncoder, "Encoder failed to start: %s", qPrintable(result.startError));
        return result;
    }

    readOutput();
    result.outputTail = QString::fromUtf8(m_tail);
    result.exitCode = m_process.exitCode();
    result.outcome = m_process.exitStatus() == QProcess::NormalExit ? EncoderRun::Outcome::Exited
                                                                    : EncoderRun::Outcome::Crashed;

    if (result.succeeded()) {
        qCInfo(cutlineEncoder, "Encoder finished");
    } else {
        qCWarning(cutlineEncoder, "Encoder %s (exit code %d)",
                  result.outcome == EncoderRun::Outcome::Crashed ? "was killed or crashed" : "failed",
                  result.exitCode);
    }
    return result;
}

void EncoderProcess::kill()
{
    if (!isRunning()) {
        return;
    }
    qCWarning(cutlineEncoder, "Killing encoder pid %lld", static_cast<long long>(m_process.processId()));
    m_process.kill();
}

void EncoderProcess::readOutput()
{
    const QByteArray chunk = m_process.readAllStandardOutput();
    if (chunk.isEmpty()) {
        return;
    }

    m_tail.append(chunk);
    if (m_tail.size() > OUTPUT_TAIL_BYTES) {
        m_tail.remove(0, m_tail.size() - OUTPUT_TAIL_BYTES);
    }

    emit outputActivity();
    if (m_progress.consume(chunk)) {
        emit progressChanged(m_progress.percent());
    }
}

} // namespace cutline
