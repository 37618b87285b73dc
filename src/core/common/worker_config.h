#pragma once

#include <QString>
#include <QStringList>

namespace cutline {

/**
 * Worker configuration passed explicitly to RenderWorker
 * Defaults come from QStandardPaths; fromEnvironment() layers CUTLINE_* on top.
 */
struct WorkerConfig {
    QString databasePath;
    QString tempDir;
    QString outputDir;
    QString publicUrlPrefix = QStringLiteral("/outputs");
    QString encoderProgram = QStringLiteral("ffmpeg");

    int pollIntervalMs = 1000;
    int watchdogIntervalMs = 5000;
    qint64 maxRuntimeMs = 30 * 60 * 1000;
    qint64 stallTimeoutMs = 0;          // 0 disables the stall check
    int downloadTimeoutMs = 300000;

    int defaultWidth = 1080;
    int defaultHeight = 1920;

    QString workerOwner;                // "<host>:<pid>"

    static WorkerConfig defaults();

    /**
     * Defaults overridden by CUTLINE_DB, CUTLINE_TEMP_DIR, CUTLINE_OUTPUT_DIR,
     * CUTLINE_PUBLIC_URL_PREFIX, CUTLINE_ENCODER, CUTLINE_POLL_MS,
     * CUTLINE_WATCHDOG_MS, CUTLINE_MAX_RUNTIME_MS, CUTLINE_STALL_TIMEOUT_MS,
     * CUTLINE_DOWNLOAD_TIMEOUT_MS
     */
    static WorkerConfig fromEnvironment();

    // Empty list means the configuration is usable
    QStringList validate() const;

    static QString defaultWorkerOwner();
};

} // namespace cutline
