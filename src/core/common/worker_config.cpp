#include "worker_config.h"

#include <QCoreApplication>
#include <QDir>
#include <QHostInfo>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QtGlobal>

Q_LOGGING_CATEGORY(cutlineConfig, "cutline.config")

namespace cutline {

namespace {

template<typename T>
void overrideNumber(const char* name, T& field)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    bool ok = false;
    const qlonglong value = qEnvironmentVariable(name).toLongLong(&ok);
    if (!ok) {
        qCWarning(cutlineConfig, "Ignoring non-numeric %s=%s", name, qPrintable(qEnvironmentVariable(name)));
        return;
    }
    field = static_cast<T>(value);
}

void overrideString(const char* name, QString& field)
{
    if (qEnvironmentVariableIsSet(name)) {
        field = qEnvironmentVariable(name);
    }
}

} // namespace

WorkerConfig WorkerConfig::defaults()
{
    WorkerConfig config;

    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataDir.isEmpty()) {
        dataDir = QDir::currentPath();
    }
    const QString tempRoot = QStandardPaths::writableLocation(QStandardPaths::TempLocation);

    config.databasePath = QDir(dataDir).filePath("cutline.db");
    config.outputDir = QDir(dataDir).filePath("outputs");
    config.tempDir = QDir(tempRoot).filePath("cutline/assets");
    config.workerOwner = defaultWorkerOwner();
    return config;
}

WorkerConfig WorkerConfig::fromEnvironment()
{
    WorkerConfig config = defaults();

    overrideString("CUTLINE_DB", config.databasePath);
    overrideString("CUTLINE_TEMP_DIR", config.tempDir);
    overrideString("CUTLINE_OUTPUT_DIR", config.outputDir);
    overrideString("CUTLINE_PUBLIC_URL_PREFIX", config.publicUrlPrefix);
    overrideString("CUTLINE_ENCODER", config.encoderProgram);

    overrideNumber("CUTLINE_POLL_MS", config.pollIntervalMs);
    overrideNumber("CUTLINE_WATCHDOG_MS", config.watchdogIntervalMs);
    overrideNumber("CUTLINE_MAX_RUNTIME_MS", config.maxRuntimeMs);
    overrideNumber("CUTLINE_STALL_TIMEOUT_MS", config.stallTimeoutMs);
    overrideNumber("CUTLINE_DOWNLOAD_TIMEOUT_MS", config.downloadTimeoutMs);

    return config;
}

QStringList WorkerConfig::validate() const
{
    QStringList problems;

    if (databasePath.isEmpty()) {
        problems << "database path is empty";
    }
    if (tempDir.isEmpty()) {
        problems << "temp dir is empty";
    }
    if (outputDir.isEmpty()) {
        problems << "output dir is empty";
    }
    if (encoderProgram.isEmpty()) {
        problems << "encoder program is empty";
    }
    if (pollIntervalMs <= 0) {
        problems << QString("poll interval must be positive (got %1)").arg(pollIntervalMs);
    }
    if (watchdogIntervalMs <= 0) {
        problems << QString("watchdog interval must be positive (got %1)").arg(watchdogIntervalMs);
    }
    if (maxRuntimeMs <= 0) {
        problems << QString("max runtime must be positive (got %1)").arg(maxRuntimeMs);
    }
    if (stallTimeoutMs < 0) {
        problems << QString("stall timeout must not be negative (got %1)").arg(stallTimeoutMs);
    }
    if (downloadTimeoutMs <= 0) {
        problems << QString("download timeout must be positive (got %1)").arg(downloadTimeoutMs);
    }
    if (defaultWidth <= 0 || defaultHeight <= 0) {
        problems << QString("default output size must be positive (got %1x%2)").arg(defaultWidth).arg(defaultHeight);
    }

    return problems;
}

QString WorkerConfig::defaultWorkerOwner()
{
    return QString("%1:%2").arg(QHostInfo::localHostName()).arg(QCoreApplication::applicationPid());
}

} // namespace cutline
