#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTextStream>

#include "core/common/worker_config.h"
#include "core/models/job.h"
#include "core/persistence/job_store.h"
#include "core/worker/render_worker.h"

Q_LOGGING_CATEGORY(cutlineMain, "cutline.main")

using namespace cutline;

namespace {

const char* const DEFAULT_LOG_RULES = "cutline.*.debug=false";
const int STATUS_LIST_LIMIT = 20;

void printJson(const QJsonDocument& doc)
{
    QTextStream out(stdout);
    out << doc.toJson(QJsonDocument::Indented);
}

int openStore(JobStore& store)
{
    Result<void> opened = store.open();
    if (opened.is_error()) {
        qCCritical(cutlineMain, "%s", opened.error().message.c_str());
        return 1;
    }
    return 0;
}

int runWorker(QCoreApplication& app, const WorkerConfig& config)
{
    RenderWorker worker(config);
    Result<void> started = worker.start();
    if (started.is_error()) {
        return 1;
    }
    return app.exec();
}

int runSubmit(const WorkerConfig& config, const QString& inputPath)
{
    QFile file(inputPath);
    const bool opened = inputPath == "-" ? file.open(stdin, QIODevice::ReadOnly)
                                         : file.open(QIODevice::ReadOnly);
    if (!opened) {
        qCCritical(cutlineMain, "Cannot read %s: %s", qPrintable(inputPath), qPrintable(file.errorString()));
        return 1;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCCritical(cutlineMain, "Input is not a JSON object: %s", qPrintable(parseError.errorString()));
        return 1;
    }

    JobStore store(config.databasePath);
    if (openStore(store) != 0) {
        return 1;
    }

    Result<Job> inserted = store.insert(Job::create(doc.object()));
    if (inserted.is_error()) {
        qCCritical(cutlineMain, "Submit failed: %s", inserted.error().message.c_str());
        return 1;
    }

    QTextStream(stdout) << inserted.value().id() << '\n';
    return 0;
}

int runStatus(const WorkerConfig& config, const QString& jobId)
{
    JobStore store(config.databasePath);
    if (openStore(store) != 0) {
        return 1;
    }

    if (!jobId.isEmpty()) {
        Result<Job> job = store.get(jobId);
        if (job.is_error()) {
            qCCritical(cutlineMain, "%s", job.error().message.c_str());
            return 1;
        }
        printJson(QJsonDocument(job.value().toJson()));
        return 0;
    }

    Result<QVector<Job>> jobs = store.listJobs(STATUS_LIST_LIMIT);
    if (jobs.is_error()) {
        qCCritical(cutlineMain, "%s", jobs.error().message.c_str());
        return 1;
    }
    QJsonArray list;
    for (const Job& job : jobs.value()) {
        list.append(job.toJson());
    }
    printJson(QJsonDocument(list));
    return 0;
}

int runRecover(const WorkerConfig& config)
{
    JobStore store(config.databasePath);
    if (openStore(store) != 0) {
        return 1;
    }

    Result<int> recovered = store.recoverOrphans();
    if (recovered.is_error()) {
        qCCritical(cutlineMain, "%s", recovered.error().message.c_str());
        return 1;
    }
    QTextStream(stdout) << recovered.value() << '\n';
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("cutline");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Cutline");

    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} %{category} [%{type}] %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Durable render job engine");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "worker | submit <input.json> | status [<id>] | recover");

    const QCommandLineOption dbOption("db", "Job database path.", "path");
    const QCommandLineOption tempOption("temp-dir", "Asset cache directory.", "dir");
    const QCommandLineOption outputOption("output-dir", "Rendered output directory.", "dir");
    const QCommandLineOption encoderOption("encoder", "Encoder program.", "program");
    const QCommandLineOption runtimeOption("max-runtime-ms", "Per-job runtime ceiling.", "ms");
    const QCommandLineOption pollOption("poll-ms", "Idle poll interval.", "ms");
    const QCommandLineOption rulesOption("log-rules", "QLoggingCategory filter rules.", "rules");
    parser.addOptions({dbOption, tempOption, outputOption, encoderOption, runtimeOption, pollOption, rulesOption});
    parser.process(app);

    // Explicit rules beat QT_LOGGING_RULES, which beats the quiet default
    if (parser.isSet(rulesOption)) {
        QLoggingCategory::setFilterRules(parser.value(rulesOption).replace(';', '\n'));
    } else if (!qEnvironmentVariableIsSet("QT_LOGGING_RULES")) {
        QLoggingCategory::setFilterRules(DEFAULT_LOG_RULES);
    }

    WorkerConfig config = WorkerConfig::fromEnvironment();
    if (parser.isSet(dbOption)) {
        config.databasePath = parser.value(dbOption);
    }
    if (parser.isSet(tempOption)) {
        config.tempDir = parser.value(tempOption);
    }
    if (parser.isSet(outputOption)) {
        config.outputDir = parser.value(outputOption);
    }
    if (parser.isSet(encoderOption)) {
        config.encoderProgram = parser.value(encoderOption);
    }
    if (parser.isSet(runtimeOption)) {
        config.maxRuntimeMs = parser.value(runtimeOption).toLongLong();
    }
    if (parser.isSet(pollOption)) {
        config.pollIntervalMs = parser.value(pollOption).toInt();
    }

    const QStringList problems = config.validate();
    if (!problems.isEmpty()) {
        for (const QString& problem : problems) {
            qCCritical(cutlineMain, "Invalid configuration: %s", qPrintable(problem));
        }
        return 1;
    }

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0);

    if (command == "worker") {
        return runWorker(app, config);
    }
    if (command == "submit" && args.size() == 2) {
        return runSubmit(config, args.at(1));
    }
    if (command == "status" && args.size() <= 2) {
        return runStatus(config, args.value(1));
    }
    if (command == "recover") {
        return runRecover(config);
    }

    qCCritical(cutlineMain, "Unknown or incomplete command: %s", qPrintable(args.join(' ')));
    parser.showHelp(1);
}
