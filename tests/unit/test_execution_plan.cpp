#include "../common/test_base.h"
#include "../../src/core/models/execution_plan.h"
#include "../../src/core/models/job.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QTest>

using namespace cutline;

namespace {

QJsonObject parseObject(const char* json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

class TestExecutionPlan : public TestBase
{
    Q_OBJECT

private slots:
    void testParsesFullPlan();
    void testAudioAndOverlayDefaults();
    void testLegacyInputBecomesOneSegment();
    void testLegacyInputHonoursOutputFormat();
    void testMalformedInputIsValidationError_data();
    void testMalformedInputIsValidationError();
    void testAssetUrlsFirstSeenOrder();
    void testJobStatusDocument();
    void testJobErrorRoundTripsCode();
};

void TestExecutionPlan::testParsesFullPlan()
{
    const QJsonObject input = parseObject(R"({
        "plan": {
            "timeline": [
                {"asset_url": "https://cdn.example/a.mp4", "trim_start_ms": 0, "trim_end_ms": 4000},
                {"asset_url": "https://cdn.example/b.mov", "trim_start_ms": 1500, "trim_end_ms": 3500}
            ],
            "audio_tracks": [
                {"asset_url": "https://cdn.example/music.mp3", "trim_start_ms": 0,
                 "timeline_start_ms": 0, "timeline_end_ms": 6000, "volume": 0.4}
            ],
            "text_overlays": [
                {"content": "Hello", "timeline_start_ms": 500, "timeline_end_ms": 2500,
                 "x": 100, "y": "h-200", "font_size": 72, "color": "yellow", "box": true}
            ],
            "output_format": {"width": 720, "height": 1280}
        }
    })");

    Result<ExecutionPlan, JobError> result = ExecutionPlan::fromJobInput(input, 1080, 1920);
    QVERIFY(result.is_ok());
    const ExecutionPlan& plan = result.value();

    QCOMPARE(plan.timeline.size(), 2);
    QCOMPARE(plan.timeline[1].assetUrl, QString("https://cdn.example/b.mov"));
    QCOMPARE(plan.timeline[1].durationMs(), qint64(2000));

    QCOMPARE(plan.audioTracks.size(), 1);
    QCOMPARE(plan.audioTracks[0].volume, 0.4);
    QCOMPARE(plan.audioTracks[0].timelineEndMs, qint64(6000));

    QCOMPARE(plan.textOverlays.size(), 1);
    QCOMPARE(plan.textOverlays[0].x, QString("100"));
    QCOMPARE(plan.textOverlays[0].y, QString("h-200"));
    QCOMPARE(plan.textOverlays[0].fontSize, 72);
    QVERIFY(plan.textOverlays[0].box);

    QCOMPARE(plan.outputFormat.width, 720);
    QCOMPARE(plan.outputFormat.height, 1280);
}

void TestExecutionPlan::testAudioAndOverlayDefaults()
{
    const QJsonObject planJson = parseObject(R"({
        "timeline": [{"asset_url": "a", "trim_start_ms": 0, "trim_end_ms": 1000}],
        "audio_tracks": [{"asset_url": "m", "timeline_start_ms": 0, "timeline_end_ms": 1000}],
        "text_overlays": [{"content": "t", "timeline_start_ms": 0, "timeline_end_ms": 1000}],
        "output_format": {"width": 1080, "height": 1920}
    })");

    Result<ExecutionPlan, JobError> result = ExecutionPlan::fromJson(planJson);
    QVERIFY(result.is_ok());

    const AudioTrack& track = result.value().audioTracks[0];
    QCOMPARE(track.volume, 1.0);
    QCOMPARE(track.trimStartMs, qint64(0));
    QCOMPARE(track.trimEndMs, qint64(0));

    const TextOverlay& overlay = result.value().textOverlays[0];
    QCOMPARE(overlay.x, QString("(w-text_w)/2"));
    QCOMPARE(overlay.color, QString("white"));
    QVERIFY(!overlay.box);
    QVERIFY(overlay.fontFile.isEmpty());
}

void TestExecutionPlan::testLegacyInputBecomesOneSegment()
{
    const QJsonObject input = parseObject(R"({
        "source_url": "https://cdn.example/source.mp4",
        "trim": {"start_ms": 2000, "end_ms": 7000}
    })");

    Result<ExecutionPlan, JobError> result = ExecutionPlan::fromJobInput(input, 1080, 1920);
    QVERIFY(result.is_ok());

    const ExecutionPlan& plan = result.value();
    QCOMPARE(plan.timeline.size(), 1);
    QCOMPARE(plan.timeline[0].assetUrl, QString("https://cdn.example/source.mp4"));
    QCOMPARE(plan.timeline[0].trimStartMs, qint64(2000));
    QCOMPARE(plan.timeline[0].trimEndMs, qint64(7000));
    QVERIFY(plan.audioTracks.isEmpty());
    QVERIFY(plan.textOverlays.isEmpty());
    QCOMPARE(plan.outputFormat.width, 1080);
    QCOMPARE(plan.outputFormat.height, 1920);
}

void TestExecutionPlan::testLegacyInputHonoursOutputFormat()
{
    const QJsonObject input = parseObject(R"({
        "source_url": "s.mp4",
        "trim": {"start_ms": 0, "end_ms": 1000},
        "output_format": {"width": 640, "height": 360}
    })");

    Result<ExecutionPlan, JobError> result = ExecutionPlan::fromJobInput(input, 1080, 1920);
    QVERIFY(result.is_ok());
    QCOMPARE(result.value().outputFormat.width, 640);
    QCOMPARE(result.value().outputFormat.height, 360);
}

void TestExecutionPlan::testMalformedInputIsValidationError_data()
{
    QTest::addColumn<QByteArray>("input");

    QTest::newRow("empty input") << QByteArray("{}");
    QTest::newRow("plan not an object") << QByteArray(R"({"plan": [1, 2]})");
    QTest::newRow("plan without timeline") << QByteArray(R"({"plan": {"output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("timeline not an array") << QByteArray(
        R"({"plan": {"timeline": {}, "output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("segment missing url") << QByteArray(
        R"({"plan": {"timeline": [{"trim_start_ms": 0, "trim_end_ms": 1}], "output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("segment trim as string") << QByteArray(
        R"({"plan": {"timeline": [{"asset_url": "a", "trim_start_ms": "0", "trim_end_ms": 1}], "output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("negative trim") << QByteArray(
        R"({"plan": {"timeline": [{"asset_url": "a", "trim_start_ms": -5, "trim_end_ms": 1}], "output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("missing output format") << QByteArray(
        R"({"plan": {"timeline": [{"asset_url": "a", "trim_start_ms": 0, "trim_end_ms": 1}]}})");
    QTest::newRow("overlay box not bool") << QByteArray(
        R"({"plan": {"timeline": [{"asset_url": "a", "trim_start_ms": 0, "trim_end_ms": 1}],
            "text_overlays": [{"content": "x", "timeline_start_ms": 0, "timeline_end_ms": 1, "box": "yes"}],
            "output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("trim beyond range") << QByteArray(
        R"({"plan": {"timeline": [{"asset_url": "a", "trim_start_ms": 1e19, "trim_end_ms": 1000}], "output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("audio placement beyond range") << QByteArray(
        R"({"plan": {"timeline": [{"asset_url": "a", "trim_start_ms": 0, "trim_end_ms": 1}],
            "audio_tracks": [{"asset_url": "m", "timeline_start_ms": 0, "timeline_end_ms": 1e300}],
            "output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("width beyond int") << QByteArray(
        R"({"plan": {"timeline": [{"asset_url": "a", "trim_start_ms": 0, "trim_end_ms": 1}], "output_format": {"width": 4294967296, "height": 1}}})");
    QTest::newRow("font size beyond int") << QByteArray(
        R"({"plan": {"timeline": [{"asset_url": "a", "trim_start_ms": 0, "trim_end_ms": 1}],
            "text_overlays": [{"content": "x", "timeline_start_ms": 0, "timeline_end_ms": 1, "font_size": 3000000000}],
            "output_format": {"width": 1, "height": 1}}})");
    QTest::newRow("legacy trim beyond range") << QByteArray(
        R"({"source_url": "a.mp4", "trim": {"start_ms": 0, "end_ms": 1e16}})");
    QTest::newRow("legacy without trim") << QByteArray(R"({"source_url": "a.mp4"})");
    QTest::newRow("legacy trim missing end") << QByteArray(R"({"source_url": "a.mp4", "trim": {"start_ms": 0}})");
}

void TestExecutionPlan::testMalformedInputIsValidationError()
{
    QFETCH(QByteArray, input);

    Result<ExecutionPlan, JobError> result =
        ExecutionPlan::fromJobInput(QJsonDocument::fromJson(input).object(), 1080, 1920);
    QVERIFY(result.is_error());
    QCOMPARE(result.error().code, JobErrorCode::Validation);
    QVERIFY(!result.error().message.isEmpty());
}

void TestExecutionPlan::testAssetUrlsFirstSeenOrder()
{
    ExecutionPlan plan;
    plan.timeline = {{"b.mp4", 0, 1000}, {"a.mp4", 0, 1000}, {"b.mp4", 1000, 2000}};
    AudioTrack music;
    music.assetUrl = "music.mp3";
    AudioTrack reused;
    reused.assetUrl = "a.mp4";
    plan.audioTracks = {music, reused};

    QCOMPARE(plan.assetUrls(), QStringList({"b.mp4", "a.mp4", "music.mp3"}));

    // The legacy source is fetched first even when a plan is present
    QJsonObject input;
    input["source_url"] = "legacy.mp4";
    QCOMPARE(jobAssetUrls(input, plan), QStringList({"legacy.mp4", "b.mp4", "a.mp4", "music.mp3"}));
}

void TestExecutionPlan::testJobStatusDocument()
{
    QJsonObject input;
    input["source_url"] = "s.mp4";
    input["variation_id"] = "var-7";

    Job job = Job::createWithId("job-1", input);
    QCOMPARE(job.state(), JobState::Queued);
    QCOMPARE(job.variationId(), QString("var-7"));

    const QJsonObject status = job.toJson();
    QCOMPARE(status.value("id").toString(), QString("job-1"));
    QCOMPARE(status.value("state").toString(), QString("queued"));
    QCOMPARE(status.value("progress_pct").toInt(), 0);
    QVERIFY(status.value("output").isNull());
    QVERIFY(status.value("error").isNull());
    QCOMPARE(status.value("variation_id").toString(), QString("var-7"));

    QVERIFY(!Job::create(input).id().isEmpty());
    QVERIFY(Job::create(input).id() != Job::create(input).id());
}

void TestExecutionPlan::testJobErrorRoundTripsCode()
{
    QJsonObject detail;
    detail["reason"] = "DiskFull";
    const JobError error = JobError::encoderExec("encoder exited with code 1", detail);

    const QJsonObject json = error.toJson();
    QCOMPARE(json.value("code").toString(), QString("EncoderExec"));

    std::optional<JobError> parsed = JobError::fromJson(json);
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->code, JobErrorCode::EncoderExec);
    QCOMPARE(parsed->detail.value("reason").toString(), QString("DiskFull"));

    QVERIFY(jobStateFromString("finalizing") == std::optional<JobState>(JobState::Finalizing));
    QVERIFY(!jobStateFromString("paused").has_value());
    QVERIFY(isTerminalState(JobState::Failed));
    QVERIFY(!isTerminalState(JobState::Finalizing));
}

QTEST_GUILESS_MAIN(TestExecutionPlan)
#include "test_execution_plan.moc"
