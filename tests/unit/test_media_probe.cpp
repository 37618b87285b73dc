#include "../common/test_base.h"

#include <media_probe/probe.h>

#include <QProcess>
#include <QStandardPaths>
#include <QTest>
#include <QtEndian>

using namespace cutline;

namespace {

void appendLe32(QByteArray& out, quint32 value)
{
    char bytes[4];
    qToLittleEndian(value, bytes);
    out.append(bytes, 4);
}

void appendLe16(QByteArray& out, quint16 value)
{
    char bytes[2];
    qToLittleEndian(value, bytes);
    out.append(bytes, 2);
}

// PCM s16le mono silence
QByteArray silentWav(int sampleRate, int seconds)
{
    const quint32 dataSize = static_cast<quint32>(sampleRate * seconds * 2);

    QByteArray wav;
    wav.append("RIFF");
    appendLe32(wav, 36 + dataSize);
    wav.append("WAVE");
    wav.append("fmt ");
    appendLe32(wav, 16);
    appendLe16(wav, 1);
    appendLe16(wav, 1);
    appendLe32(wav, static_cast<quint32>(sampleRate));
    appendLe32(wav, static_cast<quint32>(sampleRate * 2));
    appendLe16(wav, 2);
    appendLe16(wav, 16);
    wav.append("data");
    appendLe32(wav, dataSize);
    wav.append(QByteArray(static_cast<int>(dataSize), '\0'));
    return wav;
}

} // namespace

class TestMediaProbe : public TestBase
{
    Q_OBJECT

private slots:
    void testMissingFile();
    void testEmptyPath();
    void testJunkFileRejected();
    void testAudioOnlyFile();
    void testRenderedClip();
};

void TestMediaProbe::testMissingFile()
{
    const std::string path = m_testDataDir->filePath("does-not-exist.mp4").toStdString();
    Result<media::MediaInfo, media::ProbeError> result = media::probe(path);

    QVERIFY(result.is_error());
    QCOMPARE(result.error().code, media::ProbeErrorCode::FileNotFound);
    QVERIFY(result.error().message.find("does-not-exist.mp4") != std::string::npos);
}

void TestMediaProbe::testEmptyPath()
{
    Result<media::MediaInfo, media::ProbeError> result = media::probe(std::string());
    QVERIFY(result.is_error());
    QCOMPARE(result.error().code, media::ProbeErrorCode::FileNotFound);
}

void TestMediaProbe::testJunkFileRejected()
{
    const QString path = writeTestFile("junk.mp4", QByteArray("this is not a media container\n").repeated(64));
    QVERIFY(!path.isEmpty());

    Result<media::MediaInfo, media::ProbeError> result = media::probe(path.toStdString());
    QVERIFY(result.is_error());
    QVERIFY(result.error().code != media::ProbeErrorCode::FileNotFound);
    QVERIFY(!result.error().message.empty());
}

void TestMediaProbe::testAudioOnlyFile()
{
    const QString path = writeTestFile("silence.wav", silentWav(8000, 2));
    QVERIFY(!path.isEmpty());

    Result<media::MediaInfo, media::ProbeError> result = media::probe(path.toStdString());
    QVERIFY2(result.is_ok(), result.is_error() ? result.error().message.c_str() : "");

    const media::MediaInfo& info = result.value();
    QVERIFY(info.has_audio);
    QVERIFY(!info.has_video);
    QCOMPARE(info.format_name, std::string("wav"));
    QVERIFY2(qAbs(info.duration_ms() - 2000) <= 50, qPrintable(QString::number(info.duration_ms())));
}

void TestMediaProbe::testRenderedClip()
{
    const QString ffmpeg = QStandardPaths::findExecutable("ffmpeg");
    if (ffmpeg.isEmpty()) {
        QSKIP("ffmpeg not installed");
    }

    const QString output = m_testDataDir->filePath("clip.mp4");
    QProcess process;
    process.start(ffmpeg, {
        "-hide_banner", "-loglevel", "error", "-y",
        "-f", "lavfi", "-i", "testsrc=duration=1:size=320x240:rate=25",
        "-f", "lavfi", "-i", "sine=frequency=440:duration=1",
        "-shortest", "-c:v", "mpeg4", "-c:a", "aac", output
    });
    QVERIFY(process.waitForFinished(30000));
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        QSKIP("ffmpeg could not render a test clip");
    }

    Result<media::MediaInfo, media::ProbeError> result = media::probe(output.toStdString());
    QVERIFY2(result.is_ok(), result.is_error() ? result.error().message.c_str() : "");

    const media::MediaInfo& info = result.value();
    QVERIFY(info.has_video);
    QVERIFY(info.has_audio);
    QCOMPARE(info.width, 320);
    QCOMPARE(info.height, 240);
    QVERIFY2(info.duration_ms() >= 900 && info.duration_ms() <= 1200,
             qPrintable(QString::number(info.duration_ms())));
}

QTEST_GUILESS_MAIN(TestMediaProbe)
#include "test_media_probe.moc"
