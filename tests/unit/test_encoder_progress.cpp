#include "../common/test_base.h"
#include "../../src/core/render/encoder_progress.h"

#include <QTest>

using namespace cutline;

class TestEncoderProgress : public TestBase
{
    Q_OBJECT

private slots:
    void testParseTimestamp_data();
    void testParseTimestamp();
    void testExpectedDurationDrivesPercent();
    void testStatusLinesSplitAcrossChunks();
    void testReportedDurationFallback();
    void testPercentNeverDecreases();
    void testPercentCapsBelowHundred();
    void testNoDenominatorReportsNothing();
};

void TestEncoderProgress::testParseTimestamp_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<qint64>("ms");

    QTest::newRow("zero") << "00:00:00.00" << true << qint64(0);
    QTest::newRow("centiseconds") << "00:00:05.50" << true << qint64(5500);
    QTest::newRow("hours and minutes") << "01:02:03.25" << true << qint64(3723250);
    QTest::newRow("no fraction") << "00:01:10" << true << qint64(70000);
    QTest::newRow("padded") << "  00:00:01.00 " << true << qint64(1000);
    QTest::newRow("missing field") << "01:02" << false << qint64(0);
    QTest::newRow("garbage") << "N/A" << false << qint64(0);
    QTest::newRow("negative") << "-1:00:00.00" << false << qint64(0);
}

void TestEncoderProgress::testParseTimestamp()
{
    QFETCH(QString, text);
    QFETCH(bool, valid);
    QFETCH(qint64, ms);

    std::optional<qint64> parsed = EncoderProgress::parseTimestampMs(text);
    QCOMPARE(parsed.has_value(), valid);
    if (valid) {
        QCOMPARE(*parsed, ms);
    }
}

void TestEncoderProgress::testExpectedDurationDrivesPercent()
{
    EncoderProgress progress(10000);
    QCOMPARE(progress.denominatorMs(), qint64(10000));

    QVERIFY(progress.consume("frame=  30 fps=0.0 q=28.0 size=256kB time=00:00:02.50 bitrate=800kbits/s\r"));
    QCOMPARE(progress.percent(), 25);
    QCOMPARE(progress.positionMs(), qint64(2500));

    // Stream Duration does not override a known plan duration
    QVERIFY(!progress.consume("  Duration: 00:01:00.00, start: 0.000000, bitrate: 1200 kb/s\n"));
    QCOMPARE(progress.denominatorMs(), qint64(10000));
}

void TestEncoderProgress::testStatusLinesSplitAcrossChunks()
{
    EncoderProgress progress(4000);

    QVERIFY(!progress.consume("frame=  10 fps=0.0 time=00:00:0"));
    QCOMPARE(progress.percent(), 0);

    QVERIFY(progress.consume("1.00 bitrate=N/A\rframe=  20 fps=24 time=00:00:02.00 bitrate=N/A"));
    QCOMPARE(progress.percent(), 25);

    // Unterminated tail completes with the next terminator
    QVERIFY(progress.consume("\r"));
    QCOMPARE(progress.percent(), 50);
}

void TestEncoderProgress::testReportedDurationFallback()
{
    EncoderProgress progress;
    QCOMPARE(progress.denominatorMs(), qint64(0));

    QVERIFY(!progress.consume("Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'in.mp4':\n"
                              "  Duration: 00:00:20.00, start: 0.000000, bitrate: 900 kb/s\n"));
    QCOMPARE(progress.denominatorMs(), qint64(20000));

    // Only the first Duration line counts
    QVERIFY(!progress.consume("  Duration: 00:00:05.00, start: 0.000000\n"));
    QCOMPARE(progress.denominatorMs(), qint64(20000));

    QVERIFY(progress.consume("time=00:00:05.00\r"));
    QCOMPARE(progress.percent(), 25);
}

void TestEncoderProgress::testPercentNeverDecreases()
{
    EncoderProgress progress(10000);

    QVERIFY(progress.consume("time=00:00:06.00\r"));
    QCOMPARE(progress.percent(), 60);

    QVERIFY(!progress.consume("time=00:00:03.00\r"));
    QCOMPARE(progress.percent(), 60);
    QCOMPARE(progress.positionMs(), qint64(3000));

    QVERIFY(!progress.consume("time=00:00:06.05\r"));
    QCOMPARE(progress.percent(), 60);

    QVERIFY(progress.consume("time=00:00:07.00\r"));
    QCOMPARE(progress.percent(), 70);
}

void TestEncoderProgress::testPercentCapsBelowHundred()
{
    EncoderProgress progress(2000);

    QVERIFY(progress.consume("time=00:00:01.99\r"));
    QCOMPARE(progress.percent(), 99);

    QVERIFY(!progress.consume("time=00:00:02.00\rtime=00:00:03.50\r"));
    QCOMPARE(progress.percent(), 99);
}

void TestEncoderProgress::testNoDenominatorReportsNothing()
{
    EncoderProgress progress;

    QVERIFY(!progress.consume("time=00:00:04.00\r"));
    QCOMPARE(progress.percent(), 0);
    QCOMPARE(progress.positionMs(), qint64(4000));

    QVERIFY(!progress.consume(QByteArray(70 * 1024, 'x')));
    QCOMPARE(progress.percent(), 0);
}

QTEST_GUILESS_MAIN(TestEncoderProgress)
#include "test_encoder_progress.moc"
