#include <QtTest>

#include "playeroptions.h"

class tst_PlayerOptions : public QObject
{
    Q_OBJECT

private slots:
    void testDefaults();
    void testFromArguments_FileOnly_KeepsDefaults();
    void testFromArguments_AllOptions();
    void testFromArguments_MissingFile_Fails();
    void testFromArguments_TwoFiles_Fails();
    void testFromArguments_UnknownLogLevel_Fails();
    void testFromArguments_UnknownOption_Fails();
    void testFromArguments_Failure_LeavesOptionsUntouched();
    void testIsValidLogLevel();
};

void tst_PlayerOptions::testDefaults()
{
    const PlayerOptions options;
    QCOMPARE(options.osdLevel, 0);
    QVERIFY(!options.ytdl);
    QVERIFY(options.audioFallbackToNull);
    QVERIFY(options.audioOutput.isEmpty());
    QVERIFY(options.hwdec.isEmpty());
    QVERIFY(!options.verbose);
    QCOMPARE(options.logLevel, QByteArray("warn"));
    QVERIFY(options.file.isEmpty());
}

void tst_PlayerOptions::testFromArguments_FileOnly_KeepsDefaults()
{
    PlayerOptions options;
    QString error;
    QVERIFY(PlayerOptions::fromArguments({"mpv-player-view", "clip.mkv"}, &options, &error));
    QCOMPARE(options.file, QString("clip.mkv"));
    QVERIFY(!options.verbose);
    QVERIFY(!options.ytdl);
    QVERIFY(options.hwdec.isEmpty());
    QCOMPARE(options.logLevel, QByteArray("warn"));
    QVERIFY(error.isEmpty());
}

void tst_PlayerOptions::testFromArguments_AllOptions()
{
    PlayerOptions options;
    QString error;
    const QStringList args{
        "mpv-player-view", "--verbose", "--ytdl", "--hwdec", "auto-safe",
        "--ao", "null", "--log-level", "debug", "https://example.com/video.webm"
    };
    QVERIFY2(PlayerOptions::fromArguments(args, &options, &error), qPrintable(error));
    QVERIFY(options.verbose);
    QVERIFY(options.ytdl);
    QCOMPARE(options.hwdec, QByteArray("auto-safe"));
    QCOMPARE(options.audioOutput, QByteArray("null"));
    QCOMPARE(options.logLevel, QByteArray("debug"));
    QCOMPARE(options.file, QString("https://example.com/video.webm"));
}

void tst_PlayerOptions::testFromArguments_MissingFile_Fails()
{
    PlayerOptions options;
    QString error;
    QVERIFY(!PlayerOptions::fromArguments({"mpv-player-view", "--verbose"}, &options, &error));
    QCOMPARE(error, QString("Missing video file"));
}

void tst_PlayerOptions::testFromArguments_TwoFiles_Fails()
{
    PlayerOptions options;
    QString error;
    QVERIFY(!PlayerOptions::fromArguments({"mpv-player-view", "a.mkv", "b.mkv"}, &options, &error));
    QCOMPARE(error, QString("Expected exactly one video file"));
}

void tst_PlayerOptions::testFromArguments_UnknownLogLevel_Fails()
{
    PlayerOptions options;
    QString error;
    QVERIFY(!PlayerOptions::fromArguments({"mpv-player-view", "--log-level", "loud", "a.mkv"}, &options, &error));
    QVERIFY(error.contains("loud"));
}

void tst_PlayerOptions::testFromArguments_UnknownOption_Fails()
{
    PlayerOptions options;
    QString error;
    QVERIFY(!PlayerOptions::fromArguments({"mpv-player-view", "--fullscreen", "a.mkv"}, &options, &error));
    QVERIFY(!error.isEmpty());
}

void tst_PlayerOptions::testFromArguments_Failure_LeavesOptionsUntouched()
{
    PlayerOptions options;
    options.hwdec = "vaapi";
    QVERIFY(!PlayerOptions::fromArguments({"mpv-player-view", "--hwdec", "nvdec"}, &options, nullptr));
    QCOMPARE(options.hwdec, QByteArray("vaapi"));
}

void tst_PlayerOptions::testIsValidLogLevel()
{
    QVERIFY(PlayerOptions::isValidLogLevel("no"));
    QVERIFY(PlayerOptions::isValidLogLevel("warn"));
    QVERIFY(PlayerOptions::isValidLogLevel("v"));
    QVERIFY(PlayerOptions::isValidLogLevel("trace"));
    QVERIFY(!PlayerOptions::isValidLogLevel(""));
    QVERIFY(!PlayerOptions::isValidLogLevel("WARN"));
    QVERIFY(!PlayerOptions::isValidLogLevel("verbose"));
}

QTEST_APPLESS_MAIN(tst_PlayerOptions)
#include "tst_PlayerOptions.moc"
