#include "playeroptions.h"

#include <QCommandLineParser>

bool PlayerOptions::isValidLogLevel(const QByteArray& level)
{
    static const char* const kLevels[] = {
        "no", "fatal", "error", "warn", "info", "v", "debug", "trace"
    };
    for (const char* known : kLevels) {
        if (level == known)
            return true;
    }
    return false;
}

bool PlayerOptions::fromArguments(const QStringList& args, PlayerOptions* options, QString* errorMessage)
{
    QCommandLineParser parser;
    parser.setApplicationDescription("Plays a video file inside a Qt Quick window using libmpv");
    parser.addHelpOption();
    parser.addPositionalArgument("file", "Video file or URL to play");
    parser.addOption({"verbose", "Print verbose mpv output to the terminal"});
    parser.addOption({"hwdec", "Hardware decoding mode passed to mpv", "mode"});
    parser.addOption({"ao", "Audio output driver passed to mpv", "driver"});
    parser.addOption({"log-level", "Minimum mpv log level forwarded to Qt logging", "level", "warn"});
    parser.addOption({"ytdl", "Allow mpv to resolve URLs through youtube-dl"});

    if (!parser.parse(args)) {
        if (errorMessage)
            *errorMessage = parser.errorText();
        return false;
    }

    if (parser.isSet("help")) {
        if (errorMessage)
            *errorMessage = parser.helpText();
        return false;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        if (errorMessage)
            *errorMessage = positional.isEmpty()
                ? QStringLiteral("Missing video file")
                : QStringLiteral("Expected exactly one video file");
        return false;
    }

    const QByteArray logLevel = parser.value("log-level").toUtf8();
    if (!isValidLogLevel(logLevel)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Unknown log level: %1").arg(QString::fromUtf8(logLevel));
        return false;
    }

    PlayerOptions parsed;
    parsed.verbose = parser.isSet("verbose");
    parsed.ytdl = parser.isSet("ytdl");
    parsed.hwdec = parser.value("hwdec").toUtf8();
    parsed.audioOutput = parser.value("ao").toUtf8();
    parsed.logLevel = logLevel;
    parsed.file = positional.first();

    *options = parsed;
    return true;
}
