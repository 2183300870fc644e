#ifndef PLAYEROPTIONS_H
#define PLAYEROPTIONS_H

#include <QByteArray>
#include <QString>
#include <QStringList>

// Startup options applied to an mpv core before mpv_initialize()
struct PlayerOptions
{
    int osdLevel = 0;
    bool ytdl = false;
    bool audioFallbackToNull = true;
    QByteArray audioOutput;     // empty: libmpv default
    QByteArray hwdec;           // empty: libmpv default
    bool verbose = false;
    QByteArray logLevel = "warn";

    QString file;

    // Parses a full command line (args[0] is the program name).
    // Returns false and fills errorMessage on a missing file or bad value.
    static bool fromArguments(const QStringList& args, PlayerOptions* options, QString* errorMessage);

    static bool isValidLogLevel(const QByteArray& level);
};

#endif // PLAYEROPTIONS_H
