#include "mpvplayer.h"
#include "playeroptions.h"
#include "playerview.h"

#include <QDebug>
#include <QGuiApplication>
#include <QQuickWindow>
#include <QSGRendererInterface>
#include <QTimer>

#include <clocale>

int main(int argc, char* argv[])
{
    // CRITICAL: Force Qt6 to use OpenGL backend (MPV requires OpenGL)
    // Must be set before QGuiApplication
    QQuickWindow::setGraphicsApi(QSGRendererInterface::OpenGL);

    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName("mpv-player-view");

    PlayerOptions options;
    QString error;
    if (!PlayerOptions::fromArguments(app.arguments(), &options, &error)) {
        qFatal("%s\nUsage: %s [--verbose] [--hwdec mode] [--ao driver] [--log-level level] [--ytdl] <video-file>",
               qPrintable(error), argv[0]);
        return 1;
    }

    // Required for mpv to work correctly with number formatting
    // Must be set after QGuiApplication as Qt may override it
    setlocale(LC_NUMERIC, "C");

    MpvPlayer player(options);
    if (!player.isValid()) {
        qFatal("Failed to initialize MPV");
        return 1;
    }

    QObject::connect(&player, &MpvPlayer::endOfFile, &app, [](int reason) {
        if (reason == MPV_END_FILE_REASON_EOF || reason == MPV_END_FILE_REASON_ERROR)
            QCoreApplication::quit();
    });
    QObject::connect(&player, &MpvPlayer::shutdown, &app, &QCoreApplication::quit);

    int result;
    {
        QQuickWindow window;
        window.setTitle(options.file);
        window.setColor(Qt::black);
        window.resize(1280, 720);

        // Video fills the whole window
        PlayerView* view = new PlayerView(&player, window.contentItem());
        view->setSize(window.size());
        QObject::connect(&window, &QWindow::widthChanged, view, [view](int width) { view->setWidth(width); });
        QObject::connect(&window, &QWindow::heightChanged, view, [view](int height) { view->setHeight(height); });

        window.show();

        // Load video with small delay to ensure rendering pipeline is fully initialized
        const QString file = options.file;
        QTimer::singleShot(100, &player, [&player, file]() {
            if (!player.loadFile(file))
                QCoreApplication::exit(1);
        });

        result = app.exec();
    } // window and its renderer destroyed here, before mpv cleanup

    return result;
}
