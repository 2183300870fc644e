#ifndef MPVPLAYER_H
#define MPVPLAYER_H

#include "playeroptions.h"

#include <QByteArray>
#include <QObject>
#include <QString>

#include <mpv/client.h>

// Owns one libmpv core. Views refer to it but never own it.
class MpvPlayer : public QObject
{
    Q_OBJECT
public:
    explicit MpvPlayer(const PlayerOptions& options = PlayerOptions(), QObject* parent = nullptr);
    ~MpvPlayer() override;

    // True once the core was created and initialized
    bool isValid() const { return m_initialized; }
    mpv_handle* handle() const { return m_mpv; }

    bool setPropertyString(const char* name, const QByteArray& value);
    // Does not wait for the core; safe to call from the render thread
    bool setPropertyDoubleAsync(const char* name, double value);

    bool loadFile(const QString& path);
    bool stop();
    bool setPaused(bool paused);

Q_SIGNALS:
    void fileLoaded();
    void endOfFile(int reason);
    void shutdown();

    // Emitted at the start of destruction, while handle() is still usable
    void aboutToTerminate();

private Q_SLOTS:
    void processEvents();

private:
    static void on_wakeup(void* ctx);
    void handleLogMessage(const mpv_event_log_message* msg);

    mpv_handle* m_mpv;
    bool m_initialized;
};

#endif // MPVPLAYER_H
