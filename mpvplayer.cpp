#include "mpvplayer.h"

#include <QDebug>
#include <QMetaObject>

namespace {

bool checkResult(int result, const char* what, const char* name)
{
    if (result >= 0)
        return true;
    qWarning() << "MpvPlayer -" << what << name << "failed:" << mpv_error_string(result);
    return false;
}

bool setOption(mpv_handle* mpv, const char* name, const QByteArray& value)
{
    return checkResult(mpv_set_option_string(mpv, name, value.constData()), "setting option", name);
}

} // namespace

MpvPlayer::MpvPlayer(const PlayerOptions& options, QObject* parent)
    : QObject(parent), m_mpv(nullptr), m_initialized(false)
{
    m_mpv = mpv_create();
    if (!m_mpv) {
        qWarning() << "MpvPlayer::MpvPlayer() - Failed to create MPV instance";
        return;
    }

    // Options must be set before mpv_initialize()
    bool ok = setOption(m_mpv, "osd-level", QByteArray::number(options.osdLevel));
    ok = setOption(m_mpv, "ytdl", options.ytdl ? "yes" : "no") && ok;
    ok = setOption(m_mpv, "audio-fallback-to-null", options.audioFallbackToNull ? "yes" : "no") && ok;
    if (!options.audioOutput.isEmpty())
        ok = setOption(m_mpv, "ao", options.audioOutput) && ok;
    if (!options.hwdec.isEmpty())
        ok = setOption(m_mpv, "hwdec", options.hwdec) && ok;
    if (options.verbose) {
        ok = setOption(m_mpv, "terminal", "yes") && ok;
        ok = setOption(m_mpv, "msg-level", "all=v") && ok;
    }
    if (!ok)
        qWarning() << "MpvPlayer::MpvPlayer() - Some options were rejected, continuing with defaults";

    checkResult(mpv_request_log_messages(m_mpv, options.logLevel.constData()),
                "requesting log level", options.logLevel.constData());

    const int result = mpv_initialize(m_mpv);
    if (result < 0) {
        qWarning() << "MpvPlayer::MpvPlayer() - Failed to initialize MPV:" << mpv_error_string(result);
        mpv_destroy(m_mpv);
        m_mpv = nullptr;
        return;
    }

    mpv_set_wakeup_callback(m_mpv, on_wakeup, this);
    m_initialized = true;
    qDebug() << "MpvPlayer::MpvPlayer() - MPV initialized";
}

MpvPlayer::~MpvPlayer()
{
    Q_EMIT aboutToTerminate();

    if (!m_mpv)
        return;

    mpv_set_wakeup_callback(m_mpv, nullptr, nullptr);
    if (m_initialized)
        stop();

    // A renderer may still hold its own client handle; the core goes away
    // once that one is destroyed too.
    mpv_destroy(m_mpv);
    m_mpv = nullptr;
    qDebug() << "MpvPlayer::~MpvPlayer() - MPV handle released";
}

bool MpvPlayer::setPropertyString(const char* name, const QByteArray& value)
{
    if (!m_initialized)
        return false;
    return checkResult(mpv_set_property_string(m_mpv, name, value.constData()), "setting property", name);
}

bool MpvPlayer::setPropertyDoubleAsync(const char* name, double value)
{
    if (!m_initialized)
        return false;
    return checkResult(mpv_set_property_async(m_mpv, 0, name, MPV_FORMAT_DOUBLE, &value), "setting property", name);
}

bool MpvPlayer::loadFile(const QString& path)
{
    if (!m_initialized) {
        qWarning() << "MpvPlayer::loadFile() - Player is not initialized";
        return false;
    }

    const QByteArray file = path.toUtf8();
    const char* cmd[] = {"loadfile", file.constData(), nullptr};
    return checkResult(mpv_command_async(m_mpv, 0, cmd), "command", "loadfile");
}

bool MpvPlayer::stop()
{
    if (!m_initialized)
        return false;

    const char* cmd[] = {"stop", nullptr};
    return checkResult(mpv_command(m_mpv, cmd), "command", "stop");
}

bool MpvPlayer::setPaused(bool paused)
{
    return setPropertyString("pause", paused ? "yes" : "no");
}

void MpvPlayer::on_wakeup(void* ctx)
{
    // Called from an mpv thread; drain events on ours
    MpvPlayer* self = static_cast<MpvPlayer*>(ctx);
    QMetaObject::invokeMethod(self, "processEvents", Qt::QueuedConnection);
}

void MpvPlayer::processEvents()
{
    while (m_mpv) {
        mpv_event* event = mpv_wait_event(m_mpv, 0);
        if (event->event_id == MPV_EVENT_NONE)
            break;

        switch (event->event_id) {
        case MPV_EVENT_LOG_MESSAGE:
            handleLogMessage(static_cast<mpv_event_log_message*>(event->data));
            break;
        case MPV_EVENT_SET_PROPERTY_REPLY:
        case MPV_EVENT_COMMAND_REPLY:
            if (event->error < 0)
                qWarning() << "MpvPlayer::processEvents() - Async request failed:" << mpv_error_string(event->error);
            break;
        case MPV_EVENT_FILE_LOADED:
            qDebug() << "MpvPlayer::processEvents() - File loaded";
            Q_EMIT fileLoaded();
            break;
        case MPV_EVENT_END_FILE: {
            const mpv_event_end_file* endFile = static_cast<mpv_event_end_file*>(event->data);
            if (endFile->reason == MPV_END_FILE_REASON_ERROR)
                qWarning() << "MpvPlayer::processEvents() - Playback failed:" << mpv_error_string(endFile->error);
            Q_EMIT endOfFile(static_cast<int>(endFile->reason));
            break;
        }
        case MPV_EVENT_SHUTDOWN:
            qDebug() << "MpvPlayer::processEvents() - Core shut down";
            Q_EMIT shutdown();
            return;
        default:
            break;
        }
    }
}

void MpvPlayer::handleLogMessage(const mpv_event_log_message* msg)
{
    const QString text = QStringLiteral("[%1] %2")
        .arg(QString::fromUtf8(msg->prefix), QString::fromUtf8(msg->text).trimmed());

    switch (msg->log_level) {
    case MPV_LOG_LEVEL_FATAL:
    case MPV_LOG_LEVEL_ERROR:
        qCritical().noquote() << text;
        break;
    case MPV_LOG_LEVEL_WARN:
        qWarning().noquote() << text;
        break;
    case MPV_LOG_LEVEL_INFO:
        qInfo().noquote() << text;
        break;
    default:
        qDebug().noquote() << text;
        break;
    }
}
