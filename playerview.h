#ifndef PLAYERVIEW_H
#define PLAYERVIEW_H

#include "mpvplayer.h"

#include <QMarginsF>
#include <QPointer>
#include <QQuickItem>
#include <QRectF>

class PlayerRenderer;
class QQuickWindow;

// Qt Quick item showing the video of one MpvPlayer, bound at construction.
// Does not own the player; emits playerLost() if the player goes first.
class PlayerView : public QQuickItem
{
    Q_OBJECT
    Q_PROPERTY(MpvPlayer* player READ player NOTIFY playerLost)
    Q_PROPERTY(bool hasPlayer READ hasPlayer NOTIFY playerLost)

public:
    explicit PlayerView(MpvPlayer* player, QQuickItem* parent = nullptr);
    ~PlayerView() override;

    MpvPlayer* player() const;
    bool hasPlayer() const;

    // mpv video-margin-ratio-* values confining the video to sceneRect.
    // Returns false when sceneRect covers no area of the window.
    static bool videoMarginsFor(const QRectF& sceneRect, const QSizeF& windowSize, QMarginsF* margins);

Q_SIGNALS:
    void playerLost();

protected:
    void releaseResources() override;
    void geometryChange(const QRectF& newGeometry, const QRectF& oldGeometry) override;
    void itemChange(ItemChange change, const ItemChangeData& value) override;

private Q_SLOTS:
    void onWindowChanged(QQuickWindow* win);
    void onSynchronize();
    void onInvalidate();
    void onPlayerTerminating();

private:
    void scheduleRendererCleanup();
    bool updateVideoMargins();

    QPointer<MpvPlayer> m_player;
    PlayerRenderer* m_renderer;
    QPointer<QQuickWindow> m_window;
    QMarginsF m_margins;
};

#endif // PLAYERVIEW_H
