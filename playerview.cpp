#include "playerview.h"
#include "playerrenderer.h"

#include <QDebug>
#include <QQuickWindow>

PlayerView::PlayerView(MpvPlayer* player, QQuickItem* parent)
    : QQuickItem(parent), m_renderer(nullptr)
{
    if (player && player->isValid()) {
        m_player = player;

        // Critical: Set vo=libmpv for Qt integration
        player->setPropertyString("vo", "libmpv");

        // Direct: the player's handle is only usable until its destructor returns
        connect(player, &MpvPlayer::aboutToTerminate, this, &PlayerView::onPlayerTerminating, Qt::DirectConnection);
    } else {
        qWarning() << "PlayerView::PlayerView() - No usable player, view stays empty";
    }

    connect(this, &QQuickItem::windowChanged, this, &PlayerView::onWindowChanged, Qt::DirectConnection);
}

PlayerView::~PlayerView()
{
    scheduleRendererCleanup();
}

MpvPlayer* PlayerView::player() const
{
    return m_player.data();
}

bool PlayerView::hasPlayer() const
{
    return !m_player.isNull();
}

void PlayerView::releaseResources()
{
    scheduleRendererCleanup();
}

void PlayerView::geometryChange(const QRectF& newGeometry, const QRectF& oldGeometry)
{
    QQuickItem::geometryChange(newGeometry, oldGeometry);
    if (window())
        window()->update();
}

void PlayerView::itemChange(ItemChange change, const ItemChangeData& value)
{
    QQuickItem::itemChange(change, value);
    if (change == ItemVisibleHasChanged && window())
        window()->update();
}

void PlayerView::onWindowChanged(QQuickWindow* win)
{
    if (m_window)
        disconnect(m_window, nullptr, this, nullptr);
    m_window = win;

    if (win) {
        connect(win, &QQuickWindow::beforeSynchronizing, this, &PlayerView::onSynchronize, Qt::DirectConnection);
        connect(win, &QQuickWindow::sceneGraphInvalidated, this, &PlayerView::onInvalidate, Qt::DirectConnection);
    }
}

// Runs on the render thread while the GUI thread is blocked
void PlayerView::onSynchronize()
{
    QQuickWindow* win = window();
    if (!win)
        return;

    if (!m_renderer && m_player) {
        qDebug() << "PlayerView::onSynchronize() - Creating PlayerRenderer";
        m_renderer = new PlayerRenderer(m_player->handle(), win);

        // Qt6 pattern: init on beforeRendering, render on beforeRenderPassRecording
        connect(win, &QQuickWindow::beforeRendering, m_renderer, &PlayerRenderer::init, Qt::DirectConnection);
        connect(win, &QQuickWindow::beforeRenderPassRecording, m_renderer, &PlayerRenderer::render, Qt::DirectConnection);
        connect(win, &QQuickWindow::frameSwapped, m_renderer, &PlayerRenderer::swap, Qt::DirectConnection);
    }

    if (!m_renderer)
        return;

    m_renderer->setSize(win->size() * win->devicePixelRatio());

    bool active = isVisible() && !m_player.isNull();
    // A renderer that lost the race for the core's render context must not
    // move the video of the one that won.
    if (active && m_renderer->isInitialized())
        active = updateVideoMargins();
    m_renderer->setActive(active);
}

void PlayerView::onInvalidate()
{
    if (m_renderer)
        delete m_renderer;
    m_renderer = nullptr;
}

void PlayerView::onPlayerTerminating()
{
    qDebug() << "PlayerView::onPlayerTerminating() - Player is going away";

    scheduleRendererCleanup();
    m_player.clear();
    Q_EMIT playerLost();

    if (m_window)
        m_window->update();
}

void PlayerView::scheduleRendererCleanup()
{
    if (!m_renderer)
        return;

    if (m_window) {
        m_window->scheduleRenderJob(new CleanupJob(m_renderer), QQuickWindow::BeforeSynchronizingStage);
    } else {
        qWarning() << "PlayerView::scheduleRendererCleanup() - No window left, releasing renderer directly";
        delete m_renderer;
    }
    m_renderer = nullptr;
}

bool PlayerView::videoMarginsFor(const QRectF& sceneRect, const QSizeF& windowSize, QMarginsF* margins)
{
    if (windowSize.isEmpty())
        return false;

    const QRectF area = sceneRect.intersected(QRectF(QPointF(0, 0), windowSize));
    if (area.isEmpty())
        return false;

    *margins = QMarginsF(area.left() / windowSize.width(),
                         area.top() / windowSize.height(),
                         (windowSize.width() - area.right()) / windowSize.width(),
                         (windowSize.height() - area.bottom()) / windowSize.height());
    return true;
}

// Confines mpv's output to this item's rectangle within the window.
// Returns false when the item covers no visible area.
bool PlayerView::updateVideoMargins()
{
    QMarginsF margins;
    if (!videoMarginsFor(mapRectToScene(boundingRect()), window()->size(), &margins))
        return false;
    if (margins == m_margins)
        return true;

    m_margins = margins;
    m_player->setPropertyDoubleAsync("video-margin-ratio-left", margins.left());
    m_player->setPropertyDoubleAsync("video-margin-ratio-top", margins.top());
    m_player->setPropertyDoubleAsync("video-margin-ratio-right", margins.right());
    m_player->setPropertyDoubleAsync("video-margin-ratio-bottom", margins.bottom());
    return true;
}
