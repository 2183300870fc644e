#ifndef PLAYERRENDERER_H
#define PLAYERRENDERER_H

#include <QObject>
#include <QRunnable>
#include <QSize>

#include <mpv/client.h>
#include <mpv/render_gl.h>

class QQuickWindow;

// Draws mpv video into the window's OpenGL framebuffer, underneath the
// Qt Quick scene. Lives on the scene-graph render thread.
// Qt6 pattern: init() on beforeRendering, render() on beforeRenderPassRecording
class PlayerRenderer : public QObject
{
    Q_OBJECT
public:
    PlayerRenderer(mpv_handle* mpv, QQuickWindow* window);
    ~PlayerRenderer() override;

    bool isInitialized() const { return m_mpvGL != nullptr; }
    bool hasFailed() const { return m_failed; }

    void setSize(const QSize& size) { m_size = size; }

    // An inactive renderer leaves the framebuffer untouched but still
    // consumes frames, so playback keeps its pace
    void setActive(bool active) { m_active = active; }
    bool isActive() const { return m_active; }

public Q_SLOTS:
    void init();
    void render();
    void swap();

private:
    static void on_update(void* ctx);

    mpv_handle* m_client;
    mpv_render_context* m_mpvGL;
    QQuickWindow* m_window;
    QSize m_size;
    bool m_active;
    bool m_failed;
};

// Deletes a renderer on the render thread, where its GL context is current
class CleanupJob : public QRunnable
{
public:
    explicit CleanupJob(PlayerRenderer* renderer) : m_renderer(renderer) {}
    void run() override { delete m_renderer; }
private:
    PlayerRenderer* m_renderer;
};

#endif // PLAYERRENDERER_H
