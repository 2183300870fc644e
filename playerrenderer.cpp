#include "playerrenderer.h"

#include <QDebug>
#include <QOpenGLContext>
#include <QOpenGLFunctions>
#include <QQuickWindow>

// Get OpenGL proc address for MPV
static void* get_proc_address(void* ctx, const char* name)
{
    Q_UNUSED(ctx);
    QOpenGLContext* glctx = QOpenGLContext::currentContext();
    if (!glctx) return nullptr;
    return (void*)glctx->getProcAddress(QByteArray(name));
}

PlayerRenderer::PlayerRenderer(mpv_handle* mpv, QQuickWindow* window)
    : m_client(nullptr), m_mpvGL(nullptr), m_window(window), m_size(), m_active(true), m_failed(false)
{
    // Own client handle keeps the core alive until the render context is
    // freed, even if the player is destroyed first. Created here, during
    // synchronization, while the player is known to be alive.
    m_client = mpv_create_client(mpv, "playerview");
    if (!m_client) {
        qWarning() << "PlayerRenderer::PlayerRenderer() - Could not create MPV client handle";
        m_failed = true;
    }
}

PlayerRenderer::~PlayerRenderer()
{
    if (m_mpvGL) {
        mpv_render_context_set_update_callback(m_mpvGL, nullptr, nullptr);
        mpv_render_context_free(m_mpvGL);
    }
    // Last handle out destroys the core
    if (m_client)
        mpv_destroy(m_client);
    qDebug() << "PlayerRenderer::~PlayerRenderer() - Render context released";
}

void PlayerRenderer::init()
{
    if (m_mpvGL || m_failed)
        return;

    qDebug() << "PlayerRenderer::init() - Initializing MPV render context";

    mpv_opengl_init_params opengl_params = {
        get_proc_address,
        nullptr
    };

    mpv_render_param params[] = {
        {MPV_RENDER_PARAM_API_TYPE, const_cast<char*>(MPV_RENDER_API_TYPE_OPENGL)},
        {MPV_RENDER_PARAM_OPENGL_INIT_PARAMS, &opengl_params},
        {MPV_RENDER_PARAM_INVALID, nullptr}
    };

    const int result = mpv_render_context_create(&m_mpvGL, m_client, params);
    if (result < 0) {
        // Only one render context may exist per core
        qWarning() << "PlayerRenderer::init() - FAILED:" << mpv_error_string(result);
        m_mpvGL = nullptr;
        m_failed = true;
        return;
    }

    mpv_render_context_set_update_callback(m_mpvGL, on_update, this);
    qDebug() << "PlayerRenderer::init() - SUCCESS";
}

void PlayerRenderer::render()
{
    if (!m_mpvGL)
        return;

    if (!m_active) {
        // Nothing to draw, but mpv's video output waits for every frame to
        // be consumed. Advance its timing without touching the framebuffer.
        mpv_opengl_fbo mpv_fbo = {
            0,
            qMax(1, m_size.width()),
            qMax(1, m_size.height()),
            0
        };
        int skip = 1;
        mpv_render_param params[] = {
            {MPV_RENDER_PARAM_OPENGL_FBO, &mpv_fbo},
            {MPV_RENDER_PARAM_SKIP_RENDERING, &skip},
            {MPV_RENDER_PARAM_INVALID, nullptr}
        };
        mpv_render_context_render(m_mpvGL, params);
        return;
    }

    QOpenGLContext* context = QOpenGLContext::currentContext();
    if (!context) {
        qWarning() << "PlayerRenderer::render() - No OpenGL context!";
        return;
    }

    // Qt6 RHI: Tell Qt we're doing external OpenGL commands
    m_window->beginExternalCommands();

    GLint fbo = 0;
    context->functions()->glGetIntegerv(GL_FRAMEBUFFER_BINDING, &fbo);

    mpv_opengl_fbo mpv_fbo = {
        static_cast<int>(fbo),
        m_size.width(),
        m_size.height(),
        0
    };
    int flip = -1;
    mpv_render_param params[] = {
        {MPV_RENDER_PARAM_OPENGL_FBO, &mpv_fbo},
        {MPV_RENDER_PARAM_FLIP_Y, &flip},
        {MPV_RENDER_PARAM_INVALID, nullptr}
    };
    mpv_render_context_render(m_mpvGL, params);

    m_window->endExternalCommands();
}

void PlayerRenderer::swap()
{
    if (m_mpvGL)
        mpv_render_context_report_swap(m_mpvGL);
}

void PlayerRenderer::on_update(void* ctx)
{
    PlayerRenderer* self = static_cast<PlayerRenderer*>(ctx);
    QMetaObject::invokeMethod(self->m_window, "update", Qt::QueuedConnection);
}
