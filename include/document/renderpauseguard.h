#ifndef RENDERPAUSEGUARD_H
#define RENDERPAUSEGUARD_H

// Anything that renders off the UI thread and must be quiesced around a save
class BackgroundRenderer
{
public:
    virtual ~BackgroundRenderer() = default;

    // Request cancellation and block until no work is running
    virtual void stop() = 0;
    // Continue with whatever was not finished
    virtual void resume() = 0;
};

// Stops a renderer for the lifetime of the guard; resumes on every exit path
class RenderPauseGuard
{
public:
    explicit RenderPauseGuard(BackgroundRenderer* renderer)
        : m_renderer(renderer)
    {
        if (m_renderer) m_renderer->stop();
    }

    ~RenderPauseGuard()
    {
        if (m_renderer) m_renderer->resume();
    }

    RenderPauseGuard(const RenderPauseGuard&) = delete;
    RenderPauseGuard& operator=(const RenderPauseGuard&) = delete;

private:
    BackgroundRenderer* m_renderer{nullptr};
};

#endif // RENDERPAUSEGUARD_H
