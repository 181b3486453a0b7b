#pragma once

#include <plugview/event-translator.h>
#include <plugview/host-window.h>
#include <plugview/surface-renderer.h>
#include <plugview/widget-root.h>
#include <chrono>
#include <functional>
#include <optional>

namespace plugview {

enum class SessionState {
    Uninitialized,
    PartiallyInitialized,
    Ready,
    Closed
};

const char* toString(SessionState state) noexcept;

// Builds the GPU surface for a window; width and height are physical pixels.
using RenderSurfaceFactory = std::function<Result<RenderSurface::Ptr>(
    const NativeWindowHandle& handle, uint32_t width, uint32_t height)>;

struct SessionOptions {
    Color background = Color::rgba8(30, 30, 35, 255);
    SurfaceOptions surface;
    // Empty: SurfaceRenderer::createUnchecked with the options above.
    RenderSurfaceFactory surfaceFactory;
};

//-----------------------------------------------------------------------------
// WindowSession
//
// Per-window state driven by the host callbacks. The GPU surface and the
// widget root are created lazily on frame callbacks, independently of each
// other; frames are rendered only once both exist.
//-----------------------------------------------------------------------------
class WindowSession : public WindowHandler {
public:
    WindowSession(WidgetBuilder builder, Size logicalSize, SessionOptions options = {});
    ~WindowSession() override = default;

    WindowSession(const WindowSession&) = delete;
    WindowSession& operator=(const WindowSession&) = delete;

    void onFrame(HostWindow& window) override;
    EventStatus onEvent(HostWindow& window, const HostEvent& event) override;

    SessionState state() const noexcept;
    bool hasWidgetRoot() const noexcept { return _root != nullptr; }
    bool hasRenderSurface() const noexcept { return _surface != nullptr; }
    bool builderConsumed() const noexcept { return !_builder.has_value(); }

    Size logicalSize() const noexcept { return _logicalSize; }
    const EventTranslator& translator() const noexcept { return _translator; }
    const Scene& lastScene() const noexcept { return _scene; }
    uint64_t framesSubmitted() const noexcept { return _framesSubmitted; }

private:
    void ensureInitialized(HostWindow& window);
    void renderFrame();
    void dispatch(const NormalizedEvent& event);
    void handleResize(const ResizeEvent& resize);

    std::optional<WidgetBuilder> _builder;
    WidgetRoot::Ptr _root;
    RenderSurface::Ptr _surface;
    RenderSurfaceFactory _surfaceFactory;

    EventTranslator _translator;
    Scene _scene;
    std::chrono::steady_clock::time_point _lastFrame;
    Color _background;
    Size _logicalSize;
    bool _resized = false;
    bool _closed = false;
    uint64_t _framesSubmitted = 0;
};

} // namespace plugview
