#pragma once

//=============================================================================
// Session harness
//
// Fake host window, recording render surface, recording widget root and an
// in-process host backend, for driving window sessions without a GPU or a
// windowing system.
//=============================================================================

#include <plugview/plugview-window.h>
#include <plugview/window-session.h>
#include <memory>
#include <string>
#include <vector>

namespace plugview::test {

//-----------------------------------------------------------------------------
// FakeHostWindow
//-----------------------------------------------------------------------------
class FakeHostWindow : public HostWindow {
public:
    FakeHostWindow(Size logicalSize = {400.0, 300.0}, double scale = 1.0)
        : _logicalSize(logicalSize), _scale(scale) {}

    NativeWindowHandle nativeHandle() const override { return NativeWindowHandle{}; }
    double scaleFactor() const override { return _scale; }
    Size logicalSize() const override { return _logicalSize; }
    void close() override { _closeRequested = true; }

    bool closeRequested() const { return _closeRequested; }

private:
    Size _logicalSize;
    double _scale;
    bool _closeRequested = false;
};

//-----------------------------------------------------------------------------
// MockRenderSurface - records what the session submits
//-----------------------------------------------------------------------------
struct SurfaceStats {
    bool failCreate = false;
    bool failRender = false;
    int created = 0;
    int createAttempts = 0;
    int renders = 0;
    int resizes = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    size_t lastSceneSize = 0;
    Color lastBackground;
};

class MockRenderSurface : public RenderSurface {
public:
    explicit MockRenderSurface(std::shared_ptr<SurfaceStats> stats) : _stats(std::move(stats)) {}

    Result<void> resize(uint32_t width, uint32_t height) noexcept override {
        // Raw request; clamping belongs to the real surface.
        ++_stats->resizes;
        _stats->width = width;
        _stats->height = height;
        return Ok();
    }

    Result<void> render(const Scene& scene, Color baseColor) noexcept override {
        ++_stats->renders;
        _stats->lastSceneSize = scene.size();
        _stats->lastBackground = baseColor;
        if (_stats->failRender) {
            return RenderErr(RenderErrorKind::Surface, "mock surface lost");
        }
        return Ok();
    }

private:
    std::shared_ptr<SurfaceStats> _stats;
};

inline RenderSurfaceFactory mockSurfaceFactory(std::shared_ptr<SurfaceStats> stats) {
    return [stats](const NativeWindowHandle&, uint32_t width,
                   uint32_t height) -> Result<RenderSurface::Ptr> {
        ++stats->createAttempts;
        if (stats->failCreate) {
            return RenderErr<RenderSurface::Ptr>(RenderErrorKind::NoAdapter);
        }
        ++stats->created;
        stats->width = width;
        stats->height = height;
        return Ok(RenderSurface::Ptr(new MockRenderSurface(stats)));
    };
}

//-----------------------------------------------------------------------------
// MockWidgetRoot - logs everything delivered to it
//-----------------------------------------------------------------------------
struct RootStats {
    std::vector<std::string> windowEvents; // "resize 800x600", "rescale 2", "anim"
    std::vector<PointerEvent> pointerEvents;
    std::vector<KeyboardEvent> keyboardEvents;
    int redraws = 0;
};

class MockWidgetRoot : public WidgetRoot {
public:
    explicit MockWidgetRoot(std::shared_ptr<RootStats> stats) : _stats(std::move(stats)) {}

    Handled handlePointerEvent(const PointerEvent& event) override {
        _stats->pointerEvents.push_back(event);
        return Handled::Yes;
    }

    Handled handleWindowEvent(const WindowEvent& event) override {
        if (auto* resize = std::get_if<WindowResize>(&event)) {
            _stats->windowEvents.push_back("resize " + std::to_string(resize->width) + "x" +
                                           std::to_string(resize->height));
        } else if (auto* rescale = std::get_if<WindowRescale>(&event)) {
            _stats->windowEvents.push_back("rescale " + formatScale(rescale->scale));
        } else {
            _stats->windowEvents.push_back("anim");
        }
        return Handled::Yes;
    }

    Handled handleKeyboardEvent(const KeyboardEvent& event) override {
        _stats->keyboardEvents.push_back(event);
        return Handled::Yes;
    }

    RedrawResult redraw() override {
        ++_stats->redraws;
        RedrawResult result;
        result.scene.fillRect(Rect::fromOriginSize(0, 0, 10, 10), Color::rgba8(255, 0, 0));
        result.scene.fillCircle({5, 5}, 2, Color::rgba8(0, 255, 0));
        return result;
    }

private:
    static std::string formatScale(double scale) {
        std::string s = std::to_string(scale);
        s.erase(s.find_last_not_of('0') + 1);
        if (!s.empty() && s.back() == '.') {
            s.pop_back();
        }
        return s;
    }

    std::shared_ptr<RootStats> _stats;
};

// Builder that counts its invocations.
inline WidgetBuilder countingBuilder(std::shared_ptr<int> counter,
                                     std::shared_ptr<RootStats> stats) {
    return [counter, stats]() -> WidgetRoot::Ptr {
        ++*counter;
        return WidgetRoot::Ptr(new MockWidgetRoot(stats));
    };
}

//-----------------------------------------------------------------------------
// FakeHostBackend - runs blocking windows for a fixed number of frames and
// parented windows on demand
//-----------------------------------------------------------------------------
class FakeHostBackend : public HostBackend,
                        public std::enable_shared_from_this<FakeHostBackend> {
public:
    int framesPerWindow = 10;
    double scale = 1.0;
    bool failOpen = false;

    int openBlockingCalls = 0;
    int openParentedCalls = 0;
    WindowOpenOptions lastOptions;
    std::unique_ptr<FakeHostWindow> parentedWindow;
    std::unique_ptr<WindowHandler> parentedHandler;
    bool parentedOpen = false;

    Result<void> openBlocking(const WindowOpenOptions& options,
                              HandlerFactory factory) override {
        ++openBlockingCalls;
        lastOptions = options;
        if (failOpen) {
            return Err<void>("No display available");
        }
        FakeHostWindow window(options.size, scale);
        auto handler = factory(window);
        if (!handler) {
            return Err<void>("Handler factory failed", handler);
        }
        (*handler)->onEvent(window, HostEvent::resized(
            static_cast<uint32_t>(options.size.width * scale),
            static_cast<uint32_t>(options.size.height * scale), scale));
        for (int i = 0; i < framesPerWindow; ++i) {
            (*handler)->onFrame(window);
        }
        (*handler)->onEvent(window, HostEvent::willClose());
        return Ok();
    }

    // The backend owns the parented window; handles only close it.
    Result<WindowHandle::Ptr> openParented(const NativeWindowHandle&,
                                           const WindowOpenOptions& options,
                                           HandlerFactory factory) override {
        ++openParentedCalls;
        lastOptions = options;
        if (failOpen) {
            return Err<WindowHandle::Ptr>("Parent window is not embeddable");
        }
        parentedWindow = std::make_unique<FakeHostWindow>(options.size, scale);
        auto handler = factory(*parentedWindow);
        if (!handler) {
            return Err<WindowHandle::Ptr>("Handler factory failed", handler);
        }
        parentedHandler = std::move(*handler);
        parentedOpen = true;
        return Ok(WindowHandle::Ptr(std::make_shared<Handle>(shared_from_this())));
    }

    // One frame loop iteration for the parented window, as the window thread
    // would run it.
    void runParentedFrames(int frames) {
        for (int i = 0; i < frames && parentedOpen; ++i) {
            parentedHandler->onFrame(*parentedWindow);
        }
    }

private:
    class Handle : public WindowHandle {
    public:
        explicit Handle(std::shared_ptr<FakeHostBackend> backend) : _backend(std::move(backend)) {}

        void close() override {
            if (_backend->parentedOpen) {
                _backend->parentedHandler->onEvent(*_backend->parentedWindow, HostEvent::willClose());
                _backend->parentedOpen = false;
            }
        }
        bool isOpen() const override { return _backend->parentedOpen; }

    private:
        std::shared_ptr<FakeHostBackend> _backend;
    };
};

} // namespace plugview::test
