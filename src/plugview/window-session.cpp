#include <plugview/window-session.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace plugview {

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

uint32_t toPhysical(double logical, double scale) {
    return static_cast<uint32_t>(std::lround(std::max(0.0, logical * scale)));
}

} // namespace

const char* toString(SessionState state) noexcept {
    switch (state) {
    case SessionState::Uninitialized: return "Uninitialized";
    case SessionState::PartiallyInitialized: return "PartiallyInitialized";
    case SessionState::Ready: return "Ready";
    case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

WindowSession::WindowSession(WidgetBuilder builder, Size logicalSize, SessionOptions options)
    : _builder(std::move(builder)),
      _surfaceFactory(std::move(options.surfaceFactory)),
      _translator(1.0),
      _lastFrame(std::chrono::steady_clock::now()),
      _background(options.background),
      _logicalSize(logicalSize) {
    if (!_surfaceFactory) {
        _surfaceFactory = [surfaceOptions = options.surface](const NativeWindowHandle& handle,
                                                             uint32_t width, uint32_t height) {
            return SurfaceRenderer::createUnchecked(handle, width, height, surfaceOptions);
        };
    }
}

SessionState WindowSession::state() const noexcept {
    if (_closed) {
        return SessionState::Closed;
    }
    if (_root && _surface) {
        return SessionState::Ready;
    }
    if (_root || _surface) {
        return SessionState::PartiallyInitialized;
    }
    return SessionState::Uninitialized;
}

//-----------------------------------------------------------------------------
// Frames
//-----------------------------------------------------------------------------

void WindowSession::onFrame(HostWindow& window) {
    if (_closed) {
        return;
    }
    ensureInitialized(window);
    renderFrame();
}

void WindowSession::ensureInitialized(HostWindow& window) {
    // Until the host reports a resize, trust the window's own scale.
    if (!_resized) {
        _translator.setScaleFactor(window.scaleFactor());
    }
    double scale = _translator.scaleFactor();

    if (!_surface) {
        auto res = _surfaceFactory(window.nativeHandle(),
                                   toPhysical(_logicalSize.width, scale),
                                   toPhysical(_logicalSize.height, scale));
        if (!res) {
            yerror("Failed to create GPU context: {}", error_msg(res));
            return;
        }
        _surface = std::move(*res);
        yinfo("GPU context initialized");
    }

    if (!_root && _builder) {
        WidgetBuilder builder = std::move(*_builder);
        _builder.reset();

        _root = builder();
        if (!_root) {
            yerror("Widget builder returned no widget root");
            return;
        }
        _root->handleWindowEvent(WindowResize{toPhysical(_logicalSize.width, scale),
                                              toPhysical(_logicalSize.height, scale)});
        _root->handleWindowEvent(WindowRescale{scale});
        yinfo("Widget tree initialized");
    }
}

void WindowSession::renderFrame() {
    if (!_root || !_surface) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    auto dt = std::chrono::duration_cast<std::chrono::nanoseconds>(now - _lastFrame);
    _lastFrame = now;

    _root->handleWindowEvent(AnimFrame{dt});

    auto redraw = _root->redraw();
    _scene = std::move(redraw.scene);

    ++_framesSubmitted;
    if (auto res = _surface->render(_scene, _background); !res) {
        yerror("Render error: {}", error_msg(res));
    }
}

//-----------------------------------------------------------------------------
// Events
//-----------------------------------------------------------------------------

EventStatus WindowSession::onEvent(HostWindow&, const HostEvent& event) {
    auto translated = _translator.translate(event);
    if (!translated) {
        return EventStatus::Ignored;
    }
    dispatch(*translated);
    return EventStatus::Captured;
}

void WindowSession::dispatch(const NormalizedEvent& event) {
    std::visit(overloaded{
        [this](const PointerEvent& pointer) {
            if (_root) {
                _root->handlePointerEvent(pointer);
            }
        },
        [this](const KeyboardEvent& key) {
            if (_root) {
                _root->handleKeyboardEvent(key);
            }
        },
        [this](const ResizeEvent& resize) {
            handleResize(resize);
        },
        [](const FocusEvent& focus) {
            ydebug("Focus {} absorbed", focus.focused ? "gained" : "lost");
        },
        [this](const CloseEvent&) {
            yinfo("Window closing");
            _closed = true;
        },
    }, event);
}

void WindowSession::handleResize(const ResizeEvent& resize) {
    double scale = resize.scale > 0.0 ? resize.scale : 1.0;
    _logicalSize = {resize.width / scale, resize.height / scale};
    _translator.setScaleFactor(scale);
    _resized = true;

    if (_surface) {
        if (auto res = _surface->resize(resize.width, resize.height); !res) {
            yerror("Surface resize failed: {}", error_msg(res));
        }
    }

    if (_root) {
        _root->handleWindowEvent(WindowResize{resize.width, resize.height});
        _root->handleWindowEvent(WindowRescale{scale});
    }
}

} // namespace plugview
