#pragma once

#include <plugview/host-event.h>
#include <plugview/pointer.h>
#include <plugview/scene.h>
#include <chrono>
#include <functional>
#include <memory>
#include <variant>

namespace plugview {

enum class Handled {
    Yes,
    No
};

struct WindowResize {
    uint32_t width;  // physical
    uint32_t height; // physical
};

struct WindowRescale {
    double scale;
};

struct AnimFrame {
    std::chrono::nanoseconds elapsed;
};

using WindowEvent = std::variant<WindowResize, WindowRescale, AnimFrame>;

// Placeholder for the accessibility tree delta produced by a redraw.
struct AccessibilityUpdate {
    bool changed = false;
};

struct RedrawResult {
    Scene scene;
    AccessibilityUpdate accessibility;
};

//-----------------------------------------------------------------------------
// WidgetRoot - the retained widget tree as seen from a window
//-----------------------------------------------------------------------------
class WidgetRoot {
public:
    using Ptr = std::unique_ptr<WidgetRoot>;

    virtual ~WidgetRoot() = default;

    virtual Handled handlePointerEvent(const PointerEvent& event) = 0;
    virtual Handled handleWindowEvent(const WindowEvent& event) = 0;

    // Raw host keyboard events; there is no text or key translation yet.
    virtual Handled handleKeyboardEvent(const KeyboardEvent&) { return Handled::No; }

    // Scene in physical pixels.
    virtual RedrawResult redraw() = 0;
};

// Invoked once, on the window's thread, after a native window exists.
using WidgetBuilder = std::function<WidgetRoot::Ptr()>;

} // namespace plugview
