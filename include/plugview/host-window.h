#pragma once

#include <plugview/host-event.h>
#include <plugview/native-window-handle.h>
#include <plugview/result.hpp>
#include <functional>
#include <memory>
#include <string>

namespace plugview {

struct Size {
    double width = 0.0;
    double height = 0.0;
};

class WindowScalePolicy {
public:
    static WindowScalePolicy systemScaleFactor() { return WindowScalePolicy(0.0); }
    static WindowScalePolicy scaleFactor(double factor) { return WindowScalePolicy(factor); }

    bool isSystem() const noexcept { return _factor <= 0.0; }
    double factor() const noexcept { return isSystem() ? 1.0 : _factor; }

private:
    explicit WindowScalePolicy(double factor) : _factor(factor) {}

    double _factor;
};

struct WindowOpenOptions {
    std::string title = "plugview";
    Size size{400.0, 300.0}; // logical
    WindowScalePolicy scale = WindowScalePolicy::systemScaleFactor();
};

enum class EventStatus {
    Captured,
    Ignored
};

// A window owned by the host side, valid for the duration of a callback.
class HostWindow {
public:
    virtual ~HostWindow() = default;

    virtual NativeWindowHandle nativeHandle() const = 0;
    virtual double scaleFactor() const = 0;
    virtual Size logicalSize() const = 0;
    virtual void close() = 0;
};

// Receives the host callback sequence for one window, on the window's thread.
class WindowHandler {
public:
    virtual ~WindowHandler() = default;

    virtual void onFrame(HostWindow& window) = 0;
    virtual EventStatus onEvent(HostWindow& window, const HostEvent& event) = 0;
};

// Called once on the window's thread when the window has been created.
using HandlerFactory =
    std::function<Result<std::unique_ptr<WindowHandler>>(HostWindow& window)>;

// Handle to a parented window running on another thread.
class WindowHandle {
public:
    using Ptr = std::shared_ptr<WindowHandle>;

    virtual ~WindowHandle() = default;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

//-----------------------------------------------------------------------------
// HostBackend - owns native windows and delivers their callbacks
//-----------------------------------------------------------------------------
class HostBackend {
public:
    using Ptr = std::shared_ptr<HostBackend>;

    virtual ~HostBackend() = default;

    // GLFW backend. frameRate is the frame callback rate in Hz.
    static Result<Ptr> createDefault(double frameRate = 60.0) noexcept;

    // Runs the window on the calling thread until it closes.
    virtual Result<void> openBlocking(const WindowOpenOptions& options,
                                      HandlerFactory factory) = 0;

    // Embeds a child window into parent and returns immediately.
    virtual Result<WindowHandle::Ptr> openParented(const NativeWindowHandle& parent,
                                                   const WindowOpenOptions& options,
                                                   HandlerFactory factory) = 0;
};

} // namespace plugview
