#pragma once

#include <plugview/host-window.h>
#include <plugview/widget-root.h>
#include <plugview/window-session.h>

namespace plugview {

using PlugviewWindowHandle = WindowHandle::Ptr;

// Entry points that put a widget tree into a window. The builder is moved
// into the window's thread and invoked there exactly once.
class PlugviewWindow {
public:
    // Embeds into a host-provided parent window; returns once the window has
    // been requested. A null backend selects HostBackend::createDefault().
    static Result<PlugviewWindowHandle> openParented(const NativeWindowHandle& parent,
                                                     const WindowOpenOptions& options,
                                                     WidgetBuilder builder,
                                                     SessionOptions sessionOptions = {},
                                                     HostBackend::Ptr backend = nullptr) noexcept;

    // Opens a top-level window and blocks until it is closed.
    static Result<void> openBlocking(const WindowOpenOptions& options,
                                     WidgetBuilder builder,
                                     SessionOptions sessionOptions = {},
                                     HostBackend::Ptr backend = nullptr) noexcept;

    // Factory handed to a backend: takes the builder out of a one-shot slot
    // and wraps it in a WindowSession.
    static HandlerFactory makeHandlerFactory(WidgetBuilder builder,
                                             SessionOptions sessionOptions);
};

} // namespace plugview
