#pragma once

#include <cstdint>

struct GLFWwindow;

namespace plugview {

// Raw, non-owning window handle handed over by the host. Which fields are
// meaningful depends on the platform.
struct NativeWindowHandle {
    enum class Platform {
        Unknown,
        Xlib,    // display: Display*, window: Window
        Xcb,     // display: xcb_connection_t*, window: xcb_window_t
        Wayland, // display: wl_display*, surface: wl_surface*
        Win32,   // instance: HINSTANCE, surface: HWND
        AppKit,  // surface: NSView*
        Glfw     // surface: GLFWwindow*
    };

    Platform platform = Platform::Unknown;
    void* display = nullptr;
    uint64_t window = 0;
    void* surface = nullptr;
    void* instance = nullptr;

    static NativeWindowHandle xlib(void* display, uint64_t window) {
        NativeWindowHandle h;
        h.platform = Platform::Xlib;
        h.display = display;
        h.window = window;
        return h;
    }

    static NativeWindowHandle xcb(void* connection, uint32_t window) {
        NativeWindowHandle h;
        h.platform = Platform::Xcb;
        h.display = connection;
        h.window = window;
        return h;
    }

    static NativeWindowHandle wayland(void* display, void* surface) {
        NativeWindowHandle h;
        h.platform = Platform::Wayland;
        h.display = display;
        h.surface = surface;
        return h;
    }

    static NativeWindowHandle win32(void* hinstance, void* hwnd) {
        NativeWindowHandle h;
        h.platform = Platform::Win32;
        h.instance = hinstance;
        h.surface = hwnd;
        return h;
    }

    static NativeWindowHandle appKit(void* nsView) {
        NativeWindowHandle h;
        h.platform = Platform::AppKit;
        h.surface = nsView;
        return h;
    }

    static NativeWindowHandle glfw(GLFWwindow* window) {
        NativeWindowHandle h;
        h.platform = Platform::Glfw;
        h.surface = window;
        return h;
    }

    bool valid() const noexcept {
        switch (platform) {
        case Platform::Xlib:
        case Platform::Xcb:
            return display != nullptr && window != 0;
        case Platform::Wayland:
            return display != nullptr && surface != nullptr;
        case Platform::Win32:
        case Platform::AppKit:
        case Platform::Glfw:
            return surface != nullptr;
        case Platform::Unknown:
            break;
        }
        return false;
    }
};

const char* toString(NativeWindowHandle::Platform platform) noexcept;

} // namespace plugview
