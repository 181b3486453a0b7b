#include "native-surface.h"
#include <plugview/wgpu-compat.h>
#include <glfw3webgpu.h>
#include <ytrace/ytrace.hpp>
#include <cstdlib>

namespace plugview {

const char* toString(NativeWindowHandle::Platform platform) noexcept {
    using Platform = NativeWindowHandle::Platform;
    switch (platform) {
    case Platform::Xlib: return "Xlib";
    case Platform::Xcb: return "XCB";
    case Platform::Wayland: return "Wayland";
    case Platform::Win32: return "Win32";
    case Platform::AppKit: return "AppKit";
    case Platform::Glfw: return "GLFW";
    case Platform::Unknown: break;
    }
    return "unknown";
}

[[noreturn]] static void unsupportedHandle(const NativeWindowHandle& handle) {
    yerror("Unsupported window handle platform: {}", toString(handle.platform));
    std::abort();
}

static WGPUSurface createFromChain(WGPUInstance instance, WGPUChainedStruct* chain) {
    WGPUSurfaceDescriptor surfaceDesc = {};
    surfaceDesc.label = WGPU_STR("plugview surface");
    surfaceDesc.nextInChain = chain;
    return wgpuInstanceCreateSurface(instance, &surfaceDesc);
}

Result<WGPUSurface> createNativeSurface(WGPUInstance instance,
                                        const NativeWindowHandle& handle) noexcept {
    using Platform = NativeWindowHandle::Platform;

    if (handle.platform == Platform::AppKit || handle.platform == Platform::Unknown) {
        unsupportedHandle(handle);
    }
    if (!handle.valid()) {
        return Err<WGPUSurface>(std::string("Invalid ") + toString(handle.platform) + " window handle");
    }

    WGPUSurface surface = nullptr;
    switch (handle.platform) {
    case Platform::Xlib: {
        WGPUSurfaceSourceXlibWindow source = {};
        source.chain.sType = WGPUSType_SurfaceSourceXlibWindow;
        source.display = handle.display;
        source.window = handle.window;
        surface = createFromChain(instance, &source.chain);
        break;
    }
    case Platform::Xcb: {
        WGPUSurfaceSourceXCBWindow source = {};
        source.chain.sType = WGPUSType_SurfaceSourceXCBWindow;
        source.connection = handle.display;
        source.window = static_cast<uint32_t>(handle.window);
        surface = createFromChain(instance, &source.chain);
        break;
    }
    case Platform::Wayland: {
        WGPUSurfaceSourceWaylandSurface source = {};
        source.chain.sType = WGPUSType_SurfaceSourceWaylandSurface;
        source.display = handle.display;
        source.surface = handle.surface;
        surface = createFromChain(instance, &source.chain);
        break;
    }
    case Platform::Win32: {
        WGPUSurfaceSourceWindowsHWND source = {};
        source.chain.sType = WGPUSType_SurfaceSourceWindowsHWND;
        source.hinstance = handle.instance;
        source.hwnd = handle.surface;
        surface = createFromChain(instance, &source.chain);
        break;
    }
    case Platform::Glfw:
        surface = glfwCreateWindowWGPUSurface(instance, static_cast<GLFWwindow*>(handle.surface));
        break;
    case Platform::AppKit:
    case Platform::Unknown:
        unsupportedHandle(handle);
    }

    if (!surface) {
        return Err<WGPUSurface>(std::string("Failed to create WebGPU surface from ") +
                                toString(handle.platform) + " window");
    }
    ydebug("Created WebGPU surface from {} window", toString(handle.platform));
    return Ok(surface);
}

} // namespace plugview
