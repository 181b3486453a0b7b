//=============================================================================
// Surface Configuration Tests
//
// Extent clamping, format/alpha/present mode selection and render errors.
// None of these touch a GPU.
//=============================================================================

#include <boost/ut.hpp>
#include <plugview/surface-renderer.h>
#include <plugview/native-window-handle.h>
#include <atomic>
#include <string>

using namespace boost::ut;
using namespace plugview;

suite surface_config_tests = [] {
    "zero extent clamps to one pixel"_test = [] {
        expect(clampSurfaceExtent(0, 0) == SurfaceExtent{1, 1});
        expect(clampSurfaceExtent(0, 480) == SurfaceExtent{1, 480});
        expect(clampSurfaceExtent(640, 0) == SurfaceExtent{640, 1});
        expect(clampSurfaceExtent(1920, 1080) == SurfaceExtent{1920, 1080});
    };

    "surface format skips sRGB"_test = [] {
        const WGPUTextureFormat formats[] = {WGPUTextureFormat_BGRA8UnormSrgb,
                                             WGPUTextureFormat_RGBA8Unorm,
                                             WGPUTextureFormat_BGRA8Unorm};
        expect(chooseSurfaceFormat(formats, 3) == WGPUTextureFormat_RGBA8Unorm);
    };

    "surface format fallback"_test = [] {
        expect(chooseSurfaceFormat(nullptr, 0) == WGPUTextureFormat_BGRA8Unorm);
        const WGPUTextureFormat onlySrgb[] = {WGPUTextureFormat_RGBA8UnormSrgb};
        expect(chooseSurfaceFormat(onlySrgb, 1) == WGPUTextureFormat_BGRA8Unorm);
    };

    "srgb detection"_test = [] {
        expect(isSrgbFormat(WGPUTextureFormat_BGRA8UnormSrgb));
        expect(isSrgbFormat(WGPUTextureFormat_RGBA8UnormSrgb));
        expect(!isSrgbFormat(WGPUTextureFormat_BGRA8Unorm));
        expect(!isSrgbFormat(WGPUTextureFormat_RGBA16Float));
    };

    "alpha mode prefers premultiplied"_test = [] {
        const WGPUCompositeAlphaMode modes[] = {WGPUCompositeAlphaMode_Opaque,
                                                WGPUCompositeAlphaMode_Premultiplied};
        expect(chooseAlphaMode(modes, 2) == WGPUCompositeAlphaMode_Premultiplied);

        const WGPUCompositeAlphaMode opaqueOnly[] = {WGPUCompositeAlphaMode_Opaque};
        expect(chooseAlphaMode(opaqueOnly, 1) == WGPUCompositeAlphaMode_Auto);
        expect(chooseAlphaMode(nullptr, 0) == WGPUCompositeAlphaMode_Auto);
    };

    "present mode names"_test = [] {
        expect(*parsePresentMode("fifo") == PresentMode::Fifo);
        expect(*parsePresentMode("vsync") == PresentMode::Fifo);
        expect(*parsePresentMode("mailbox") == PresentMode::Mailbox);
        expect(*parsePresentMode("immediate") == PresentMode::Immediate);
        expect(!parsePresentMode("triple").has_value());
        expect(std::string(toString(PresentMode::Mailbox)) == "mailbox");
    };

    "present mode maps to WebGPU"_test = [] {
        expect(toWGPUPresentMode(PresentMode::Fifo) == WGPUPresentMode_Fifo);
        expect(toWGPUPresentMode(PresentMode::Mailbox) == WGPUPresentMode_Mailbox);
        expect(toWGPUPresentMode(PresentMode::Immediate) == WGPUPresentMode_Immediate);
    };

    "request pumping waits for a slow callback"_test = [] {
        std::atomic<bool> done{false};
        int pumps = 0;
        pumpUntilDone(done, [&]() {
            if (++pumps == 250000) {
                done = true;
            }
        });
        expect(pumps == 250000_i);
    };

    "request pumping stops at once when already done"_test = [] {
        std::atomic<bool> done{true};
        int pumps = 0;
        pumpUntilDone(done, [&]() { ++pumps; });
        expect(pumps == 0_i);
    };

    "render error messages"_test = [] {
        expect(renderError(RenderErrorKind::NoAdapter).message() == "No suitable GPU adapter found");
        expect(renderError(RenderErrorKind::Device, "lost").message() == "Device error: lost");
        expect(renderError(RenderErrorKind::Surface, "outdated").message() ==
               "Surface error: outdated");
        expect(renderError(RenderErrorKind::Renderer, "oom").message() == "Renderer error: oom");
    };

    "render error kind survives wrapping"_test = [] {
        auto inner = RenderErr(RenderErrorKind::Device, "request failed");
        auto outer = Err<void>("Failed to initialize SurfaceRenderer", inner);
        auto kind = renderErrorKind(outer.error());
        expect((kind.has_value()) >> fatal);
        expect(*kind == RenderErrorKind::Device);
        expect(error_msg(outer) == "Failed to initialize SurfaceRenderer: Device error: request failed");

        expect(!renderErrorKind(Error("plain")).has_value());
    };

    "native handle validity"_test = [] {
        expect(!NativeWindowHandle{}.valid());
        expect(!NativeWindowHandle::xlib(nullptr, 7).valid());
        int dummy = 0;
        expect(NativeWindowHandle::xlib(&dummy, 7).valid());
        expect(NativeWindowHandle::wayland(&dummy, &dummy).valid());
        expect(!NativeWindowHandle::win32(nullptr, nullptr).valid());
        expect(std::string(toString(NativeWindowHandle::Platform::Xcb)) == "XCB");
    };
};
