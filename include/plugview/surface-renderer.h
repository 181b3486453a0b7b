#pragma once

#include <plugview/native-window-handle.h>
#include <plugview/result.hpp>
#include <plugview/scene-renderer.h>
#include <plugview/scene.h>
#include <plugview/surface-options.h>
#include <webgpu/webgpu.h>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace plugview {

//-----------------------------------------------------------------------------
// Errors
//-----------------------------------------------------------------------------
enum class RenderErrorKind : int {
    NoAdapter = 1,
    Device,
    Surface,
    Renderer
};

const char* toString(RenderErrorKind kind) noexcept;

// "No suitable GPU adapter found", "Device error: <detail>", ...
Error renderError(RenderErrorKind kind, const std::string& detail = {});

template<typename T = void>
Result<T> RenderErr(RenderErrorKind kind, const std::string& detail = {}) {
    return Result<T>(renderError(kind, detail));
}

// Kind recorded anywhere along the error's cause chain.
std::optional<RenderErrorKind> renderErrorKind(const Error& error) noexcept;

//-----------------------------------------------------------------------------
// RenderSurface - what the window session needs from a GPU surface
//-----------------------------------------------------------------------------
class RenderSurface {
public:
    using Ptr = std::unique_ptr<RenderSurface>;

    virtual ~RenderSurface() = default;

    // Physical pixels, clamped to at least 1x1.
    virtual Result<void> resize(uint32_t width, uint32_t height) noexcept = 0;
    virtual Result<void> render(const Scene& scene, Color baseColor) noexcept = 0;
};

//-----------------------------------------------------------------------------
// Surface configuration helpers
//-----------------------------------------------------------------------------
struct SurfaceExtent {
    uint32_t width;
    uint32_t height;

    bool operator==(const SurfaceExtent&) const = default;
};

SurfaceExtent clampSurfaceExtent(uint32_t width, uint32_t height) noexcept;

bool isSrgbFormat(WGPUTextureFormat format) noexcept;

// First non-sRGB format, BGRA8Unorm when the surface reports none.
WGPUTextureFormat chooseSurfaceFormat(const WGPUTextureFormat* formats, size_t count) noexcept;

// Premultiplied when supported, otherwise Auto.
WGPUCompositeAlphaMode chooseAlphaMode(const WGPUCompositeAlphaMode* modes, size_t count) noexcept;

WGPUPresentMode toWGPUPresentMode(PresentMode mode) noexcept;

// Calls pump until a request callback sets done. No poll limit: the
// request's userdata lives on the waiting stack frame.
void pumpUntilDone(const std::atomic<bool>& done, const std::function<void()>& pump) noexcept;

class BlitPipeline;

//-----------------------------------------------------------------------------
// SurfaceRenderer
//
// The scene renderer writes into a storage texture, which a presentable
// surface texture cannot be. Each frame is painted into an offscreen
// RGBA8Unorm target and then copied to the surface with a fullscreen
// triangle.
//-----------------------------------------------------------------------------
class SurfaceRenderer : public RenderSurface {
public:
    // The window behind handle must stay alive for the renderer's lifetime.
    // Platforms without a surface path (AppKit views, unknown) are fatal.
    static Result<Ptr> createUnchecked(const NativeWindowHandle& handle,
                                       uint32_t width, uint32_t height,
                                       const SurfaceOptions& options = {}) noexcept;

    ~SurfaceRenderer() override;

    SurfaceRenderer(const SurfaceRenderer&) = delete;
    SurfaceRenderer& operator=(const SurfaceRenderer&) = delete;

    Result<void> resize(uint32_t width, uint32_t height) noexcept override;
    Result<void> render(const Scene& scene, Color baseColor) noexcept override;

    WGPUDevice getDevice() const noexcept { return _device; }
    WGPUQueue getQueue() const noexcept { return _queue; }
    WGPUTextureFormat getSurfaceFormat() const noexcept { return _surfaceFormat; }
    uint32_t width() const noexcept { return _width; }
    uint32_t height() const noexcept { return _height; }

private:
    SurfaceRenderer(const NativeWindowHandle& handle, uint32_t width, uint32_t height,
                    const SurfaceOptions& options) noexcept;

    Result<void> init() noexcept;
    Result<void> requestAdapter() noexcept;
    Result<void> requestDevice() noexcept;
    void configureSurface() noexcept;
    Result<void> createTarget() noexcept;
    void releaseTarget() noexcept;

    NativeWindowHandle _handle;
    SurfaceOptions _options;

    WGPUInstance _instance = nullptr;
    WGPUAdapter _adapter = nullptr;
    WGPUDevice _device = nullptr;
    WGPUQueue _queue = nullptr;
    WGPUSurface _surface = nullptr;
    WGPUTextureFormat _surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    WGPUCompositeAlphaMode _alphaMode = WGPUCompositeAlphaMode_Auto;

    WGPUTexture _target = nullptr;
    WGPUTextureView _targetView = nullptr;

    std::unique_ptr<BlitPipeline> _blit;
    SceneRenderer::Ptr _sceneRenderer;

    uint32_t _width = 1;
    uint32_t _height = 1;
};

} // namespace plugview
