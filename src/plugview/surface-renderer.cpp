#include <plugview/surface-renderer.h>
#include <plugview/wgpu-compat.h>
#include "blit-pipeline.h"
#include "native-surface.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace plugview {

void pumpUntilDone(const std::atomic<bool>& done, const std::function<void()>& pump) noexcept {
    while (!done.load()) {
        pump();
    }
}

//-----------------------------------------------------------------------------
// Errors
//-----------------------------------------------------------------------------

const char* toString(RenderErrorKind kind) noexcept {
    switch (kind) {
    case RenderErrorKind::NoAdapter: return "NoAdapter";
    case RenderErrorKind::Device: return "Device";
    case RenderErrorKind::Surface: return "Surface";
    case RenderErrorKind::Renderer: return "Renderer";
    }
    return "Unknown";
}

Error renderError(RenderErrorKind kind, const std::string& detail) {
    std::string message;
    switch (kind) {
    case RenderErrorKind::NoAdapter:
        message = "No suitable GPU adapter found";
        break;
    case RenderErrorKind::Device:
        message = "Device error: " + detail;
        break;
    case RenderErrorKind::Surface:
        message = "Surface error: " + detail;
        break;
    case RenderErrorKind::Renderer:
        message = "Renderer error: " + detail;
        break;
    }
    return Error(std::move(message), static_cast<int>(kind));
}

std::optional<RenderErrorKind> renderErrorKind(const Error& error) noexcept {
    int code = error.code();
    if (code >= static_cast<int>(RenderErrorKind::NoAdapter) &&
        code <= static_cast<int>(RenderErrorKind::Renderer)) {
        return static_cast<RenderErrorKind>(code);
    }
    return std::nullopt;
}

//-----------------------------------------------------------------------------
// Surface configuration helpers
//-----------------------------------------------------------------------------

SurfaceExtent clampSurfaceExtent(uint32_t width, uint32_t height) noexcept {
    return SurfaceExtent{std::max(width, 1u), std::max(height, 1u)};
}

bool isSrgbFormat(WGPUTextureFormat format) noexcept {
    switch (format) {
    case WGPUTextureFormat_RGBA8UnormSrgb:
    case WGPUTextureFormat_BGRA8UnormSrgb:
    case WGPUTextureFormat_BC1RGBAUnormSrgb:
    case WGPUTextureFormat_BC2RGBAUnormSrgb:
    case WGPUTextureFormat_BC3RGBAUnormSrgb:
    case WGPUTextureFormat_BC7RGBAUnormSrgb:
    case WGPUTextureFormat_ETC2RGB8UnormSrgb:
    case WGPUTextureFormat_ETC2RGB8A1UnormSrgb:
    case WGPUTextureFormat_ETC2RGBA8UnormSrgb:
        return true;
    default:
        return false;
    }
}

WGPUTextureFormat chooseSurfaceFormat(const WGPUTextureFormat* formats, size_t count) noexcept {
    for (size_t i = 0; i < count; ++i) {
        if (!isSrgbFormat(formats[i])) {
            return formats[i];
        }
    }
    return WGPUTextureFormat_BGRA8Unorm;
}

WGPUCompositeAlphaMode chooseAlphaMode(const WGPUCompositeAlphaMode* modes, size_t count) noexcept {
    for (size_t i = 0; i < count; ++i) {
        if (modes[i] == WGPUCompositeAlphaMode_Premultiplied) {
            return WGPUCompositeAlphaMode_Premultiplied;
        }
    }
    return WGPUCompositeAlphaMode_Auto;
}

WGPUPresentMode toWGPUPresentMode(PresentMode mode) noexcept {
    switch (mode) {
    case PresentMode::Fifo: return WGPUPresentMode_Fifo;
    case PresentMode::Mailbox: return WGPUPresentMode_Mailbox;
    case PresentMode::Immediate: return WGPUPresentMode_Immediate;
    }
    return WGPUPresentMode_Fifo;
}

Result<PresentMode> parsePresentMode(const std::string& name) noexcept {
    if (name == "fifo" || name == "vsync") return Ok(PresentMode::Fifo);
    if (name == "mailbox") return Ok(PresentMode::Mailbox);
    if (name == "immediate") return Ok(PresentMode::Immediate);
    return Err<PresentMode>("Unknown present mode: " + name);
}

const char* toString(PresentMode mode) noexcept {
    switch (mode) {
    case PresentMode::Fifo: return "fifo";
    case PresentMode::Mailbox: return "mailbox";
    case PresentMode::Immediate: return "immediate";
    }
    return "fifo";
}

//-----------------------------------------------------------------------------
// SurfaceRenderer
//-----------------------------------------------------------------------------

Result<RenderSurface::Ptr> SurfaceRenderer::createUnchecked(const NativeWindowHandle& handle,
                                                            uint32_t width, uint32_t height,
                                                            const SurfaceOptions& options) noexcept {
    auto renderer = std::unique_ptr<SurfaceRenderer>(
        new SurfaceRenderer(handle, width, height, options));
    if (auto res = renderer->init(); !res) {
        return Err<Ptr>("Failed to initialize SurfaceRenderer", res);
    }
    return Ok(std::move(renderer));
}

SurfaceRenderer::SurfaceRenderer(const NativeWindowHandle& handle, uint32_t width,
                                 uint32_t height, const SurfaceOptions& options) noexcept
    : _handle(handle), _options(options) {
    auto extent = clampSurfaceExtent(width, height);
    _width = extent.width;
    _height = extent.height;
}

SurfaceRenderer::~SurfaceRenderer() {
    // Pipelines hold device references; drop them before the device.
    _sceneRenderer.reset();
    _blit.reset();
    releaseTarget();
    if (_surface) {
        if (_device) wgpuSurfaceUnconfigure(_surface);
        wgpuSurfaceRelease(_surface);
    }
    if (_queue) wgpuQueueRelease(_queue);
    if (_device) wgpuDeviceRelease(_device);
    if (_adapter) wgpuAdapterRelease(_adapter);
    if (_instance) wgpuInstanceRelease(_instance);
}

Result<void> SurfaceRenderer::init() noexcept {
    WGPUInstanceDescriptor instanceDesc = {};
    _instance = wgpuCreateInstance(&instanceDesc);
    if (!_instance) {
        return RenderErr(RenderErrorKind::Device, "Failed to create WebGPU instance");
    }

    auto surfaceRes = createNativeSurface(_instance, _handle);
    if (!surfaceRes) {
        return RenderErr(RenderErrorKind::Surface, error_msg(surfaceRes));
    }
    _surface = *surfaceRes;

    if (auto res = requestAdapter(); !res) {
        return res;
    }
    if (auto res = requestDevice(); !res) {
        return res;
    }

    WGPUSurfaceCapabilities caps = {};
    if (wgpuSurfaceGetCapabilities(_surface, _adapter, &caps) != WGPUStatus_Success) {
        return RenderErr(RenderErrorKind::Surface, "Failed to query surface capabilities");
    }
    _surfaceFormat = chooseSurfaceFormat(caps.formats, caps.formatCount);
    _alphaMode = chooseAlphaMode(caps.alphaModes, caps.alphaModeCount);

    auto wanted = toWGPUPresentMode(_options.presentMode);
    bool presentModeSupported = std::find(caps.presentModes,
                                          caps.presentModes + caps.presentModeCount,
                                          wanted) != caps.presentModes + caps.presentModeCount;
    if (!presentModeSupported) {
        ywarn("Present mode {} not supported by surface, using fifo", toString(_options.presentMode));
        _options.presentMode = PresentMode::Fifo;
    }
    wgpuSurfaceCapabilitiesFreeMembers(caps);

    configureSurface();

    if (auto res = createTarget(); !res) {
        return RenderErr(RenderErrorKind::Renderer, error_msg(res));
    }

    auto blitRes = BlitPipeline::create(_device, _surfaceFormat);
    if (!blitRes) {
        return RenderErr(RenderErrorKind::Renderer, error_msg(blitRes));
    }
    _blit = std::move(*blitRes);
    if (auto res = _blit->setSource(_targetView); !res) {
        return RenderErr(RenderErrorKind::Renderer, error_msg(res));
    }

    auto sceneRes = ComputeSceneRenderer::create(_device);
    if (!sceneRes) {
        return RenderErr(RenderErrorKind::Renderer, error_msg(sceneRes));
    }
    _sceneRenderer = std::move(*sceneRes);

    yinfo("GPU surface initialized: {}x{} format {} alpha {} present {}", _width, _height,
          static_cast<int>(_surfaceFormat), static_cast<int>(_alphaMode),
          toString(_options.presentMode));
    return Ok();
}

Result<void> SurfaceRenderer::requestAdapter() noexcept {
    struct Request {
        WGPUAdapter adapter = nullptr;
        std::atomic<bool> done{false};
        std::string message;
    } request;

    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = _surface;
    adapterOpts.powerPreference = WGPUPowerPreference_LowPower;

    WGPURequestAdapterCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    callbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                               WGPUStringView message, void* userdata1, void*) {
        auto* req = static_cast<Request*>(userdata1);
        if (status == WGPURequestAdapterStatus_Success) {
            req->adapter = adapter;
        } else {
            req->message = toString(message);
        }
        req->done = true;
    };
    callbackInfo.userdata1 = &request;
    wgpuInstanceRequestAdapter(_instance, &adapterOpts, callbackInfo);

    // The callback always fires, with an error status at worst, and it
    // writes into this frame.
    pumpUntilDone(request.done, [this]() { wgpuInstanceProcessEvents(_instance); });

    if (!request.adapter) {
        if (!request.message.empty()) {
            ywarn("Adapter request failed: {}", request.message);
        }
        return RenderErr(RenderErrorKind::NoAdapter);
    }
    _adapter = request.adapter;
    return Ok();
}

Result<void> SurfaceRenderer::requestDevice() noexcept {
    struct Request {
        WGPUDevice device = nullptr;
        std::atomic<bool> done{false};
        std::string message;
    } request;

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = WGPU_STR("plugview device");
    deviceDesc.defaultQueue.label = WGPU_STR("plugview queue");
    deviceDesc.uncapturedErrorCallbackInfo.callback =
        [](WGPUDevice const*, WGPUErrorType type, WGPUStringView message, void*, void*) {
            yerror("WebGPU error ({}): {}", static_cast<int>(type), toString(message));
        };

    WGPURequestDeviceCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    callbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                               WGPUStringView message, void* userdata1, void*) {
        auto* req = static_cast<Request*>(userdata1);
        if (status == WGPURequestDeviceStatus_Success) {
            req->device = device;
        } else {
            req->message = toString(message);
        }
        req->done = true;
    };
    callbackInfo.userdata1 = &request;
    wgpuAdapterRequestDevice(_adapter, &deviceDesc, callbackInfo);

    // The callback always fires, with an error status at worst, and it
    // writes into this frame.
    pumpUntilDone(request.done, [this]() { wgpuInstanceProcessEvents(_instance); });

    if (!request.device) {
        return RenderErr(RenderErrorKind::Device,
                         request.message.empty() ? "device request failed" : request.message);
    }
    _device = request.device;
    _queue = wgpuDeviceGetQueue(_device);
    return Ok();
}

void SurfaceRenderer::configureSurface() noexcept {
    WGPUSurfaceConfiguration config = {};
    config.device = _device;
    config.format = _surfaceFormat;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.viewFormatCount = 0;
    config.viewFormats = nullptr;
    config.alphaMode = _alphaMode;
    config.presentMode = toWGPUPresentMode(_options.presentMode);
    config.width = _width;
    config.height = _height;
    wgpuSurfaceConfigure(_surface, &config);
}

Result<void> SurfaceRenderer::createTarget() noexcept {
    WGPUTextureDescriptor texDesc = {};
    texDesc.label = WGPU_STR("plugview offscreen target");
    texDesc.size = {_width, _height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_RGBA8Unorm;
    texDesc.usage = WGPUTextureUsage_StorageBinding | WGPUTextureUsage_TextureBinding;
    _target = wgpuDeviceCreateTexture(_device, &texDesc);
    if (!_target) {
        return Err<void>("Failed to create offscreen target texture");
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = WGPUTextureFormat_RGBA8Unorm;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    _targetView = wgpuTextureCreateView(_target, &viewDesc);
    if (!_targetView) {
        return Err<void>("Failed to create offscreen target view");
    }
    return Ok();
}

void SurfaceRenderer::releaseTarget() noexcept {
    if (_targetView) {
        wgpuTextureViewRelease(_targetView);
        _targetView = nullptr;
    }
    if (_target) {
        wgpuTextureDestroy(_target);
        wgpuTextureRelease(_target);
        _target = nullptr;
    }
}

Result<void> SurfaceRenderer::resize(uint32_t width, uint32_t height) noexcept {
    auto extent = clampSurfaceExtent(width, height);
    _width = extent.width;
    _height = extent.height;

    configureSurface();
    releaseTarget();
    if (auto res = createTarget(); !res) {
        return RenderErr(RenderErrorKind::Renderer, error_msg(res));
    }
    if (auto res = _blit->setSource(_targetView); !res) {
        return RenderErr(RenderErrorKind::Renderer, error_msg(res));
    }
    ydebug("Surface reconfigured to {}x{}", _width, _height);
    return Ok();
}

Result<void> SurfaceRenderer::render(const Scene& scene, Color baseColor) noexcept {
    RenderParams params{baseColor, _width, _height, AaConfig::Msaa16};
    if (auto res = _sceneRenderer->renderToTexture(_queue, scene, _targetView, params); !res) {
        return RenderErr(RenderErrorKind::Renderer, error_msg(res));
    }

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(_surface, &surfaceTexture);
    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfaceTexture.texture) {
            wgpuTextureRelease(surfaceTexture.texture);
        }
        return RenderErr(RenderErrorKind::Surface,
                         "failed to acquire surface texture (status " +
                             std::to_string(static_cast<int>(surfaceTexture.status)) + ")");
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = _surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    WGPUTextureView surfaceView = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);
    if (!surfaceView) {
        wgpuTextureRelease(surfaceTexture.texture);
        return RenderErr(RenderErrorKind::Surface, "failed to create surface texture view");
    }

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = WGPU_STR("blit encoder");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, &encoderDesc);

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = surfaceView;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {0.0, 0.0, 0.0, 1.0};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.label = WGPU_STR("blit pass");
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    _blit->draw(pass);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(_queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);

    wgpuSurfacePresent(_surface);

    wgpuTextureViewRelease(surfaceView);
    wgpuTextureRelease(surfaceTexture.texture);
    return Ok();
}

} // namespace plugview
