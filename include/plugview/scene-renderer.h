#pragma once

#include <plugview/result.hpp>
#include <plugview/scene.h>
#include <webgpu/webgpu.h>
#include <memory>

namespace plugview {

// Coverage sampling used when painting the scene.
enum class AaConfig {
    Area,
    Msaa8,
    Msaa16
};

struct RenderParams {
    Color baseColor;
    uint32_t width;
    uint32_t height;
    AaConfig antialiasing = AaConfig::Msaa16;
};

//-----------------------------------------------------------------------------
// SceneRenderer - paints a Scene into a storage texture
//-----------------------------------------------------------------------------
class SceneRenderer {
public:
    using Ptr = std::unique_ptr<SceneRenderer>;

    virtual ~SceneRenderer() = default;

    // target must be an RGBA8Unorm view created with StorageBinding usage.
    virtual Result<void> renderToTexture(WGPUQueue queue, const Scene& scene,
                                         WGPUTextureView target,
                                         const RenderParams& params) noexcept = 0;
};

// Compute shader implementation: one invocation per pixel, primitives are
// evaluated as signed distance fields and composited in order.
class ComputeSceneRenderer : public SceneRenderer {
public:
    static Result<Ptr> create(WGPUDevice device) noexcept;

    ~ComputeSceneRenderer() override;

    ComputeSceneRenderer(const ComputeSceneRenderer&) = delete;
    ComputeSceneRenderer& operator=(const ComputeSceneRenderer&) = delete;

    Result<void> renderToTexture(WGPUQueue queue, const Scene& scene,
                                 WGPUTextureView target,
                                 const RenderParams& params) noexcept override;

private:
    explicit ComputeSceneRenderer(WGPUDevice device) noexcept;
    Result<void> init() noexcept;
    Result<void> ensurePrimitiveCapacity(size_t count) noexcept;

    WGPUDevice _device = nullptr;
    WGPUShaderModule _shader = nullptr;
    WGPUBindGroupLayout _bindGroupLayout = nullptr;
    WGPUComputePipeline _pipeline = nullptr;
    WGPUBuffer _paramsBuffer = nullptr;
    WGPUBuffer _primitiveBuffer = nullptr;
    size_t _primitiveCapacity = 0;
};

} // namespace plugview
