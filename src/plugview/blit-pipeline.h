#pragma once

#include <plugview/result.hpp>
#include <webgpu/webgpu.h>
#include <memory>

namespace plugview {

// Fullscreen-triangle copy of a sampled texture onto a render target.
class BlitPipeline {
public:
    static Result<std::unique_ptr<BlitPipeline>> create(WGPUDevice device,
                                                        WGPUTextureFormat targetFormat) noexcept;

    ~BlitPipeline();

    BlitPipeline(const BlitPipeline&) = delete;
    BlitPipeline& operator=(const BlitPipeline&) = delete;

    // Rebuilds the bind group; call whenever the source view changes.
    Result<void> setSource(WGPUTextureView source) noexcept;

    void draw(WGPURenderPassEncoder pass) const noexcept;

private:
    explicit BlitPipeline(WGPUDevice device) noexcept;
    Result<void> init(WGPUTextureFormat targetFormat) noexcept;

    WGPUDevice _device = nullptr;
    WGPUBindGroupLayout _bindGroupLayout = nullptr;
    WGPURenderPipeline _pipeline = nullptr;
    WGPUSampler _sampler = nullptr;
    WGPUBindGroup _bindGroup = nullptr;
};

} // namespace plugview
