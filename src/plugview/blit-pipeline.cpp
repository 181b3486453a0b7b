#include "blit-pipeline.h"
#include <plugview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>

namespace plugview {

static const char* BLIT_SHADER = R"(
struct VertexOutput {
    @builtin(position) position: vec4<f32>,
    @location(0) uv: vec2<f32>,
}

@vertex fn vs_main(@builtin(vertex_index) vi: u32) -> VertexOutput {
    // Oversized triangle covering the viewport.
    let x = f32(i32(vi) / 2) * 4.0 - 1.0;
    let y = f32(i32(vi) % 2) * 4.0 - 1.0;

    var out: VertexOutput;
    out.position = vec4<f32>(x, y, 0.0, 1.0);
    out.uv = vec2<f32>((x + 1.0) * 0.5, (1.0 - y) * 0.5);
    return out;
}

@group(0) @binding(0) var sourceTex: texture_2d<f32>;
@group(0) @binding(1) var sourceSampler: sampler;

@fragment fn fs_main(@location(0) uv: vec2<f32>) -> @location(0) vec4<f32> {
    return textureSample(sourceTex, sourceSampler, uv);
}
)";

Result<std::unique_ptr<BlitPipeline>> BlitPipeline::create(WGPUDevice device,
                                                           WGPUTextureFormat targetFormat) noexcept {
    auto blit = std::unique_ptr<BlitPipeline>(new BlitPipeline(device));
    if (auto res = blit->init(targetFormat); !res) {
        return Err<std::unique_ptr<BlitPipeline>>("Failed to init BlitPipeline", res);
    }
    return Ok(std::move(blit));
}

BlitPipeline::BlitPipeline(WGPUDevice device) noexcept : _device(device) {
    wgpuDeviceAddRef(_device);
}

BlitPipeline::~BlitPipeline() {
    if (_bindGroup) wgpuBindGroupRelease(_bindGroup);
    if (_sampler) wgpuSamplerRelease(_sampler);
    if (_pipeline) wgpuRenderPipelineRelease(_pipeline);
    if (_bindGroupLayout) wgpuBindGroupLayoutRelease(_bindGroupLayout);
    if (_device) wgpuDeviceRelease(_device);
}

Result<void> BlitPipeline::init(WGPUTextureFormat targetFormat) noexcept {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    WGPU_SHADER_CODE(wgslDesc, BLIT_SHADER);
    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.label = WGPU_STR("blit shader");
    shaderDesc.nextInChain = &wgslDesc.chain;
    WGPUShaderModule shaderModule = wgpuDeviceCreateShaderModule(_device, &shaderDesc);
    if (!shaderModule) {
        return Err<void>("Failed to create blit shader module");
    }

    WGPUBindGroupLayoutEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Fragment;
    entries[0].texture.sampleType = WGPUTextureSampleType_Float;
    entries[0].texture.viewDimension = WGPUTextureViewDimension_2D;
    entries[0].texture.multisampled = false;

    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Fragment;
    entries[1].sampler.type = WGPUSamplerBindingType_Filtering;

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = WGPU_STR("blit bind group layout");
    layoutDesc.entryCount = 2;
    layoutDesc.entries = entries;
    _bindGroupLayout = wgpuDeviceCreateBindGroupLayout(_device, &layoutDesc);
    if (!_bindGroupLayout) {
        wgpuShaderModuleRelease(shaderModule);
        return Err<void>("Failed to create blit bind group layout");
    }

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.label = WGPU_STR("blit sampler");
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Linear;
    samplerDesc.minFilter = WGPUFilterMode_Linear;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 32.0f;
    samplerDesc.maxAnisotropy = 1;
    _sampler = wgpuDeviceCreateSampler(_device, &samplerDesc);
    if (!_sampler) {
        wgpuShaderModuleRelease(shaderModule);
        return Err<void>("Failed to create blit sampler");
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &_bindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(_device, &pipelineLayoutDesc);

    // Replace: the offscreen target already holds the finished frame.
    WGPUBlendState blend = {};
    blend.color.srcFactor = WGPUBlendFactor_One;
    blend.color.dstFactor = WGPUBlendFactor_Zero;
    blend.color.operation = WGPUBlendOperation_Add;
    blend.alpha.srcFactor = WGPUBlendFactor_One;
    blend.alpha.dstFactor = WGPUBlendFactor_Zero;
    blend.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = targetFormat;
    colorTarget.blend = &blend;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragment = {};
    fragment.module = shaderModule;
    fragment.entryPoint = WGPU_STR("fs_main");
    fragment.targetCount = 1;
    fragment.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = WGPU_STR("blit pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = WGPU_STR("vs_main");
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.fragment = &fragment;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = 0xFFFFFFFF;

    _pipeline = wgpuDeviceCreateRenderPipeline(_device, &pipelineDesc);

    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(shaderModule);

    if (!_pipeline) {
        return Err<void>("Failed to create blit pipeline");
    }
    ydebug("Blit pipeline created for surface format {}", static_cast<int>(targetFormat));
    return Ok();
}

Result<void> BlitPipeline::setSource(WGPUTextureView source) noexcept {
    if (_bindGroup) {
        wgpuBindGroupRelease(_bindGroup);
        _bindGroup = nullptr;
    }

    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].textureView = source;
    entries[1].binding = 1;
    entries[1].sampler = _sampler;

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.label = WGPU_STR("blit bind group");
    bgDesc.layout = _bindGroupLayout;
    bgDesc.entryCount = 2;
    bgDesc.entries = entries;
    _bindGroup = wgpuDeviceCreateBindGroup(_device, &bgDesc);
    if (!_bindGroup) {
        return Err<void>("Failed to create blit bind group");
    }
    return Ok();
}

void BlitPipeline::draw(WGPURenderPassEncoder pass) const noexcept {
    wgpuRenderPassEncoderSetPipeline(pass, _pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, _bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
}

} // namespace plugview
