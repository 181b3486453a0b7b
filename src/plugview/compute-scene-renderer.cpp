#include <plugview/scene-renderer.h>
#include <plugview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <vector>

namespace plugview {

namespace {

constexpr uint32_t WORKGROUP_SIZE = 8;
constexpr size_t MIN_PRIMITIVE_CAPACITY = 64;

struct ParamsUniform {
    uint32_t width;
    uint32_t height;
    uint32_t count;
    uint32_t aa;
    float base[4];
};
static_assert(sizeof(ParamsUniform) == 32);

uint32_t aaMode(AaConfig aa) {
    switch (aa) {
    case AaConfig::Area:
        return 0;
    case AaConfig::Msaa8:
        return 8;
    case AaConfig::Msaa16:
        return 16;
    }
    return 16;
}

} // namespace

static const char* SCENE_SHADER = R"(
struct Params {
    width: u32,
    height: u32,
    count: u32,
    aa: u32,
    base: vec4<f32>,
};

struct Prim {
    kind: u32,
    stroke: f32,
    radius: f32,
    pad: f32,
    geom: vec4<f32>,
    color: vec4<f32>,
};

@group(0) @binding(0) var<uniform> params: Params;
@group(0) @binding(1) var<storage, read> prims: array<Prim>;
@group(0) @binding(2) var outputTex: texture_storage_2d<rgba8unorm, write>;

fn sdRoundBox(p: vec2<f32>, lo: vec2<f32>, hi: vec2<f32>, radius: f32) -> f32 {
    let center = (lo + hi) * 0.5;
    let halfSize = (hi - lo) * 0.5;
    let r = min(radius, min(halfSize.x, halfSize.y));
    let q = abs(p - center) - halfSize + vec2<f32>(r);
    return length(max(q, vec2<f32>(0.0))) + min(max(q.x, q.y), 0.0) - r;
}

fn sdSegment(p: vec2<f32>, a: vec2<f32>, b: vec2<f32>) -> f32 {
    let pa = p - a;
    let ba = b - a;
    let h = clamp(dot(pa, ba) / max(dot(ba, ba), 1e-6), 0.0, 1.0);
    return length(pa - ba * h);
}

fn primDistance(prim: Prim, p: vec2<f32>) -> f32 {
    var d = 1e9;
    switch prim.kind {
        case 0u: {
            d = sdRoundBox(p, prim.geom.xy, prim.geom.zw, 0.0);
        }
        case 1u: {
            d = sdRoundBox(p, prim.geom.xy, prim.geom.zw, prim.radius);
        }
        case 2u: {
            d = abs(sdRoundBox(p, prim.geom.xy, prim.geom.zw, prim.radius)) - prim.stroke * 0.5;
        }
        case 3u: {
            d = length(p - prim.geom.xy) - prim.radius;
        }
        case 4u: {
            d = sdSegment(p, prim.geom.xy, prim.geom.zw) - prim.stroke * 0.5;
        }
        default: {}
    }
    return d;
}

// Standard 8x sample pattern in 1/16 pixel units.
const MSAA8 = array<vec2<f32>, 8>(
    vec2<f32>(1.0, -3.0), vec2<f32>(-1.0, 3.0), vec2<f32>(5.0, 1.0), vec2<f32>(-3.0, -5.0),
    vec2<f32>(-5.0, 5.0), vec2<f32>(-7.0, -1.0), vec2<f32>(3.0, 7.0), vec2<f32>(7.0, -7.0));

fn coverage(prim: Prim, p: vec2<f32>) -> f32 {
    let d = primDistance(prim, p);
    if (d >= 1.0) {
        return 0.0;
    }
    if (d <= -1.0) {
        return 1.0;
    }
    if (params.aa == 0u) {
        return clamp(0.5 - d, 0.0, 1.0);
    }
    var hits = 0.0;
    if (params.aa == 8u) {
        var samples = MSAA8;
        for (var i = 0u; i < 8u; i++) {
            if (primDistance(prim, p + samples[i] / 16.0) < 0.0) {
                hits += 1.0;
            }
        }
        return hits / 8.0;
    }
    for (var j = 0u; j < 16u; j++) {
        let offset = vec2<f32>(f32(j % 4u) + 0.5, f32(j / 4u) + 0.5) / 4.0 - vec2<f32>(0.5);
        if (primDistance(prim, p + offset) < 0.0) {
            hits += 1.0;
        }
    }
    return hits / 16.0;
}

@compute @workgroup_size(8, 8)
fn main(@builtin(global_invocation_id) gid: vec3<u32>) {
    if (gid.x >= params.width || gid.y >= params.height) {
        return;
    }
    let p = vec2<f32>(f32(gid.x) + 0.5, f32(gid.y) + 0.5);

    // Premultiplied accumulation.
    var acc = vec4<f32>(params.base.rgb * params.base.a, params.base.a);
    for (var i = 0u; i < params.count; i++) {
        let prim = prims[i];
        let cov = coverage(prim, p);
        if (cov <= 0.0) {
            continue;
        }
        let a = prim.color.a * cov;
        let src = vec4<f32>(prim.color.rgb * a, a);
        acc = src + acc * (1.0 - a);
    }
    textureStore(outputTex, vec2<i32>(gid.xy), acc);
}
)";

//-----------------------------------------------------------------------------
// ComputeSceneRenderer
//-----------------------------------------------------------------------------

Result<SceneRenderer::Ptr> ComputeSceneRenderer::create(WGPUDevice device) noexcept {
    auto renderer = std::unique_ptr<ComputeSceneRenderer>(new ComputeSceneRenderer(device));
    if (auto res = renderer->init(); !res) {
        return Err<Ptr>("Failed to initialize ComputeSceneRenderer", res);
    }
    return Ok(std::move(renderer));
}

ComputeSceneRenderer::ComputeSceneRenderer(WGPUDevice device) noexcept : _device(device) {
    wgpuDeviceAddRef(_device);
}

ComputeSceneRenderer::~ComputeSceneRenderer() {
    if (_primitiveBuffer) {
        wgpuBufferDestroy(_primitiveBuffer);
        wgpuBufferRelease(_primitiveBuffer);
    }
    if (_paramsBuffer) {
        wgpuBufferDestroy(_paramsBuffer);
        wgpuBufferRelease(_paramsBuffer);
    }
    if (_pipeline) wgpuComputePipelineRelease(_pipeline);
    if (_bindGroupLayout) wgpuBindGroupLayoutRelease(_bindGroupLayout);
    if (_shader) wgpuShaderModuleRelease(_shader);
    if (_device) wgpuDeviceRelease(_device);
}

Result<void> ComputeSceneRenderer::init() noexcept {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    WGPU_SHADER_CODE(wgslDesc, SCENE_SHADER);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.label = WGPU_STR("scene compute shader");
    shaderDesc.nextInChain = &wgslDesc.chain;

    _shader = wgpuDeviceCreateShaderModule(_device, &shaderDesc);
    if (!_shader) {
        return Err<void>("Failed to create scene shader module");
    }

    WGPUBindGroupLayoutEntry entries[3] = {};

    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Compute;
    entries[0].buffer.type = WGPUBufferBindingType_Uniform;
    entries[0].buffer.minBindingSize = sizeof(ParamsUniform);

    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Compute;
    entries[1].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;

    entries[2].binding = 2;
    entries[2].visibility = WGPUShaderStage_Compute;
    entries[2].storageTexture.access = WGPUStorageTextureAccess_WriteOnly;
    entries[2].storageTexture.format = WGPUTextureFormat_RGBA8Unorm;
    entries[2].storageTexture.viewDimension = WGPUTextureViewDimension_2D;

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = WGPU_STR("scene bind group layout");
    layoutDesc.entryCount = 3;
    layoutDesc.entries = entries;

    _bindGroupLayout = wgpuDeviceCreateBindGroupLayout(_device, &layoutDesc);
    if (!_bindGroupLayout) {
        return Err<void>("Failed to create scene bind group layout");
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &_bindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(_device, &pipelineLayoutDesc);

    WGPUComputePipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = WGPU_STR("scene compute pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.compute.module = _shader;
    pipelineDesc.compute.entryPoint = WGPU_STR("main");

    _pipeline = wgpuDeviceCreateComputePipeline(_device, &pipelineDesc);
    wgpuPipelineLayoutRelease(pipelineLayout);
    if (!_pipeline) {
        return Err<void>("Failed to create scene compute pipeline");
    }

    WGPUBufferDescriptor paramsDesc = {};
    paramsDesc.label = WGPU_STR("scene params");
    paramsDesc.size = sizeof(ParamsUniform);
    paramsDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    _paramsBuffer = wgpuDeviceCreateBuffer(_device, &paramsDesc);
    if (!_paramsBuffer) {
        return Err<void>("Failed to create scene params buffer");
    }

    if (auto res = ensurePrimitiveCapacity(MIN_PRIMITIVE_CAPACITY); !res) {
        return res;
    }

    ydebug("Scene compute pipeline initialized");
    return Ok();
}

Result<void> ComputeSceneRenderer::ensurePrimitiveCapacity(size_t count) noexcept {
    if (_primitiveBuffer && count <= _primitiveCapacity) {
        return Ok();
    }
    size_t capacity = std::max(MIN_PRIMITIVE_CAPACITY, _primitiveCapacity);
    while (capacity < count) {
        capacity *= 2;
    }

    if (_primitiveBuffer) {
        wgpuBufferDestroy(_primitiveBuffer);
        wgpuBufferRelease(_primitiveBuffer);
        _primitiveBuffer = nullptr;
        _primitiveCapacity = 0;
    }

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("scene primitives");
    bufDesc.size = capacity * sizeof(ScenePrimitive);
    bufDesc.usage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst;
    _primitiveBuffer = wgpuDeviceCreateBuffer(_device, &bufDesc);
    if (!_primitiveBuffer) {
        return Err<void>("Failed to allocate scene primitive buffer");
    }
    _primitiveCapacity = capacity;
    ytrace("Scene primitive buffer grown to {} entries", capacity);
    return Ok();
}

Result<void> ComputeSceneRenderer::renderToTexture(WGPUQueue queue, const Scene& scene,
                                                   WGPUTextureView target,
                                                   const RenderParams& params) noexcept {
    if (!target) {
        return Err<void>("No target texture view");
    }
    const auto& prims = scene.primitives();
    if (auto res = ensurePrimitiveCapacity(prims.size()); !res) {
        return res;
    }

    ParamsUniform uniforms = {};
    uniforms.width = params.width;
    uniforms.height = params.height;
    uniforms.count = static_cast<uint32_t>(prims.size());
    uniforms.aa = aaMode(params.antialiasing);
    uniforms.base[0] = params.baseColor.r;
    uniforms.base[1] = params.baseColor.g;
    uniforms.base[2] = params.baseColor.b;
    uniforms.base[3] = params.baseColor.a;
    wgpuQueueWriteBuffer(queue, _paramsBuffer, 0, &uniforms, sizeof(uniforms));
    if (!prims.empty()) {
        wgpuQueueWriteBuffer(queue, _primitiveBuffer, 0, prims.data(),
                             prims.size() * sizeof(ScenePrimitive));
    }

    WGPUBindGroupEntry entries[3] = {};
    entries[0].binding = 0;
    entries[0].buffer = _paramsBuffer;
    entries[0].size = sizeof(ParamsUniform);

    entries[1].binding = 1;
    entries[1].buffer = _primitiveBuffer;
    entries[1].size = _primitiveCapacity * sizeof(ScenePrimitive);

    entries[2].binding = 2;
    entries[2].textureView = target;

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.layout = _bindGroupLayout;
    bgDesc.entryCount = 3;
    bgDesc.entries = entries;
    WGPUBindGroup bindGroup = wgpuDeviceCreateBindGroup(_device, &bgDesc);
    if (!bindGroup) {
        return Err<void>("Failed to create scene bind group");
    }

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = WGPU_STR("scene encoder");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, &encoderDesc);

    WGPUComputePassDescriptor passDesc = {};
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
    wgpuComputePassEncoderSetPipeline(pass, _pipeline);
    wgpuComputePassEncoderSetBindGroup(pass, 0, bindGroup, 0, nullptr);
    wgpuComputePassEncoderDispatchWorkgroups(pass,
                                             (params.width + WORKGROUP_SIZE - 1) / WORKGROUP_SIZE,
                                             (params.height + WORKGROUP_SIZE - 1) / WORKGROUP_SIZE,
                                             1);
    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(queue, 1, &cmdBuf);

    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);
    wgpuBindGroupRelease(bindGroup);
    return Ok();
}

} // namespace plugview
