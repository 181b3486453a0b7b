#pragma once

#include <plugview/native-window-handle.h>
#include <plugview/result.hpp>
#include <webgpu/webgpu.h>

namespace plugview {

// Creates a WebGPU surface for a host window. Aborts for platforms that have
// no surface path.
Result<WGPUSurface> createNativeSurface(WGPUInstance instance,
                                        const NativeWindowHandle& handle) noexcept;

} // namespace plugview
