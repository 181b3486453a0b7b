#pragma once

// Compatibility macros for the WebGPU C API (Dawn and wgpu-native share the
// WGPUStringView based headers).

#include <webgpu/webgpu.h>
#include <string>

#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})
#define WGPU_STR_NULL (WGPUStringView{.data = nullptr, .length = 0})

// Shader code: WGPUStringView
#define WGPU_SHADER_CODE(desc, src)                                            \
  (desc).code = {.data = (src), .length = WGPU_STRLEN}

namespace plugview {

inline std::string toString(WGPUStringView view) {
    if (!view.data) {
        return "unknown";
    }
    if (view.length == WGPU_STRLEN) {
        return std::string(view.data);
    }
    return std::string(view.data, view.length);
}

} // namespace plugview
