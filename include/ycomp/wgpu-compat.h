#pragma once

// Helpers over Dawn's webgpu.h (WGPUStringView strings, callback-driven
// futures). ycomp targets the desktop Dawn API only.

#include <webgpu/webgpu.h>
#include <string>

// Null-terminated label or WGSL text as a WGPUStringView
#define YCOMP_WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})

// Drives pending map and error-scope callbacks
#define YCOMP_DEVICE_TICK(device) wgpuDeviceTick(device)

namespace ycomp::gpu {

inline WGPUStringView stringView(const std::string& s) {
    return WGPUStringView{.data = s.data(), .length = s.size()};
}

inline WGPUColor transparentBlack() {
    return WGPUColor{0.0, 0.0, 0.0, 0.0};
}

// Optimal and suboptimal textures can both be rendered to
inline bool surfaceTextureUsable(WGPUSurfaceGetCurrentTextureStatus status) {
    return status == WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal ||
           status == WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal;
}

} // namespace ycomp::gpu
