#include "demo-window.h"
#include <ycomp/wgpu-compat.h>
#include <ytrace/ytrace.hpp>

#include <GLFW/glfw3.h>
#include <glfw3webgpu.h>

#include <string>
#include <vector>

namespace ycomp::demo {

Result<DemoWindow::Ptr> DemoWindow::create(const std::string& title, uint32_t width,
                                           uint32_t height) noexcept {
    auto win = Ptr(new DemoWindow(width, height));
    if (auto res = win->init(title); !res) {
        return Err<Ptr>("Failed to open demo window", res);
    }
    return Ok(std::move(win));
}

DemoWindow::~DemoWindow() {
    if (_currentView) wgpuTextureViewRelease(_currentView);
    if (_currentTexture) wgpuTextureRelease(_currentTexture);
    if (_queue) wgpuQueueRelease(_queue);
    if (_device) wgpuDeviceRelease(_device);
    if (_adapter) wgpuAdapterRelease(_adapter);
    if (_surface) wgpuSurfaceRelease(_surface);
    if (_instance) wgpuInstanceRelease(_instance);
    if (_window) glfwDestroyWindow(_window);
    glfwTerminate();
}

Result<void> DemoWindow::init(const std::string& title) noexcept {
    if (!glfwInit()) {
        return Err<void>("Failed to initialize GLFW");
    }
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    _window = glfwCreateWindow(static_cast<int>(_width), static_cast<int>(_height),
                               title.c_str(), nullptr, nullptr);
    if (!_window) {
        return Err<void>("Failed to create window");
    }

    int fbWidth = 0, fbHeight = 0;
    glfwGetFramebufferSize(_window, &fbWidth, &fbHeight);
    if (fbWidth > 0 && fbHeight > 0) {
        _width = static_cast<uint32_t>(fbWidth);
        _height = static_cast<uint32_t>(fbHeight);
    }
    return initWebGPU();
}

Result<void> DemoWindow::initWebGPU() noexcept {
    WGPUInstanceDescriptor instanceDesc = {};
    _instance = wgpuCreateInstance(&instanceDesc);
    if (!_instance) {
        return Err<void>("Failed to create WebGPU instance");
    }

    _surface = glfwCreateWindowWGPUSurface(_instance, _window);
    if (!_surface) {
        return Err<void>("Failed to create WebGPU surface");
    }

    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = _surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    WGPURequestAdapterCallbackInfo adapterCallbackInfo = {};
    adapterCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                                      WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestAdapterStatus_Success) {
            *static_cast<WGPUAdapter*>(userdata1) = adapter;
        } else {
            yerror("Failed to get WebGPU adapter: {}",
                   message.data ? std::string(message.data, message.length) : "unknown error");
        }
    };
    adapterCallbackInfo.userdata1 = &_adapter;
    wgpuInstanceRequestAdapter(_instance, &adapterOpts, adapterCallbackInfo);
    if (!_adapter) {
        return Err<void>("Failed to get WebGPU adapter");
    }

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = YCOMP_WGPU_STR("ycomp-demo device");
    deviceDesc.defaultQueue.label = YCOMP_WGPU_STR("default queue");
    deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const*, WGPUErrorType type,
                                                         WGPUStringView message, void*, void*) {
        yerror("WebGPU error ({}): {}", static_cast<int>(type),
               message.data ? std::string(message.data, message.length) : "unknown");
    };

    WGPURequestDeviceCallbackInfo deviceCallbackInfo = {};
    deviceCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                                     WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestDeviceStatus_Success) {
            *static_cast<WGPUDevice*>(userdata1) = device;
        } else {
            yerror("Failed to get WebGPU device: {}",
                   message.data ? std::string(message.data, message.length) : "unknown error");
        }
    };
    deviceCallbackInfo.userdata1 = &_device;
    wgpuAdapterRequestDevice(_adapter, &deviceDesc, deviceCallbackInfo);
    if (!_device) {
        return Err<void>("Failed to get WebGPU device");
    }
    _queue = wgpuDeviceGetQueue(_device);

    WGPUSurfaceCapabilities caps = {};
    wgpuSurfaceGetCapabilities(_surface, _adapter, &caps);
    if (caps.formatCount > 0) {
        _surfaceFormat = caps.formats[0];
    }
    wgpuSurfaceCapabilitiesFreeMembers(caps);

    WGPULimits limits = {};
    uint32_t maxDim = 8192;
    if (wgpuDeviceGetLimits(_device, &limits) == WGPUStatus_Success) {
        maxDim = limits.maxTextureDimension2D;
    }

    _gpu.device = _device;
    _gpu.queue = _queue;
    _gpu.surfaceFormat = _surfaceFormat;
    _gpu.maxTextureDimension2D = maxDim;

    configureSurface();
    yinfo("WebGPU initialized: {}x{}, surface format {}, max texture {}",
          _width, _height, static_cast<int>(_surfaceFormat), maxDim);
    return Ok();
}

void DemoWindow::configureSurface() noexcept {
    WGPUSurfaceConfiguration config = {};
    config.device = _device;
    config.format = _surfaceFormat;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.presentMode = WGPUPresentMode_Fifo;
    config.width = _width;
    config.height = _height;
    wgpuSurfaceConfigure(_surface, &config);
}

void DemoWindow::resize(uint32_t width, uint32_t height) noexcept {
    if (width == 0 || height == 0) return;
    _width = width;
    _height = height;
    configureSurface();
}

Result<WGPUTextureView> DemoWindow::beginFrame() noexcept {
    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(_surface, &surfaceTexture);
    if (!gpu::surfaceTextureUsable(surfaceTexture.status)) {
        return Err<WGPUTextureView>("Failed to get surface texture");
    }
    _currentTexture = surfaceTexture.texture;

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = _surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    _currentView = wgpuTextureCreateView(_currentTexture, &viewDesc);
    if (!_currentView) {
        return Err<WGPUTextureView>("Failed to create surface texture view");
    }
    return Ok(_currentView);
}

void DemoWindow::submit(const std::vector<WGPUCommandBuffer>& commands) noexcept {
    if (!commands.empty()) {
        wgpuQueueSubmit(_queue, commands.size(), commands.data());
    }
    for (auto cmd : commands) {
        wgpuCommandBufferRelease(cmd);
    }
}

void DemoWindow::present() noexcept {
    wgpuSurfacePresent(_surface);
    if (_currentView) {
        wgpuTextureViewRelease(_currentView);
        _currentView = nullptr;
    }
    if (_currentTexture) {
        wgpuTextureRelease(_currentTexture);
        _currentTexture = nullptr;
    }
}

} // namespace ycomp::demo
