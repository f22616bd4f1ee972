#pragma once

#include <webgpu/webgpu.h>

// Dawn string views
#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})

// Headless contexts drive callbacks by ticking the device
#define WGPU_DEVICE_TICK(device) wgpuDeviceTick(device)
