#include <pictura/gpu-state-manager.h>
#include <pictura/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <sstream>

namespace pictura {

namespace {

constexpr uint32_t ROW_ALIGNMENT = 256;
constexpr uint64_t MIN_STORAGE_SIZE = 256;

uint32_t alignUp(uint32_t value, uint32_t alignment) {
    return (value + alignment - 1) / alignment * alignment;
}

bool isBufferMember(UniformType type) {
    return type == UniformType::Float || type == UniformType::Int ||
           type == UniformType::Vec2 || type == UniformType::Vec4;
}

uint32_t memberAlign(UniformType type) {
    switch (type) {
        case UniformType::Vec2: return 8;
        case UniformType::Vec4: return 16;
        default: return 4;
    }
}

uint32_t memberSize(UniformType type) {
    switch (type) {
        case UniformType::Vec2: return 8;
        case UniformType::Vec4: return 16;
        default: return 4;
    }
}

const char* memberWgsl(UniformType type) {
    switch (type) {
        case UniformType::Float: return "f32";
        case UniformType::Int: return "i32";
        case UniformType::Vec2: return "vec2f";
        case UniformType::Vec4: return "vec4f";
        default: return "";
    }
}

// Byte offsets of the u members in declaration order; targetSize comes first
struct UniformLayout {
    std::vector<uint32_t> offsets;
    uint32_t size = 0;
};

UniformLayout layoutUniforms(const std::vector<UniformDecl>& uniforms) {
    UniformLayout layout;
    uint32_t end = 8;  // targetSize: vec2f
    for (const auto& decl : uniforms) {
        if (!isBufferMember(decl.type)) {
            layout.offsets.push_back(0);
            continue;
        }
        uint32_t offset = alignUp(end, memberAlign(decl.type));
        layout.offsets.push_back(offset);
        end = offset + memberSize(decl.type);
    }
    layout.size = alignUp(end, 16);
    return layout;
}

std::string viewToString(WGPUStringView view) {
    if (!view.data) return std::string();
    if (view.length == WGPU_STRLEN) return std::string(view.data);
    return std::string(view.data, view.length);
}

void dumpSource(const std::string& source) {
    std::istringstream iss(source);
    std::string line;
    int lineNum = 1;
    while (std::getline(iss, line)) {
        yerror("{:4d}: {}", lineNum++, line);
    }
}

} // namespace

GpuStateManager::GpuStateManager(WGPUDevice device, WGPUQueue queue, GpuAllocator& allocator)
    : _device(device), _queue(queue), _allocator(allocator) {
    _owner = _allocator.newOwner("state manager");
}

GpuStateManager::~GpuStateManager() {
    for (auto& [key, program] : _programs) {
        if (program->_pipeline) wgpuRenderPipelineRelease(program->_pipeline);
        if (program->_bindGroupLayout) wgpuBindGroupLayoutRelease(program->_bindGroupLayout);
    }
    _programs.clear();
    _allocator.releaseOwner(_owner);
}

//=============================================================================
// Shader sources
//=============================================================================

std::string GpuStateManager::declarations(const std::vector<UniformDecl>& uniforms) {
    std::string out = "struct Uniforms {\n    targetSize: vec2f,\n";
    for (const auto& decl : uniforms) {
        if (isBufferMember(decl.type)) {
            out += "    " + decl.name + ": " + memberWgsl(decl.type) + ",\n";
        }
    }
    out += "}\n\n@group(0) @binding(0) var<uniform> u: Uniforms;\n";

    uint32_t binding = 1;
    for (const auto& decl : uniforms) {
        if (decl.type == UniformType::Texture) {
            out += "@group(0) @binding(" + std::to_string(binding++) + ") var " + decl.name +
                   ": texture_2d<f32>;\n";
        } else if (decl.type == UniformType::Storage) {
            out += "@group(0) @binding(" + std::to_string(binding++) + ") var<storage, read> " +
                   decl.name + ": array<" + decl.element + ">;\n";
        }
    }
    return out + "\n";
}

std::string GpuStateManager::fullscreenVertexSource() {
    return R"(
struct FullscreenOut {
    @builtin(position) pos: vec4f,
    @location(0) uv: vec2f,
}

@vertex
fn vs_main(@builtin(vertex_index) vi: u32) -> FullscreenOut {
    var corners = array<vec2f, 6>(
        vec2f(0.0, 0.0), vec2f(1.0, 0.0), vec2f(0.0, 1.0),
        vec2f(0.0, 1.0), vec2f(1.0, 0.0), vec2f(1.0, 1.0));
    let c = corners[vi];
    var out: FullscreenOut;
    out.pos = vec4f(c.x * 2.0 - 1.0, 1.0 - c.y * 2.0, 0.0, 1.0);
    out.uv = c;
    return out;
}
)";
}

WGPUShaderModule GpuStateManager::compileShader(const std::string& label, const std::string& source) {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = {.data = source.c_str(), .length = source.size()};

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.label = {.data = label.c_str(), .length = label.size()};
    shaderDesc.nextInChain = &wgslDesc.chain;

    WGPUShaderModule module = wgpuDeviceCreateShaderModule(_device, &shaderDesc);
    if (!module) {
        yerror("GpuStateManager: failed to compile '{}' - dumping source:", label);
        dumpSource(source);
        return nullptr;
    }

    struct Report {
        const std::string* source;
        bool failed = false;
        std::atomic<bool> done{false};
    } report{&source};

    WGPUCompilationInfoCallbackInfo cbInfo = {};
    cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    cbInfo.callback = [](WGPUCompilationInfoRequestStatus, WGPUCompilationInfo const* info,
                         void* userdata1, void*) {
        auto* r = static_cast<Report*>(userdata1);
        if (info) {
            for (size_t i = 0; i < info->messageCount; i++) {
                const auto& msg = info->messages[i];
                if (msg.type == WGPUCompilationMessageType_Error) {
                    yerror("Shader error: line {}: {}", msg.lineNum, viewToString(msg.message));
                    r->failed = true;
                } else {
                    ydebug("Shader: line {}: {}", msg.lineNum, viewToString(msg.message));
                }
            }
        }
        r->done = true;
    };
    cbInfo.userdata1 = &report;
    wgpuShaderModuleGetCompilationInfo(module, cbInfo);
    while (!report.done) WGPU_DEVICE_TICK(_device);

    if (report.failed) {
        dumpSource(source);
        wgpuShaderModuleRelease(module);
        return nullptr;
    }
    return module;
}

//=============================================================================
// Programs
//=============================================================================

GpuProgram* GpuStateManager::findProgram(const std::string& key) {
    auto it = _programs.find(key);
    return it == _programs.end() ? nullptr : it->second.get();
}

Result<GpuProgram*> GpuStateManager::program(const std::string& key,
                                             const std::string& vertexSource,
                                             const std::string& fragmentSource,
                                             const std::vector<UniformDecl>& uniforms,
                                             WGPUTextureFormat targetFormat,
                                             PipelineBlend blend) {
    if (auto* cached = findProgram(key)) {
        return Ok(cached);
    }

    std::string source = declarations(uniforms) + vertexSource + "\n" + fragmentSource;
    WGPUShaderModule module = compileShader(key, source);
    if (!module) {
        return Err<GpuProgram*>("Failed to compile program " + key, Error::Code::GpuFailure);
    }

    auto prog = std::make_unique<GpuProgram>();
    prog->_key = key;

    UniformLayout layout = layoutUniforms(uniforms);
    prog->_uniformSize = layout.size;
    prog->_targetSizeOffset = 0;

    std::vector<WGPUBindGroupLayoutEntry> entries;
    WGPUBindGroupLayoutEntry uniformEntry = {};
    uniformEntry.binding = 0;
    uniformEntry.visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    uniformEntry.buffer.type = WGPUBufferBindingType_Uniform;
    uniformEntry.buffer.minBindingSize = layout.size;
    entries.push_back(uniformEntry);

    uint32_t binding = 1;
    for (size_t i = 0; i < uniforms.size(); i++) {
        const auto& decl = uniforms[i];
        GpuProgram::Slot slot;
        slot.type = decl.type;
        if (isBufferMember(decl.type)) {
            slot.offset = layout.offsets[i];
        } else {
            slot.binding = binding++;
            WGPUBindGroupLayoutEntry entry = {};
            entry.binding = slot.binding;
            entry.visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
            if (decl.type == UniformType::Texture) {
                entry.visibility = WGPUShaderStage_Fragment;
                entry.texture.sampleType = WGPUTextureSampleType_UnfilterableFloat;
                entry.texture.viewDimension = WGPUTextureViewDimension_2D;
            } else {
                entry.buffer.type = WGPUBufferBindingType_ReadOnlyStorage;
            }
            entries.push_back(entry);
        }
        prog->_slots[decl.name] = slot;
    }

    WGPUBindGroupLayoutDescriptor bglDesc = {};
    bglDesc.entryCount = entries.size();
    bglDesc.entries = entries.data();
    prog->_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(_device, &bglDesc);
    if (!prog->_bindGroupLayout) {
        wgpuShaderModuleRelease(module);
        return Err<GpuProgram*>("Failed to create bind group layout for " + key, Error::Code::GpuFailure);
    }

    WGPUPipelineLayoutDescriptor plDesc = {};
    plDesc.bindGroupLayoutCount = 1;
    plDesc.bindGroupLayouts = &prog->_bindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(_device, &plDesc);

    WGPUBlendState blendState = {};
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.color.srcFactor = WGPUBlendFactor_One;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrc;
    blendState.alpha.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrc;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = targetFormat;
    colorTarget.blend = blend == PipelineBlend::Accumulate ? &blendState : nullptr;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragState = {};
    fragState.module = module;
    fragState.entryPoint = WGPU_STR("fs_main");
    fragState.targetCount = 1;
    fragState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = {.data = prog->_key.c_str(), .length = prog->_key.size()};
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = module;
    pipelineDesc.vertex.entryPoint = WGPU_STR("vs_main");
    pipelineDesc.vertex.bufferCount = 0;
    pipelineDesc.fragment = &fragState;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = 0xFFFFFFFF;

    prog->_pipeline = wgpuDeviceCreateRenderPipeline(_device, &pipelineDesc);
    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(module);
    if (!prog->_pipeline) {
        wgpuBindGroupLayoutRelease(prog->_bindGroupLayout);
        return Err<GpuProgram*>("Failed to create render pipeline for " + key, Error::Code::GpuFailure);
    }

    std::string uniformLabel = key + " uniforms";
    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = {.data = uniformLabel.c_str(), .length = uniformLabel.size()};
    bufDesc.size = layout.size;
    bufDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    prog->_uniformBuffer = _allocator.createBuffer(_owner, bufDesc);
    if (!prog->_uniformBuffer) {
        wgpuRenderPipelineRelease(prog->_pipeline);
        wgpuBindGroupLayoutRelease(prog->_bindGroupLayout);
        return Err<GpuProgram*>("Failed to create uniform buffer for " + key, Error::Code::GpuFailure);
    }

    ydebug("GpuStateManager: built program '{}' ({} programs)", key, _programs.size() + 1);
    GpuProgram* raw = prog.get();
    _programs[key] = std::move(prog);
    return Ok(raw);
}

//=============================================================================
// Operations
//=============================================================================

Result<void> GpuStateManager::draw(GpuProgram& program, const UniformValues& values,
                                   WGPUTexture target, const Rect& scissor,
                                   uint32_t vertexCount, uint32_t instanceCount) {
    if (!target) {
        return Err("GpuStateManager::draw: null target", Error::Code::GpuFailure);
    }
    uint32_t targetWidth = wgpuTextureGetWidth(target);
    uint32_t targetHeight = wgpuTextureGetHeight(target);
    Rect area = scissor.integerBounds();
    area.intersectRect(Rect(0, static_cast<float>(targetWidth), 0, static_cast<float>(targetHeight)));
    if (area.isEmpty() || instanceCount == 0) {
        return Ok();
    }

    std::vector<uint8_t> uniformData(program._uniformSize, 0);
    glm::vec2 targetSize(static_cast<float>(targetWidth), static_cast<float>(targetHeight));
    std::memcpy(uniformData.data() + program._targetSizeOffset, &targetSize, sizeof(targetSize));

    std::vector<WGPUBindGroupEntry> entries;
    std::vector<WGPUTextureView> views;
    WGPUBindGroupEntry uniformEntry = {};
    uniformEntry.binding = 0;
    uniformEntry.buffer = program._uniformBuffer;
    uniformEntry.size = program._uniformSize;
    entries.push_back(uniformEntry);

    auto releaseViews = [&views]() {
        for (auto view : views) wgpuTextureViewRelease(view);
    };

    for (auto& [name, slot] : program._slots) {
        auto it = values.find(name);
        if (isBufferMember(slot.type)) {
            if (it == values.end()) continue;
            uint8_t* dst = uniformData.data() + slot.offset;
            if (auto* f = std::get_if<float>(&it->second)) {
                std::memcpy(dst, f, sizeof(float));
            } else if (auto* i = std::get_if<int32_t>(&it->second)) {
                std::memcpy(dst, i, sizeof(int32_t));
            } else if (auto* v2 = std::get_if<glm::vec2>(&it->second)) {
                std::memcpy(dst, v2, sizeof(glm::vec2));
            } else if (auto* v4 = std::get_if<glm::vec4>(&it->second)) {
                std::memcpy(dst, v4, sizeof(glm::vec4));
            } else {
                releaseViews();
                return Err("GpuStateManager::draw: wrong value type for " + name);
            }
            continue;
        }

        if (it == values.end()) {
            releaseViews();
            return Err("GpuStateManager::draw: missing binding " + name + " for " + program._key);
        }

        WGPUBindGroupEntry entry = {};
        entry.binding = slot.binding;
        if (slot.type == UniformType::Texture) {
            auto* texture = std::get_if<WGPUTexture>(&it->second);
            if (!texture || !*texture) {
                releaseViews();
                return Err("GpuStateManager::draw: binding " + name + " needs a texture");
            }
            WGPUTextureView view = wgpuTextureCreateView(*texture, nullptr);
            views.push_back(view);
            entry.textureView = view;
        } else {
            auto* storage = std::get_if<StorageData>(&it->second);
            if (!storage) {
                releaseViews();
                return Err("GpuStateManager::draw: binding " + name + " needs storage data");
            }
            uint64_t needed = std::max<uint64_t>(alignUp(static_cast<uint32_t>(storage->size), 4),
                                                 MIN_STORAGE_SIZE);
            if (!slot.storage || slot.storageSize < needed) {
                _allocator.releaseBuffer(slot.storage);
                std::string label = program._key + " " + name;
                WGPUBufferDescriptor bufDesc = {};
                bufDesc.label = {.data = label.c_str(), .length = label.size()};
                bufDesc.size = std::max(needed, slot.storageSize * 2);
                bufDesc.usage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst;
                slot.storage = _allocator.createBuffer(_owner, bufDesc);
                slot.storageSize = slot.storage ? bufDesc.size : 0;
                if (!slot.storage) {
                    releaseViews();
                    return Err("GpuStateManager::draw: failed to allocate storage " + name,
                               Error::Code::GpuFailure);
                }
            }
            // Element structs are multiples of 16 bytes, so size is 4-aligned
            if (storage->size > 0) {
                wgpuQueueWriteBuffer(_queue, slot.storage, 0, storage->data, storage->size);
            }
            entry.buffer = slot.storage;
            entry.size = slot.storageSize;
        }
        entries.push_back(entry);
    }

    wgpuQueueWriteBuffer(_queue, program._uniformBuffer, 0, uniformData.data(), uniformData.size());

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.layout = program._bindGroupLayout;
    bgDesc.entryCount = entries.size();
    bgDesc.entries = entries.data();
    WGPUBindGroup bindGroup = wgpuDeviceCreateBindGroup(_device, &bgDesc);
    if (!bindGroup) {
        releaseViews();
        return Err("GpuStateManager::draw: failed to create bind group for " + program._key,
                   Error::Code::GpuFailure);
    }

    WGPUTextureView targetView = wgpuTextureCreateView(target, nullptr);

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = targetView;
    colorAttachment.loadOp = WGPULoadOp_Load;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, nullptr);
    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    wgpuRenderPassEncoderSetPipeline(pass, program._pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, bindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetScissorRect(pass,
        static_cast<uint32_t>(area.left), static_cast<uint32_t>(area.top),
        static_cast<uint32_t>(area.width()), static_cast<uint32_t>(area.height()));
    wgpuRenderPassEncoderDraw(pass, vertexCount, instanceCount, 0, 0);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuQueueSubmit(_queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);

    wgpuBindGroupRelease(bindGroup);
    wgpuTextureViewRelease(targetView);
    releaseViews();
    return Ok();
}

Result<void> GpuStateManager::copyTexture(WGPUTexture src, WGPUTexture dst) {
    if (!src || !dst) {
        return Err("GpuStateManager::copyTexture: null texture", Error::Code::GpuFailure);
    }
    uint32_t width = wgpuTextureGetWidth(src);
    uint32_t height = wgpuTextureGetHeight(src);
    if (width != wgpuTextureGetWidth(dst) || height != wgpuTextureGetHeight(dst)) {
        return Err("GpuStateManager::copyTexture: size mismatch");
    }

    WGPUTexelCopyTextureInfo srcInfo = {};
    srcInfo.texture = src;
    WGPUTexelCopyTextureInfo dstInfo = {};
    dstInfo.texture = dst;
    WGPUExtent3D extent = {width, height, 1};

    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, nullptr);
    wgpuCommandEncoderCopyTextureToTexture(encoder, &srcInfo, &dstInfo, &extent);
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuQueueSubmit(_queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);
    return Ok();
}

Result<void> GpuStateManager::clearTexture(WGPUTexture target, const glm::vec4& value) {
    if (!target) {
        return Err("GpuStateManager::clearTexture: null texture", Error::Code::GpuFailure);
    }
    WGPUTextureView view = wgpuTextureCreateView(target, nullptr);

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = view;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.clearValue = {value.r, value.g, value.b, value.a};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, nullptr);
    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuQueueSubmit(_queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);
    wgpuTextureViewRelease(view);
    return Ok();
}

Result<std::vector<uint8_t>> GpuStateManager::readPixels(WGPUTexture texture, uint32_t x, uint32_t y,
                                                         uint32_t width, uint32_t height) {
    using Bytes = std::vector<uint8_t>;
    if (!texture || width == 0 || height == 0) {
        return Err<Bytes>("GpuStateManager::readPixels: nothing to read", Error::Code::InvalidIndex);
    }
    if (x + width > wgpuTextureGetWidth(texture) || y + height > wgpuTextureGetHeight(texture)) {
        return Err<Bytes>("GpuStateManager::readPixels: rect outside texture", Error::Code::InvalidIndex);
    }

    uint32_t bpp = GpuAllocator::bytesPerPixel(wgpuTextureGetFormat(texture));
    uint32_t rowBytes = width * bpp;
    uint32_t paddedRow = alignUp(rowBytes, ROW_ALIGNMENT);
    uint64_t size = static_cast<uint64_t>(paddedRow) * height;

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("readback");
    bufDesc.size = size;
    bufDesc.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
    WGPUBuffer readback = _allocator.createBuffer(_owner, bufDesc);
    if (!readback) {
        return Err<Bytes>("GpuStateManager::readPixels: failed to allocate readback buffer",
                          Error::Code::GpuFailure);
    }

    WGPUTexelCopyTextureInfo srcInfo = {};
    srcInfo.texture = texture;
    srcInfo.origin = {x, y, 0};
    WGPUTexelCopyBufferInfo dstInfo = {};
    dstInfo.buffer = readback;
    dstInfo.layout.bytesPerRow = paddedRow;
    dstInfo.layout.rowsPerImage = height;
    WGPUExtent3D extent = {width, height, 1};

    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_device, nullptr);
    wgpuCommandEncoderCopyTextureToBuffer(encoder, &srcInfo, &dstInfo, &extent);
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuQueueSubmit(_queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);

    struct MapRequest {
        std::atomic<bool> done{false};
        bool ok = false;
    } request;

    WGPUBufferMapCallbackInfo mapCb = {};
    mapCb.mode = WGPUCallbackMode_AllowSpontaneous;
    mapCb.callback = [](WGPUMapAsyncStatus status, WGPUStringView, void* ud, void*) {
        auto* r = static_cast<MapRequest*>(ud);
        r->ok = status == WGPUMapAsyncStatus_Success;
        r->done = true;
    };
    mapCb.userdata1 = &request;
    wgpuBufferMapAsync(readback, WGPUMapMode_Read, 0, size, mapCb);
    while (!request.done) WGPU_DEVICE_TICK(_device);

    if (!request.ok) {
        _allocator.releaseBuffer(readback);
        return Err<Bytes>("GpuStateManager::readPixels: map failed", Error::Code::GpuFailure);
    }

    const auto* mapped = static_cast<const uint8_t*>(wgpuBufferGetConstMappedRange(readback, 0, size));
    Bytes pixels(static_cast<size_t>(rowBytes) * height);
    for (uint32_t row = 0; row < height; row++) {
        std::memcpy(pixels.data() + static_cast<size_t>(row) * rowBytes,
                    mapped + static_cast<size_t>(row) * paddedRow, rowBytes);
    }
    wgpuBufferUnmap(readback);
    _allocator.releaseBuffer(readback);
    return Ok(std::move(pixels));
}

WGPUTexture GpuStateManager::createTexture(GpuAllocator::OwnerId owner, const std::string& label,
                                           uint32_t width, uint32_t height, WGPUTextureFormat format) {
    WGPUTextureDescriptor texDesc = {};
    texDesc.label = {.data = label.c_str(), .length = label.size()};
    texDesc.size = {width, height, 1};
    texDesc.format = format;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_RenderAttachment |
                    WGPUTextureUsage_CopySrc | WGPUTextureUsage_CopyDst;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    return _allocator.createTexture(owner, texDesc);
}

Result<void> GpuStateManager::writeTexture(WGPUTexture texture, const uint8_t* data, uint32_t width,
                                           uint32_t height, uint32_t bytesPerPixel) {
    if (!texture || !data) {
        return Err("GpuStateManager::writeTexture: nothing to write", Error::Code::GpuFailure);
    }
    WGPUTexelCopyTextureInfo dst = {};
    dst.texture = texture;
    WGPUTexelCopyBufferLayout layout = {};
    layout.bytesPerRow = width * bytesPerPixel;
    layout.rowsPerImage = height;
    WGPUExtent3D extent = {width, height, 1};
    wgpuQueueWriteTexture(_queue, &dst, data, static_cast<size_t>(width) * height * bytesPerPixel,
                          &layout, &extent);
    return Ok();
}

} // namespace pictura
