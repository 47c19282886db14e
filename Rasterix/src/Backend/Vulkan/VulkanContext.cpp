#include "VulkanContext.h"
#include <Common/Assert.h>
#include "ShaderCompiler.h"
#include <algorithm>
#include <cstring>

#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>

namespace Rasterix {

static const char* VALIDATION_LAYER = "VK_LAYER_KHRONOS_validation";

static bool has_instance_layer(const char* name) {
    u32 count = 0;
    if (vkEnumerateInstanceLayerProperties(&count, nullptr) != VK_SUCCESS) return false;
    std::vector<VkLayerProperties> layers(count);
    if (vkEnumerateInstanceLayerProperties(&count, layers.data()) != VK_SUCCESS) return false;
    return std::any_of(layers.begin(), layers.end(),
                       [name](const VkLayerProperties& layer) { return std::strcmp(layer.layerName, name) == 0; });
}

static VKAPI_ATTR VkBool32 VKAPI_CALL validation_callback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void*) {
    const spdlog::level::level_enum level =
        (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)   ? spdlog::level::err :
        (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) ? spdlog::level::warn :
                                                                       spdlog::level::debug;
    Logger::get()->log(level, "[validation] {}", data->pMessage);
    return VK_FALSE;
}

static u64 texture_byte_size(u32 rows, u32 cols, bool packed) {
    if (packed) {
        return static_cast<u64>(half_ceil(static_cast<i32>(rows))) *
               static_cast<u64>(half_ceil(static_cast<i32>(cols))) * 4 * sizeof(f32);
    }
    return static_cast<u64>(rows) * cols * sizeof(f32);
}

VulkanContext::VulkanContext(const VulkanContextConfig& config)
    : _config(config) {
    RX_ASSERT(config.shader_api_version == LEGACY_SHADER_API_VERSION ||
             config.shader_api_version == MODERN_SHADER_API_VERSION,
             "Unsupported shader API version");
    try {
        create_instance();
        vulkan_create_device(_vk.instance, _config.device_index, _vk.device);
        _deletion_queue.push([this]() { vulkan_destroy_device(_vk.device); });
        create_allocator();
        create_command_objects();
    } catch (const std::exception& e) {
        LOG_ERROR("VulkanContext initialization failed: {}", e.what());
        shutdown();
        throw;
    }
    LOG_INFO("VulkanContext ready on {} (shader API v{}, validation {})",
             _vk.device.properties.deviceName, _config.shader_api_version,
             _vk.validation_enabled ? "on" : "off");
}

VulkanContext::~VulkanContext() { shutdown(); }

void VulkanContext::create_instance() {
    _vk.validation_enabled = _config.enable_validation && has_instance_layer(VALIDATION_LAYER);
    if (_config.enable_validation && !_vk.validation_enabled) {
        LOG_WARN("{} requested but not installed", VALIDATION_LAYER);
    }

    // vkEnumerateInstanceVersion is missing on 1.0 loaders.
    auto enumerate_version = reinterpret_cast<PFN_vkEnumerateInstanceVersion>(
        vkGetInstanceProcAddr(VK_NULL_HANDLE, "vkEnumerateInstanceVersion"));
    u32 loader_version = VK_API_VERSION_1_0;
    if (enumerate_version) VK_CHECK(enumerate_version(&loader_version));
    _vk.api_version = std::min<u32>(loader_version, VK_API_VERSION_1_2);

    VkApplicationInfo app_info = {VK_STRUCTURE_TYPE_APPLICATION_INFO};
    app_info.pApplicationName = _config.app_name.c_str();
    app_info.pEngineName = "Rasterix";
    app_info.engineVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    app_info.apiVersion = _vk.api_version;

    std::vector<const char*> extensions;
    std::vector<const char*> layers;
    VkInstanceCreateInfo instance_info = {VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO};
#ifdef RX_PLATFORM_APPLE
    extensions.push_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
    extensions.push_back(VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME);
    instance_info.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
#endif

    VkDebugUtilsMessengerCreateInfoEXT messenger_info = {VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT};
    messenger_info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                     VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    messenger_info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                                 VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    messenger_info.pfnUserCallback = validation_callback;
    if (_vk.validation_enabled) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        layers.push_back(VALIDATION_LAYER);
        instance_info.pNext = &messenger_info;
    }

    instance_info.pApplicationInfo = &app_info;
    instance_info.enabledExtensionCount = static_cast<u32>(extensions.size());
    instance_info.ppEnabledExtensionNames = extensions.data();
    instance_info.enabledLayerCount = static_cast<u32>(layers.size());
    instance_info.ppEnabledLayerNames = layers.data();

    VK_CHECK(vkCreateInstance(&instance_info, nullptr, &_vk.instance));
    _deletion_queue.push([this]() {
        vkDestroyInstance(_vk.instance, nullptr);
        _vk.instance = VK_NULL_HANDLE;
    });

    if (!_vk.validation_enabled) return;
    auto create_messenger = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(_vk.instance, "vkCreateDebugUtilsMessengerEXT"));
    auto destroy_messenger = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(_vk.instance, "vkDestroyDebugUtilsMessengerEXT"));
    if (!create_messenger || !destroy_messenger) return;
    VK_CHECK(create_messenger(_vk.instance, &messenger_info, nullptr, &_vk.debug_messenger));
    _deletion_queue.push([this, destroy_messenger]() {
        destroy_messenger(_vk.instance, _vk.debug_messenger, nullptr);
        _vk.debug_messenger = VK_NULL_HANDLE;
    });
}

void VulkanContext::create_allocator() {
    VmaAllocatorCreateInfo allocator_info = {};
    allocator_info.instance = _vk.instance;
    allocator_info.physicalDevice = _vk.device.physical;
    allocator_info.device = _vk.device.logical;
    allocator_info.vulkanApiVersion = std::min(_vk.api_version, _vk.device.properties.apiVersion);
    VK_CHECK(vmaCreateAllocator(&allocator_info, &_vk.allocator));
    _deletion_queue.push([this]() {
        vmaDestroyAllocator(_vk.allocator);
        _vk.allocator = VK_NULL_HANDLE;
    });
}

// Programs run one at a time, so a single command buffer and fence suffice.
void VulkanContext::create_command_objects() {
    VkDevice device = _vk.device.logical;

    VkCommandPoolCreateInfo pool_info = {VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO};
    pool_info.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    pool_info.queueFamilyIndex = _vk.device.compute_family;
    VK_CHECK(vkCreateCommandPool(device, &pool_info, nullptr, &_command_pool));
    _deletion_queue.push([this, device]() { vkDestroyCommandPool(device, _command_pool, nullptr); });

    VkCommandBufferAllocateInfo buffer_info = {VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO};
    buffer_info.commandPool = _command_pool;
    buffer_info.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    buffer_info.commandBufferCount = 1;
    VK_CHECK(vkAllocateCommandBuffers(device, &buffer_info, &_command_buffer));

    VkFenceCreateInfo fence_info = {VK_STRUCTURE_TYPE_FENCE_CREATE_INFO};
    VK_CHECK(vkCreateFence(device, &fence_info, nullptr, &_fence));
    _deletion_queue.push([this, device]() { vkDestroyFence(device, _fence, nullptr); });
}

void VulkanContext::shutdown() {
    if (_vk.device.logical != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(_vk.device.logical);
        for (VulkanProgram* program : _programs) destroy_program(program);
    }
    _programs.clear();
    _bound = nullptr;
    _output = {};
    _deletion_queue.flush();
}

bool VulkanContext::is_valid() const { return _vk.device.logical != VK_NULL_HANDLE; }

ProgramHandle VulkanContext::create_program(const std::string& source) {
    RX_ASSERT(is_valid(), "VulkanContext is not initialized");
    
    std::vector<u32> spirv = compile_glsl_to_spirv(source);
    
    auto* program = new VulkanProgram();
    try {
        program->uniforms = UniformLayout::reflect(spirv);
        const UniformLayout& layout = program->uniforms;
        const u32 storage_limit = _vk.device.properties.limits.maxPerStageDescriptorStorageBuffers;
        if (layout.buffers().size() > storage_limit) {
            throw std::runtime_error("Program binds " + std::to_string(layout.buffers().size()) +
                                     " textures but the device allows " + std::to_string(storage_limit));
        }
        
        std::vector<VkDescriptorSetLayoutBinding> bindings;
        std::vector<VkDescriptorPoolSize> pool_sizes;
        if (layout.has_block()) {
            VkDescriptorSetLayoutBinding binding = {};
            binding.binding = layout.block_binding();
            binding.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            binding.descriptorCount = 1;
            binding.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
            bindings.push_back(binding);
            pool_sizes.push_back({VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1});
        }
        for (const auto& decl : layout.buffers()) {
            VkDescriptorSetLayoutBinding binding = {};
            binding.binding = decl.binding;
            binding.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            binding.descriptorCount = 1;
            binding.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
            bindings.push_back(binding);
        }
        if (!layout.buffers().empty()) {
            pool_sizes.push_back({VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, static_cast<u32>(layout.buffers().size())});
        }
        
        VkDescriptorSetLayoutCreateInfo layout_info = {VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO};
        layout_info.bindingCount = static_cast<u32>(bindings.size());
        layout_info.pBindings = bindings.data();
        VK_CHECK(vkCreateDescriptorSetLayout(_vk.device.logical, &layout_info, nullptr, &program->descriptor_layout));
        
        // One set per program, rewritten before every dispatch.
        VkDescriptorPoolCreateInfo pool_info = {VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO};
        pool_info.maxSets = 1;
        pool_info.poolSizeCount = static_cast<u32>(pool_sizes.size());
        pool_info.pPoolSizes = pool_sizes.data();
        VK_CHECK(vkCreateDescriptorPool(_vk.device.logical, &pool_info, nullptr, &program->descriptor_pool));
        
        VkPipelineLayoutCreateInfo pipe_layout_info = {VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO};
        pipe_layout_info.setLayoutCount = 1;
        pipe_layout_info.pSetLayouts = &program->descriptor_layout;
        VK_CHECK(vkCreatePipelineLayout(_vk.device.logical, &pipe_layout_info, nullptr, &program->layout));
        
        VkShaderModuleCreateInfo shader_info = {VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO};
        shader_info.codeSize = spirv.size() * sizeof(u32);
        shader_info.pCode = spirv.data();
        
        VkShaderModule shader;
        VK_CHECK(vkCreateShaderModule(_vk.device.logical, &shader_info, nullptr, &shader));
        
        VkPipelineShaderStageCreateInfo stage = {VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO};
        stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
        stage.module = shader;
        stage.pName = "main";
        
        VkComputePipelineCreateInfo pipe_info = {VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO};
        pipe_info.stage = stage;
        pipe_info.layout = program->layout;
        
        VkResult result = vkCreateComputePipelines(_vk.device.logical, VK_NULL_HANDLE, 1, &pipe_info, nullptr, &program->pipeline);
        vkDestroyShaderModule(_vk.device.logical, shader, nullptr);
        VK_CHECK(result);
        
        if (layout.has_block()) {
            VkBufferCreateInfo buf_info = {VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO};
            buf_info.size = layout.block_size();
            buf_info.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
            buf_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
            
            VmaAllocationCreateInfo alloc = {};
            alloc.usage = VMA_MEMORY_USAGE_CPU_TO_GPU;
            alloc.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
            
            VmaAllocationInfo info;
            VK_CHECK(vmaCreateBuffer(_vk.allocator, &buf_info, &alloc, &program->uniform_buffer, &program->uniform_allocation, &info));
            program->uniform_mapped = info.pMappedData;
            program->block_data.assign(layout.block_size(), 0);
        }
    } catch (const std::exception&) {
        destroy_program(program);
        throw;
    }
    
    _programs.push_back(program);
    
    ProgramHandle handle;
    handle.native_handle = program;
    return handle;
}

void VulkanContext::destroy_program(VulkanProgram* program) {
    if (!program) return;
    VkDevice device = _vk.device.logical;
    if (program->pipeline) vkDestroyPipeline(device, program->pipeline, nullptr);
    if (program->layout) vkDestroyPipelineLayout(device, program->layout, nullptr);
    if (program->descriptor_pool) vkDestroyDescriptorPool(device, program->descriptor_pool, nullptr);
    if (program->descriptor_layout) vkDestroyDescriptorSetLayout(device, program->descriptor_layout, nullptr);
    if (program->uniform_buffer) vmaDestroyBuffer(_vk.allocator, program->uniform_buffer, program->uniform_allocation);
    delete program;
}

void VulkanContext::delete_program(ProgramHandle& program) {
    if (!program.valid()) return;
    auto* native = static_cast<VulkanProgram*>(program.native_handle);
    
    auto it = std::find(_programs.begin(), _programs.end(), native);
    if (it != _programs.end()) {
        vkDeviceWaitIdle(_vk.device.logical);
        _programs.erase(it);
        if (_bound == native) _bound = nullptr;
        destroy_program(native);
    } else {
        LOG_WARN("delete_program: unknown program {}", program.native_handle);
    }
    program = {};
}

std::optional<UniformLocation> VulkanContext::get_uniform_location(const ProgramHandle& program,
                                                                   const std::string& name,
                                                                   bool should_throw) {
    RX_ASSERT(program.valid(), "get_uniform_location on an invalid program");
    auto* native = static_cast<VulkanProgram*>(program.native_handle);
    
    std::optional<i32> index = native->uniforms.find(name);
    if (!index) {
        if (should_throw) throw std::runtime_error("Uniform '" + name + "' not found in program");
        return std::nullopt;
    }
    return UniformLocation{*index};
}

void VulkanContext::set_program(const ProgramHandle& program) {
    RX_ASSERT(program.valid(), "set_program on an invalid program");
    _bound = static_cast<VulkanProgram*>(program.native_handle);
    _bound->inputs.clear();
}

void VulkanContext::bind_output(const TextureHandle& texture, u32 rows, u32 cols, bool packed) {
    RX_ASSERT(texture.valid(), "Output texture is not allocated");
    RX_ASSERT(texture.packed == packed, "Output texture packing does not match the binding");
    RX_ASSERT(texture.size >= texture_byte_size(rows, cols, packed), "Output texture is smaller than its bound shape");
    _output.texture = texture;
    _output.rows = rows;
    _output.cols = cols;
    _output.packed = packed;
}

void VulkanContext::set_output_matrix_texture(const TextureHandle& texture, u32 rows, u32 cols) {
    bind_output(texture, rows, cols, false);
}

void VulkanContext::set_output_packed_matrix_texture(const TextureHandle& texture, u32 rows, u32 cols) {
    bind_output(texture, rows, cols, true);
}

void VulkanContext::set_input_matrix_texture(const TextureHandle& texture, UniformLocation location, u32 texture_unit) {
    VulkanProgram& program = bound_program();
    const StorageBufferDecl* decl = program.uniforms.buffer(location.index);
    RX_ASSERT(decl != nullptr, "Input location does not name a texture");
    RX_ASSERT(decl->readonly, "Cannot bind an input to the output texture");
    RX_ASSERT(texture.valid(), "Input texture is not allocated");
    RX_ASSERT(texture.packed == decl->vec4_texels, "Input texture packing does not match the program");
    
    program.inputs[decl->binding] = texture;
    LOG_TRACE("Bound input {} to binding {} (unit {})", decl->name, decl->binding, texture_unit);
}

VulkanContext::VulkanProgram& VulkanContext::bound_program() {
    RX_ASSERT(_bound != nullptr, "No program is bound");
    return *_bound;
}

const UniformMember& VulkanContext::bound_member(UniformLocation location, const char* op) {
    const UniformMember* member = bound_program().uniforms.member(location.index);
    if (!member) throw std::runtime_error(std::string(op) + ": location does not name a uniform");
    return *member;
}

void VulkanContext::write_block(u32 offset, const void* data, u32 size) {
    std::vector<u8>& block = bound_program().block_data;
    RX_ASSERT(offset + size <= block.size(), "Uniform write past the end of the block");
    memcpy(block.data() + offset, data, size);
}

void VulkanContext::uniform1f(UniformLocation location, f32 value) {
    const UniformMember& member = bound_member(location, "uniform1f");
    RX_ASSERT(member.type == UniformType::Float, "uniform1f on a non-float uniform");
    write_block(member.offset, &value, sizeof(f32));
}

void VulkanContext::uniform1fv(UniformLocation location, const std::vector<f32>& values) {
    const UniformMember& member = bound_member(location, "uniform1fv");
    RX_ASSERT(member.type == UniformType::Float, "uniform1fv on a non-float uniform");
    
    if (member.array_count == 0) {
        RX_ASSERT(values.size() == 1, "uniform1fv with several values on a scalar uniform");
        write_block(member.offset, values.data(), sizeof(f32));
        return;
    }
    
    RX_ASSERT(values.size() == member.array_count, "uniform1fv must write every element of '" + member.name + "'");
    for (size_t i = 0; i < values.size(); ++i) {
        write_block(member.offset + static_cast<u32>(i) * member.array_stride, &values[i], sizeof(f32));
    }
}

void VulkanContext::uniform1i(UniformLocation location, i32 value) {
    const UniformMember& member = bound_member(location, "uniform1i");
    RX_ASSERT(member.type == UniformType::Int, "uniform1i on a non-int uniform");
    write_block(member.offset, &value, sizeof(i32));
}

void VulkanContext::uniform1iv(UniformLocation location, const std::vector<i32>& values) {
    const UniformMember& member = bound_member(location, "uniform1iv");
    
    if (member.type == UniformType::IVec2) {
        RX_ASSERT(member.array_count == 0 && values.size() == 2, "uniform1iv expects two values for an ivec2");
        write_block(member.offset, values.data(), 2 * sizeof(i32));
        return;
    }
    
    RX_ASSERT(member.type == UniformType::Int, "uniform1iv on a non-int uniform");
    if (member.array_count == 0) {
        RX_ASSERT(values.size() == 1, "uniform1iv with several values on a scalar uniform");
        write_block(member.offset, values.data(), sizeof(i32));
        return;
    }
    
    RX_ASSERT(values.size() == member.array_count, "uniform1iv must write every element of '" + member.name + "'");
    for (size_t i = 0; i < values.size(); ++i) {
        write_block(member.offset + static_cast<u32>(i) * member.array_stride, &values[i], sizeof(i32));
    }
}

void VulkanContext::execute_program() {
    VulkanProgram& program = bound_program();
    RX_ASSERT(_output.texture.valid(), "No output texture is bound");
    
    const UniformLayout& layout = program.uniforms;
    const StorageBufferDecl* output_decl = layout.output_buffer();
    RX_ASSERT(output_decl != nullptr, "Program declares no output buffer");
    RX_ASSERT(output_decl->vec4_texels == _output.packed, "Output texture packing does not match the program");
    
    if (layout.has_block()) {
        memcpy(program.uniform_mapped, program.block_data.data(), program.block_data.size());
        VK_CHECK(vmaFlushAllocation(_vk.allocator, program.uniform_allocation, 0, VK_WHOLE_SIZE));
    }
    
    VK_CHECK(vkResetDescriptorPool(_vk.device.logical, program.descriptor_pool, 0));
    
    VkDescriptorSetAllocateInfo alloc = {VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO};
    alloc.descriptorPool = program.descriptor_pool;
    alloc.descriptorSetCount = 1;
    alloc.pSetLayouts = &program.descriptor_layout;
    VkDescriptorSet set;
    VK_CHECK(vkAllocateDescriptorSets(_vk.device.logical, &alloc, &set));
    
    std::vector<VkDescriptorBufferInfo> infos;
    infos.reserve(layout.buffers().size() + 1);
    std::vector<VkWriteDescriptorSet> writes;
    
    auto add_write = [&](u32 binding, VkDescriptorType type, VkBuffer buffer, VkDeviceSize range) {
        infos.push_back({buffer, 0, range});
        VkWriteDescriptorSet write = {VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET};
        write.dstSet = set;
        write.dstBinding = binding;
        write.descriptorType = type;
        write.descriptorCount = 1;
        write.pBufferInfo = &infos.back();
        writes.push_back(write);
    };
    
    if (layout.has_block()) {
        add_write(layout.block_binding(), VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, program.uniform_buffer, layout.block_size());
    }
    for (const auto& decl : layout.buffers()) {
        if (!decl.readonly) {
            add_write(decl.binding, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
                      static_cast<VkBuffer>(_output.texture.native_handle), _output.texture.size);
            continue;
        }
        auto it = program.inputs.find(decl.binding);
        if (it == program.inputs.end()) {
            throw std::runtime_error("Input texture '" + decl.name + "' is not bound");
        }
        add_write(decl.binding, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
                  static_cast<VkBuffer>(it->second.native_handle), it->second.size);
    }
    vkUpdateDescriptorSets(_vk.device.logical, static_cast<u32>(writes.size()), writes.data(), 0, nullptr);
    
    u32 texel_rows = _output.packed ? static_cast<u32>(half_ceil(static_cast<i32>(_output.rows))) : _output.rows;
    u32 texel_cols = _output.packed ? static_cast<u32>(half_ceil(static_cast<i32>(_output.cols))) : _output.cols;
    u32 group_x = rx_max(div_up(texel_cols, WORKGROUP_SIZE_X), 1u);
    u32 group_y = rx_max(div_up(texel_rows, WORKGROUP_SIZE_Y), 1u);
    
    VK_CHECK(vkResetCommandBuffer(_command_buffer, 0));
    VkCommandBufferBeginInfo begin = {VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO};
    begin.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    VK_CHECK(vkBeginCommandBuffer(_command_buffer, &begin));
    
    vkCmdBindPipeline(_command_buffer, VK_PIPELINE_BIND_POINT_COMPUTE, program.pipeline);
    vkCmdBindDescriptorSets(_command_buffer, VK_PIPELINE_BIND_POINT_COMPUTE, program.layout, 0, 1, &set, 0, nullptr);
    vkCmdDispatch(_command_buffer, group_x, group_y, 1);
    
    VkMemoryBarrier barrier = {VK_STRUCTURE_TYPE_MEMORY_BARRIER};
    barrier.srcAccessMask = VK_ACCESS_SHADER_WRITE_BIT;
    barrier.dstAccessMask = VK_ACCESS_HOST_READ_BIT;
    vkCmdPipelineBarrier(_command_buffer, VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT, VK_PIPELINE_STAGE_HOST_BIT,
                         0, 1, &barrier, 0, nullptr, 0, nullptr);
    
    VK_CHECK(vkEndCommandBuffer(_command_buffer));
    submit_and_wait(_command_buffer);
}

void VulkanContext::submit_and_wait(VkCommandBuffer cmd) {
    VK_CHECK(vkResetFences(_vk.device.logical, 1, &_fence));
    
    VkSubmitInfo submit = {VK_STRUCTURE_TYPE_SUBMIT_INFO};
    submit.commandBufferCount = 1;
    submit.pCommandBuffers = &cmd;
    VK_CHECK(vkQueueSubmit(_vk.device.compute_queue, 1, &submit, _fence));
    VK_CHECK(vkWaitForFences(_vk.device.logical, 1, &_fence, VK_TRUE, UINT64_MAX));
}

TextureHandle VulkanContext::create_matrix_texture(u32 rows, u32 cols, bool packed) {
    RX_ASSERT(is_valid(), "VulkanContext is not initialized");
    RX_ASSERT(rows > 0 && cols > 0, "Texture dimensions must be positive");
    
    VkBufferCreateInfo buf_info = {VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO};
    buf_info.size = texture_byte_size(rows, cols, packed);
    RX_ASSERT(buf_info.size <= _vk.device.max_texture_bytes(), "Matrix texture exceeds the storage buffer range");
    buf_info.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_SRC_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    buf_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    
    VmaAllocationCreateInfo alloc = {};
    alloc.usage = VMA_MEMORY_USAGE_CPU_TO_GPU;
    alloc.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
    
    VkBuffer buffer;
    VmaAllocation allocation;
    VmaAllocationInfo info;
    VK_CHECK(vmaCreateBuffer(_vk.allocator, &buf_info, &alloc, &buffer, &allocation, &info));
    
    TextureHandle handle;
    handle.native_handle = buffer;
    handle.allocation = allocation;
    handle.mapped = info.pMappedData;
    handle.size = buf_info.size;
    handle.rows = rows;
    handle.cols = cols;
    handle.packed = packed;
    return handle;
}

void VulkanContext::delete_matrix_texture(TextureHandle& texture) {
    if (!texture.valid()) return;
    vkDeviceWaitIdle(_vk.device.logical);
    
    for (VulkanProgram* program : _programs) {
        for (auto it = program->inputs.begin(); it != program->inputs.end();) {
            if (it->second.native_handle == texture.native_handle) it = program->inputs.erase(it);
            else ++it;
        }
    }
    if (_output.texture.native_handle == texture.native_handle) _output = {};
    
    vmaDestroyBuffer(_vk.allocator, static_cast<VkBuffer>(texture.native_handle), static_cast<VmaAllocation>(texture.allocation));
    texture = {};
}

void VulkanContext::upload_matrix_texture(TextureHandle& texture, const std::vector<f32>& data) {
    RX_CHECK(texture.valid());
    u64 bytes = data.size() * sizeof(f32);
    RX_ASSERT(bytes == texture.size, "Upload size does not match the texture");
    
    memcpy(texture.mapped, data.data(), bytes);
    VK_CHECK(vmaFlushAllocation(_vk.allocator, static_cast<VmaAllocation>(texture.allocation), 0, bytes));
}

std::vector<f32> VulkanContext::download_matrix_texture(TextureHandle& texture) {
    RX_CHECK(texture.valid());
    VK_CHECK(vmaInvalidateAllocation(_vk.allocator, static_cast<VmaAllocation>(texture.allocation), 0, texture.size));
    
    std::vector<f32> data(texture.size / sizeof(f32));
    memcpy(data.data(), texture.mapped, texture.size);
    return data;
}

}
