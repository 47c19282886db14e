#pragma once

#include <Backend/GpgpuContext.h>
#include "UniformLayout.h"
#include "VulkanTypes.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace Rasterix {

struct VulkanContextConfig {
    std::string app_name = "Rasterix";
    u32 device_index = 0;
    u32 shader_api_version = MODERN_SHADER_API_VERSION;
    bool enable_validation = false;
};

// GpgpuContext over a Vulkan compute queue. Matrix textures are host-visible
// storage buffers; each program owns a std140 uniform buffer whose host copy
// is written by the uniform* calls and flushed at dispatch.
class RX_API VulkanContext : public GpgpuContext {
public:
    explicit VulkanContext(const VulkanContextConfig& config = {});
    ~VulkanContext() override;
    
    VulkanContext(const VulkanContext&) = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;
    
    bool is_valid() const override;
    u32 shader_api_version() const override { return _config.shader_api_version; }
    
    ProgramHandle create_program(const std::string& source) override;
    void delete_program(ProgramHandle& program) override;
    
    std::optional<UniformLocation> get_uniform_location(const ProgramHandle& program,
                                                        const std::string& name,
                                                        bool should_throw) override;
    
    void set_program(const ProgramHandle& program) override;
    void set_output_matrix_texture(const TextureHandle& texture, u32 rows, u32 cols) override;
    void set_output_packed_matrix_texture(const TextureHandle& texture, u32 rows, u32 cols) override;
    void set_input_matrix_texture(const TextureHandle& texture, UniformLocation location, u32 texture_unit) override;
    
    void uniform1f(UniformLocation location, f32 value) override;
    void uniform1fv(UniformLocation location, const std::vector<f32>& values) override;
    void uniform1i(UniformLocation location, i32 value) override;
    void uniform1iv(UniformLocation location, const std::vector<i32>& values) override;
    
    void execute_program() override;
    
    TextureHandle create_matrix_texture(u32 rows, u32 cols, bool packed) override;
    void delete_matrix_texture(TextureHandle& texture) override;
    void upload_matrix_texture(TextureHandle& texture, const std::vector<f32>& data) override;
    std::vector<f32> download_matrix_texture(TextureHandle& texture) override;
    
    const VulkanDevice& device() const { return _vk.device; }

private:
    struct VulkanProgram {
        VkPipeline pipeline = VK_NULL_HANDLE;
        VkPipelineLayout layout = VK_NULL_HANDLE;
        VkDescriptorSetLayout descriptor_layout = VK_NULL_HANDLE;
        VkDescriptorPool descriptor_pool = VK_NULL_HANDLE;
        
        VkBuffer uniform_buffer = VK_NULL_HANDLE;
        VmaAllocation uniform_allocation = VK_NULL_HANDLE;
        void* uniform_mapped = nullptr;
        
        UniformLayout uniforms;
        std::vector<u8> block_data;
        std::unordered_map<u32, TextureHandle> inputs;
    };
    
    struct OutputBinding {
        TextureHandle texture;
        u32 rows = 0;
        u32 cols = 0;
        bool packed = false;
    };
    
    void create_instance();
    void create_allocator();
    void create_command_objects();
    void shutdown();
    
    void destroy_program(VulkanProgram* program);
    VulkanProgram& bound_program();
    const UniformMember& bound_member(UniformLocation location, const char* op);
    void write_block(u32 offset, const void* data, u32 size);
    void bind_output(const TextureHandle& texture, u32 rows, u32 cols, bool packed);
    
    void submit_and_wait(VkCommandBuffer cmd);
    
    VulkanContextConfig _config;
    VulkanInstance _vk;
    DeletionQueue _deletion_queue;
    
    VkCommandPool _command_pool = VK_NULL_HANDLE;
    VkCommandBuffer _command_buffer = VK_NULL_HANDLE;
    VkFence _fence = VK_NULL_HANDLE;
    
    std::vector<VulkanProgram*> _programs;
    VulkanProgram* _bound = nullptr;
    OutputBinding _output;
};

}
