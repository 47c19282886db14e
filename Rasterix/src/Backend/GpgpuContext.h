#pragma once

#include <Common/Types.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Rasterix {

struct TextureHandle {
    void* native_handle = nullptr;
    void* allocation = nullptr;
    void* mapped = nullptr;
    u64 size = 0;
    u32 rows = 0;
    u32 cols = 0;
    bool packed = false;
    
    bool valid() const { return native_handle != nullptr; }
};

struct ProgramHandle {
    void* native_handle = nullptr;
    
    bool valid() const { return native_handle != nullptr; }
    bool operator==(const ProgramHandle& other) const { return native_handle == other.native_handle; }
    bool operator!=(const ProgramHandle& other) const { return !(*this == other); }
};

// Opaque per-program uniform slot. Only meaningful for the program it was
// resolved against.
struct UniformLocation {
    i32 index = -1;
    
    bool operator==(const UniformLocation& other) const { return index == other.index; }
    bool operator!=(const UniformLocation& other) const { return index != other.index; }
};

constexpr u32 LEGACY_SHADER_API_VERSION = 1;
constexpr u32 MODERN_SHADER_API_VERSION = 2;

// The GPU the compute core runs against. One program and one output texture
// are bound at a time; callers serialize access.
class GpgpuContext {
public:
    virtual ~GpgpuContext() = default;
    
    virtual bool is_valid() const = 0;
    
    // 1 declares INFINITY as a uniform, 2 as a shader constant.
    virtual u32 shader_api_version() const = 0;
    
    // Throws CompileError when the driver rejects the source.
    virtual ProgramHandle create_program(const std::string& source) = 0;
    virtual void delete_program(ProgramHandle& program) = 0;
    
    // Empty when the program does not declare the uniform. Throws only when
    // should_throw is set.
    virtual std::optional<UniformLocation> get_uniform_location(const ProgramHandle& program,
                                                                const std::string& name,
                                                                bool should_throw) = 0;
    
    virtual void set_program(const ProgramHandle& program) = 0;
    virtual void set_output_matrix_texture(const TextureHandle& texture, u32 rows, u32 cols) = 0;
    virtual void set_output_packed_matrix_texture(const TextureHandle& texture, u32 rows, u32 cols) = 0;
    virtual void set_input_matrix_texture(const TextureHandle& texture, UniformLocation location, u32 texture_unit) = 0;
    
    // Uniform uploads apply to the currently bound program.
    virtual void uniform1f(UniformLocation location, f32 value) = 0;
    virtual void uniform1fv(UniformLocation location, const std::vector<f32>& values) = 0;
    virtual void uniform1i(UniformLocation location, i32 value) = 0;
    virtual void uniform1iv(UniformLocation location, const std::vector<i32>& values) = 0;
    
    // Runs the bound program over every texel of the bound output.
    virtual void execute_program() = 0;
    
    virtual TextureHandle create_matrix_texture(u32 rows, u32 cols, bool packed) = 0;
    virtual void delete_matrix_texture(TextureHandle& texture) = 0;
    virtual void upload_matrix_texture(TextureHandle& texture, const std::vector<f32>& data) = 0;
    virtual std::vector<f32> download_matrix_texture(TextureHandle& texture) = 0;
    
    // Expires when the context is destroyed. Objects that release resources
    // through the context hold this instead of assuming it outlives them.
    std::weak_ptr<const void> lifetime() const { return _lifetime; }

private:
    std::shared_ptr<const void> _lifetime = std::make_shared<int>(0);
};

}
