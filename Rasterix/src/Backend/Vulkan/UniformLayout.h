#pragma once

#include <Common/Types.h>
#include <optional>
#include <string>
#include <vector>

namespace Rasterix {

enum class UniformType : u32 {
    Float = 0,
    Int,
    IVec2
};

struct UniformMember {
    std::string name;
    UniformType type = UniformType::Float;
    u32 array_count = 0;     // 0 for a non-array member
    u32 offset = 0;
    u32 array_stride = 0;
};

struct StorageBufferDecl {
    std::string name;
    u32 binding = 0;
    bool readonly = true;
    bool vec4_texels = false;
};

// Reflection of a compiled compute module: the offsets of its uniform block
// members and the storage buffers it binds, as decorated in the SPIR-V.
// Locations index members first, then buffers.
class UniformLayout {
public:
    // Throws std::invalid_argument for a block member or buffer the context
    // cannot upload to, and spirv_cross::CompilerError for a malformed module.
    static UniformLayout reflect(std::vector<u32> spirv);
    
    std::optional<i32> find(const std::string& name) const;
    
    const UniformMember* member(i32 location) const;
    const StorageBufferDecl* buffer(i32 location) const;
    
    bool has_block() const { return _has_block; }
    u32 block_binding() const { return _block_binding; }
    u32 block_size() const { return _block_size; }
    
    const std::vector<UniformMember>& members() const { return _members; }
    const std::vector<StorageBufferDecl>& buffers() const { return _buffers; }
    const StorageBufferDecl* output_buffer() const;

private:
    std::vector<UniformMember> _members;
    std::vector<StorageBufferDecl> _buffers;
    bool _has_block = false;
    u32 _block_binding = 0;
    u32 _block_size = 0;
};

}
