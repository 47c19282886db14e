#include "UniformLayout.h"
#include <spirv_cross.hpp>
#include <algorithm>
#include <stdexcept>

namespace Rasterix {

namespace {

using spirv_cross::SPIRType;

UniformType member_type(const SPIRType& type, const std::string& name) {
    if (type.columns == 1) {
        if (type.basetype == SPIRType::Float && type.vecsize == 1) return UniformType::Float;
        if (type.basetype == SPIRType::Int && type.vecsize == 1) return UniformType::Int;
        if (type.basetype == SPIRType::Int && type.vecsize == 2) return UniformType::IVec2;
    }
    throw std::invalid_argument("Unsupported uniform block member '" + name + "'");
}

u32 align_to(u32 value, u32 alignment) {
    return (value + alignment - 1) / alignment * alignment;
}

}

UniformLayout UniformLayout::reflect(std::vector<u32> spirv) {
    spirv_cross::Compiler compiler(std::move(spirv));
    const spirv_cross::ShaderResources resources = compiler.get_shader_resources();
    UniformLayout layout;
    
    if (resources.uniform_buffers.size() > 1) {
        throw std::invalid_argument("Only one uniform block is supported");
    }
    for (const auto& block : resources.uniform_buffers) {
        const SPIRType& type = compiler.get_type(block.base_type_id);
        layout._has_block = true;
        layout._block_binding = compiler.get_decoration(block.id, spv::DecorationBinding);
        layout._block_size = align_to(static_cast<u32>(compiler.get_declared_struct_size(type)), 16);
        
        for (u32 i = 0; i < type.member_types.size(); ++i) {
            const SPIRType& member_spir_type = compiler.get_type(type.member_types[i]);
            UniformMember member;
            member.name = compiler.get_member_name(type.self, i);
            if (member.name.empty()) throw std::invalid_argument("Uniform block member without a name");
            member.type = member_type(member_spir_type, member.name);
            member.offset = compiler.type_struct_member_offset(type, i);
            if (!member_spir_type.array.empty()) {
                if (member_spir_type.array.size() != 1 || !member_spir_type.array_size_literal[0]) {
                    throw std::invalid_argument("Uniform '" + member.name + "' must be a one-dimensional sized array");
                }
                member.array_count = member_spir_type.array[0];
                member.array_stride = compiler.type_struct_member_array_stride(type, i);
            }
            layout._members.push_back(member);
        }
    }
    
    for (const auto& buffer : resources.storage_buffers) {
        const SPIRType& type = compiler.get_type(buffer.base_type_id);
        if (type.member_types.size() != 1) {
            throw std::invalid_argument("Texel buffer '" + buffer.name + "' must hold a single array");
        }
        const SPIRType& texel = compiler.get_type(type.member_types[0]);
        if (texel.basetype != SPIRType::Float || (texel.vecsize != 1 && texel.vecsize != 4)) {
            throw std::invalid_argument("Texel buffer '" + buffer.name + "' must hold float or vec4 texels");
        }
        
        StorageBufferDecl decl;
        decl.name = compiler.get_member_name(type.self, 0);
        decl.binding = compiler.get_decoration(buffer.id, spv::DecorationBinding);
        decl.readonly = compiler.get_buffer_block_flags(buffer.id).get(spv::DecorationNonWritable);
        decl.vec4_texels = texel.vecsize == 4;
        layout._buffers.push_back(decl);
    }
    std::sort(layout._buffers.begin(), layout._buffers.end(),
              [](const StorageBufferDecl& a, const StorageBufferDecl& b) { return a.binding < b.binding; });
    
    return layout;
}

std::optional<i32> UniformLayout::find(const std::string& name) const {
    for (size_t i = 0; i < _members.size(); ++i) {
        if (_members[i].name == name) return static_cast<i32>(i);
    }
    for (size_t i = 0; i < _buffers.size(); ++i) {
        if (_buffers[i].name == name) return static_cast<i32>(_members.size() + i);
    }
    return std::nullopt;
}

const UniformMember* UniformLayout::member(i32 location) const {
    if (location < 0 || static_cast<size_t>(location) >= _members.size()) return nullptr;
    return &_members[location];
}

const StorageBufferDecl* UniformLayout::buffer(i32 location) const {
    if (location < static_cast<i32>(_members.size())) return nullptr;
    size_t index = static_cast<size_t>(location) - _members.size();
    return index < _buffers.size() ? &_buffers[index] : nullptr;
}

const StorageBufferDecl* UniformLayout::output_buffer() const {
    for (const auto& decl : _buffers) {
        if (!decl.readonly) return &decl;
    }
    return nullptr;
}

}
