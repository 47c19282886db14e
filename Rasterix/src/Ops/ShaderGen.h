#pragma once

#include <Common/Types.h>
#include <Core/TensorData.h>
#include <string>
#include <vector>

namespace Rasterix {
namespace ShaderGen {

constexpr u32 WORKGROUP_SIZE = 8;
constexpr u32 UNIFORM_BLOCK_BINDING = 0;

struct ShaderSource {
    std::string source;
    std::string key;
};

// Builds a GLSL 450 compute shader around a program body. Every layout
// value that may differ between two operands of the same key (shapes,
// strides, texture shapes, offsets) is read from a uniform so one binary
// serves all of them.
ShaderSource make_shader(const std::vector<InputInfo>& inputs,
                         const ShapeInfo& output,
                         const std::string& user_code,
                         bool uses_packed_textures,
                         u32 api_version);

std::string glsl_header(u32 api_version);
std::string texture_binding(u32 binding, const std::string& name, bool packed, bool readonly);

}
}
