#include "ShaderGen.h"
#include <Backend/GpgpuContext.h>
#include <Core/UniformTable.h>
#include <sstream>
#include <stdexcept>

namespace Rasterix {
namespace ShaderGen {

namespace {

std::string int_array(const std::string& name, size_t count) {
    std::ostringstream ss;
    ss << "    int " << name << "[" << count << "];\n";
    return ss.str();
}

std::string coord_params(size_t rank) {
    std::ostringstream ss;
    for (size_t i = 0; i < rank; ++i) {
        if (i > 0) ss << ", ";
        ss << "int i" << i;
    }
    return ss.str();
}

void check_input_layout(const InputInfo& input, bool uses_packed_textures) {
    const ShapeInfo& info = input.shape_info;
    if (info.is_uniform) return;
    if (!info.tex_shape) {
        throw std::invalid_argument("Texture input '" + input.name + "' has no texture shape");
    }
    if (info.is_packed && !uses_packed_textures) {
        throw std::invalid_argument("Packed input '" + input.name + "' requires a packed program");
    }
    if (!info.is_packed && uses_packed_textures) {
        throw std::invalid_argument("Unpacked input '" + input.name + "' cannot be read by a packed program");
    }
    // A flat offset counts logical elements, which do not map onto 2x2 texels.
    if (info.is_packed && info.flat_offset) {
        throw std::invalid_argument("Packed input '" + input.name + "' cannot be a sliced view");
    }
}

// Uniform block members for one input.
std::string input_uniforms(const InputInfo& input) {
    const ShapeInfo& info = input.shape_info;
    const std::string& name = input.name;
    std::ostringstream ss;
    
    if (info.is_uniform) {
        i64 size = size_from_shape(info.logical_shape);
        if (size < 2) ss << "    float " << name << ";\n";
        else ss << "    float " << name << "[" << size << "];\n";
        return ss.str();
    }
    
    if (info.logical_shape.empty()) {
        if (info.flat_offset) {
            ss << "    int " << input_uniform_name(InputUniform::Offset, name) << ";\n";
        }
        return ss.str();
    }
    
    if (info.is_packed) {
        size_t rank = info.logical_shape.size();
        ss << int_array(input_uniform_name(InputUniform::Shape, name), rank);
        if (rank >= 2) ss << int_array(input_uniform_name(InputUniform::Strides, name), rank - 1);
        ss << "    ivec2 " << input_uniform_name(InputUniform::PackedTexShape, name) << ";\n";
        return ss.str();
    }
    
    size_t squeezed_rank = squeeze_shape(info.logical_shape).new_shape.size();
    if (squeezed_rank >= 1) ss << int_array(input_uniform_name(InputUniform::Shape, name), squeezed_rank);
    if (squeezed_rank >= 2) ss << int_array(input_uniform_name(InputUniform::Strides, name), squeezed_rank - 1);
    ss << "    ivec2 " << input_uniform_name(InputUniform::TexShape, name) << ";\n";
    if (info.flat_offset) {
        ss << "    int " << input_uniform_name(InputUniform::Offset, name) << ";\n";
    }
    return ss.str();
}

std::string output_uniforms(const ShapeInfo& output) {
    std::ostringstream ss;
    size_t rank = output.logical_shape.size();
    if (rank == 0) return ss.str();
    
    ss << int_array(output_uniform_name(OutputUniform::Shape), rank);
    if (output.is_packed) {
        ss << "    ivec2 " << output_uniform_name(OutputUniform::PackedTexShape) << ";\n";
        ss << "    int " << output_uniform_name(OutputUniform::TexelsInLogicalRow) << ";\n";
        ss << "    int " << output_uniform_name(OutputUniform::TexelsInBatch) << ";\n";
    } else {
        if (rank >= 2) ss << int_array(output_uniform_name(OutputUniform::Strides), rank - 1);
        ss << "    ivec2 " << output_uniform_name(OutputUniform::TexShape) << ";\n";
    }
    return ss.str();
}

std::string uniform_getter(const InputInfo& input) {
    const Shape& shape = input.shape_info.logical_shape;
    const std::string& name = input.name;
    std::ostringstream ss;
    
    ss << "float get" << name << "(" << coord_params(shape.size()) << ") {\n";
    if (size_from_shape(shape) < 2) {
        ss << "    return " << name << ";\n";
    } else {
        // Shapes are part of the cache key, so strides can be baked in.
        std::vector<i32> strides = compute_strides(shape);
        ss << "    int flat = i" << shape.size() - 1;
        for (size_t i = 0; i < strides.size(); ++i) {
            ss << " + i" << i << " * " << strides[i];
        }
        ss << ";\n";
        ss << "    return " << name << "[flat];\n";
    }
    ss << "}\n\n";
    return ss.str();
}

std::string texture_getter(const InputInfo& input) {
    const ShapeInfo& info = input.shape_info;
    const std::string& name = input.name;
    const std::string shape_name = input_uniform_name(InputUniform::Shape, name);
    const std::string strides_name = input_uniform_name(InputUniform::Strides, name);
    const std::string tex_name = input_uniform_name(InputUniform::TexShape, name);
    const std::string offset_name = input_uniform_name(InputUniform::Offset, name);
    std::ostringstream ss;
    
    ss << "float get" << name << "(" << coord_params(info.logical_shape.size()) << ") {\n";
    if (info.logical_shape.empty()) {
        ss << "    return " << name << "[" << (info.flat_offset ? offset_name : "0") << "];\n";
        ss << "}\n\n";
        return ss.str();
    }
    
    const std::vector<u32> kept = squeeze_shape(info.logical_shape).kept_dims;
    for (size_t j = 0; j < kept.size(); ++j) {
        ss << "    if (i" << kept[j] << " >= " << shape_name << "[" << j << "]) return 0.0;\n";
    }
    if (kept.empty()) {
        ss << "    int flat = 0;\n";
    } else {
        ss << "    int flat = i" << kept.back();
        for (size_t j = 0; j + 1 < kept.size(); ++j) {
            ss << " + i" << kept[j] << " * " << strides_name << "[" << j << "]";
        }
        ss << ";\n";
    }
    if (info.flat_offset) ss << "    flat += " << offset_name << ";\n";
    ss << "    if (flat >= " << tex_name << "[0] * " << tex_name << "[1]) return 0.0;\n";
    ss << "    return " << name << "[flat];\n";
    ss << "}\n\n";
    return ss.str();
}

// Packed texels hold the 2x2 block (r, c), (r, c+1), (r+1, c), (r+1, c+1)
// in xyzw. The getter returns the texel covering the logical coordinate.
std::string packed_getter(const InputInfo& input) {
    const ShapeInfo& info = input.shape_info;
    const std::string& name = input.name;
    const std::string shape_name = input_uniform_name(InputUniform::Shape, name);
    const std::string strides_name = input_uniform_name(InputUniform::Strides, name);
    const std::string packed_name = input_uniform_name(InputUniform::PackedTexShape, name);
    const size_t rank = info.logical_shape.size();
    std::ostringstream ss;
    
    ss << "vec4 get" << name << "(" << coord_params(rank) << ") {\n";
    if (rank == 0) {
        ss << "    return " << name << "[0];\n";
        ss << "}\n\n";
        return ss.str();
    }
    
    for (size_t j = 0; j < rank; ++j) {
        bool halved = j + 2 >= rank;
        ss << "    int c" << j << " = " << (halved ? "i" + std::to_string(j) + " / 2" : "i" + std::to_string(j)) << ";\n";
        ss << "    if (c" << j << " >= " << shape_name << "[" << j << "]) return vec4(0.0);\n";
    }
    ss << "    int flat = c" << rank - 1;
    for (size_t j = 0; j + 1 < rank; ++j) {
        ss << " + c" << j << " * " << strides_name << "[" << j << "]";
    }
    ss << ";\n";
    ss << "    if (flat >= " << packed_name << "[0] * " << packed_name << "[1]) return vec4(0.0);\n";
    ss << "    return " << name << "[flat];\n";
    ss << "}\n\n";
    return ss.str();
}

std::string output_helpers(const ShapeInfo& output) {
    const size_t rank = output.logical_shape.size();
    std::ostringstream ss;
    ss << "int outCoords[" << rx_max<size_t>(rank, 1) << "];\n";
    ss << "int outTexel;\n\n";
    ss << "int getOutputCoord(int axis) {\n";
    ss << "    return outCoords[axis];\n";
    ss << "}\n\n";
    if (output.is_packed) {
        ss << "void setOutput(vec4 value) {\n";
    } else {
        ss << "void setOutput(float value) {\n";
    }
    ss << "    result[outTexel] = value;\n";
    ss << "}\n\n";
    return ss.str();
}

std::string unpacked_main(const ShapeInfo& output) {
    const size_t rank = output.logical_shape.size();
    const char* tex = output_uniform_name(OutputUniform::TexShape);
    const char* shape = output_uniform_name(OutputUniform::Shape);
    const char* strides = output_uniform_name(OutputUniform::Strides);
    std::ostringstream ss;
    
    ss << "void main() {\n";
    ss << "    ivec2 texel = ivec2(gl_GlobalInvocationID.xy);\n";
    if (rank == 0) {
        ss << "    if (texel.x > 0 || texel.y > 0) return;\n";
        ss << "    outTexel = 0;\n";
        ss << "    outCoords[0] = 0;\n";
    } else {
        ss << "    if (texel.x >= " << tex << "[1] || texel.y >= " << tex << "[0]) return;\n";
        ss << "    outTexel = texel.y * " << tex << "[1] + texel.x;\n";
        ss << "    int size = " << shape << "[0]";
        if (rank >= 2) ss << " * " << strides << "[0]";
        ss << ";\n";
        ss << "    if (outTexel >= size) return;\n";
        ss << "    int rem = outTexel;\n";
        for (size_t j = 0; j + 1 < rank; ++j) {
            ss << "    outCoords[" << j << "] = rem / " << strides << "[" << j << "];\n";
            ss << "    rem -= outCoords[" << j << "] * " << strides << "[" << j << "];\n";
        }
        ss << "    outCoords[" << rank - 1 << "] = rem;\n";
    }
    ss << "    run();\n";
    ss << "}\n";
    return ss.str();
}

std::string packed_main(const ShapeInfo& output) {
    const size_t rank = output.logical_shape.size();
    const char* packed_tex = output_uniform_name(OutputUniform::PackedTexShape);
    const char* shape = output_uniform_name(OutputUniform::Shape);
    const char* per_row = output_uniform_name(OutputUniform::TexelsInLogicalRow);
    const char* per_batch = output_uniform_name(OutputUniform::TexelsInBatch);
    std::ostringstream ss;
    
    ss << "void main() {\n";
    ss << "    ivec2 texel = ivec2(gl_GlobalInvocationID.xy);\n";
    if (rank == 0) {
        ss << "    if (texel.x > 0 || texel.y > 0) return;\n";
        ss << "    outTexel = 0;\n";
        ss << "    outCoords[0] = 0;\n";
        ss << "    run();\n";
        ss << "}\n";
        return ss.str();
    }
    
    ss << "    if (texel.x >= " << packed_tex << "[1] || texel.y >= " << packed_tex << "[0]) return;\n";
    ss << "    outTexel = texel.y * " << packed_tex << "[1] + texel.x;\n";
    ss << "    int batch = outTexel / " << per_batch << ";\n";
    ss << "    int rem = outTexel - batch * " << per_batch << ";\n";
    ss << "    int batches = 1;\n";
    for (size_t j = 0; j + 2 < rank; ++j) {
        ss << "    batches *= " << shape << "[" << j << "];\n";
    }
    ss << "    if (batch >= batches) return;\n";
    for (size_t j = rank - 2; rank >= 3 && j-- > 0;) {
        ss << "    outCoords[" << j << "] = batch - (batch / " << shape << "[" << j << "]) * " << shape << "[" << j << "];\n";
        ss << "    batch /= " << shape << "[" << j << "];\n";
    }
    if (rank >= 2) {
        ss << "    outCoords[" << rank - 2 << "] = (rem / " << per_row << ") * 2;\n";
    }
    ss << "    outCoords[" << rank - 1 << "] = (rem - (rem / " << per_row << ") * " << per_row << ") * 2;\n";
    ss << "    run();\n";
    ss << "}\n";
    return ss.str();
}

std::string layout_key(const InputInfo& input) {
    const ShapeInfo& info = input.shape_info;
    std::ostringstream ss;
    ss << input.name << ":";
    if (info.is_uniform) {
        ss << "u" << size_from_shape(info.logical_shape);
    } else {
        ss << (info.is_packed ? "p" : "t") << info.logical_shape.size()
           << "s" << shape_to_string(squeeze_shape(info.logical_shape).new_shape)
           << (info.flat_offset ? "o" : "");
    }
    return ss.str();
}

}

std::string glsl_header(u32 api_version) {
    std::ostringstream ss;
    ss << "#version 450\n";
    ss << "layout(local_size_x = " << WORKGROUP_SIZE << ", local_size_y = " << WORKGROUP_SIZE << ") in;\n\n";
    if (api_version != LEGACY_SHADER_API_VERSION) {
        ss << "const float " << INFINITY_UNIFORM_NAME << " = uintBitsToFloat(0x7F800000u);\n\n";
    }
    return ss.str();
}

std::string texture_binding(u32 binding, const std::string& name, bool packed, bool readonly) {
    std::ostringstream ss;
    ss << "layout(std430, set = 0, binding = " << binding << ") ";
    ss << (readonly ? "readonly " : "writeonly ");
    ss << "buffer " << name << "Texels { " << (packed ? "vec4" : "float") << " " << name << "[]; };\n";
    return ss.str();
}

ShaderSource make_shader(const std::vector<InputInfo>& inputs,
                         const ShapeInfo& output,
                         const std::string& user_code,
                         bool uses_packed_textures,
                         u32 api_version) {
    for (const auto& input : inputs) check_input_layout(input, uses_packed_textures);
    
    std::ostringstream ss;
    ss << glsl_header(api_version);
    
    ss << "layout(std140, set = 0, binding = " << UNIFORM_BLOCK_BINDING << ") uniform Uniforms {\n";
    ss << "    float " << NAN_UNIFORM_NAME << ";\n";
    if (api_version == LEGACY_SHADER_API_VERSION) {
        ss << "    float " << INFINITY_UNIFORM_NAME << ";\n";
    }
    for (const auto& input : inputs) ss << input_uniforms(input);
    ss << output_uniforms(output);
    ss << "};\n\n";
    
    u32 binding = UNIFORM_BLOCK_BINDING + 1;
    for (const auto& input : inputs) {
        if (input.shape_info.is_uniform) continue;
        ss << texture_binding(binding++, input.name, input.shape_info.is_packed, true);
    }
    ss << texture_binding(binding, "result", output.is_packed, false);
    ss << "\n";
    
    ss << output_helpers(output);
    for (const auto& input : inputs) {
        const ShapeInfo& info = input.shape_info;
        if (info.is_uniform) ss << uniform_getter(input);
        else if (info.is_packed) ss << packed_getter(input);
        else ss << texture_getter(input);
    }
    
    ss << user_code << "\n\n";
    ss << (output.is_packed ? packed_main(output) : unpacked_main(output));
    
    std::ostringstream key;
    for (const auto& input : inputs) key << layout_key(input) << "|";
    key << "out:" << (output.is_packed ? "p" : "t") << output.logical_shape.size()
        << "|api" << api_version;
    
    return {ss.str(), key.str()};
}

}
}
