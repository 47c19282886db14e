#include "ProgramCompiler.h"
#include <Common/Assert.h>
#include <Common/Logger.h>
#include <Ops/ShaderGen.h>
#include <sstream>

namespace Rasterix {

namespace {

ShapeInfo make_input_shape_info(const TensorData& input) {
    ShapeInfo info;
    info.logical_shape = input.shape;
    info.is_uniform = input.is_uniform();
    if (!info.is_uniform) {
        const TextureData& tex = input.tex_data();
        info.tex_shape = tex.tex_shape;
        info.is_packed = tex.is_packed;
        // Slicing changes which texels a fragment reads even though both
        // shapes stay the same.
        if (input.has_offset()) info.flat_offset = tex.slice->flat_offset;
    }
    return info;
}

void record_uniform_locations(GpgpuContext& context,
                              const ProgramHandle& handle,
                              UniformTable& table,
                              u32 input,
                              const std::string& variable_name,
                              std::initializer_list<InputUniform> roles) {
    for (InputUniform role : roles) {
        table.set(input, role, context.get_uniform_location(handle, input_uniform_name(role, variable_name), false));
    }
}

}

AssembledSource assemble_program_source(const GpgpuProgram& program,
                                        const std::vector<TensorData>& inputs,
                                        const TensorData& output,
                                        u32 api_version) {
    RX_ASSERT(inputs.size() == program.variable_names.size(),
              "program '" + program.name + "' declares " + std::to_string(program.variable_names.size()) +
              " variables but got " + std::to_string(inputs.size()) + " inputs");
    RX_ASSERT(!output.is_uniform(), "program output must be a texture");
    
    AssembledSource result;
    result.input_infos.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        result.input_infos.push_back({program.variable_names[i], make_input_shape_info(inputs[i])});
    }
    
    const TextureData& out_tex = output.tex_data();
    result.out_shape_info.logical_shape = output.shape;
    result.out_shape_info.tex_shape = out_tex.tex_shape;
    result.out_shape_info.is_uniform = false;
    result.out_shape_info.is_packed = out_tex.is_packed;
    
    ShaderGen::ShaderSource shader = ShaderGen::make_shader(
        result.input_infos, result.out_shape_info, program.user_code,
        program.uses_packed_textures, api_version);
    result.source = std::move(shader.source);
    result.key = std::move(shader.key);
    return result;
}

std::shared_ptr<GpgpuBinary> compile_program(GpgpuContext& context,
                                             const GpgpuProgram& program,
                                             const std::vector<TensorData>& inputs,
                                             const TensorData& output) {
    const u32 api_version = context.shader_api_version();
    AssembledSource assembled = assemble_program_source(program, inputs, output, api_version);
    
    ProgramHandle handle = context.create_program(assembled.source);
    
    try {
        std::optional<UniformLocation> nan_location = context.get_uniform_location(handle, NAN_UNIFORM_NAME, false);
        std::optional<UniformLocation> inf_location;
        if (api_version == LEGACY_SHADER_API_VERSION) {
            inf_location = context.get_uniform_location(handle, INFINITY_UNIFORM_NAME, false);
        }
    
        UniformTable uniforms(program.variable_names.size());
        for (u32 i = 0; i < program.variable_names.size(); ++i) {
            record_uniform_locations(context, handle, uniforms, i, program.variable_names[i],
                                     {InputUniform::Variable, InputUniform::Offset});
        }
    
        for (u32 i = 0; i < assembled.input_infos.size(); ++i) {
            const InputInfo& info = assembled.input_infos[i];
            if (info.shape_info.logical_shape.empty()) continue;
            record_uniform_locations(context, handle, uniforms, i, info.name,
                                     {InputUniform::Shape, InputUniform::TexShape, InputUniform::Strides,
                                      InputUniform::PackedTexShape, InputUniform::ValuesPerRow,
                                      InputUniform::TexelsInBatch});
        }
    
        if (!assembled.out_shape_info.logical_shape.empty()) {
            for (OutputUniform role : {OutputUniform::Shape, OutputUniform::Strides, OutputUniform::TexShape,
                                       OutputUniform::PackedTexShape, OutputUniform::TexelsInLogicalRow,
                                       OutputUniform::TexelsInBatch}) {
                uniforms.set(role, context.get_uniform_location(handle, output_uniform_name(role), false));
            }
        }
    
        LOG_DEBUG("Compiled program '{}' ({}), {} uniforms resolved",
                  program.name, assembled.key, uniforms.resolved_count());
    
        std::vector<ShapeInfo> in_shape_infos;
        in_shape_infos.reserve(assembled.input_infos.size());
        for (auto& info : assembled.input_infos) in_shape_infos.push_back(std::move(info.shape_info));
    
        return std::make_shared<GpgpuBinary>(&context, handle, program, std::move(assembled.source),
                                             std::move(uniforms), std::move(in_shape_infos),
                                             std::move(assembled.out_shape_info), nan_location, inf_location);
    } catch (const std::exception&) {
        context.delete_program(handle);
        throw;
    }
}

std::string make_shader_key(const GpgpuProgram& program,
                            const std::vector<TensorData>& inputs,
                            const TensorData& output) {
    std::ostringstream key_inputs;
    auto append = [&key_inputs](const TensorData& operand) {
        key_inputs << shape_to_string(operand.shape) << "_";
        if (operand.is_uniform()) key_inputs << "uniform";
        else key_inputs << shape_to_string(operand.tex_data().tex_shape);
        key_inputs << "_" << (operand.has_offset() ? "true" : "false");
    };
    for (const auto& input : inputs) append(input);
    append(output);
    
    std::string key = program.name;
    key += "_" + key_inputs.str() + "_" + program.user_code;
    return key;
}

}
