#include "ProgramRunner.h"
#include <Common/Assert.h>
#include <Common/Errors.h>
#include <Common/Logger.h>
#include <limits>

namespace Rasterix {

namespace {

std::string tex_shape_string(const std::optional<TexShape>& tex_shape) {
    return tex_shape ? shape_to_string(*tex_shape) : "null";
}

void upload_ints(GpgpuContext& context, std::optional<UniformLocation> location, const std::vector<i32>& values) {
    if (location) context.uniform1iv(*location, values);
}

void upload_ints(GpgpuContext& context, std::optional<UniformLocation> location, const TexShape& values) {
    if (location) context.uniform1iv(*location, {values[0], values[1]});
}

void upload_int(GpgpuContext& context, std::optional<UniformLocation> location, i32 value) {
    if (location) context.uniform1i(*location, value);
}

void upload_input(GpgpuContext& context, const GpgpuBinary& binary, u32 index, const TensorData& input) {
    const UniformTable& uniforms = binary.uniforms();
    std::optional<UniformLocation> var_location = uniforms.get(index, InputUniform::Variable);
    
    // Compiled out: the shader never reads this variable.
    if (!var_location) return;
    
    if (input.is_uniform()) {
        const std::vector<f32>& values = input.uniform_data().values;
        // The block keeps the previous call's values in any slot not written.
        RX_ASSERT(static_cast<i64>(values.size()) == size_from_shape(input.shape),
                  "uniform input '" + binary.program().variable_names[index] + "' holds " +
                  std::to_string(values.size()) + " values for shape [" + shape_to_string(input.shape) + "]");
        // Some uniform types reject a 1-element array.
        if (size_from_shape(input.shape) < 2) {
            context.uniform1f(*var_location, values[0]);
        } else {
            context.uniform1fv(*var_location, values);
        }
        return;
    }
    
    const TextureData& tex = input.tex_data();
    
    Shape shape;
    if (binary.program().uses_packed_textures) {
        shape = packed_shape_transform(input.shape);
    } else {
        shape = squeeze_shape(input.shape).new_shape;
    }
    
    upload_ints(context, uniforms.get(index, InputUniform::Shape), shape);
    upload_ints(context, uniforms.get(index, InputUniform::Strides), compute_strides(shape));
    upload_ints(context, uniforms.get(index, InputUniform::TexShape), tex.tex_shape);
    upload_ints(context, uniforms.get(index, InputUniform::PackedTexShape), packed_tex_shape(tex.tex_shape));
    
    const i32 values_per_row = half_ceil(dim_from_end(shape, 1));
    upload_int(context, uniforms.get(index, InputUniform::ValuesPerRow), values_per_row);
    
    const i32 texels_in_batch = values_per_row * half_ceil(dim_from_end(shape, 2));
    upload_int(context, uniforms.get(index, InputUniform::TexelsInBatch), texels_in_batch);
    
    if (tex.slice) {
        upload_int(context, uniforms.get(index, InputUniform::Offset), tex.slice->flat_offset);
    }
    
    context.set_input_matrix_texture(tex.texture, *var_location, index);
}

void upload_output(GpgpuContext& context, const GpgpuBinary& binary, const TensorData& output) {
    const UniformTable& uniforms = binary.uniforms();
    const Shape& output_shape = output.shape;
    const TexShape& output_tex_shape = output.tex_data().tex_shape;
    
    upload_ints(context, uniforms.get(OutputUniform::Shape), output_shape);
    upload_ints(context, uniforms.get(OutputUniform::Strides), compute_strides(output_shape));
    upload_ints(context, uniforms.get(OutputUniform::TexShape), output_tex_shape);
    
    // Uploaded whether or not the program is packed: some unpacked programs
    // still address a packed output through it.
    upload_ints(context, uniforms.get(OutputUniform::PackedTexShape), packed_tex_shape(output_tex_shape));
    
    const i32 texels_in_logical_row = half_ceil(dim_from_end(output_shape, 1));
    upload_int(context, uniforms.get(OutputUniform::TexelsInLogicalRow), texels_in_logical_row);
    
    const i32 texels_in_batch = texels_in_logical_row * half_ceil(dim_from_end(output_shape, 2));
    upload_int(context, uniforms.get(OutputUniform::TexelsInBatch), texels_in_batch);
}

}

void validate_binary_and_program(const std::vector<ShapeInfo>& shape_infos,
                                 const std::vector<TensorData>& inputs) {
    if (shape_infos.size() != inputs.size()) {
        throw ShapeMismatchError("Binary was compiled with " + std::to_string(shape_infos.size()) +
                                 " inputs, but was executed with " + std::to_string(inputs.size()) + " inputs");
    }
    
    for (size_t i = 0; i < shape_infos.size(); ++i) {
        const ShapeInfo& info = shape_infos[i];
        const TensorData& input = inputs[i];
        
        if (info.logical_shape != input.shape) {
            throw ShapeMismatchError("Binary was compiled with different shapes than the current args. Shapes [" +
                                     shape_to_string(info.logical_shape) + "] and [" +
                                     shape_to_string(input.shape) + "] must match");
        }
        
        // Uniform values are generic; they do not constrain the layout.
        if (info.is_uniform && input.is_uniform()) continue;
        
        std::optional<TexShape> tex_shape;
        if (!input.is_uniform()) tex_shape = input.tex_data().tex_shape;
        if (info.tex_shape != tex_shape) {
            throw ShapeMismatchError("Binary was compiled with different texture shapes than the current args. "
                                     "Shape [" + tex_shape_string(info.tex_shape) + "] and [" +
                                     tex_shape_string(tex_shape) + "] must match");
        }
    }
}

void run_program(GpgpuContext& context,
                 const GpgpuBinary& binary,
                 const std::vector<TensorData>& inputs,
                 const TensorData& output,
                 const CustomSetup& custom_setup) {
    RX_ASSERT(binary.is_valid(), "program '" + binary.program().name + "' was released or its context destroyed");
    
    try {
        validate_binary_and_program(binary.in_shape_infos(), inputs);
        validate_binary_and_program({binary.out_shape_info()}, {output});
    } catch (const ShapeMismatchError& e) {
        LOG_ERROR("Refusing to run program '{}': {}", binary.program().name, e.what());
        throw;
    }
    
    const TextureData& out_tex = output.tex_data();
    const u32 out_rows = static_cast<u32>(out_tex.tex_shape[0]);
    const u32 out_cols = static_cast<u32>(out_tex.tex_shape[1]);
    if (out_tex.is_packed) {
        context.set_output_packed_matrix_texture(out_tex.texture, out_rows, out_cols);
    } else {
        context.set_output_matrix_texture(out_tex.texture, out_rows, out_cols);
    }
    context.set_program(binary.handle());
    
    if (context.shader_api_version() == LEGACY_SHADER_API_VERSION && binary.inf_location()) {
        context.uniform1f(*binary.inf_location(), std::numeric_limits<f32>::infinity());
    }
    if (binary.nan_location()) {
        context.uniform1f(*binary.nan_location(), std::numeric_limits<f32>::quiet_NaN());
    }
    
    for (u32 i = 0; i < inputs.size(); ++i) {
        upload_input(context, binary, i, inputs[i]);
    }
    
    if (!output.shape.empty()) {
        upload_output(context, binary, output);
    }
    
    if (custom_setup) {
        custom_setup(context, binary.handle());
    }
    
    LOG_TRACE("Executing program '{}'", binary.program().name);
    context.execute_program();
}

}
