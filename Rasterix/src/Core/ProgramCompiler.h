#pragma once

#include <Common/Types.h>
#include <Backend/GpgpuContext.h>
#include "GpgpuBinary.h"
#include "GpgpuProgram.h"
#include "TensorData.h"
#include <memory>
#include <string>
#include <vector>

namespace Rasterix {

struct AssembledSource {
    std::string key;
    std::string source;
    std::vector<InputInfo> input_infos;
    ShapeInfo out_shape_info;
};

// Derives the layout metadata of every operand and generates the shader
// source for it. Pure; does not touch a context.
AssembledSource assemble_program_source(const GpgpuProgram& program,
                                        const std::vector<TensorData>& inputs,
                                        const TensorData& output,
                                        u32 api_version = MODERN_SHADER_API_VERSION);

// Compiles the program for these operand layouts and resolves every uniform
// location it may need. Throws CompileError if the context rejects the
// source. The binary deletes its program on destruction while the context is
// alive; once the context is gone it is invalid and deletes nothing.
std::shared_ptr<GpgpuBinary> compile_program(GpgpuContext& context,
                                             const GpgpuProgram& program,
                                             const std::vector<TensorData>& inputs,
                                             const TensorData& output);

// Key under which a compiled binary may be reused. Equal for operands with
// the same logical shape, texture shape (or uniform storage) and offset
// presence; different as soon as any of those, the program name or its body
// differ.
std::string make_shader_key(const GpgpuProgram& program,
                            const std::vector<TensorData>& inputs,
                            const TensorData& output);

}
