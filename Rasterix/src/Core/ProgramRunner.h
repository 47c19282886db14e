#pragma once

#include <Common/Types.h>
#include <Backend/GpgpuContext.h>
#include "GpgpuBinary.h"
#include "TensorData.h"
#include <functional>
#include <vector>

namespace Rasterix {

// Last-mile hook run after every standard uniform upload and before the
// dispatch.
using CustomSetup = std::function<void(GpgpuContext&, const ProgramHandle&)>;

// Throws ShapeMismatchError unless the operands match the layouts a binary
// was compiled against.
void validate_binary_and_program(const std::vector<ShapeInfo>& shape_infos,
                                 const std::vector<TensorData>& inputs);

// Binds the output and program, uploads every layout uniform, binds the
// input textures and dispatches. Synchronous; assumes exclusive use of the
// context for its duration.
void run_program(GpgpuContext& context,
                 const GpgpuBinary& binary,
                 const std::vector<TensorData>& inputs,
                 const TensorData& output,
                 const CustomSetup& custom_setup = nullptr);

}
