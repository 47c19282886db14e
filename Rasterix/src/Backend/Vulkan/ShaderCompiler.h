#pragma once

#include <Common/Types.h>
#include <string>
#include <vector>

namespace Rasterix {

// GLSL compute source to SPIR-V for Vulkan 1.0. Throws CompileError with the
// shaderc log; the rejected source is also written to the temp directory.
std::vector<u32> compile_glsl_to_spirv(const std::string& glsl);

}
