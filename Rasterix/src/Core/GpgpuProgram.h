#pragma once

#include "ShapeUtil.h"
#include <string>
#include <vector>

namespace Rasterix {

// An operation as a shader body plus the operands it reads. The body must
// define `void run()`; the generated prologue provides the getters for every
// variable and setOutput().
struct GpgpuProgram {
    std::string name;
    std::vector<std::string> variable_names;
    Shape output_shape;
    std::string user_code;
    bool uses_packed_textures = false;
    // Layout-conversion shader: its output must not be unpacked eagerly by
    // the caller.
    bool is_pack_shader = false;
};

}
