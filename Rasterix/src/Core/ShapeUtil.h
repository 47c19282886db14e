#pragma once

#include <Common/Types.h>
#include <array>
#include <string>
#include <vector>

namespace Rasterix {

using Shape = std::vector<i32>;
using TexShape = std::array<i32, 2>;

struct SqueezeResult {
    Shape new_shape;
    std::vector<u32> kept_dims;
};

// Number of logical elements. A rank-0 shape holds one element.
i64 size_from_shape(const Shape& shape);

// Row-major strides without the trailing unit stride: rank-1 entries,
// empty for rank < 2.
std::vector<i32> compute_strides(const Shape& shape);

// Drops every size-1 axis. The shader generator never emits addressing
// code for those axes.
SqueezeResult squeeze_shape(const Shape& shape);

// Halves the last two axes (the last one for rank 1) with ceiling
// rounding: the texel grid a packed texture stores for this shape.
Shape packed_shape_transform(const Shape& shape);

// Packed storage fits a 2x2 block of logical elements into one texel.
TexShape packed_tex_shape(const TexShape& tex_shape);

// Size of an axis counted from the end (1 = last). Missing axes are 1.
i32 dim_from_end(const Shape& shape, u32 position);

std::string shape_to_string(const Shape& shape);
std::string shape_to_string(const TexShape& shape);

}
