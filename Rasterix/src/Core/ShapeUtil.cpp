#include "ShapeUtil.h"
#include <sstream>

namespace Rasterix {

i64 size_from_shape(const Shape& shape) {
    i64 size = 1;
    for (i32 dim : shape) size *= dim;
    return size;
}

std::vector<i32> compute_strides(const Shape& shape) {
    const size_t rank = shape.size();
    if (rank < 2) return {};
    
    std::vector<i32> strides(rank - 1);
    strides[rank - 2] = shape[rank - 1];
    for (size_t i = rank - 2; i-- > 0;) {
        strides[i] = strides[i + 1] * shape[i + 1];
    }
    return strides;
}

SqueezeResult squeeze_shape(const Shape& shape) {
    SqueezeResult result;
    for (u32 i = 0; i < shape.size(); ++i) {
        if (shape[i] != 1) {
            result.new_shape.push_back(shape[i]);
            result.kept_dims.push_back(i);
        }
    }
    return result;
}

Shape packed_shape_transform(const Shape& shape) {
    Shape packed = shape;
    const size_t rank = packed.size();
    if (rank >= 1) packed[rank - 1] = half_ceil(packed[rank - 1]);
    if (rank >= 2) packed[rank - 2] = half_ceil(packed[rank - 2]);
    return packed;
}

TexShape packed_tex_shape(const TexShape& tex_shape) {
    return {half_ceil(tex_shape[0]), half_ceil(tex_shape[1])};
}

i32 dim_from_end(const Shape& shape, u32 position) {
    if (position == 0 || position > shape.size()) return 1;
    return shape[shape.size() - position];
}

std::string shape_to_string(const Shape& shape) {
    std::ostringstream ss;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) ss << ",";
        ss << shape[i];
    }
    return ss.str();
}

std::string shape_to_string(const TexShape& shape) {
    std::ostringstream ss;
    ss << shape[0] << "," << shape[1];
    return ss.str();
}

}
