#pragma once

#include <Common/Types.h>
#include <Common/Assert.h>
#include <Backend/GpgpuContext.h>
#include "ShapeUtil.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Rasterix {

// A strided view into a larger texture allocation.
struct SliceInfo {
    i32 flat_offset = 0;
};

struct TextureData {
    TexShape tex_shape = {0, 0};
    bool is_packed = false;
    TextureHandle texture;
    std::optional<SliceInfo> slice;
};

struct UniformData {
    std::vector<f32> values;
};

// An operand as handed to the compute core: its logical shape plus exactly
// one storage alternative.
struct TensorData {
    Shape shape;
    std::variant<TextureData, UniformData> storage;
    
    static TensorData from_texture(Shape shape, TextureData texture) {
        TensorData data;
        data.shape = std::move(shape);
        data.storage = std::move(texture);
        return data;
    }
    
    static TensorData from_uniform(Shape shape, std::vector<f32> values) {
        TensorData data;
        data.shape = std::move(shape);
        data.storage = UniformData{std::move(values)};
        return data;
    }
    
    bool is_uniform() const { return std::holds_alternative<UniformData>(storage); }
    
    const TextureData& tex_data() const {
        RX_ASSERT(!is_uniform(), "operand is stored as a uniform");
        return std::get<TextureData>(storage);
    }
    
    const UniformData& uniform_data() const {
        RX_ASSERT(is_uniform(), "operand is stored as a texture");
        return std::get<UniformData>(storage);
    }
    
    bool has_offset() const {
        if (is_uniform()) return false;
        const auto& slice = std::get<TextureData>(storage).slice;
        return slice.has_value() && slice->flat_offset > 0;
    }
};

// Layout metadata a program is generated and validated against.
struct ShapeInfo {
    Shape logical_shape;
    std::optional<TexShape> tex_shape;
    bool is_uniform = false;
    bool is_packed = false;
    std::optional<i32> flat_offset;
};

struct InputInfo {
    std::string name;
    ShapeInfo shape_info;
};

}
