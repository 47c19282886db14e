#pragma once

#include <Common/Types.h>
#include <Backend/GpgpuContext.h>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace Rasterix {

enum class InputUniform : u32 {
    Variable = 0,
    Offset,
    Shape,
    TexShape,
    Strides,
    PackedTexShape,
    ValuesPerRow,
    TexelsInBatch,
    Count
};

enum class OutputUniform : u32 {
    Shape = 0,
    Strides,
    TexShape,
    PackedTexShape,
    TexelsInLogicalRow,
    TexelsInBatch,
    Count
};

constexpr const char* NAN_UNIFORM_NAME = "NAN";
constexpr const char* INFINITY_UNIFORM_NAME = "INFINITY";

// GLSL identifier of a per-input uniform, e.g. "stridesA".
std::string input_uniform_name(InputUniform role, const std::string& variable_name);
const char* output_uniform_name(OutputUniform role);

// Resolved uniform locations of a compiled program, by role. An empty slot
// means the generated shader does not declare that uniform.
class UniformTable {
public:
    explicit UniformTable(size_t input_count = 0);
    
    void set(u32 input, InputUniform role, std::optional<UniformLocation> location);
    void set(OutputUniform role, std::optional<UniformLocation> location);
    
    std::optional<UniformLocation> get(u32 input, InputUniform role) const;
    std::optional<UniformLocation> get(OutputUniform role) const;
    
    size_t input_count() const { return _inputs.size(); }
    u32 resolved_count() const;
    
    bool operator==(const UniformTable& other) const;
    bool operator!=(const UniformTable& other) const { return !(*this == other); }

private:
    using InputSlots = std::array<std::optional<UniformLocation>, static_cast<size_t>(InputUniform::Count)>;
    using OutputSlots = std::array<std::optional<UniformLocation>, static_cast<size_t>(OutputUniform::Count)>;
    
    std::vector<InputSlots> _inputs;
    OutputSlots _output;
};

}
