#include "UniformTable.h"
#include <Common/Assert.h>

namespace Rasterix {

std::string input_uniform_name(InputUniform role, const std::string& variable_name) {
    switch (role) {
        case InputUniform::Variable:       return variable_name;
        case InputUniform::Offset:         return "offset" + variable_name;
        case InputUniform::Shape:          return "shape" + variable_name;
        case InputUniform::TexShape:       return "texShape" + variable_name;
        case InputUniform::Strides:        return "strides" + variable_name;
        case InputUniform::PackedTexShape: return "packedTexShape" + variable_name;
        case InputUniform::ValuesPerRow:   return "valuesPerRow" + variable_name;
        case InputUniform::TexelsInBatch:  return "texelsInBatch" + variable_name;
        case InputUniform::Count:          break;
    }
    throw std::invalid_argument("Unknown input uniform role");
}

const char* output_uniform_name(OutputUniform role) {
    switch (role) {
        case OutputUniform::Shape:              return "outputShape";
        case OutputUniform::Strides:            return "outputStrides";
        case OutputUniform::TexShape:           return "outputTexShape";
        case OutputUniform::PackedTexShape:     return "outputPackedTexShape";
        case OutputUniform::TexelsInLogicalRow: return "outputTexelsInLogicalRow";
        case OutputUniform::TexelsInBatch:      return "outputTexelsInBatch";
        case OutputUniform::Count:              break;
    }
    throw std::invalid_argument("Unknown output uniform role");
}

UniformTable::UniformTable(size_t input_count)
    : _inputs(input_count) {
}

void UniformTable::set(u32 input, InputUniform role, std::optional<UniformLocation> location) {
    RX_ASSERT(input < _inputs.size(), "input index out of range");
    _inputs[input][static_cast<size_t>(role)] = location;
}

void UniformTable::set(OutputUniform role, std::optional<UniformLocation> location) {
    _output[static_cast<size_t>(role)] = location;
}

std::optional<UniformLocation> UniformTable::get(u32 input, InputUniform role) const {
    if (input >= _inputs.size()) return std::nullopt;
    return _inputs[input][static_cast<size_t>(role)];
}

std::optional<UniformLocation> UniformTable::get(OutputUniform role) const {
    return _output[static_cast<size_t>(role)];
}

u32 UniformTable::resolved_count() const {
    u32 count = 0;
    for (const auto& slots : _inputs) {
        for (const auto& slot : slots) {
            if (slot) ++count;
        }
    }
    for (const auto& slot : _output) {
        if (slot) ++count;
    }
    return count;
}

bool UniformTable::operator==(const UniformTable& other) const {
    return _inputs == other._inputs && _output == other._output;
}

}
