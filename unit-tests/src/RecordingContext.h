#pragma once

#include <Backend/GpgpuContext.h>
#include <Common/Errors.h>
#include <Core/TensorData.h>
#include <map>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace Rasterix {

// In-memory GpgpuContext for tests. A program declares a uniform when the
// name occurs as an identifier in its source; sources containing "#error"
// fail to compile. Every call is appended to calls().
class RecordingContext : public GpgpuContext {
public:
    explicit RecordingContext(u32 api_version = MODERN_SHADER_API_VERSION)
        : _api_version(api_version) {}
    
    bool is_valid() const override { return true; }
    u32 shader_api_version() const override { return _api_version; }
    
    ProgramHandle create_program(const std::string& source) override {
        _calls.push_back("create_program");
        if (source.find("#error") != std::string::npos) {
            throw CompileError("0:1: '#error' : user error", source);
        }
        auto program = std::make_unique<Program>();
        program->source = source;
        ProgramHandle handle;
        handle.native_handle = program.get();
        _programs.push_back(std::move(program));
        ++_created;
        return handle;
    }
    
    void delete_program(ProgramHandle& program) override {
        _calls.push_back("delete_program");
        if (program.valid()) ++_deleted;
        program = {};
    }
    
    std::optional<UniformLocation> get_uniform_location(const ProgramHandle& program,
                                                        const std::string& name,
                                                        bool should_throw) override {
        Program* native = static_cast<Program*>(program.native_handle);
        const std::regex identifier("\\b" + name + "\\b");
        if (!std::regex_search(native->source, identifier)) {
            if (should_throw) throw std::runtime_error("uniform '" + name + "' not found");
            return std::nullopt;
        }
        for (size_t i = 0; i < native->names.size(); ++i) {
            if (native->names[i] == name) return UniformLocation{static_cast<i32>(i)};
        }
        native->names.push_back(name);
        return UniformLocation{static_cast<i32>(native->names.size() - 1)};
    }
    
    void set_program(const ProgramHandle& program) override {
        _calls.push_back("set_program");
        _bound = static_cast<Program*>(program.native_handle);
    }
    
    void set_output_matrix_texture(const TextureHandle& texture, u32 rows, u32 cols) override {
        _calls.push_back("set_output_matrix_texture " + std::to_string(rows) + "x" + std::to_string(cols));
    }
    
    void set_output_packed_matrix_texture(const TextureHandle& texture, u32 rows, u32 cols) override {
        _calls.push_back("set_output_packed_matrix_texture " + std::to_string(rows) + "x" + std::to_string(cols));
    }
    
    void set_input_matrix_texture(const TextureHandle& texture, UniformLocation location, u32 texture_unit) override {
        _calls.push_back("set_input_matrix_texture " + name_of(location) + " unit " + std::to_string(texture_unit));
    }
    
    void uniform1f(UniformLocation location, f32 value) override {
        _calls.push_back("uniform1f " + name_of(location));
        _floats[name_of(location)] = {value};
    }
    
    void uniform1fv(UniformLocation location, const std::vector<f32>& values) override {
        _calls.push_back("uniform1fv " + name_of(location));
        _floats[name_of(location)] = values;
    }
    
    void uniform1i(UniformLocation location, i32 value) override {
        _calls.push_back("uniform1i " + name_of(location));
        _ints[name_of(location)] = {value};
    }
    
    void uniform1iv(UniformLocation location, const std::vector<i32>& values) override {
        _calls.push_back("uniform1iv " + name_of(location));
        _ints[name_of(location)] = values;
    }
    
    void execute_program() override {
        _calls.push_back("execute_program");
        ++_executions;
    }
    
    TextureHandle create_matrix_texture(u32 rows, u32 cols, bool packed) override {
        size_t count = packed ? static_cast<size_t>(half_ceil(static_cast<i32>(rows))) * half_ceil(static_cast<i32>(cols)) * 4
                              : static_cast<size_t>(rows) * cols;
        auto storage = std::make_unique<std::vector<f32>>(count);
        TextureHandle handle;
        handle.native_handle = storage.get();
        handle.size = storage->size() * sizeof(f32);
        handle.rows = rows;
        handle.cols = cols;
        handle.packed = packed;
        _textures.push_back(std::move(storage));
        return handle;
    }
    
    void delete_matrix_texture(TextureHandle& texture) override { texture = {}; }
    
    void upload_matrix_texture(TextureHandle& texture, const std::vector<f32>& data) override {
        *static_cast<std::vector<f32>*>(texture.native_handle) = data;
    }
    
    std::vector<f32> download_matrix_texture(TextureHandle& texture) override {
        return *static_cast<std::vector<f32>*>(texture.native_handle);
    }
    
    const std::vector<std::string>& calls() const { return _calls; }
    void clear_calls() { _calls.clear(); _floats.clear(); _ints.clear(); }
    
    bool has_call(const std::string& call) const { return index_of(call) >= 0; }
    
    i32 index_of(const std::string& call) const {
        for (size_t i = 0; i < _calls.size(); ++i) {
            if (_calls[i] == call) return static_cast<i32>(i);
        }
        return -1;
    }
    
    bool has_floats(const std::string& name) const { return _floats.count(name) > 0; }
    bool has_ints(const std::string& name) const { return _ints.count(name) > 0; }
    const std::vector<f32>& floats(const std::string& name) const { return _floats.at(name); }
    const std::vector<i32>& ints(const std::string& name) const { return _ints.at(name); }
    
    u32 created() const { return _created; }
    u32 deleted() const { return _deleted; }
    u32 executions() const { return _executions; }

private:
    struct Program {
        std::string source;
        std::vector<std::string> names;
    };
    
    std::string name_of(UniformLocation location) const {
        if (!_bound || location.index < 0 || static_cast<size_t>(location.index) >= _bound->names.size()) {
            return "<invalid>";
        }
        return _bound->names[location.index];
    }
    
    u32 _api_version;
    std::vector<std::unique_ptr<Program>> _programs;
    std::vector<std::unique_ptr<std::vector<f32>>> _textures;
    Program* _bound = nullptr;
    
    std::vector<std::string> _calls;
    std::map<std::string, std::vector<f32>> _floats;
    std::map<std::string, std::vector<i32>> _ints;
    u32 _created = 0;
    u32 _deleted = 0;
    u32 _executions = 0;
};

// Operands backed by RecordingContext textures.
inline TensorData make_texture_operand(GpgpuContext& context, Shape shape, TexShape tex_shape,
                                       bool packed = false, i32 flat_offset = 0) {
    TextureData tex;
    tex.tex_shape = tex_shape;
    tex.is_packed = packed;
    tex.texture = context.create_matrix_texture(static_cast<u32>(tex_shape[0]),
                                                static_cast<u32>(tex_shape[1]), packed);
    if (flat_offset > 0) tex.slice = SliceInfo{flat_offset};
    return TensorData::from_texture(std::move(shape), tex);
}

}
