#include "ProgramCache.h"
#include "ProgramCompiler.h"
#include <Common/Logger.h>

namespace Rasterix {

ProgramCache::ProgramCache(GpgpuContext& context)
    : _context(context) {
}

ProgramCache::~ProgramCache() {
    clear();
}

std::shared_ptr<GpgpuBinary> ProgramCache::get_or_compile(const GpgpuProgram& program,
                                                          const std::vector<TensorData>& inputs,
                                                          const TensorData& output) {
    std::string key = cache_key(program, inputs, output);
    
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _binaries.find(key);
    if (it != _binaries.end()) {
        LOG_TRACE("Program cache hit: '{}'", program.name);
        return it->second;
    }
    
    LOG_DEBUG("Program cache miss: '{}', compiling", program.name);
    auto binary = compile_program(_context, program, inputs, output);
    _binaries[key] = binary;
    return binary;
}

std::string ProgramCache::cache_key(const GpgpuProgram& program,
                                    const std::vector<TensorData>& inputs,
                                    const TensorData& output) {
    // Packed and unpacked textures of equal shapes generate different sources.
    std::string packing;
    for (const auto& input : inputs) {
        packing += input.is_uniform() ? 'u' : (input.tex_data().is_packed ? 'p' : 't');
    }
    packing += output.tex_data().is_packed ? 'p' : 't';
    return make_shader_key(program, inputs, output) + "_" + packing;
}

std::shared_ptr<GpgpuBinary> ProgramCache::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _binaries.find(key);
    return it != _binaries.end() ? it->second : nullptr;
}

void ProgramCache::compile_and_run(const GpgpuProgram& program,
                                   const std::vector<TensorData>& inputs,
                                   const TensorData& output,
                                   const CustomSetup& custom_setup) {
    auto binary = get_or_compile(program, inputs, output);
    run_program(_context, *binary, inputs, output, custom_setup);
}

size_t ProgramCache::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _binaries.size();
}

void ProgramCache::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _binaries.clear();
}

}
