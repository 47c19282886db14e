#pragma once

#include <Common/Types.h>
#include <Backend/GpgpuContext.h>
#include "GpgpuBinary.h"
#include "GpgpuProgram.h"
#include "ProgramRunner.h"
#include "TensorData.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Rasterix {

// Compiled binaries of one context, keyed by make_shader_key plus the
// packing of every texture operand. Binaries are released when the cache is
// cleared or destroyed, so the cache must not outlive its context.
class RX_API ProgramCache {
public:
    explicit ProgramCache(GpgpuContext& context);
    ~ProgramCache();
    
    ProgramCache(const ProgramCache&) = delete;
    ProgramCache& operator=(const ProgramCache&) = delete;
    
    std::shared_ptr<GpgpuBinary> get_or_compile(const GpgpuProgram& program,
                                                const std::vector<TensorData>& inputs,
                                                const TensorData& output);
    
    std::shared_ptr<GpgpuBinary> find(const std::string& key) const;
    
    static std::string cache_key(const GpgpuProgram& program,
                                 const std::vector<TensorData>& inputs,
                                 const TensorData& output);
    
    // Looks up (or compiles) the binary and runs it.
    void compile_and_run(const GpgpuProgram& program,
                         const std::vector<TensorData>& inputs,
                         const TensorData& output,
                         const CustomSetup& custom_setup = nullptr);
    
    size_t size() const;
    void clear();
    
    GpgpuContext& context() const { return _context; }

private:
    GpgpuContext& _context;
    std::unordered_map<std::string, std::shared_ptr<GpgpuBinary>> _binaries;
    mutable std::mutex _mutex;
};

}
