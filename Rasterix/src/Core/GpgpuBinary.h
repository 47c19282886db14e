#pragma once

#include <Common/Types.h>
#include <Backend/GpgpuContext.h>
#include "GpgpuProgram.h"
#include "TensorData.h"
#include "UniformTable.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Rasterix {

// A compiled program together with everything needed to execute it again:
// its resolved uniform table and the operand layouts it was compiled for.
// Immutable after construction; per-call data is supplied at run time.
// A binary that outlives its context becomes invalid and releases nothing.
class GpgpuBinary {
public:
    GpgpuBinary(GpgpuContext* context,
                ProgramHandle handle,
                GpgpuProgram program,
                std::string source,
                UniformTable uniforms,
                std::vector<ShapeInfo> in_shape_infos,
                ShapeInfo out_shape_info,
                std::optional<UniformLocation> nan_location,
                std::optional<UniformLocation> inf_location);
    ~GpgpuBinary();
    
    GpgpuBinary(const GpgpuBinary&) = delete;
    GpgpuBinary& operator=(const GpgpuBinary&) = delete;
    GpgpuBinary(GpgpuBinary&& other) noexcept;
    GpgpuBinary& operator=(GpgpuBinary&& other) noexcept;
    
    const ProgramHandle& handle() const { return _handle; }
    const GpgpuProgram& program() const { return _program; }
    const std::string& source() const { return _source; }
    const UniformTable& uniforms() const { return _uniforms; }
    const std::vector<ShapeInfo>& in_shape_infos() const { return _in_shape_infos; }
    const ShapeInfo& out_shape_info() const { return _out_shape_info; }
    std::optional<UniformLocation> nan_location() const { return _nan_location; }
    std::optional<UniformLocation> inf_location() const { return _inf_location; }
    
    bool is_valid() const { return _context && _handle.valid() && !_context_lifetime.expired(); }

private:
    void release();
    
    GpgpuContext* _context;
    std::weak_ptr<const void> _context_lifetime;
    ProgramHandle _handle;
    GpgpuProgram _program;
    std::string _source;
    UniformTable _uniforms;
    std::vector<ShapeInfo> _in_shape_infos;
    ShapeInfo _out_shape_info;
    std::optional<UniformLocation> _nan_location;
    std::optional<UniformLocation> _inf_location;
};

}
