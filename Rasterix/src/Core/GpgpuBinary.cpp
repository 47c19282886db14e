#include "GpgpuBinary.h"
#include <stdexcept>

namespace Rasterix {

GpgpuBinary::GpgpuBinary(GpgpuContext* context,
                         ProgramHandle handle,
                         GpgpuProgram program,
                         std::string source,
                         UniformTable uniforms,
                         std::vector<ShapeInfo> in_shape_infos,
                         ShapeInfo out_shape_info,
                         std::optional<UniformLocation> nan_location,
                         std::optional<UniformLocation> inf_location)
    : _context(context)
    , _handle(handle)
    , _program(std::move(program))
    , _source(std::move(source))
    , _uniforms(std::move(uniforms))
    , _in_shape_infos(std::move(in_shape_infos))
    , _out_shape_info(std::move(out_shape_info))
    , _nan_location(nan_location)
    , _inf_location(inf_location)
{
    if (!_context) throw std::invalid_argument("Context cannot be null");
    _context_lifetime = _context->lifetime();
    if (!_handle.valid()) throw std::invalid_argument("Program handle is not valid");
}

GpgpuBinary::~GpgpuBinary() {
    release();
}

GpgpuBinary::GpgpuBinary(GpgpuBinary&& other) noexcept
    : _context(other._context)
    , _context_lifetime(std::move(other._context_lifetime))
    , _handle(other._handle)
    , _program(std::move(other._program))
    , _source(std::move(other._source))
    , _uniforms(std::move(other._uniforms))
    , _in_shape_infos(std::move(other._in_shape_infos))
    , _out_shape_info(std::move(other._out_shape_info))
    , _nan_location(other._nan_location)
    , _inf_location(other._inf_location)
{
    other._context = nullptr;
    other._handle = {};
}

GpgpuBinary& GpgpuBinary::operator=(GpgpuBinary&& other) noexcept {
    if (this != &other) {
        release();
        _context = other._context;
        _context_lifetime = std::move(other._context_lifetime);
        _handle = other._handle;
        _program = std::move(other._program);
        _source = std::move(other._source);
        _uniforms = std::move(other._uniforms);
        _in_shape_infos = std::move(other._in_shape_infos);
        _out_shape_info = std::move(other._out_shape_info);
        _nan_location = other._nan_location;
        _inf_location = other._inf_location;
        
        other._context = nullptr;
        other._handle = {};
    }
    return *this;
}

void GpgpuBinary::release() {
    if (_context && _handle.valid() && !_context_lifetime.expired()) {
        _context->delete_program(_handle);
    }
    _handle = {};
}

}
