#pragma once

#include <stdexcept>
#include <string>

namespace Rasterix {

// Shader source rejected by the driver. Indicates a generator or template bug.
class CompileError : public std::runtime_error {
public:
    CompileError(const std::string& log, const std::string& source)
        : std::runtime_error("Failed to compile program: " + log)
        , _log(log)
        , _source(source) {}

    const std::string& log() const { return _log; }
    const std::string& source() const { return _source; }

private:
    std::string _log;
    std::string _source;
};

// A compiled binary was reused against operands it was not compiled for.
// Always a cache-key bug upstream; never recoverable.
class ShapeMismatchError : public std::runtime_error {
public:
    explicit ShapeMismatchError(const std::string& message)
        : std::runtime_error(message) {}
};

}
