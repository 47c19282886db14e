#include "ShaderCompiler.h"
#include <Common/Errors.h>
#include <Common/Logger.h>
#include <shaderc/shaderc.h>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace Rasterix {

namespace {

void dump_rejected_source(const std::string& glsl) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::error_code ec;
    const std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) return;
    const std::filesystem::path path = dir / ("rasterix_shader_error_" + std::to_string(ms) + ".glsl");
    std::ofstream out(path);
    if (!out) return;
    out << glsl;
    LOG_ERROR("Rejected shader written to {}", path.string());
}

}

std::vector<u32> compile_glsl_to_spirv(const std::string& glsl) {
    shaderc_compiler_t compiler = shaderc_compiler_initialize();
    shaderc_compile_options_t options = shaderc_compile_options_initialize();
    shaderc_compile_options_set_target_env(options, shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_0);
    // Reflection reads every declared block member by name, so the module is
    // left unoptimized. The driver optimizes the pipeline.
    shaderc_compile_options_set_optimization_level(options, shaderc_optimization_level_zero);

    shaderc_compilation_result_t result = shaderc_compile_into_spv(
        compiler, glsl.c_str(), glsl.size(), shaderc_glsl_compute_shader, "program", "main", options);
    shaderc_compile_options_release(options);

    std::vector<u32> spirv;
    std::string log;
    const bool ok = shaderc_result_get_compilation_status(result) == shaderc_compilation_status_success;
    if (ok) {
        const u32* words = reinterpret_cast<const u32*>(shaderc_result_get_bytes(result));
        spirv.assign(words, words + shaderc_result_get_length(result) / sizeof(u32));
    } else {
        log = shaderc_result_get_error_message(result);
    }
    shaderc_result_release(result);
    shaderc_compiler_release(compiler);

    if (!ok) {
        LOG_ERROR("Shader compile error: {}", log);
        dump_rejected_source(glsl);
        throw CompileError(log, glsl);
    }
    return spirv;
}

}
