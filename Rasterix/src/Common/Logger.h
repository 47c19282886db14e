#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace Rasterix {

struct LoggerConfig {
    // Empty path logs to the console only.
    std::string log_file = "rasterix.log";
    spdlog::level::level_enum console_level = spdlog::level::warn;
    spdlog::level::level_enum file_level = spdlog::level::trace;
    // Honour SPDLOG_LEVEL from the environment after the sinks are set up.
    bool load_env_levels = true;
};

class Logger {
public:
    static void init(const LoggerConfig& config = {});
    static void init(const std::string& log_file);
    static void shutdown();

    static void set_console_level(spdlog::level::level_enum level);
    static std::shared_ptr<spdlog::logger>& get();

    static constexpr const char* name = "rasterix";

private:
    static std::shared_ptr<spdlog::logger> _logger;
    static std::shared_ptr<spdlog::sinks::sink> _console_sink;
};

#define LOG_TRACE(...) ::Rasterix::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::Rasterix::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::Rasterix::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::Rasterix::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::Rasterix::Logger::get()->error(__VA_ARGS__)
#define LOG_FATAL(...) ::Rasterix::Logger::get()->critical(__VA_ARGS__)

}
