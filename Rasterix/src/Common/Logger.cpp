#include "Logger.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Rasterix {

std::shared_ptr<spdlog::logger> Logger::_logger = nullptr;
std::shared_ptr<spdlog::sinks::sink> Logger::_console_sink = nullptr;

void Logger::init(const LoggerConfig& config) {
    if (_logger) return;

    _console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    _console_sink->set_level(config.console_level);
    std::vector<spdlog::sink_ptr> sinks{_console_sink};

    std::string file_error;
    if (!config.log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true);
            file_sink->set_level(config.file_level);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    _logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    _logger->set_level(spdlog::level::trace);
    _logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    _logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(_logger);

    if (config.load_env_levels) {
        spdlog::cfg::load_env_levels();
    }
    if (!file_error.empty()) {
        _logger->warn("Logging to console only, cannot open {}: {}", config.log_file, file_error);
    }
}

void Logger::init(const std::string& log_file) {
    LoggerConfig config;
    config.log_file = log_file;
    init(config);
}

void Logger::set_console_level(spdlog::level::level_enum level) {
    get();
    _console_sink->set_level(level);
}

void Logger::shutdown() {
    if (!_logger) return;
    _logger->flush();
    spdlog::drop(name);
    _logger.reset();
    _console_sink.reset();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!_logger) init();
    return _logger;
}

}
