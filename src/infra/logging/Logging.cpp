#include "Logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

spdlog::level::level_enum ParseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps anything unknown to "off"
    if (level == spdlog::level::off && name != "off") {
        throw std::runtime_error("Unknown log level '" + name + "'");
    }
    return level;
}

void setup_logging(const LoggingConfig& config) {
    const auto console_level = ParseLogLevel(config.console_level);
    const auto file_level = ParseLogLevel(config.file_level);

    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(console_level);
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
    constexpr size_t MAX_FILES = 3;
    bool file_ok = true;
    try {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.diagnostic_file, MAX_SIZE, MAX_FILES);
        file_sink->set_level(file_level);
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex&) {
        file_ok = false;
    }

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("tagtune", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    spdlog::set_level(file_ok ? std::min(console_level, file_level) : console_level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::info);

    if (!file_ok) {
        spdlog::error("Cannot open log file {}. Logging to console only.", config.diagnostic_file);
    }
}
