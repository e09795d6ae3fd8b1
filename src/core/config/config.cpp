#include "config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace {

std::chrono::milliseconds millis_or(toml::node_view<toml::node> node,
                                    std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(node.value_or<int64_t>(fallback.count()));
}

}  // namespace

SensorInterface ParseSensorInterface(const std::string& name) {
    if (name == "i2c") return SensorInterface::I2c;
    if (name == "uart") return SensorInterface::Uart;
    throw std::runtime_error("Unknown sensor interface '" + name + "' (expected i2c or uart)");
}

AppConfig LoadConfig(const std::string& path) {
    AppConfig config;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw std::runtime_error("Config parse error");
    }

    // 1. Controller
    if (auto controller = tbl["controller"]) {
        config.controller.poll_interval =
            millis_or(controller["poll_interval_ms"], DEFAULT_POLL_INTERVAL);
    }

    // 2. Catalog
    if (auto catalog = tbl["catalog"]) {
        config.catalog.mapping_file = catalog["mapping_file"].value_or("config.json");
        config.catalog.audio_extension = catalog["audio_extension"].value_or(".mp3");
    }

    // 3. Sensor
    if (auto sensor = tbl["sensor"]) {
        config.sensor.device = sensor["device"].value_or("/dev/i2c-1");
        config.sensor.interface = ParseSensorInterface(std::string(sensor["interface"].value_or("i2c")));
        const int64_t address = sensor["i2c_address"].value_or<int64_t>(PN532_DEFAULT_I2C_ADDRESS);
        if (address < 0x03 || address > 0x77) {
            throw std::runtime_error("sensor.i2c_address must be a 7-bit address (0x03-0x77)");
        }
        config.sensor.i2c_address = static_cast<uint8_t>(address);
        config.sensor.read_timeout = millis_or(sensor["read_timeout_ms"], DEFAULT_READ_TIMEOUT);
    }

    // 4. Audio
    if (auto audio = tbl["audio"]) {
        config.audio.device = audio["device"].value_or("default");
        config.audio.track_gap = millis_or(audio["track_gap_ms"], DEFAULT_TRACK_GAP);
        config.audio.error_backoff = millis_or(audio["error_backoff_ms"], DEFAULT_ERROR_BACKOFF);
    }

    // 5. Logging
    if (auto logging = tbl["logging"]) {
        config.logging.activity_file = logging["activity_file"].value_or("logs/activity.log");
        config.logging.diagnostic_file = logging["diagnostic_file"].value_or("logs/tagtune.log");
        config.logging.console_level = logging["console_level"].value_or("info");
        config.logging.file_level = logging["file_level"].value_or("debug");
    }

    ValidateConfig(config);

    spdlog::info("Loaded configuration from {}", path);
    return config;
}

void ValidateConfig(const AppConfig& config) {
    if (config.controller.poll_interval.count() <= 0) {
        throw std::runtime_error("controller.poll_interval_ms must be positive");
    }
    if (config.sensor.read_timeout.count() <= 0 ||
        config.sensor.read_timeout >= config.controller.poll_interval) {
        throw std::runtime_error("sensor.read_timeout_ms must be positive and below the poll interval");
    }
    if (config.audio.track_gap.count() < 0 || config.audio.error_backoff.count() < 0) {
        throw std::runtime_error("audio delays must not be negative");
    }
    if (config.catalog.audio_extension.empty() || config.catalog.audio_extension.front() != '.') {
        throw std::runtime_error("catalog.audio_extension must start with '.'");
    }
}
