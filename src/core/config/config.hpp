#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "Session.hpp"

static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{500};
static constexpr std::chrono::milliseconds DEFAULT_READ_TIMEOUT{150};
static constexpr std::chrono::milliseconds DEFAULT_TRACK_GAP{500};
static constexpr std::chrono::milliseconds DEFAULT_ERROR_BACKOFF{1000};
static constexpr double DEFAULT_VOLUME = 0.7;
static constexpr uint8_t PN532_DEFAULT_I2C_ADDRESS = 0x24;

enum class SensorInterface {
    I2c,
    Uart
};

struct ControllerConfig {
    std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL;
};

struct CatalogConfig {
    std::string mapping_file = "config.json";
    std::string audio_extension = ".mp3";
};

struct SensorConfig {
    std::string device = "/dev/i2c-1";
    SensorInterface interface = SensorInterface::I2c;
    uint8_t i2c_address = PN532_DEFAULT_I2C_ADDRESS;
    std::chrono::milliseconds read_timeout = DEFAULT_READ_TIMEOUT;
};

struct AudioConfig {
    std::string device = "default";
    std::chrono::milliseconds track_gap = DEFAULT_TRACK_GAP;
    std::chrono::milliseconds error_backoff = DEFAULT_ERROR_BACKOFF;
};

struct LoggingConfig {
    std::string activity_file = "logs/activity.log";
    std::string diagnostic_file = "logs/tagtune.log";
    std::string console_level = "info";
    std::string file_level = "debug";
};

struct AppConfig {
    ControllerConfig controller;
    CatalogConfig catalog;
    SensorConfig sensor;
    AudioConfig audio;
    LoggingConfig logging;
};

/**
 * @brief Contents of the tag mapping file (JSON).
 * Tag IDs map to an album folder under `music_root`.
 */
struct MappingFile {
    std::filesystem::path music_root = "/media/pi/MUSIC";
    std::map<TagId, AlbumMapping> mappings;
    double volume = DEFAULT_VOLUME;
};

/**
 * @brief Loads daemon settings from a TOML file.
 * @param path Path to the .toml file (default: "tagtune.toml")
 * @return Parsed and validated AppConfig. Defaults are used if the file does not exist.
 * @throws std::runtime_error if the file cannot be parsed or holds invalid values.
 */
AppConfig LoadConfig(const std::string& path = "tagtune.toml");

/**
 * @brief Checks cross-field constraints (positive interval, read timeout below it, ...).
 * @throws std::runtime_error describing the first violation.
 */
void ValidateConfig(const AppConfig& config);

SensorInterface ParseSensorInterface(const std::string& name);
