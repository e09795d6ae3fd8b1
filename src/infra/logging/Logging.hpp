#pragma once

#include <spdlog/common.h>

#include <string>

#include "config.hpp"

/**
 * @brief Installs the default diagnostic logger: colored console plus a
 * rotating file (5MB, 3 files) at `config.diagnostic_file`.
 * Falls back to console only if the file cannot be opened.
 */
void setup_logging(const LoggingConfig& config);

// "trace", "debug", "info", "warn", "error", "critical" or "off".
// @throws std::runtime_error on any other name.
spdlog::level::level_enum ParseLogLevel(const std::string& name);
