#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ITagSensor.hpp"
#include "Pn532Transport.hpp"
#include "config.hpp"

/**
 * @brief Renders a tag UID as a TagId.
 * 4-byte UIDs become the decimal value of the UID followed by its XOR check
 * byte (the numbering used by RC522-based readers, so existing mapping files
 * stay valid). Other lengths become uppercase hex.
 */
TagId FormatTagId(std::span<const uint8_t> uid);

struct Pn532Firmware {
    uint8_t ic = 0;
    uint8_t version = 0;
    uint8_t revision = 0;
};

/**
 * @brief ITagSensor for an NXP PN532 reading ISO14443A tags.
 * @details
 * Initialize() must succeed before Poll() is used. Each Poll() issues one
 * InListPassiveTarget with a single activation attempt, so it returns within
 * the read timeout whether or not a tag is present.
 */
class Pn532Sensor : public ITagSensor {
   public:
    Pn532Sensor(std::unique_ptr<Pn532Transport> transport, std::chrono::milliseconds read_timeout);

    // Checks the firmware and configures the reader.
    // @throws std::runtime_error if the PN532 does not answer.
    Pn532Firmware Initialize();

    std::optional<TagId> Poll() override;

    // UID of the tag in the field, if any.
    std::optional<std::vector<uint8_t>> ReadUid();

   private:
    // Sends a command and returns the response data (after the response code).
    std::optional<std::vector<uint8_t>> Transceive(uint8_t command,
                                                   std::span<const uint8_t> params);
    void ReportFailure(const char* what, uint8_t command);

    std::unique_ptr<Pn532Transport> transport_;
    std::chrono::milliseconds read_timeout_;
    int consecutive_failures_ = 0;
};

/**
 * @brief Opens the transport named by `config` and initializes the reader.
 * @throws boost::system::system_error or std::runtime_error on failure.
 */
std::unique_ptr<Pn532Sensor> OpenPn532Sensor(const SensorConfig& config);
