#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Pn532Frame.hpp"

/**
 * @brief Byte link to a PN532 (I2C or HSU/UART).
 * @details
 * ReadFrame() waits for the next complete frame until `deadline` and returns
 * std::nullopt on timeout. I/O errors are reported as std::nullopt as well;
 * only the constructors of concrete transports throw.
 */
class Pn532Transport {
   public:
    using Clock = std::chrono::steady_clock;

    virtual ~Pn532Transport() = default;

    virtual bool Write(std::span<const uint8_t> bytes) = 0;
    virtual std::optional<Pn532::Frame> ReadFrame(Clock::time_point deadline) = 0;
};

/**
 * @brief PN532 on a Linux i2c-dev bus. Each read is prefixed by a status byte
 * whose bit 0 signals that a frame is ready.
 * @throws boost::system::system_error if the bus cannot be opened or addressed.
 */
class I2cTransport : public Pn532Transport {
   public:
    I2cTransport(const std::string& device, uint8_t address);
    ~I2cTransport() override;

    I2cTransport(const I2cTransport&) = delete;
    I2cTransport& operator=(const I2cTransport&) = delete;

    bool Write(std::span<const uint8_t> bytes) override;
    std::optional<Pn532::Frame> ReadFrame(Clock::time_point deadline) override;

   private:
    int fd_ = -1;
    std::string device_;
};

/**
 * @brief PN532 on a serial line (HSU, 115200 8N1). Sends the wake-up preamble on open.
 * @throws boost::system::system_error if the port cannot be opened or configured.
 */
class UartTransport : public Pn532Transport {
   public:
    explicit UartTransport(const std::string& device);
    ~UartTransport() override;

    UartTransport(const UartTransport&) = delete;
    UartTransport& operator=(const UartTransport&) = delete;

    bool Write(std::span<const uint8_t> bytes) override;
    std::optional<Pn532::Frame> ReadFrame(Clock::time_point deadline) override;

   private:
    int fd_ = -1;
    std::string device_;
    std::vector<uint8_t> pending_;
};
