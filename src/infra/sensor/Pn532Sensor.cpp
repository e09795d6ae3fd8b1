#include "Pn532Sensor.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <stdexcept>
#include <utility>

// InListPassiveTarget response: NbTg, Tg, SENS_RES(2), SEL_RES, NFCIDLength, NFCID...
static constexpr std::size_t TARGET_UID_LENGTH_INDEX = 5;
static constexpr std::size_t TARGET_UID_INDEX = 6;

// Initialization exchanges are allowed more time than a poll
static constexpr std::chrono::milliseconds INIT_TIMEOUT{1000};

TagId FormatTagId(std::span<const uint8_t> uid) {
    if (uid.size() == 4) {
        uint8_t bcc = 0;
        uint64_t value = 0;
        for (uint8_t b : uid) {
            value = (value << 8) | b;
            bcc ^= b;
        }
        value = (value << 8) | bcc;
        return std::to_string(value);
    }

    static constexpr char hex[] = "0123456789ABCDEF";
    std::string id;
    id.reserve(uid.size() * 2);
    for (uint8_t b : uid) {
        id.push_back(hex[b >> 4]);
        id.push_back(hex[b & 0x0F]);
    }
    return id;
}

Pn532Sensor::Pn532Sensor(std::unique_ptr<Pn532Transport> transport,
                         std::chrono::milliseconds read_timeout)
    : transport_(std::move(transport)), read_timeout_(read_timeout) {
    if (!transport_) {
        throw std::invalid_argument("Pn532Sensor requires a transport");
    }
}

Pn532Firmware Pn532Sensor::Initialize() {
    auto saved_timeout = std::exchange(read_timeout_, INIT_TIMEOUT);

    // 1. Firmware
    auto fw = Transceive(Pn532::CMD_GET_FIRMWARE_VERSION, {});
    if (!fw || fw->size() < 3) {
        read_timeout_ = saved_timeout;
        throw std::runtime_error("PN532 did not answer GetFirmwareVersion");
    }
    Pn532Firmware firmware{(*fw)[0], (*fw)[1], (*fw)[2]};
    spdlog::info("Found PN5{:02X} firmware {}.{}", firmware.ic, firmware.version, firmware.revision);

    // 2. SAM: normal mode, no IRQ
    static constexpr std::array<uint8_t, 3> sam_config = {0x01, 0x14, 0x01};
    if (!Transceive(Pn532::CMD_SAM_CONFIGURATION, sam_config)) {
        read_timeout_ = saved_timeout;
        throw std::runtime_error("PN532 SAM configuration failed");
    }

    // 3. MaxRetries: one passive activation attempt so polls return promptly without a tag
    static constexpr std::array<uint8_t, 4> max_retries = {0x05, 0xFF, 0x01, 0x01};
    if (!Transceive(Pn532::CMD_RF_CONFIGURATION, max_retries)) {
        read_timeout_ = saved_timeout;
        throw std::runtime_error("PN532 RF configuration failed");
    }

    read_timeout_ = saved_timeout;
    spdlog::info("PN532 configured for tag detection");
    return firmware;
}

std::optional<TagId> Pn532Sensor::Poll() {
    auto uid = ReadUid();
    if (!uid) return std::nullopt;
    return FormatTagId(*uid);
}

std::optional<std::vector<uint8_t>> Pn532Sensor::ReadUid() {
    // One target, 106 kbps type A
    static constexpr std::array<uint8_t, 2> params = {0x01, 0x00};

    auto data = Transceive(Pn532::CMD_IN_LIST_PASSIVE_TARGET, params);
    if (!data || data->empty() || (*data)[0] == 0) {
        return std::nullopt;
    }
    if (data->size() <= TARGET_UID_LENGTH_INDEX) {
        spdlog::debug("Short InListPassiveTarget response ({} bytes)", data->size());
        return std::nullopt;
    }

    const std::size_t uid_len = (*data)[TARGET_UID_LENGTH_INDEX];
    if (uid_len == 0 || data->size() < TARGET_UID_INDEX + uid_len) {
        spdlog::debug("Truncated UID in InListPassiveTarget response");
        return std::nullopt;
    }

    return std::vector<uint8_t>(data->begin() + TARGET_UID_INDEX,
                                data->begin() + TARGET_UID_INDEX + uid_len);
}

std::optional<std::vector<uint8_t>> Pn532Sensor::Transceive(uint8_t command,
                                                            std::span<const uint8_t> params) {
    const auto deadline = Pn532Transport::Clock::now() + read_timeout_;

    // A. Command
    if (!transport_->Write(Pn532::BuildCommandFrame(command, params))) {
        ReportFailure("write failed", command);
        return std::nullopt;
    }

    // B. ACK
    auto ack = transport_->ReadFrame(deadline);
    if (!ack || ack->kind != Pn532::FrameKind::Ack) {
        ReportFailure(ack ? "no ACK" : "ACK timeout", command);
        return std::nullopt;
    }

    // C. Response
    auto response = transport_->ReadFrame(deadline);
    if (!response) {
        // Abort the pending command so the next one starts clean
        if (!transport_->Write(Pn532::AckFrame())) {
            spdlog::debug("PN532 abort after timeout was not delivered");
        }
        ReportFailure("response timeout", command);
        return std::nullopt;
    }
    if (response->kind != Pn532::FrameKind::Data || response->payload.empty() ||
        response->payload[0] != static_cast<uint8_t>(command + 1)) {
        ReportFailure("bad response", command);
        return std::nullopt;
    }

    if (consecutive_failures_ > 0) {
        spdlog::info("PN532 link recovered after {} failed exchanges", consecutive_failures_);
        consecutive_failures_ = 0;
    }
    return std::vector<uint8_t>(response->payload.begin() + 1, response->payload.end());
}

void Pn532Sensor::ReportFailure(const char* what, uint8_t command) {
    // Warn once per outage; a disconnected reader would otherwise log every tick
    if (consecutive_failures_++ == 0) {
        spdlog::warn("PN532 read error (command 0x{:02X}): {}", command, what);
    } else {
        spdlog::trace("PN532 read error (command 0x{:02X}): {}", command, what);
    }
}

std::unique_ptr<Pn532Sensor> OpenPn532Sensor(const SensorConfig& config) {
    std::unique_ptr<Pn532Transport> transport;
    if (config.interface == SensorInterface::I2c) {
        transport = std::make_unique<I2cTransport>(config.device, config.i2c_address);
    } else {
        transport = std::make_unique<UartTransport>(config.device);
    }

    auto sensor = std::make_unique<Pn532Sensor>(std::move(transport), config.read_timeout);
    sensor->Initialize();
    return sensor;
}
