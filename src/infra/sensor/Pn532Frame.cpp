#include "Pn532Frame.hpp"

#include <array>

namespace Pn532 {

namespace {

constexpr std::array<uint8_t, 6> ACK = {0x00, 0x00, 0xFF, 0x00, 0xFF, 0x00};

// Two's complement checksum: sum(data) + checksum == 0 (mod 256)
uint8_t checksum(uint8_t seed, std::span<const uint8_t> data) {
    uint8_t sum = seed;
    for (uint8_t b : data) sum += b;
    return static_cast<uint8_t>(~sum + 1);
}

}  // namespace

std::vector<uint8_t> BuildCommandFrame(uint8_t command, std::span<const uint8_t> params) {
    const auto len = static_cast<uint8_t>(params.size() + 2);  // TFI + command

    std::vector<uint8_t> frame;
    frame.reserve(params.size() + 9);
    frame.push_back(0x00);  // Preamble
    frame.push_back(0x00);  // Start code
    frame.push_back(0xFF);
    frame.push_back(len);
    frame.push_back(static_cast<uint8_t>(~len + 1));
    frame.push_back(HOST_TO_PN532);
    frame.push_back(command);
    frame.insert(frame.end(), params.begin(), params.end());
    frame.push_back(checksum(static_cast<uint8_t>(HOST_TO_PN532 + command), params));
    frame.push_back(0x00);  // Postamble
    return frame;
}

std::span<const uint8_t> AckFrame() {
    return ACK;
}

Frame ParseFrame(std::span<const uint8_t> bytes) {
    Frame frame;

    // 1. Find the start code 00 FF
    std::size_t start = 0;
    while (start + 1 < bytes.size() && !(bytes[start] == 0x00 && bytes[start + 1] == 0xFF)) {
        ++start;
    }
    if (start + 3 >= bytes.size()) {
        return frame;  // Incomplete
    }

    const std::size_t len_pos = start + 2;
    const uint8_t len = bytes[len_pos];
    const uint8_t lcs = bytes[len_pos + 1];

    // 2. ACK / NACK / extended
    if (len == 0x00 && lcs == 0xFF) {
        frame.kind = FrameKind::Ack;
        frame.consumed = len_pos + 2;
        return frame;
    }
    if (len == 0xFF && lcs == 0x00) {
        frame.kind = FrameKind::Nack;
        frame.consumed = len_pos + 2;
        return frame;
    }
    if (static_cast<uint8_t>(len + lcs) != 0x00 || len == 0) {
        frame.kind = FrameKind::Invalid;
        frame.consumed = len_pos + 2;
        return frame;
    }

    // 3. Body: TFI + data, then DCS
    const std::size_t body_pos = len_pos + 2;
    if (body_pos + len + 1 > bytes.size()) {
        return frame;  // Incomplete
    }
    auto body = bytes.subspan(body_pos, len);
    const uint8_t dcs = bytes[body_pos + len];
    frame.consumed = body_pos + len + 1;

    if (checksum(0, body) != dcs) {
        frame.kind = FrameKind::Invalid;
        return frame;
    }

    if (body[0] == ERROR_TFI) {
        frame.kind = FrameKind::Error;
        return frame;
    }
    if (body[0] != PN532_TO_HOST) {
        frame.kind = FrameKind::Invalid;
        return frame;
    }

    frame.kind = FrameKind::Data;
    frame.payload.assign(body.begin() + 1, body.end());
    return frame;
}

}  // namespace Pn532
