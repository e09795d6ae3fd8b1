#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// PN532 host interface framing (normal information frames only).
namespace Pn532 {

static constexpr uint8_t HOST_TO_PN532 = 0xD4;
static constexpr uint8_t PN532_TO_HOST = 0xD5;
static constexpr uint8_t ERROR_TFI = 0x7F;

static constexpr uint8_t CMD_GET_FIRMWARE_VERSION = 0x02;
static constexpr uint8_t CMD_SAM_CONFIGURATION = 0x14;
static constexpr uint8_t CMD_RF_CONFIGURATION = 0x32;
static constexpr uint8_t CMD_IN_LIST_PASSIVE_TARGET = 0x4A;

// Largest frame we ever expect back (normal frame, LEN <= 255)
static constexpr std::size_t MAX_FRAME_SIZE = 262;

enum class FrameKind {
    Incomplete,  // Need more bytes
    Invalid,     // Bad checksum, unexpected TFI or unsupported extended frame
    Ack,
    Nack,
    Error,       // Application-level error frame (TFI 0x7F)
    Data
};

struct Frame {
    FrameKind kind = FrameKind::Incomplete;
    std::vector<uint8_t> payload;  // Bytes after TFI (command code + data) for Data frames
    std::size_t consumed = 0;      // Bytes used from the input, including any leading noise
};

// 00 00 FF LEN LCS D4 CMD PARAMS... DCS 00
std::vector<uint8_t> BuildCommandFrame(uint8_t command, std::span<const uint8_t> params);

// 00 00 FF 00 FF 00
std::span<const uint8_t> AckFrame();

// Decodes the first frame in `bytes`, skipping anything before the start code.
Frame ParseFrame(std::span<const uint8_t> bytes);

}  // namespace Pn532
