#include "Pn532Frame.hpp"

#include <gtest/gtest.h>

#include <vector>

#include "support/pn532_fakes.hpp"

using Bytes = std::vector<uint8_t>;

TEST(Pn532FrameTest, BuildsCommandFramesWithChecksums) {
    EXPECT_EQ((Bytes{0x00, 0x00, 0xFF, 0x02, 0xFE, 0xD4, 0x02, 0x2A, 0x00}),
              Pn532::BuildCommandFrame(Pn532::CMD_GET_FIRMWARE_VERSION, {}));

    const Bytes params = {0x01, 0x00};
    EXPECT_EQ((Bytes{0x00, 0x00, 0xFF, 0x04, 0xFC, 0xD4, 0x4A, 0x01, 0x00, 0xE1, 0x00}),
              Pn532::BuildCommandFrame(Pn532::CMD_IN_LIST_PASSIVE_TARGET, params));
}

TEST(Pn532FrameTest, RecognisesAckAndNack) {
    auto ack = Pn532::ParseFrame(Pn532::AckFrame());
    EXPECT_EQ(Pn532::FrameKind::Ack, ack.kind);
    EXPECT_EQ(6u, ack.consumed);

    const Bytes nack = {0x00, 0x00, 0xFF, 0xFF, 0x00, 0x00};
    EXPECT_EQ(Pn532::FrameKind::Nack, Pn532::ParseFrame(nack).kind);
}

TEST(Pn532FrameTest, DecodesDataFrameAfterLeadingNoise) {
    Bytes bytes = {0x55, 0x13};
    const Bytes response = ResponseBytes(Pn532::CMD_GET_FIRMWARE_VERSION, {0x32, 0x01, 0x06, 0x07});
    bytes.insert(bytes.end(), response.begin(), response.end());

    auto frame = Pn532::ParseFrame(bytes);
    ASSERT_EQ(Pn532::FrameKind::Data, frame.kind);
    EXPECT_EQ((Bytes{0x03, 0x32, 0x01, 0x06, 0x07}), frame.payload);
    EXPECT_EQ(bytes.size() - 1, frame.consumed);  // Postamble is left for the next scan
}

TEST(Pn532FrameTest, ReportsIncompleteFrames) {
    const Bytes response = ResponseBytes(Pn532::CMD_SAM_CONFIGURATION, {});
    for (std::size_t cut : {0u, 2u, 4u, 7u}) {
        Bytes partial(response.begin(), response.begin() + static_cast<std::ptrdiff_t>(cut));
        EXPECT_EQ(Pn532::FrameKind::Incomplete, Pn532::ParseFrame(partial).kind) << "cut at " << cut;
    }
}

TEST(Pn532FrameTest, RejectsCorruptedChecksums) {
    Bytes bad_dcs = ResponseBytes(Pn532::CMD_SAM_CONFIGURATION, {0x01});
    bad_dcs[bad_dcs.size() - 2] ^= 0xFF;
    EXPECT_EQ(Pn532::FrameKind::Invalid, Pn532::ParseFrame(bad_dcs).kind);

    Bytes bad_lcs = ResponseBytes(Pn532::CMD_SAM_CONFIGURATION, {0x01});
    bad_lcs[4] ^= 0x01;
    EXPECT_EQ(Pn532::FrameKind::Invalid, Pn532::ParseFrame(bad_lcs).kind);
}

TEST(Pn532FrameTest, RecognisesApplicationErrorFrame) {
    const Bytes error = {0x00, 0x00, 0xFF, 0x01, 0xFF, 0x7F, 0x81, 0x00};
    EXPECT_EQ(Pn532::FrameKind::Error, Pn532::ParseFrame(error).kind);
}
