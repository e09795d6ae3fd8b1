#include "PcmUtils.hpp"

#include <gtest/gtest.h>

#include <vector>

TEST(PcmUtilsTest, UnityGainLeavesSamplesUntouched) {
    std::vector<int16_t> samples = {0, 1, -1, 32767, -32768};
    const auto original = samples;
    PcmUtils::ApplyGain(samples, 1.0);
    EXPECT_EQ(original, samples);
}

TEST(PcmUtilsTest, ScalesTowardsZero) {
    std::vector<int16_t> samples = {1000, -1000, 0, 3};
    PcmUtils::ApplyGain(samples, 0.5);
    EXPECT_EQ((std::vector<int16_t>{500, -500, 0, 1}), samples);
}

TEST(PcmUtilsTest, ClipsAtTheInt16Range) {
    std::vector<int16_t> samples = {20000, -20000};
    PcmUtils::ApplyGain(samples, 2.0);
    EXPECT_EQ((std::vector<int16_t>{32767, -32768}), samples);
}

TEST(PcmUtilsTest, ZeroGainSilences) {
    std::vector<int16_t> samples = {123, -456};
    PcmUtils::ApplyGain(samples, 0.0);
    EXPECT_EQ((std::vector<int16_t>{0, 0}), samples);
}
