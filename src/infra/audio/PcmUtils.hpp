#pragma once
#include <algorithm>
#include <cstdint>
#include <span>

namespace PcmUtils {

static constexpr int32_t MAX_SAMPLE = 32767;
static constexpr int32_t MIN_SAMPLE = -32768;

// Scales 16-bit samples in place by `gain`, clipping to the int16 range.
inline void ApplyGain(std::span<int16_t> samples, double gain) {
    if (gain == 1.0) return;

    for (auto& sample : samples) {
        auto scaled = static_cast<int32_t>(sample * gain);
        sample = static_cast<int16_t>(std::clamp(scaled, MIN_SAMPLE, MAX_SAMPLE));
    }
}

}  // namespace PcmUtils
