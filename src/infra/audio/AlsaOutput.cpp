#include "AlsaOutput.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <stdexcept>

// Keeps Stop() latency low: at most this much audio is queued in the device.
static constexpr unsigned int LATENCY_US = 200'000;
static constexpr int WAIT_TIMEOUT_MS = 100;

AlsaOutput::AlsaOutput(const std::string& device) : device_(device) {
    // Non-blocking: a device held by another client fails with EBUSY instead of waiting
    int err = snd_pcm_open(&pcm_, device_.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
    if (err < 0) {
        pcm_ = nullptr;
        if (err == -EBUSY) {
            throw std::runtime_error("Audio device '" + device_ + "' is busy");
        }
        throw std::runtime_error("Cannot open audio device '" + device_ + "': " + snd_strerror(err));
    }
    spdlog::debug("Audio device '{}' opened.", device_);
}

AlsaOutput::~AlsaOutput() {
    if (pcm_) {
        snd_pcm_close(pcm_);
        spdlog::debug("Audio device '{}' released.", device_);
    }
}

bool AlsaOutput::Configure(unsigned int sample_rate, unsigned int channels) {
    snd_pcm_drop(pcm_);

    int err = snd_pcm_set_params(pcm_, SND_PCM_FORMAT_S16, SND_PCM_ACCESS_RW_INTERLEAVED,
                                 channels, sample_rate, 1 /* soft resample */, LATENCY_US);
    if (err < 0) {
        spdlog::error("Cannot configure '{}' for {} Hz / {} ch: {}", device_, sample_rate, channels,
                      snd_strerror(err));
        channels_ = 0;
        return false;
    }

    channels_ = channels;
    return true;
}

bool AlsaOutput::Write(std::span<const int16_t> samples, std::stop_token stop) {
    if (channels_ == 0) return false;

    const int16_t* data = samples.data();
    auto remaining = static_cast<snd_pcm_uframes_t>(samples.size() / channels_);

    while (remaining > 0 && !stop.stop_requested()) {
        snd_pcm_sframes_t written = snd_pcm_writei(pcm_, data, remaining);

        if (written == -EAGAIN) {
            snd_pcm_wait(pcm_, WAIT_TIMEOUT_MS);
            continue;
        }
        if (written < 0) {
            // Underrun (EPIPE) or suspend (ESTRPIPE)
            int err = snd_pcm_recover(pcm_, static_cast<int>(written), 1 /* silent */);
            if (err < 0) {
                spdlog::error("Audio write failed on '{}': {}", device_, snd_strerror(err));
                return false;
            }
            continue;
        }

        data += static_cast<std::size_t>(written) * channels_;
        remaining -= static_cast<snd_pcm_uframes_t>(written);
    }
    return true;
}

void AlsaOutput::Drain(std::stop_token stop) {
    // Returns -EAGAIN right away in non-blocking mode; the stream keeps draining
    int err = snd_pcm_drain(pcm_);
    if (err < 0 && err != -EAGAIN) {
        spdlog::debug("Drain on '{}' failed: {}", device_, snd_strerror(err));
        return;
    }

    while (snd_pcm_state(pcm_) == SND_PCM_STATE_DRAINING) {
        if (stop.stop_requested()) {
            snd_pcm_drop(pcm_);
            return;
        }
        snd_pcm_wait(pcm_, WAIT_TIMEOUT_MS);
    }
}

void AlsaOutput::Drop() {
    snd_pcm_drop(pcm_);
}
