#pragma once

#include <alsa/asoundlib.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stop_token>
#include <string>

/**
 * @brief RAII owner of an ALSA playback PCM handle (S16, interleaved).
 * @details
 * The device is acquired in the constructor and released in the destructor.
 * It is opened non-blocking, so acquisition never waits for another client
 * and writes wait in short slices that honour the stop token.
 * Not thread-safe: the owner must serialize all calls.
 */
class AlsaOutput {
   public:
    // @throws std::runtime_error if the device cannot be opened (busy, missing, ...).
    explicit AlsaOutput(const std::string& device);
    ~AlsaOutput();

    AlsaOutput(const AlsaOutput&) = delete;
    AlsaOutput& operator=(const AlsaOutput&) = delete;

    // (Re)configures the stream format. Returns false on failure.
    bool Configure(unsigned int sample_rate, unsigned int channels);

    // Writes interleaved frames, recovering from underruns.
    // Returns false on an unrecoverable error; stops early when `stop` is requested.
    bool Write(std::span<const int16_t> samples, std::stop_token stop);

    // Waits for queued audio to play out. Drops it instead once `stop` is requested.
    void Drain(std::stop_token stop);

    // Discards queued audio immediately.
    void Drop();

    const std::string& device() const { return device_; }

   private:
    std::string device_;
    snd_pcm_t* pcm_ = nullptr;
    unsigned int channels_ = 0;
};
