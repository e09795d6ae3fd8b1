#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

#include <sndfile.hh>

/**
 * @brief Decodes an audio file (MP3, WAV, FLAC, OGG, ...) to interleaved 16-bit PCM.
 * @throws std::runtime_error from the constructor if the file cannot be opened.
 */
class TrackDecoder {
   public:
    explicit TrackDecoder(const std::filesystem::path& path);

    unsigned int sample_rate() const { return static_cast<unsigned int>(file_.samplerate()); }
    unsigned int channels() const { return static_cast<unsigned int>(file_.channels()); }

    // Fills `out` with whole frames. Returns the number of frames read; 0 at end of file.
    std::size_t Read(std::span<int16_t> out);

   private:
    SndfileHandle file_;
};
