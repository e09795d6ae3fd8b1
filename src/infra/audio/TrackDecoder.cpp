#include "TrackDecoder.hpp"

#include <stdexcept>
#include <string>

TrackDecoder::TrackDecoder(const std::filesystem::path& path) : file_(path.c_str()) {
    if (file_.error() != SF_ERR_NO_ERROR) {
        throw std::runtime_error("Cannot decode " + path.filename().string() + ": " +
                                 file_.strError());
    }
    if (file_.channels() <= 0 || file_.samplerate() <= 0) {
        throw std::runtime_error("Unsupported audio format: " + path.filename().string());
    }
}

std::size_t TrackDecoder::Read(std::span<int16_t> out) {
    const auto frames = static_cast<sf_count_t>(out.size() / channels());
    if (frames == 0) return 0;

    sf_count_t got = file_.readf(reinterpret_cast<short*>(out.data()), frames);
    return got > 0 ? static_cast<std::size_t>(got) : 0;
}
