#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include "Session.hpp"

/**
 * @brief Looping cursor over an album's tracks.
 * The shuffled permutation is drawn once at construction; wrapping around
 * replays the same order.
 */
class PlayOrder {
   public:
    // @throws std::invalid_argument if `tracks` is empty.
    PlayOrder(TrackList tracks, bool shuffle, std::uint32_t seed);

    const std::filesystem::path& current() const { return tracks_[index_]; }
    std::size_t position() const noexcept { return index_; }
    std::size_t size() const noexcept { return tracks_.size(); }
    bool shuffled() const noexcept { return shuffled_; }
    const TrackList& tracks() const noexcept { return tracks_; }

    // Moves to the next track, back to the first after the last one.
    void Advance() noexcept;

   private:
    TrackList tracks_;
    std::size_t index_ = 0;
    bool shuffled_ = false;
};
