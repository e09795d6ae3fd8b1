#include "PlayOrder.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <utility>

PlayOrder::PlayOrder(TrackList tracks, bool shuffle, std::uint32_t seed)
    : tracks_(std::move(tracks)), shuffled_(shuffle) {
    if (tracks_.empty()) {
        throw std::invalid_argument("PlayOrder requires at least one track");
    }
    if (shuffled_) {
        std::mt19937 rng(seed);
        std::shuffle(tracks_.begin(), tracks_.end(), rng);
    }
}

void PlayOrder::Advance() noexcept {
    index_ = (index_ + 1) % tracks_.size();
}
