#include "AlsaPlayer.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <random>
#include <utility>
#include <vector>

#include "PcmUtils.hpp"
#include "TrackDecoder.hpp"

// Frames decoded and written per iteration
static constexpr std::size_t CHUNK_FRAMES = 1024;

AlsaPlayer::AlsaPlayer(AudioConfig config, double volume)
    : config_(std::move(config)), volume_(volume) {
    spdlog::info("Audio initialized - Device: {}, Volume: {}%", config_.device,
                 static_cast<int>(volume_ * 100));
}

AlsaPlayer::~AlsaPlayer() {
    Stop();
}

bool AlsaPlayer::Start(const TrackList& tracks, bool shuffle) {
    if (tracks.empty()) {
        spdlog::warn("Refusing to start playback of an empty track list.");
        return false;
    }

    // Previous session must release the device first
    Stop();

    try {
        output_ = std::make_unique<AlsaOutput>(config_.device);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return false;
    }

    PlayOrder order(tracks, shuffle, std::random_device{}());
    spdlog::info("Starting playback{} ({} tracks)", shuffle ? " (shuffled)" : "", order.size());

    thread_ = std::jthread([this, order = std::move(order)](std::stop_token stop) mutable {
        try {
            PlaybackLoop(stop, std::move(order));
        } catch (const std::exception& e) {
            spdlog::critical("Playback thread exception: {}", e.what());
        }
    });
    return true;
}

void AlsaPlayer::Stop() noexcept {
    if (thread_.joinable()) {
        spdlog::info("Stopping playback...");
        thread_.request_stop();
        thread_.join();
    }

    if (output_) {
        output_->Drop();
        output_.reset();  // Closes the device
    }
}

// =========================================================
//  Playback Thread
// =========================================================

void AlsaPlayer::PlaybackLoop(std::stop_token stop, PlayOrder order) {
    while (!stop.stop_requested()) {
        const auto& track = order.current();

        if (order.shuffled()) {
            spdlog::info("Now playing: {} [track {}/{}]", track.filename().string(),
                         order.position() + 1, order.size());
        } else {
            spdlog::info("Now playing: {}", track.filename().string());
        }

        bool ok = PlayTrack(stop, track);
        if (stop.stop_requested()) break;

        // Loop back to the start when the album ends
        order.Advance();
        WaitFor(stop, ok ? config_.track_gap : config_.error_backoff);
    }
}

bool AlsaPlayer::PlayTrack(std::stop_token stop, const std::filesystem::path& track) {
    std::unique_ptr<TrackDecoder> decoder;
    try {
        decoder = std::make_unique<TrackDecoder>(track);
    } catch (const std::exception& e) {
        spdlog::error("Playback error: {}", e.what());
        return false;
    }

    if (!output_->Configure(decoder->sample_rate(), decoder->channels())) {
        return false;
    }

    std::vector<int16_t> buffer(CHUNK_FRAMES * decoder->channels());

    while (!stop.stop_requested()) {
        std::size_t frames = decoder->Read(buffer);
        if (frames == 0) break;

        std::span<int16_t> chunk(buffer.data(), frames * decoder->channels());
        PcmUtils::ApplyGain(chunk, volume_);

        if (!output_->Write(chunk, stop)) {
            spdlog::error("Playback error: output failed during {}", track.filename().string());
            return false;
        }
    }

    if (!stop.stop_requested()) {
        output_->Drain(stop);
    }
    return true;
}

void AlsaPlayer::WaitFor(std::stop_token stop, std::chrono::milliseconds delay) {
    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, stop, delay, [] { return false; });
}
