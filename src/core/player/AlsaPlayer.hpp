#pragma once

#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

#include "AlsaOutput.hpp"
#include "IPlayer.hpp"
#include "PlayOrder.hpp"
#include "config.hpp"

/**
 * @brief IPlayer that decodes tracks with libsndfile and plays them through ALSA.
 * @details
 * Start() acquires the output device on the caller's thread (so a busy
 * device is reported synchronously) and hands it to a playback thread that
 * loops over the album until Stop(). Stop() joins that thread and closes
 * the device before returning.
 */
class AlsaPlayer : public IPlayer {
   public:
    AlsaPlayer(AudioConfig config, double volume);
    ~AlsaPlayer() override;

    AlsaPlayer(const AlsaPlayer&) = delete;
    AlsaPlayer& operator=(const AlsaPlayer&) = delete;

    bool Start(const TrackList& tracks, bool shuffle) override;
    void Stop() noexcept override;

    bool is_playing() const noexcept { return thread_.joinable(); }

   private:
    void PlaybackLoop(std::stop_token stop, PlayOrder order);
    bool PlayTrack(std::stop_token stop, const std::filesystem::path& track);
    void WaitFor(std::stop_token stop, std::chrono::milliseconds delay);

    AudioConfig config_;
    double volume_;

    std::unique_ptr<AlsaOutput> output_;
    std::jthread thread_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
};
