#pragma once

#include "Session.hpp"

/**
 * @brief Playback capability driven by the SessionController.
 * @details
 * **Start:** begins looping playback of `tracks` (shuffled once if requested)
 * on the player's own thread and returns immediately. Returns false when
 * the list is empty or the output device cannot be acquired.
 * **Stop:** idempotent. Returns only after the playback thread has exited
 * and the output device has been released, so a following Start() never
 * overlaps with the previous session.
 */
struct IPlayer {
    virtual ~IPlayer() = default;

    virtual bool Start(const TrackList& tracks, bool shuffle) = 0;
    virtual void Stop() = 0;
};
