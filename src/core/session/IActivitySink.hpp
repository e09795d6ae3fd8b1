#pragma once

#include "Session.hpp"

/**
 * @brief Append-only destination for session lifecycle records.
 * @details
 * Record() must never throw: a lost record is reported on the diagnostic
 * log and otherwise ignored, so playback control is never interrupted.
 */
struct IActivitySink {
    virtual ~IActivitySink() = default;

    virtual void Record(const ActivityRecord& record) noexcept = 0;
};
