#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// =========================================================
//  Identifiers & Catalog Types
// =========================================================

// Opaque identifier read from the tag sensor. Only equality is meaningful.
using TagId = std::string;

// Ordered track locations of one album. Empty means "unplayable".
using TrackList = std::vector<std::filesystem::path>;

struct AlbumMapping {
    std::string album;
    bool shuffle = false;

    bool operator==(const AlbumMapping&) const = default;
};

// =========================================================
//  Session
// =========================================================

/**
 * @brief One playback session, bound to a single physical tag.
 * Owned exclusively by the SessionController; at most one exists at a time.
 */
struct Session {
    TagId tag_id;
    std::string album;
    std::chrono::system_clock::time_point started_at;
    bool shuffled = false;
};

// =========================================================
//  Activity Records
// =========================================================

enum class ActivityAction {
    Started,
    StartedShuffled,
    Stopped,
    UnknownTag
};

inline std::string_view to_string(ActivityAction action) {
    switch (action) {
        case ActivityAction::Started:
            return "started";
        case ActivityAction::StartedShuffled:
            return "started_shuffled";
        case ActivityAction::Stopped:
            return "stopped";
        case ActivityAction::UnknownTag:
            return "unknown_tag";
    }
    return "unknown";
}

// Album name recorded for tags with no catalog entry.
inline constexpr std::string_view UNKNOWN_ALBUM = "Unknown";

struct ActivityRecord {
    std::chrono::system_clock::time_point timestamp;
    TagId tag_id;
    std::string album;
    ActivityAction action;
};
