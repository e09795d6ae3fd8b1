#pragma once

#include <optional>
#include <string>

#include "Session.hpp"

/**
 * @brief Lookup of tag mappings and album track lists.
 */
struct ICatalog {
    virtual ~ICatalog() = default;

    // Mapping for a tag, or std::nullopt if the tag is not registered.
    virtual std::optional<AlbumMapping> Resolve(const TagId& tag) const = 0;

    // Tracks of an album in play order. Empty when the album is missing or has no audio files.
    virtual TrackList Tracks(const std::string& album) const = 0;
};
