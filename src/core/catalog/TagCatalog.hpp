#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ICatalog.hpp"
#include "config.hpp"

struct AlbumInfo {
    std::string name;
    std::filesystem::path path;
    std::size_t track_count = 0;
};

/**
 * @brief ICatalog backed by the mapping file and a directory scan.
 * @details
 * Albums are folders directly under the music root; tracks are the regular
 * files in an album folder whose extension matches (case-insensitively).
 * Tracks are ordered by file name, compared byte-wise, so the order does
 * not depend on the locale or on directory enumeration order.
 */
class TagCatalog : public ICatalog {
   public:
    TagCatalog(const MappingFile& file, std::string audio_extension);

    std::optional<AlbumMapping> Resolve(const TagId& tag) const override;
    TrackList Tracks(const std::string& album) const override;

    const std::filesystem::path& music_root() const { return music_root_; }
    const std::map<TagId, AlbumMapping>& mappings() const { return mappings_; }

    // Albums under `root` holding at least one audio file, sorted by name.
    static std::vector<AlbumInfo> ScanAlbums(const std::filesystem::path& root,
                                             const std::string& audio_extension);

    // Audio files directly inside `dir`, sorted by file name. Empty on any error.
    static TrackList ListTracks(const std::filesystem::path& dir,
                                const std::string& audio_extension);

   private:
    std::filesystem::path music_root_;
    std::map<TagId, AlbumMapping> mappings_;
    std::string audio_extension_;
};
