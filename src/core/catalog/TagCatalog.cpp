#include "TagCatalog.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool has_extension(const fs::path& file, const std::string& extension) {
    const std::string ext = file.extension().string();
    return std::equal(ext.begin(), ext.end(), extension.begin(), extension.end(),
                      [](char a, char b) { return ascii_lower(a) == ascii_lower(b); });
}

}  // namespace

TagCatalog::TagCatalog(const MappingFile& file, std::string audio_extension)
    : music_root_(file.music_root),
      mappings_(file.mappings),
      audio_extension_(std::move(audio_extension)) {}

std::optional<AlbumMapping> TagCatalog::Resolve(const TagId& tag) const {
    auto it = mappings_.find(tag);
    if (it == mappings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TrackList TagCatalog::Tracks(const std::string& album) const {
    const fs::path album_path = music_root_ / album;

    std::error_code ec;
    if (!fs::is_directory(album_path, ec)) {
        spdlog::warn("Album path not found: {}", album_path.string());
        return {};
    }

    TrackList tracks = ListTracks(album_path, audio_extension_);
    if (tracks.empty()) {
        spdlog::warn("No {} files found in {}", audio_extension_, album_path.string());
    } else {
        spdlog::debug("Album '{}': {} tracks", album, tracks.size());
    }
    return tracks;
}

TrackList TagCatalog::ListTracks(const fs::path& dir, const std::string& audio_extension) {
    TrackList tracks;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::debug("Cannot list {}: {}", dir.string(), ec.message());
        return {};
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error while listing {}: {}", dir.string(), ec.message());
            return {};
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && has_extension(it->path(), audio_extension)) {
            tracks.push_back(it->path());
        }
    }

    // Byte-wise comparison of file names keeps the order locale-independent
    std::sort(tracks.begin(), tracks.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return tracks;
}

std::vector<AlbumInfo> TagCatalog::ScanAlbums(const fs::path& root,
                                              const std::string& audio_extension) {
    std::vector<AlbumInfo> albums;

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        spdlog::debug("Cannot scan music root {}: {}", root.string(), ec.message());
        return albums;
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;

        std::error_code type_ec;
        if (!it->is_directory(type_ec)) continue;

        std::size_t count = ListTracks(it->path(), audio_extension).size();
        if (count > 0) {
            albums.push_back(AlbumInfo{it->path().filename().string(), it->path(), count});
        }
    }

    std::sort(albums.begin(), albums.end(),
              [](const AlbumInfo& a, const AlbumInfo& b) { return a.name < b.name; });
    return albums;
}
