#include "MappingWizard.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string trim_lower(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::size_t> parse_count(const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::size_t>(std::stoul(s));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace

// =========================================================
//  Music Root Discovery
// =========================================================

std::vector<fs::path> MusicRootCandidates(const std::string& user, const fs::path& preferred) {
    std::vector<fs::path> candidates;
    if (!preferred.empty()) {
        candidates.push_back(preferred);
    }

    const fs::path media_dir = fs::path("/media") / user;
    candidates.push_back(media_dir / "MUSIC");
    candidates.push_back("/mnt/MUSIC");

    std::error_code ec;
    std::vector<fs::path> mounts;
    for (fs::directory_iterator it(media_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            mounts.push_back(it->path());
        }
    }
    std::sort(mounts.begin(), mounts.end());

    for (const auto& mount : mounts) {
        candidates.push_back(mount);
        candidates.push_back(mount / "MUSIC");
    }
    return candidates;
}

std::optional<MusicRootChoice> FindMusicRoot(const std::vector<fs::path>& candidates,
                                             const std::string& audio_extension) {
    std::optional<MusicRootChoice> best;
    for (const auto& candidate : candidates) {
        const auto count = TagCatalog::ScanAlbums(candidate, audio_extension).size();
        spdlog::debug("Music root candidate {}: {} album(s)", candidate.string(), count);
        if (count > 0 && (!best || count > best->album_count)) {
            best = MusicRootChoice{candidate, count};
        }
    }
    return best;
}

std::optional<std::string> DescribeProbeStep(std::optional<TagId>& last,
                                             const std::optional<TagId>& now) {
    if (now && now != last) {
        last = now;
        return "Tag placed: " + *now;
    }
    if (!now && last) {
        auto removed = std::exchange(last, std::nullopt);
        return "Tag removed: " + *removed;
    }
    return std::nullopt;
}

// =========================================================
//  Wizard
// =========================================================

MappingWizard::MappingWizard(ITagSensor& sensor,
                             std::istream& in,
                             std::ostream& out,
                             std::chrono::milliseconds read_timeout,
                             std::chrono::milliseconds poll_delay)
    : sensor_(sensor), in_(in), out_(out), read_timeout_(read_timeout), poll_delay_(poll_delay) {}

void MappingWizard::ShowAlbums(const std::vector<AlbumInfo>& albums) {
    out_ << fmt::format("\nFound {} albums:\n", albums.size());
    out_ << std::string(40, '=') << "\n";
    for (std::size_t i = 0; i < albums.size(); ++i) {
        out_ << fmt::format("{:2d}. {} ({} tracks)\n", i + 1, albums[i].name, albums[i].track_count);
    }
    out_ << "\n";
}

bool MappingWizard::ChooseAndRun(MappingFile& file, const std::vector<AlbumInfo>& albums) {
    for (;;) {
        out_ << "Mapping methods:\n"
             << "1. Interactive - Map one album at a time\n"
             << "2. Batch - Read all tags first, then assign\n"
             << "3. Skip mapping (just save path)\n";

        auto choice = Ask("Choose method [1/2/3]: ");
        if (!choice) return false;

        if (*choice == "1") {
            RunInteractive(file, albums);
            return true;
        }
        if (*choice == "2") {
            auto count = Ask("How many tags do you want to read? [Press Enter for unlimited]: ");
            RunBatch(file, albums, count ? parse_count(*count) : std::nullopt);
            return true;
        }
        if (*choice == "3") {
            return true;
        }
        out_ << "Invalid choice, try again\n\n";
    }
}

void MappingWizard::RunInteractive(MappingFile& file, const std::vector<AlbumInfo>& albums) {
    out_ << "\n=== Interactive Mapping ===\n"
         << "For each album, place the corresponding tag on the reader\n"
         << "Press Enter to skip an album, or 'q' to quit\n\n";

    for (const auto& album : albums) {
        out_ << fmt::format("Album: {} ({} tracks)\n", album.name, album.track_count);

        auto choice = Ask("Map this album? [y/N/q]: ");
        if (!choice || *choice == "q") break;
        if (*choice != "y") {
            out_ << "Skipped.\n\n";
            continue;
        }

        auto tag = ReadTag();
        if (!tag) {
            out_ << "No tag detected, skipped\n\n";
            continue;
        }

        auto existing = file.mappings.find(*tag);
        if (existing != file.mappings.end()) {
            out_ << fmt::format("Warning: Tag {} was already mapped to '{}'\n", *tag,
                                existing->second.album);
            if (!AskYesNo("Overwrite? [y/N]: ")) {
                out_ << "Skipped.\n\n";
                continue;
            }
        }

        Assign(file, *tag, album.name);
        out_ << "\n";
    }
}

void MappingWizard::RunBatch(MappingFile& file,
                             const std::vector<AlbumInfo>& albums,
                             std::optional<std::size_t> max_tags) {
    out_ << "\n=== Batch Mapping ===\n"
         << "All tags are read first, then assigned to albums\n\n";

    // 1. Collect distinct tags
    std::vector<TagId> tags;
    while (!max_tags || tags.size() < *max_tags) {
        auto go = Ask(fmt::format("Press Enter to read tag {}, or 'd' when done: ", tags.size() + 1));
        if (!go || *go == "d") break;

        auto tag = ReadTag();
        if (!tag) {
            out_ << "No tag detected, try again\n";
            continue;
        }
        if (std::find(tags.begin(), tags.end(), *tag) != tags.end()) {
            out_ << fmt::format("Tag {} already read\n", *tag);
            continue;
        }
        tags.push_back(*tag);
        out_ << fmt::format("Read tag {}: {}\n", tags.size(), *tag);
    }

    if (tags.empty()) {
        out_ << "No tags were read.\n";
        return;
    }

    // 2. Assign them
    out_ << fmt::format("\nAssigning {} tags to albums...\n", tags.size());
    ShowAlbums(albums);

    for (std::size_t i = 0; i < tags.size(); ++i) {
        const TagId& tag = tags[i];
        out_ << fmt::format("\nTag {} (ID: {})\n", i + 1, tag);

        for (;;) {
            auto choice = Ask(fmt::format("Enter album number (1-{}), or 's' to skip: ", albums.size()));
            if (!choice) return;
            if (*choice == "s") break;

            auto number = parse_count(*choice);
            if (!number || *number < 1 || *number > albums.size()) {
                out_ << "Invalid choice, try again\n";
                continue;
            }
            const std::string& album = albums[*number - 1].name;

            auto bound = std::find_if(file.mappings.begin(), file.mappings.end(),
                                      [&](const auto& m) { return m.second.album == album && m.first != tag; });
            if (bound != file.mappings.end()) {
                out_ << fmt::format("Warning: Album '{}' already mapped to tag {}\n", album, bound->first);
                if (!AskYesNo("Overwrite? [y/N]: ")) continue;
                file.mappings.erase(bound);
            }

            Assign(file, tag, album);
            break;
        }
    }
}

void MappingWizard::ShowSummary(const MappingFile& file, const fs::path& saved_to) {
    out_ << fmt::format("\nConfiguration saved to {}\n", saved_to.string());
    out_ << fmt::format("Mapped {} tags\n", file.mappings.size());

    if (file.mappings.empty()) return;

    out_ << "\nMappings:\n";
    for (const auto& [tag, mapping] : file.mappings) {
        out_ << fmt::format("  {} -> {}{}\n", tag, mapping.album, mapping.shuffle ? " (shuffled)" : "");
    }
}

std::optional<TagId> MappingWizard::ReadTag() {
    out_ << fmt::format("Place tag on reader ({} second timeout)...\n",
                        std::chrono::duration_cast<std::chrono::seconds>(read_timeout_).count());
    out_.flush();

    const auto deadline = std::chrono::steady_clock::now() + read_timeout_;
    do {
        try {
            if (auto tag = sensor_.Poll()) {
                return tag;
            }
        } catch (const std::exception& e) {
            spdlog::debug("Tag read failed: {}", e.what());
        }
        std::this_thread::sleep_for(poll_delay_);
    } while (std::chrono::steady_clock::now() < deadline);

    return std::nullopt;
}

std::optional<std::string> MappingWizard::Ask(const std::string& prompt) {
    out_ << prompt;
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return std::nullopt;
    }
    return trim_lower(line);
}

bool MappingWizard::AskYesNo(const std::string& prompt) {
    auto answer = Ask(prompt);
    return answer && (*answer == "y" || *answer == "yes");
}

bool MappingWizard::AskShuffle(const std::string& album) {
    for (;;) {
        auto answer = Ask(fmt::format("Play '{}' shuffled? [y/N]: ", album));
        if (!answer) return false;
        if (*answer == "y" || *answer == "yes") return true;
        if (answer->empty() || *answer == "n" || *answer == "no") return false;
        out_ << "Please enter 'y' for yes or 'n' for no (default: no)\n";
    }
}

void MappingWizard::Assign(MappingFile& file, const TagId& tag, const std::string& album) {
    const bool shuffle = AskShuffle(album);
    file.mappings[tag] = AlbumMapping{album, shuffle};
    out_ << fmt::format("Mapped tag {} to '{}'{}\n", tag, album, shuffle ? " (shuffled)" : "");
}
