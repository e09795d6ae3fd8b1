#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "ITagSensor.hpp"
#include "TagCatalog.hpp"
#include "config.hpp"

static constexpr std::chrono::milliseconds WIZARD_READ_TIMEOUT{10000};
static constexpr std::chrono::milliseconds WIZARD_POLL_DELAY{200};

struct MusicRootChoice {
    std::filesystem::path path;
    std::size_t album_count = 0;
};

/**
 * @brief Places worth checking for a music drive: `preferred` (if any),
 * /media/<user>/MUSIC, /mnt/MUSIC, and every folder under /media/<user>
 * together with its MUSIC subfolder.
 */
std::vector<std::filesystem::path> MusicRootCandidates(const std::string& user,
                                                       const std::filesystem::path& preferred = {});

// The candidate holding the most albums. Ties keep the earlier candidate.
std::optional<MusicRootChoice> FindMusicRoot(const std::vector<std::filesystem::path>& candidates,
                                             const std::string& audio_extension);

/**
 * @brief Tag presence transition for the reader probe.
 * Updates `last` and returns "Tag placed: <id>" or "Tag removed: <id>" on change.
 */
std::optional<std::string> DescribeProbeStep(std::optional<TagId>& last,
                                             const std::optional<TagId>& now);

/**
 * @brief Console dialogue that binds tags to albums in a MappingFile.
 * @details
 * Questions are read line by line from `in`; end of input answers every
 * pending question with its default (skip / no / stop).
 */
class MappingWizard {
   public:
    MappingWizard(ITagSensor& sensor,
                  std::istream& in,
                  std::ostream& out,
                  std::chrono::milliseconds read_timeout = WIZARD_READ_TIMEOUT,
                  std::chrono::milliseconds poll_delay = WIZARD_POLL_DELAY);

    // Lists albums with their track counts, numbered from 1.
    void ShowAlbums(const std::vector<AlbumInfo>& albums);

    // Asks for the method (interactive, batch or none) and runs it. Returns false if input ended.
    bool ChooseAndRun(MappingFile& file, const std::vector<AlbumInfo>& albums);

    // One album at a time: confirm, read a tag, confirm overwrites, ask shuffle.
    void RunInteractive(MappingFile& file, const std::vector<AlbumInfo>& albums);

    // Reads up to `max_tags` distinct tags first, then assigns each one to an album number.
    void RunBatch(MappingFile& file,
                  const std::vector<AlbumInfo>& albums,
                  std::optional<std::size_t> max_tags);

    // Prints every mapping after a save.
    void ShowSummary(const MappingFile& file, const std::filesystem::path& saved_to);

    // Polls the sensor until a tag shows up or the read timeout passes.
    std::optional<TagId> ReadTag();

   private:
    std::optional<std::string> Ask(const std::string& prompt);
    bool AskYesNo(const std::string& prompt);
    bool AskShuffle(const std::string& album);
    void Assign(MappingFile& file, const TagId& tag, const std::string& album);

    ITagSensor& sensor_;
    std::istream& in_;
    std::ostream& out_;
    std::chrono::milliseconds read_timeout_;
    std::chrono::milliseconds poll_delay_;
};
