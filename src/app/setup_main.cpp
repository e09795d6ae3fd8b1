// 1. Standard Library
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// 2. Third Party
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "Json2Mapping.hpp"
#include "Logging.hpp"
#include "MappingWizard.hpp"
#include "Pn532Sensor.hpp"
#include "TagCatalog.hpp"
#include "config.hpp"

namespace fs = std::filesystem;

static constexpr std::chrono::milliseconds PROBE_INTERVAL{300};

struct SetupOptions {
    std::string config_path = "tagtune.toml";
    fs::path music_root;
    bool probe = false;
};

static void print_usage() {
    spdlog::critical("Usage: tagtune_setup [--config tagtune.toml] [--music-root DIR] [--probe]");
    spdlog::critical("Example: tagtune_setup --music-root /media/pi/MUSIC");
}

static bool parse_args(int argc, char* argv[], SetupOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--probe") {
            options.probe = true;
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--music-root" && i + 1 < argc) {
            options.music_root = argv[++i];
        } else {
            return false;
        }
    }
    return true;
}

// Reports tag placements and removals until the timer is cancelled.
static asio::awaitable<void> run_probe(ITagSensor& sensor, asio::steady_timer& timer, const bool& stopping) {
    std::optional<TagId> last;
    while (!stopping) {
        if (auto line = DescribeProbeStep(last, sensor.Poll())) {
            std::cout << *line << std::endl;
        }

        timer.expires_after(PROBE_INTERVAL);
        boost::system::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec == asio::error::operation_aborted) break;
    }
}

static int probe(ITagSensor& sensor) {
    std::cout << "Continuous reading test (Ctrl+C to stop)...\n"
              << "Place and remove tags to test detection..." << std::endl;

    asio::io_context ioc;
    asio::steady_timer timer(ioc);
    bool stopping = false;

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        stopping = true;
        timer.cancel();
    });

    asio::co_spawn(ioc, run_probe(sensor, timer, stopping), [&signals](std::exception_ptr e) {
        signals.cancel();
        if (e) std::rethrow_exception(e);
    });
    ioc.run();

    std::cout << "\nTest completed!" << std::endl;
    return EXIT_SUCCESS;
}

static MappingFile load_existing(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return MappingFile{};
    }
    try {
        return LoadMappingFile(path);
    } catch (const std::exception& e) {
        spdlog::warn("Could not load existing mapping file: {}", e.what());
        return MappingFile{};
    }
}

int main(int argc, char* argv[]) {
    try {
        // 1. Argument Validation
        SetupOptions options;
        if (!parse_args(argc, argv, options)) {
            print_usage();
            return EXIT_FAILURE;
        }

        auto config = LoadConfig(options.config_path);
        config.logging.console_level = "warn";
        setup_logging(config.logging);

        // 2. Reader
        auto sensor = OpenPn532Sensor(config.sensor);
        if (options.probe) {
            return probe(*sensor);
        }

        std::cout << "=== Tag Mapping Setup ===" << std::endl;

        // 3. Existing mappings and music root
        const fs::path mapping_path = config.catalog.mapping_file;
        auto file = load_existing(mapping_path);

        std::vector<fs::path> candidates;
        if (!options.music_root.empty()) {
            candidates.push_back(options.music_root);
        } else {
            const char* user = std::getenv("USER");
            candidates = MusicRootCandidates(user ? user : "pi", file.music_root);
        }

        auto root = FindMusicRoot(candidates, config.catalog.audio_extension);
        if (!root) {
            std::cout << "No music albums found on USB drives!\n"
                      << "Make sure your USB drive is connected and contains album folders with "
                      << config.catalog.audio_extension << " files" << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "Found " << root->album_count << " albums in: " << root->path.string() << std::endl;
        file.music_root = root->path;

        // 4. Mapping dialogue
        auto albums = TagCatalog::ScanAlbums(root->path, config.catalog.audio_extension);
        MappingWizard wizard(*sensor, std::cin, std::cout);
        wizard.ShowAlbums(albums);
        if (!wizard.ChooseAndRun(file, albums)) {
            std::cout << "Setup cancelled. Nothing was saved." << std::endl;
            return EXIT_FAILURE;
        }

        // 5. Save
        SaveMappingFile(mapping_path, file);
        wizard.ShowSummary(file, mapping_path);

        std::cout << "\n=== Setup Complete! ===\n"
                  << "You can now start the player: tagtune " << options.config_path << "\n"
                  << "Or add more mappings later by running this tool again" << std::endl;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
