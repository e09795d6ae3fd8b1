// 1. Standard Library
#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

// 2. Third Party
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "ActivityLog.hpp"
#include "AlsaPlayer.hpp"
#include "Json2Mapping.hpp"
#include "Logging.hpp"
#include "Pn532Sensor.hpp"
#include "SessionController.hpp"
#include "TagCatalog.hpp"
#include "config.hpp"

static void log_startup_report(const TagCatalog& catalog) {
    std::error_code ec;
    if (std::filesystem::is_directory(catalog.music_root(), ec)) {
        spdlog::info("Music root: {}", catalog.music_root().string());
    } else {
        spdlog::warn("Music root {} is not available. Mapped albums will not play until it is mounted.",
                     catalog.music_root().string());
    }

    if (catalog.mappings().empty()) {
        spdlog::warn("No tags are mapped. Run tagtune_setup to create mappings.");
        return;
    }

    spdlog::info("{} mapped tag(s):", catalog.mappings().size());
    for (const auto& [tag, mapping] : catalog.mappings()) {
        spdlog::info("  {} -> {}{}", tag, mapping.album, mapping.shuffle ? " (shuffled)" : "");
    }
}

int main(int argc, char* argv[]) {
    try {
        // 1. Argument Validation
        if (argc > 2) {
            spdlog::critical("Usage: tagtune [config.toml]");
            spdlog::critical("Example: tagtune /etc/tagtune/tagtune.toml");
            return EXIT_FAILURE;
        }
        const std::string config_path = argc == 2 ? argv[1] : "tagtune.toml";

        // 2. Configuration
        auto config = LoadConfig(config_path);
        setup_logging(config.logging);

        auto mapping_file = LoadMappingFile(config.catalog.mapping_file);

        // 3. Collaborators
        TagCatalog catalog(mapping_file, config.catalog.audio_extension);
        log_startup_report(catalog);

        AlsaPlayer player(config.audio, mapping_file.volume);
        ActivityLog activity(config.logging.activity_file);
        auto sensor = OpenPn532Sensor(config.sensor);

        // 4. Controller
        asio::io_context main_ioc;
        SessionController controller(main_ioc, *sensor, catalog, player, activity,
                                     config.controller.poll_interval);

        // 5. Graceful Shutdown Signal
        asio::signal_set signals(main_ioc, SIGINT, SIGTERM);
        signals.async_wait([&controller](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            spdlog::info("Stop signal ({}) received. Shutting down...", signal_number);
            controller.Stop();
        });

        asio::co_spawn(main_ioc, controller.Run(), [&signals](std::exception_ptr e) {
            signals.cancel();
            if (e) std::rethrow_exception(e);
        });

        spdlog::info("tagtune ready. Polling every {}ms.", config.controller.poll_interval.count());

        // 6. Run
        main_ioc.run();

        spdlog::info("tagtune shutdown complete.");

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
