#include "ActivityLog.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <ctime>

namespace {

std::tm get_safe_localtime(std::time_t timer) {
    std::tm tm_snapshot{};
    localtime_r(&timer, &tm_snapshot);
    return tm_snapshot;
}

}  // namespace

std::string FormatActivityLine(const ActivityRecord& record) {
    std::tm timeinfo = get_safe_localtime(std::chrono::system_clock::to_time_t(record.timestamp));

    char stamp[20];  // "YYYY-MM-DD HH:MM:SS"
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &timeinfo);

    return fmt::format("{} | NFC: {} | Album: {} | Action: {}", stamp, record.tag_id,
                       record.album, to_string(record.action));
}

ActivityLog::ActivityLog(const std::string& path) {
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        logger_ = std::make_shared<spdlog::logger>("activity", std::move(sink));
        has_file_ = true;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Activity log unavailable ({}). Records go to the console only.", e.what());
        logger_ = std::make_shared<spdlog::logger>("activity");
    }

    logger_->set_pattern("%v");
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::info);
    logger_->set_error_handler([](const std::string& msg) {
        spdlog::warn("Activity logging error: {}", msg);
    });

    if (has_file_) {
        spdlog::info("Activity log: {}", path);
    }
}

ActivityLog::~ActivityLog() = default;

void ActivityLog::Record(const ActivityRecord& record) noexcept {
    try {
        std::string line = FormatActivityLine(record);
        logger_->info(line);
        spdlog::info("{} | {} | {}", line.substr(0, 19), record.album, to_string(record.action));
    } catch (const std::exception& e) {
        spdlog::warn("Activity record dropped: {}", e.what());
    }
}
