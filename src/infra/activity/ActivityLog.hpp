#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

#include "IActivitySink.hpp"
#include "Session.hpp"

/**
 * @brief Formats a record as
 * `YYYY-MM-DD HH:MM:SS | NFC: <tag> | Album: <album> | Action: <action>` (local time).
 */
std::string FormatActivityLine(const ActivityRecord& record);

/**
 * @brief IActivitySink appending one line per record to a log file.
 * @details
 * Backed by a dedicated spdlog logger (not the default one). Write errors
 * are routed to the diagnostic log by the logger's error handler and never
 * reach the caller. If the file cannot be opened at all, records are only
 * echoed to the diagnostic log.
 */
class ActivityLog : public IActivitySink {
   public:
    explicit ActivityLog(const std::string& path);
    ~ActivityLog() override;

    ActivityLog(const ActivityLog&) = delete;
    ActivityLog& operator=(const ActivityLog&) = delete;

    void Record(const ActivityRecord& record) noexcept override;

    bool has_file() const noexcept { return has_file_; }

   private:
    std::shared_ptr<spdlog::logger> logger_;
    bool has_file_ = false;
};
