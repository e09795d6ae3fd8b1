#pragma once

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "spdlog/spdlog.h"

/**
 * @brief RAII guard for a temporary file that replaces a target on success.
 * The temporary file is deleted on destruction unless commit() moved it into place.
 */
class PartialFileGuard {
   public:
    explicit PartialFileGuard(std::filesystem::path tmp_path) : tmp_path_(std::move(tmp_path)) {}

    // Atomically renames the temporary file over `target` and disarms the guard.
    void commit(const std::filesystem::path& target) {
        std::error_code ec;
        std::filesystem::rename(tmp_path_, target, ec);
        if (ec) {
            throw std::runtime_error("Failed to replace " + target.string() + ": " + ec.message());
        }
        engaged_ = false;
    }

    ~PartialFileGuard() {
        if (!engaged_ || tmp_path_.empty()) return;

        std::error_code ec;
        if (std::filesystem::remove(tmp_path_, ec)) {
            spdlog::debug("Removed partial file: {}", tmp_path_.string());
        } else if (ec) {
            spdlog::warn("Failed to remove partial file {}: {}", tmp_path_.string(), ec.message());
        }
    }

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;
    PartialFileGuard(PartialFileGuard&&) = delete;
    PartialFileGuard& operator=(PartialFileGuard&&) = delete;

   private:
    std::filesystem::path tmp_path_;
    bool engaged_ = true;
};
