#include "SessionController.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <stdexcept>
#include <utility>

SessionController::SessionController(asio::io_context& io,
                                     ITagSensor& sensor,
                                     const ICatalog& catalog,
                                     IPlayer& player,
                                     IActivitySink& sink,
                                     std::chrono::milliseconds poll_interval)
    : timer_(io),
      sensor_(sensor),
      catalog_(catalog),
      player_(player),
      sink_(sink),
      poll_interval_(poll_interval) {
    if (poll_interval_.count() <= 0) {
        throw std::invalid_argument("Poll interval must be positive");
    }
}

SessionController::~SessionController() {
    Shutdown();
}

ControllerState SessionController::state() const noexcept {
    return session_ ? ControllerState::Active : ControllerState::Idle;
}

// =========================================================
//  Polling Loop
// =========================================================

asio::awaitable<void> SessionController::Run() {
    spdlog::info("Monitoring for tags every {} ms", poll_interval_.count());

    auto next_tick = std::chrono::steady_clock::now();
    boost::system::error_code ec;

    while (!stopping_) {
        Tick();

        // A. Schedule the next tick on a fixed grid; skip missed slots after a slow read
        next_tick += poll_interval_;
        auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            next_tick = now;
        }

        // B. Wait (Stop() cancels the timer)
        timer_.expires_at(next_tick);
        co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec == asio::error::operation_aborted) {
            break;
        }
    }

    Shutdown();
    spdlog::debug("Polling loop finished.");
}

void SessionController::Stop() {
    stopping_ = true;
    timer_.cancel();
}

void SessionController::Tick() {
    std::optional<TagId> tag = ReadSensor();

    if (!tag) {
        if (associated_tag_) Detach();
        return;
    }

    if (associated_tag_ == tag) {
        return;  // Steady state
    }

    // Swap without an intervening gap: close the old session before the new one starts
    if (associated_tag_) Detach();
    Attach(*tag);
}

void SessionController::Shutdown() {
    EndSession();
    associated_tag_.reset();
}

// =========================================================
//  Transitions
// =========================================================

std::optional<TagId> SessionController::ReadSensor() {
    try {
        return sensor_.Poll();
    } catch (const std::exception& e) {
        spdlog::warn("Tag read failed: {}", e.what());
        return std::nullopt;
    }
}

void SessionController::Attach(const TagId& tag) {
    auto mapping = catalog_.Resolve(tag);
    if (!mapping) {
        spdlog::warn("Unknown tag ID: {}. Add it to the mapping file to bind it to an album.", tag);
        Emit(tag, std::string(UNKNOWN_ALBUM), ActivityAction::UnknownTag);
        return;
    }

    associated_tag_ = tag;

    spdlog::info("[{}] Tag detected. Album: {}{}", tag, mapping->album,
                 mapping->shuffle ? " (shuffled)" : "");

    TrackList tracks = catalog_.Tracks(mapping->album);
    if (tracks.empty()) {
        spdlog::warn("[{}] Album '{}' not found or has no audio files. Nothing to play.", tag,
                     mapping->album);
        return;
    }

    if (!StartPlayer(tag, *mapping, tracks)) {
        return;
    }

    session_ = Session{tag, mapping->album, std::chrono::system_clock::now(), mapping->shuffle};
    Emit(tag, mapping->album,
         mapping->shuffle ? ActivityAction::StartedShuffled : ActivityAction::Started);
}

bool SessionController::StartPlayer(const TagId& tag,
                                    const AlbumMapping& mapping,
                                    const TrackList& tracks) {
    bool started = false;
    try {
        started = player_.Start(tracks, mapping.shuffle);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Player error: {}", tag, e.what());
    }

    if (!started) {
        spdlog::error("[{}] Could not start playback of '{}'. Output device unavailable?", tag,
                      mapping.album);
    }
    return started;
}

void SessionController::Detach() {
    if (session_) {
        spdlog::info("[{}] Tag removed. Stopping playback of: {}{}", session_->tag_id,
                     session_->album, session_->shuffled ? " (shuffled)" : "");
    } else {
        spdlog::debug("[{}] Tag removed.", *associated_tag_);
    }

    EndSession();
    associated_tag_.reset();
}

void SessionController::EndSession() {
    if (!session_) return;

    Session ending = std::move(*session_);
    session_.reset();

    player_.Stop();

    auto played = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - ending.started_at);
    spdlog::debug("[{}] Session for '{}' ended after {}s", ending.tag_id, ending.album,
                  played.count());

    Emit(ending.tag_id, ending.album, ActivityAction::Stopped);
}

void SessionController::Emit(const TagId& tag, const std::string& album, ActivityAction action) {
    sink_.Record(ActivityRecord{std::chrono::system_clock::now(), tag, album, action});
}
