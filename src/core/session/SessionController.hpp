#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <optional>
#include <string>

#include "IActivitySink.hpp"
#include "ICatalog.hpp"
#include "IPlayer.hpp"
#include "ITagSensor.hpp"
#include "Session.hpp"
#include "types.hpp"

enum class ControllerState {
    Idle,
    Active
};

/**
 * @brief Tag-presence state machine owning the single playback session.
 * @details
 * Every poll tick reads the sensor once and applies:
 *  - IDLE + no tag            -> nothing
 *  - IDLE + tag X             -> resolve X; start a session, or record `unknown_tag`
 *  - ACTIVE(X) + X            -> nothing
 *  - ACTIVE(X) + Y            -> stop X, then handle Y as a fresh tag in the same tick
 *  - ACTIVE(X) + no tag       -> stop X
 *
 * A tag that resolves but cannot be played stays "associated" without a
 * session until it is removed, so it is reported once per placement. An
 * unknown tag is never associated and is recorded again on every tick.
 *
 * **Thread Safety:** All methods must be called from the thread running the
 * io_context passed at construction. Collaborators are borrowed and must
 * outlive the controller.
 */
class SessionController {
   public:
    SessionController(asio::io_context& io,
                      ITagSensor& sensor,
                      const ICatalog& catalog,
                      IPlayer& player,
                      IActivitySink& sink,
                      std::chrono::milliseconds poll_interval);

    // Runs Shutdown() so an active session is always closed with a record.
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Fixed-cadence polling loop. Returns after Stop(), with any session shut down.
    asio::awaitable<void> Run();

    // Cancels the polling loop.
    void Stop();

    // Evaluates one sensor read against the current state.
    void Tick();

    // Stops the active session (emitting `stopped`) and forgets the associated tag. Idempotent.
    void Shutdown();

    ControllerState state() const noexcept;
    const std::optional<Session>& current_session() const noexcept { return session_; }
    const std::optional<TagId>& associated_tag() const noexcept { return associated_tag_; }

   private:
    std::optional<TagId> ReadSensor();
    void Attach(const TagId& tag);
    void Detach();
    bool StartPlayer(const TagId& tag, const AlbumMapping& mapping, const TrackList& tracks);
    void EndSession();
    void Emit(const TagId& tag, const std::string& album, ActivityAction action);

    asio::steady_timer timer_;
    ITagSensor& sensor_;
    const ICatalog& catalog_;
    IPlayer& player_;
    IActivitySink& sink_;
    std::chrono::milliseconds poll_interval_;

    std::optional<Session> session_;
    std::optional<TagId> associated_tag_;
    bool stopping_ = false;
};
