/// @file session.hpp
/// @brief Session/transport manager: connection state machine, reconnect
///        backoff, and the buffer of not-yet-sent operations.

#pragma once

#include <canvas-sync/events.hpp>
#include <canvas-sync/operation.hpp>
#include <canvas-sync/protocol.hpp>
#include <canvas-sync/transport.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace canvas_sync {

/// Where the session is in its lifecycle.
enum class ConnectionState : std::uint8_t {
    disconnected,  ///< No session; a reconnect may be scheduled.
    connecting,    ///< open() issued, waiting for the transport.
    connected,     ///< Frames flow in both directions.
};

/// Convert a ConnectionState to its string representation.
constexpr auto to_string_view(ConnectionState state) noexcept -> std::string_view {
    switch (state) {
        case ConnectionState::disconnected: return "disconnected";
        case ConnectionState::connecting:   return "connecting";
        case ConnectionState::connected:    return "connected";
    }
    return "unknown";
}

/// Capped exponential backoff for reconnect attempts.
///
/// The first delay is `initial`; each failed attempt doubles it up to
/// `max`; a successful connection resets it to `initial`.
class ReconnectBackoff {
public:
    explicit ReconnectBackoff(std::chrono::milliseconds initial = std::chrono::seconds{1},
                              std::chrono::milliseconds max = std::chrono::seconds{30});

    /// The delay to use for the next scheduled attempt.
    auto current() const -> std::chrono::milliseconds { return current_; }

    /// Double the delay, capped at the maximum.
    void advance();

    /// Return to the initial delay.
    void reset() { current_ = initial_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds current_;
};

/// FIFO of locally issued operations waiting for a connection.
///
/// Bounded with drop-oldest when `capacity` is non-zero. Dropped
/// operations stay applied locally but never reach the server.
class PendingBuffer {
public:
    PendingBuffer() = default;

    /// @param capacity Maximum number of buffered operations; 0 = unbounded.
    explicit PendingBuffer(std::size_t capacity) : capacity_{capacity} {}

    /// Append an operation.
    /// @return False if the buffer was full and the oldest entry was dropped.
    auto push(Operation op) -> bool;

    /// Remove and return every buffered operation, oldest first.
    auto take() -> std::vector<Operation>;

    auto ops() const -> const std::deque<Operation>& { return ops_; }
    auto size() const -> std::size_t { return ops_.size(); }
    auto empty() const -> bool { return ops_.empty(); }
    auto capacity() const -> std::size_t { return capacity_; }

    /// Number of operations dropped because the buffer was full.
    auto dropped_count() const -> std::uint64_t { return dropped_; }

private:
    std::deque<Operation> ops_;
    std::size_t capacity_{0};
    std::uint64_t dropped_{0};
};

/// Per-document session bookkeeping owned by the engine.
struct SessionState {
    std::string session_id;   ///< This node's id for the session.
    std::uint64_t version{0}; ///< Last server version observed.
    PendingBuffer pending;    ///< Operations issued while not connected.
};

/// Tunables for SessionManager.
struct SessionOptions {
    std::string url;                                                 ///< Endpoint to connect to.
    std::chrono::milliseconds initial_backoff{std::chrono::seconds{1}};
    std::chrono::milliseconds max_backoff{std::chrono::seconds{30}};
};

/// Notifications from the session to its owner.
struct SessionCallbacks {
    std::function<void()> on_connected;
    std::function<void(const Disconnected&)> on_disconnected;
    std::function<void(std::string_view)> on_frame;
};

/// Owns one network session and drives the connect/reconnect state machine.
///
/// States: disconnected -> connecting -> connected. Any close or error
/// returns to disconnected and arms the single reconnect timer with the
/// current backoff delay; the timer firing starts a new attempt.
/// Reconnection never gives up. While connected, submitted operations
/// are sent at once; otherwise they are buffered and flushed as one
/// batch, in order, as soon as the next connection opens.
class SessionManager {
public:
    SessionManager(Transport& transport, ReconnectTimer& timer, SessionState& state,
                   SessionOptions options);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    auto operator=(const SessionManager&) -> SessionManager& = delete;

    void set_callbacks(SessionCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    /// Start connecting. No-op unless disconnected.
    void connect();

    /// Cancel any scheduled reconnect and close the session. No reconnect
    /// follows until connect() is called again. Buffered operations are kept.
    void disconnect();

    /// Send an operation now if connected, otherwise buffer it.
    /// @return True if it was sent, false if it was buffered.
    auto submit(const Operation& op) -> bool;

    /// Send a control message (cursor, requests, ping). Dropped when not connected.
    /// @return True if it was handed to the transport.
    auto send(const ClientMessage& msg) -> bool;

    auto state() const -> ConnectionState { return state_; }

    /// Delay the next reconnect attempt would wait.
    auto next_delay() const -> std::chrono::milliseconds { return backoff_.current(); }

    /// True while a reconnect attempt is scheduled.
    auto reconnect_scheduled() const -> bool { return timer_.armed(); }

private:
    void start_attempt();
    void handle_open();
    void handle_close(std::optional<Error> reason);
    void schedule_reconnect();
    void flush_pending();

    Transport& transport_;
    ReconnectTimer& timer_;
    SessionState& session_;
    SessionOptions options_;
    SessionCallbacks callbacks_;
    ReconnectBackoff backoff_;
    ConnectionState state_{ConnectionState::disconnected};
    bool stopped_{false};
};

}  // namespace canvas_sync
