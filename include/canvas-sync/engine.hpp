/// @file engine.hpp
/// @brief The public façade: one synchronized document per Engine.

#pragma once

#include <canvas-sync/clock.hpp>
#include <canvas-sync/config.hpp>
#include <canvas-sync/document_state.hpp>
#include <canvas-sync/events.hpp>
#include <canvas-sync/integrator.hpp>
#include <canvas-sync/presence.hpp>
#include <canvas-sync/protocol.hpp>
#include <canvas-sync/session.hpp>
#include <canvas-sync/transport.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_sync {

/// A replica of one shared document, kept in sync over a Transport.
///
/// Mutations apply to the local replica immediately and are sent, or
/// buffered until the next connection. Remote traffic is merged under
/// the last-writer-wins rule and surfaced as typed events. All calls and
/// callbacks happen on one thread, the one driving the transport.
///
/// @code
/// auto engine = canvas_sync::Engine{config, std::move(transport), std::move(timer)};
/// auto sub = engine.on<canvas_sync::RemoteChanges>([](const auto& e) {
///     for (const auto& change : e.changes) redraw(change.element_id);
/// });
/// engine.connect();
/// engine.add_element("rect-1", {{"x", 10}, {"y", 20}});
/// engine.set_property("rect-1", "fill", "#ff0000");
/// @endcode
class Engine {
public:
    /// @param config Settings; see resolve() for how url and node_id are filled in.
    /// @param transport The network session to drive.
    /// @param timer The single reconnect timer.
    /// @param wall Wall-clock source for the hybrid clock.
    Engine(EngineConfig config, std::unique_ptr<Transport> transport,
           std::unique_ptr<ReconnectTimer> timer, WallClock wall = system_wall_clock());
    ~Engine();

    Engine(const Engine&) = delete;
    auto operator=(const Engine&) -> Engine& = delete;

    // -- Connection -----------------------------------------------------------

    /// Open the session. Reconnects automatically until disconnect().
    void connect();

    /// Close the session and stop reconnecting. Buffered edits are kept.
    void disconnect();

    // -- Document mutation ----------------------------------------------------

    void set_property(std::string_view element_id, std::string_view prop, Value value);
    void delete_property(std::string_view element_id, std::string_view prop);
    void add_element(std::string_view element_id, Value initial_props = nlohmann::json::object());
    void remove_element(std::string_view element_id);

    // -- Fire-and-forget ------------------------------------------------------
    // Each returns false, and sends nothing, when not connected.

    auto move_cursor(double x, double y) -> bool;
    auto set_status(PresenceStatus status) -> bool;
    auto ping() -> bool;
    auto request_snapshot() -> bool;

    /// Ask for the operations after `since`, or after the last observed
    /// version when omitted.
    auto request_sync(std::optional<std::uint64_t> since = std::nullopt) -> bool;

    // -- Events ---------------------------------------------------------------

    template <typename E>
    auto on(std::function<void(const E&)> handler) -> Subscription {
        return bus_.on<E>(std::move(handler));
    }

    auto on_any(std::function<void(const Event&)> handler) -> Subscription {
        return bus_.on_any(std::move(handler));
    }

    // -- Reading --------------------------------------------------------------

    auto get(std::string_view element_id, std::string_view prop) const -> std::optional<Value>;
    auto exists(std::string_view element_id) const -> bool;
    auto element_ids() const -> std::vector<std::string>;
    auto properties(std::string_view element_id) const -> std::optional<nlohmann::json>;

    /// Plain `{element_id: {prop: value}}` of the live document.
    auto snapshot() const -> nlohmann::json;

    /// Read-only view of the replicated registers, clocks included.
    auto state() const -> const DocumentState& { return integrator_.state(); }

    auto cursors() const -> std::map<UserId, CursorInfo> { return presence_.cursors(); }
    auto peers() const -> std::map<UserId, PresenceInfo> { return presence_.peers(); }

    auto connection_state() const -> ConnectionState { return session_manager_.state(); }
    auto version() const -> std::uint64_t { return integrator_.version(); }
    auto pending_count() const -> std::size_t { return session_.pending.size(); }
    auto dropped_count() const -> std::uint64_t { return session_.pending.dropped_count(); }
    auto node_id() const -> const std::string& { return clock_.node_id(); }
    auto url() const -> const std::string& { return config_.url; }
    auto document_id() const -> const std::string& { return config_.document_id; }

private:
    void issue(const Operation& op);
    void handle_frame(std::string_view frame);
    void handle(const ServerMessage& msg);

    EngineConfig config_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<ReconnectTimer> timer_;
    HybridClock clock_;
    SessionState session_;
    RemoteStateIntegrator integrator_;
    PresenceTracker presence_;
    EventBus bus_;
    SessionManager session_manager_;  // last: detaches from transport_ and timer_ first
};

}  // namespace canvas_sync
