/// @file events.hpp
/// @brief Consumer-facing events and the typed publish/subscribe bus.

#pragma once

#include <canvas-sync/error.hpp>
#include <canvas-sync/operation.hpp>
#include <canvas-sync/presence.hpp>
#include <canvas-sync/protocol.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace canvas_sync {

/// A document change as seen by consumers: an operation without its clock.
struct Change {
    OpType kind{OpType::set};
    std::string element_id;
    std::string prop;
    Value value;
    std::string origin;

    auto operator==(const Change&) const -> bool = default;
};

/// Strip the causal metadata from an operation.
auto to_change(const Operation& op) -> Change;

// -- Event payloads -----------------------------------------------------------

/// The session is open and the pending buffer has been flushed.
struct Connected {};

/// The session closed. A reconnect is scheduled unless retry_in is empty.
struct Disconnected {
    std::optional<Error> reason;                        ///< Set when a transport error caused the close.
    std::optional<std::chrono::milliseconds> retry_in;  ///< Delay before the next attempt.
};

/// A locally issued change was applied and handed to the session.
struct LocalChange {
    Change change;
};

/// A batch of remote operations was merged.
struct RemoteChanges {
    std::vector<Change> changes;  ///< The operations that changed local state.
    std::size_t received{0};      ///< Operations in the inbound batch.
    std::string origin;           ///< Session that produced the batch.
    std::uint64_t version{0};     ///< Server version after the batch.
};

/// A full snapshot was merged.
struct SnapshotApplied {
    std::uint64_t version{0};
    nlohmann::json elements;  ///< Plain `{element_id: {prop: value}}` of the merged document.
};

/// The server reported its authoritative version.
struct StateVectorReceived {
    StateVector state;
};

/// A remote participant moved their pointer.
struct CursorMoved {
    CursorInfo cursor;
};

/// A remote participant joined.
struct PeerJoined {
    PresenceInfo peer;
};

/// A remote participant left.
struct PeerLeft {
    UserId user_id{0};
    std::string username;
};

/// A remote participant changed status.
struct PresenceChanged {
    UserId user_id{0};
    PresenceStatus status{PresenceStatus::idle};
};

/// The server answered a ping.
struct PongReceived {};

/// Every event the engine emits.
using Event = std::variant<
    Connected,
    Disconnected,
    LocalChange,
    RemoteChanges,
    SnapshotApplied,
    StateVectorReceived,
    CursorMoved,
    PeerJoined,
    PeerLeft,
    PresenceChanged,
    PongReceived
>;

/// The wire-style name of an event (`connected`, `remote_ops`, ...).
auto event_name(const Event& event) -> std::string_view;

/// @cond DETAIL
namespace detail {

template <typename T, typename Variant>
struct is_alternative;

template <typename T, typename... Ts>
struct is_alternative<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

struct HandlerRegistry {
    std::map<std::uint64_t, std::function<void(const Event&)>> handlers;
    std::uint64_t next_id{1};
};

}  // namespace detail
/// @endcond

/// Handle returned by EventBus::on(); call unsubscribe() to stop delivery.
///
/// Copyable. Unsubscribing twice, or after the bus is gone, is a no-op.
class Subscription {
public:
    Subscription() = default;

    /// Stop delivering events to the handler.
    void unsubscribe();

    /// True while the handler is still registered.
    auto active() const -> bool;

private:
    friend class EventBus;

    Subscription(std::weak_ptr<detail::HandlerRegistry> registry, std::uint64_t id)
        : registry_{std::move(registry)}, id_{id} {}

    std::weak_ptr<detail::HandlerRegistry> registry_;
    std::uint64_t id_{0};
};

/// Typed publish/subscribe over the closed Event set.
///
/// @code
/// auto sub = bus.on<PeerJoined>([](const PeerJoined& e) {
///     draw_avatar(e.peer.username, e.peer.color);
/// });
/// sub.unsubscribe();
/// @endcode
class EventBus {
public:
    EventBus();

    /// Subscribe to one event type.
    template <typename E>
    auto on(std::function<void(const E&)> handler) -> Subscription {
        static_assert(detail::is_alternative<E, Event>::value,
                      "EventBus::on<E> requires E to be an Event alternative");
        return on_any([handler = std::move(handler)](const Event& event) {
            if (const auto* payload = std::get_if<E>(&event)) handler(*payload);
        });
    }

    /// Subscribe to every event.
    auto on_any(std::function<void(const Event&)> handler) -> Subscription;

    /// Deliver an event to every handler registered at the time of the call.
    /// Handlers may subscribe or unsubscribe during delivery.
    void emit(const Event& event) const;

    /// Number of registered handlers.
    auto handler_count() const -> std::size_t { return registry_->handlers.size(); }

private:
    std::shared_ptr<detail::HandlerRegistry> registry_;
};

}  // namespace canvas_sync
