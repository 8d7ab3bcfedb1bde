#include <canvas-sync/events.hpp>

#include <utility>

namespace canvas_sync {

auto to_change(const Operation& op) -> Change {
    return Change{
        .kind = op.op_type,
        .element_id = op.element_id,
        .prop = op.prop,
        .value = op.value,
        .origin = op.origin,
    };
}

auto event_name(const Event& event) -> std::string_view {
    return std::visit(overload{
        [](const Connected&) -> std::string_view { return "connected"; },
        [](const Disconnected&) -> std::string_view { return "disconnected"; },
        [](const LocalChange&) -> std::string_view { return "local_op"; },
        [](const RemoteChanges&) -> std::string_view { return "remote_ops"; },
        [](const SnapshotApplied&) -> std::string_view { return "snapshot"; },
        [](const StateVectorReceived&) -> std::string_view { return "state_vector"; },
        [](const CursorMoved&) -> std::string_view { return "cursor"; },
        [](const PeerJoined&) -> std::string_view { return "peer_joined"; },
        [](const PeerLeft&) -> std::string_view { return "peer_left"; },
        [](const PresenceChanged&) -> std::string_view { return "presence"; },
        [](const PongReceived&) -> std::string_view { return "pong"; },
    }, event);
}

// =============================================================================
// Subscription
// =============================================================================

void Subscription::unsubscribe() {
    if (auto registry = registry_.lock()) {
        registry->handlers.erase(id_);
    }
    registry_.reset();
}

auto Subscription::active() const -> bool {
    auto registry = registry_.lock();
    return registry && registry->handlers.contains(id_);
}

// =============================================================================
// EventBus
// =============================================================================

EventBus::EventBus() : registry_{std::make_shared<detail::HandlerRegistry>()} {}

auto EventBus::on_any(std::function<void(const Event&)> handler) -> Subscription {
    const auto id = registry_->next_id++;
    registry_->handlers.emplace(id, std::move(handler));
    return Subscription{registry_, id};
}

void EventBus::emit(const Event& event) const {
    auto ids = std::vector<std::uint64_t>{};
    ids.reserve(registry_->handlers.size());
    for (const auto& [id, handler] : registry_->handlers) ids.push_back(id);

    for (auto id : ids) {
        auto it = registry_->handlers.find(id);
        if (it == registry_->handlers.end()) continue;
        // Copy: the handler may unsubscribe itself while running.
        auto handler = it->second;
        handler(event);
    }
}

}  // namespace canvas_sync
