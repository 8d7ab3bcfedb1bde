#include <canvas-sync/engine.hpp>

#include <canvas-sync/log.hpp>
#include <canvas-sync/protocol.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace canvas_sync {

namespace {

auto require(std::unique_ptr<Transport> transport) -> std::unique_ptr<Transport> {
    if (!transport) throw std::invalid_argument{"Engine requires a transport"};
    return transport;
}

auto require(std::unique_ptr<ReconnectTimer> timer) -> std::unique_ptr<ReconnectTimer> {
    if (!timer) throw std::invalid_argument{"Engine requires a reconnect timer"};
    return timer;
}

}  // namespace

Engine::Engine(EngineConfig config, std::unique_ptr<Transport> transport,
               std::unique_ptr<ReconnectTimer> timer, WallClock wall)
    : config_{resolve(std::move(config))},
      transport_{require(std::move(transport))},
      timer_{require(std::move(timer))},
      clock_{config_.node_id, std::move(wall)},
      session_{.session_id = config_.node_id,
               .version = 0,
               .pending = PendingBuffer{config_.pending_capacity}},
      integrator_{clock_, session_},
      session_manager_{*transport_, *timer_, session_,
                       SessionOptions{.url = config_.url,
                                      .initial_backoff = config_.initial_backoff,
                                      .max_backoff = config_.max_backoff}} {
    session_manager_.set_callbacks(SessionCallbacks{
        .on_connected = [this] { bus_.emit(Connected{}); },
        .on_disconnected = [this](const Disconnected& e) { bus_.emit(e); },
        .on_frame = [this](std::string_view frame) { handle_frame(frame); },
    });
    logger("engine")->info("engine {} for document {} at {}",
                           config_.node_id, config_.document_id, config_.url);
}

Engine::~Engine() = default;

void Engine::connect() { session_manager_.connect(); }

void Engine::disconnect() { session_manager_.disconnect(); }

// -- Document mutation --------------------------------------------------------

void Engine::set_property(std::string_view element_id, std::string_view prop, Value value) {
    issue(make_set(std::string{element_id}, std::string{prop}, std::move(value), clock_.tick()));
}

void Engine::delete_property(std::string_view element_id, std::string_view prop) {
    issue(make_delete(std::string{element_id}, std::string{prop}, clock_.tick()));
}

void Engine::add_element(std::string_view element_id, Value initial_props) {
    if (!initial_props.is_null() && !initial_props.is_object()) {
        throw std::invalid_argument{"initial properties must be an object"};
    }
    issue(make_add_element(std::string{element_id}, std::move(initial_props), clock_.tick()));
}

void Engine::remove_element(std::string_view element_id) {
    issue(make_remove_element(std::string{element_id}, clock_.tick()));
}

void Engine::issue(const Operation& op) {
    // An operation that cannot be framed would sit at the head of the
    // pending buffer forever, so refuse it before it touches local state.
    try {
        static_cast<void>(encode(ClientMessage{OpMessage{op}}));
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument{"operation on '" + op.element_id + "' cannot be encoded: " + e.what()};
    }
    integrator_.apply_local(op);
    session_manager_.submit(op);
    bus_.emit(LocalChange{to_change(op)});
}

// -- Fire-and-forget ----------------------------------------------------------

auto Engine::move_cursor(double x, double y) -> bool {
    return session_manager_.send(CursorMove{Position{.x = x, .y = y}});
}

auto Engine::set_status(PresenceStatus status) -> bool {
    return session_manager_.send(StatusUpdate{status});
}

auto Engine::ping() -> bool {
    return session_manager_.send(Ping{});
}

auto Engine::request_snapshot() -> bool {
    return session_manager_.send(integrator_.snapshot_request());
}

auto Engine::request_sync(std::optional<std::uint64_t> since) -> bool {
    return session_manager_.send(integrator_.sync_request(since));
}

// -- Reading ------------------------------------------------------------------

auto Engine::get(std::string_view element_id, std::string_view prop) const -> std::optional<Value> {
    return integrator_.state().get(element_id, prop);
}

auto Engine::exists(std::string_view element_id) const -> bool {
    return integrator_.state().exists(element_id);
}

auto Engine::element_ids() const -> std::vector<std::string> {
    return integrator_.state().element_ids();
}

auto Engine::properties(std::string_view element_id) const -> std::optional<nlohmann::json> {
    return integrator_.state().properties(element_id);
}

auto Engine::snapshot() const -> nlohmann::json {
    return integrator_.state().snapshot();
}

// -- Inbound ------------------------------------------------------------------

void Engine::handle_frame(std::string_view frame) {
    auto msg = decode_server_message(frame);
    if (!msg) return;
    handle(*msg);
}

void Engine::handle(const ServerMessage& msg) {
    std::visit(overload{
        [this](const OpsBroadcast& m) {
            auto applied = integrator_.apply_remote(m.ops, m.version);
            auto event = RemoteChanges{.changes = {},
                                       .received = m.ops.size(),
                                       .origin = m.origin,
                                       .version = integrator_.version()};
            event.changes.reserve(applied.size());
            for (const auto& op : applied) event.changes.push_back(to_change(op));
            bus_.emit(event);
        },
        [this](const SnapshotMessage& m) {
            if (!integrator_.apply_snapshot(m.data)) return;
            bus_.emit(SnapshotApplied{.version = integrator_.version(),
                                      .elements = integrator_.state().snapshot()});
        },
        [this](const StateVectorMessage& m) {
            integrator_.observe_version(m.data.version);
            bus_.emit(StateVectorReceived{m.data});
        },
        [this](const CursorUpdate& m) {
            bus_.emit(CursorMoved{presence_.on_cursor_update(m)});
        },
        [this](const UserJoined& m) {
            bus_.emit(PeerJoined{presence_.on_user_joined(m)});
        },
        [this](const UserLeft& m) {
            presence_.on_user_left(m);
            bus_.emit(PeerLeft{.user_id = m.user_id, .username = m.username});
        },
        [this](const PresenceUpdate& m) {
            if (auto peer = presence_.on_presence_update(m)) {
                bus_.emit(PresenceChanged{.user_id = peer->user_id, .status = peer->status});
            }
        },
        [this](const Pong&) { bus_.emit(PongReceived{}); },
    }, msg);
}

}  // namespace canvas_sync
