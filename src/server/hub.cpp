#include <canvas-sync/server/hub.hpp>

#include <canvas-sync/config.hpp>
#include <canvas-sync/log.hpp>
#include <canvas-sync/url.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <variant>

namespace canvas_sync::server {

namespace {

auto split_path(std::string_view path) -> std::vector<std::string_view> {
    auto segments = std::vector<std::string_view>{};
    while (!path.empty()) {
        const auto slash = path.find('/');
        const auto segment = path.substr(0, slash);
        if (!segment.empty()) segments.push_back(segment);
        if (slash == std::string_view::npos) break;
        path.remove_prefix(slash + 1);
    }
    return segments;
}

}  // namespace

auto parse_room_target(std::string_view target) -> std::optional<RoomTarget> {
    auto segments = split_path(target_path(target));
    if (!segments.empty() && segments.front() == "ws") segments.erase(segments.begin());
    if (segments.size() != 3 || segments[0] != "project" || segments[2] != "crdt") {
        return std::nullopt;
    }
    return RoomTarget{
        .document_id = std::string{segments[1]},
        .username = query_parameter(target, "user").value_or(std::string{}),
    };
}

Hub::Hub(DocumentStore& store, WallClock wall) : store_{store}, wall_{std::move(wall)} {}

auto Hub::join(std::string_view document_id, std::string_view username, Peer& peer) -> SessionInfo {
    const auto user_id = next_user_id_++;
    auto info = SessionInfo{
        .session_id = generate_node_id(),
        .user_id = user_id,
        .username = username.empty() ? "guest-" + std::to_string(user_id) : std::string{username},
        .document_id = std::string{document_id},
    };

    auto& doc = store_.open(document_id);
    auto [it, inserted] = sessions_.emplace(
        info.session_id, Session{.info = info, .peer = &peer, .clock = HybridClock{info.session_id, wall_}});
    auto& session = it->second;
    rooms_[info.document_id].push_back(info.session_id);

    logger("server")->info("session {} opened for document {} by {} (user {})",
                           info.session_id, info.document_id, info.username, info.user_id);

    send(session, SnapshotMessage{doc.snapshot()});
    send(session, StateVectorMessage{doc.state_vector()});
    broadcast(info.document_id, UserJoined{.user_id = info.user_id, .username = info.username},
              &session);
    return info;
}

void Hub::leave(std::string_view session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return;
    const auto info = it->second.info;
    sessions_.erase(it);

    if (auto room = rooms_.find(info.document_id); room != rooms_.end()) {
        std::erase(room->second, info.session_id);
        if (room->second.empty()) {
            rooms_.erase(room);
            if (release_idle_documents_ && store_.remove(info.document_id)) {
                logger("server")->info("document {} released, no sessions left", info.document_id);
            }
        }
    }

    logger("server")->info("session {} closed ({} on document {})",
                           info.session_id, info.username, info.document_id);
    broadcast(info.document_id, UserLeft{.user_id = info.user_id, .username = info.username});
}

void Hub::receive(std::string_view session_id, std::string_view frame) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        logger("server")->warn("frame for unknown session {}", session_id);
        return;
    }
    auto msg = decode_client_message(frame);
    if (!msg) return;
    handle(it->second, *msg);
}

auto Hub::session(std::string_view session_id) const -> std::optional<SessionInfo> {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.info;
}

auto Hub::room_members(std::string_view document_id) const -> std::vector<std::string> {
    auto it = rooms_.find(document_id);
    return it == rooms_.end() ? std::vector<std::string>{} : it->second;
}

// -- Message handling ---------------------------------------------------------

void Hub::handle(Session& session, const ClientMessage& msg) {
    auto& doc = store_.open(session.info.document_id);
    std::visit(overload{
        [&](const OpMessage& m) { integrate(session, {m.op}); },
        [&](const BatchMessage& m) { integrate(session, m.ops); },
        [&](const CursorMove& m) {
            broadcast(session.info.document_id,
                      CursorUpdate{.user_id = session.info.user_id,
                                   .username = session.info.username,
                                   .position = m.position},
                      &session);
        },
        [&](const SnapshotRequest&) { send(session, SnapshotMessage{doc.snapshot()}); },
        [&](const SyncRequest& m) {
            if (m.since_version > doc.version()) {
                logger("server")->warn("session {} asked for ops since {} but document {} is at {}; "
                                       "sending a snapshot",
                                       session.info.session_id, m.since_version,
                                       session.info.document_id, doc.version());
                send(session, SnapshotMessage{doc.snapshot()});
                return;
            }
            send(session, OpsBroadcast{.ops = doc.ops_since(m.since_version),
                                       .version = doc.version(),
                                       .origin = {}});
        },
        [&](const StatusUpdate& m) {
            broadcast(session.info.document_id,
                      PresenceUpdate{.user_id = session.info.user_id,
                                     .username = session.info.username,
                                     .status = m.status},
                      &session);
        },
        [&](const Ping&) { send(session, Pong{}); },
    }, msg);
}

void Hub::integrate(Session& session, std::vector<Operation> ops) {
    for (auto& op : ops) {
        op.origin = session.info.session_id;
        session.clock.merge(op.clock);
        op.clock = session.clock.tick();
    }

    auto& doc = store_.open(session.info.document_id);
    auto applied = doc.apply(ops);
    logger("server")->debug("session {}: {} of {} operations applied, document {} at version {}",
                            session.info.session_id, applied.size(), ops.size(),
                            session.info.document_id, doc.version());
    if (applied.empty()) return;

    broadcast(session.info.document_id,
              OpsBroadcast{.ops = std::move(applied),
                           .version = doc.version(),
                           .origin = session.info.session_id});
}

void Hub::send(Session& session, const ServerMessage& msg) {
    session.peer->send(encode(msg));
}

void Hub::broadcast(std::string_view document_id, const ServerMessage& msg, const Session* except) {
    auto room = rooms_.find(document_id);
    if (room == rooms_.end()) return;

    const auto frame = encode(msg);
    for (const auto& member : room->second) {
        auto it = sessions_.find(member);
        if (it == sessions_.end() || &it->second == except) continue;
        it->second.peer->send(frame);
    }
}

}  // namespace canvas_sync::server
