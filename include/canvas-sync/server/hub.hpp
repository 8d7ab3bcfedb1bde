/// @file hub.hpp
/// @brief Socket-independent server logic: sessions, rooms and the
///        authoritative merge of client operations.

#pragma once

#include <canvas-sync/clock.hpp>
#include <canvas-sync/operation.hpp>
#include <canvas-sync/protocol.hpp>
#include <canvas-sync/server/document_store.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_sync::server {

/// A connected client, as seen by the hub.
class Peer {
public:
    virtual ~Peer() = default;

    /// Queue a text frame for the client. Must not call back into the hub.
    virtual void send(std::string frame) = 0;
};

/// Identity of one connection.
struct SessionInfo {
    std::string session_id;   ///< Random per connection; the node id of its server clock.
    UserId user_id{0};        ///< Assigned in connection order, starting at 1.
    std::string username;
    std::string document_id;

    auto operator==(const SessionInfo&) const -> bool = default;
};

/// What an upgrade request target asks for.
struct RoomTarget {
    std::string document_id;
    std::string username;  ///< From the `user` query parameter; may be empty.

    auto operator==(const RoomTarget&) const -> bool = default;
};

/// Parse `/ws/project/<id>/crdt/` or `/project/<id>/crdt/` (trailing slash
/// optional, query allowed). Nullopt for any other path.
auto parse_room_target(std::string_view target) -> std::optional<RoomTarget>;

/// Routes client frames for every open document.
///
/// Each connection joins the room of one document. Operations from a
/// session are re-stamped with that session's own hybrid clock, merged
/// into the authoritative document, and the ones that changed it are
/// broadcast to the whole room (the sender included, as its
/// acknowledgement). Cursor and presence frames go to the other members.
///
/// Peers are referenced, not owned: call leave() before a peer is destroyed.
class Hub {
public:
    explicit Hub(DocumentStore& store, WallClock wall = system_wall_clock());

    Hub(const Hub&) = delete;
    auto operator=(const Hub&) -> Hub& = delete;

    /// Open a session: the peer receives `snapshot` then `state_vector`,
    /// and the rest of the room receives `user_joined`.
    /// @param username Display name; empty means `guest-<user_id>`.
    auto join(std::string_view document_id, std::string_view username, Peer& peer) -> SessionInfo;

    /// Close a session and tell the rest of the room with `user_left`.
    /// Unknown ids are ignored.
    void leave(std::string_view session_id);

    /// Handle one client frame. Malformed frames and unknown actions are ignored.
    void receive(std::string_view session_id, std::string_view frame);

    auto session(std::string_view session_id) const -> std::optional<SessionInfo>;
    auto session_count() const -> std::size_t { return sessions_.size(); }

    /// Session ids in a room, in join order.
    auto room_members(std::string_view document_id) const -> std::vector<std::string>;

    auto store() -> DocumentStore& { return store_; }

    /// When set, a document is removed from the store as soon as its room
    /// empties. Off by default: documents live as long as the server.
    void set_release_idle_documents(bool release) { release_idle_documents_ = release; }

private:
    struct Session {
        SessionInfo info;
        Peer* peer;
        HybridClock clock;
    };

    void handle(Session& session, const ClientMessage& msg);
    void integrate(Session& session, std::vector<Operation> ops);
    void send(Session& session, const ServerMessage& msg);
    void broadcast(std::string_view document_id, const ServerMessage& msg,
                   const Session* except = nullptr);

    DocumentStore& store_;
    WallClock wall_;
    bool release_idle_documents_{false};
    std::map<std::string, Session, std::less<>> sessions_;
    std::map<std::string, std::vector<std::string>, std::less<>> rooms_;
    UserId next_user_id_{1};
};

}  // namespace canvas_sync::server
