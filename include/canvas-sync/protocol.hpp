/// @file protocol.hpp
/// @brief Wire protocol: client and server message types and the JSON codec.
///
/// Every frame is a JSON object. Client frames carry an `action` field,
/// server frames a `type` field. Decoding never throws: frames that fail
/// to parse, fail validation, or name an unknown action/type decode to
/// nullopt and are dropped by the caller.

#pragma once

#include <canvas-sync/operation.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace canvas_sync {

/// Server-assigned participant identifier.
using UserId = std::int64_t;

/// A point on the shared canvas.
struct Position {
    double x{0.0};
    double y{0.0};

    auto operator==(const Position&) const -> bool = default;
};

/// What a participant is currently doing.
enum class PresenceStatus : std::uint8_t {
    idle,
    editing,
    away,
};

/// Convert a PresenceStatus to its wire name.
constexpr auto to_string_view(PresenceStatus status) noexcept -> std::string_view {
    switch (status) {
        case PresenceStatus::idle:    return "idle";
        case PresenceStatus::editing: return "editing";
        case PresenceStatus::away:    return "away";
    }
    return "unknown";
}

/// Parse a wire name into a PresenceStatus, or nullopt if unknown.
auto parse_presence_status(std::string_view name) -> std::optional<PresenceStatus>;

// =============================================================================
// Client -> server
// =============================================================================

/// `crdt_op`: a single operation.
struct OpMessage {
    Operation op;
    auto operator==(const OpMessage&) const -> bool = default;
};

/// `crdt_batch`: operations flushed together, in issue order.
struct BatchMessage {
    std::vector<Operation> ops;
    auto operator==(const BatchMessage&) const -> bool = default;
};

/// `cursor_move`: the sender's pointer position.
struct CursorMove {
    Position position;
    auto operator==(const CursorMove&) const -> bool = default;
};

/// `snapshot_request`: ask for the full document state.
struct SnapshotRequest {
    auto operator==(const SnapshotRequest&) const -> bool = default;
};

/// `sync_request`: ask for the operations after a known version.
struct SyncRequest {
    std::uint64_t since_version{0};
    auto operator==(const SyncRequest&) const -> bool = default;
};

/// `presence_update`: the sender's status changed.
struct StatusUpdate {
    PresenceStatus status{PresenceStatus::idle};
    auto operator==(const StatusUpdate&) const -> bool = default;
};

/// `ping`: liveness check, answered by `pong`.
struct Ping {
    auto operator==(const Ping&) const -> bool = default;
};

/// Any frame a client sends.
using ClientMessage = std::variant<
    OpMessage,
    BatchMessage,
    CursorMove,
    SnapshotRequest,
    SyncRequest,
    StatusUpdate,
    Ping
>;

// =============================================================================
// Server -> client
// =============================================================================

/// `crdt_ops`: operations to merge, with the server's version after them.
struct OpsBroadcast {
    std::vector<Operation> ops;
    std::optional<std::uint64_t> version;  ///< Absent on frames that omit it.
    std::string origin;                    ///< Session that produced the ops (may be empty).
    auto operator==(const OpsBroadcast&) const -> bool = default;
};

/// Full document state with clocks, as carried by a `snapshot` frame.
struct SnapshotData {
    std::string document_id;
    std::uint64_t version{0};
    nlohmann::json elements = nlohmann::json::object();  ///< DocumentState::to_json() layout.
    auto operator==(const SnapshotData&) const -> bool = default;
};

/// `snapshot`: full document state.
struct SnapshotMessage {
    SnapshotData data;
    auto operator==(const SnapshotMessage&) const -> bool = default;
};

/// Summary of the server's document, used to detect drift.
struct StateVector {
    std::string document_id;
    std::uint64_t version{0};
    std::uint64_t element_count{0};
    std::string checksum;
    auto operator==(const StateVector&) const -> bool = default;
};

/// `state_vector`: the authoritative version.
struct StateVectorMessage {
    StateVector data;
    auto operator==(const StateVectorMessage&) const -> bool = default;
};

/// `cursor_update`: another participant moved their pointer.
struct CursorUpdate {
    UserId user_id{0};
    std::string username;
    Position position;
    auto operator==(const CursorUpdate&) const -> bool = default;
};

/// `user_joined`: a participant opened the document.
struct UserJoined {
    UserId user_id{0};
    std::string username;
    auto operator==(const UserJoined&) const -> bool = default;
};

/// `user_left`: a participant closed the document.
struct UserLeft {
    UserId user_id{0};
    std::string username;
    auto operator==(const UserLeft&) const -> bool = default;
};

/// `presence_update`: a participant's status changed.
struct PresenceUpdate {
    UserId user_id{0};
    std::string username;
    PresenceStatus status{PresenceStatus::idle};
    auto operator==(const PresenceUpdate&) const -> bool = default;
};

/// `pong`: reply to `ping`.
struct Pong {
    auto operator==(const Pong&) const -> bool = default;
};

/// Any frame a server sends.
using ServerMessage = std::variant<
    OpsBroadcast,
    SnapshotMessage,
    StateVectorMessage,
    CursorUpdate,
    UserJoined,
    UserLeft,
    PresenceUpdate,
    Pong
>;

// =============================================================================
// Codec
// =============================================================================

/// The `action` name of a client message.
auto action_name(const ClientMessage& msg) -> std::string_view;

/// The `type` name of a server message.
auto type_name(const ServerMessage& msg) -> std::string_view;

/// Encode a client message as a JSON text frame.
auto encode(const ClientMessage& msg) -> std::string;

/// Encode a server message as a JSON text frame.
auto encode(const ServerMessage& msg) -> std::string;

/// Decode a client frame, or nullopt if it is malformed or unknown.
auto decode_client_message(std::string_view frame) -> std::optional<ClientMessage>;

/// Decode a server frame, or nullopt if it is malformed or unknown.
auto decode_server_message(std::string_view frame) -> std::optional<ServerMessage>;

// -- JSON serialization (ADL) -------------------------------------------------

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, PresenceStatus status);
void from_json(const nlohmann::json& j, PresenceStatus& status);

void to_json(nlohmann::json& j, const SnapshotData& s);
void from_json(const nlohmann::json& j, SnapshotData& s);

void to_json(nlohmann::json& j, const StateVector& s);
void from_json(const nlohmann::json& j, StateVector& s);

}  // namespace canvas_sync
