#include <canvas-sync/protocol.hpp>

#include <canvas-sync/log.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace canvas_sync {

namespace {

auto optional_string(const nlohmann::json& j, const char* key) -> std::string {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw std::invalid_argument{std::string{"field '"} + key + "' must be a string"};
    }
    return it->get<std::string>();
}

auto optional_version(const nlohmann::json& j, const char* key) -> std::optional<std::uint64_t> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_unsigned()) {
        throw std::invalid_argument{std::string{"field '"} + key + "' must be a non-negative integer"};
    }
    return it->get<std::uint64_t>();
}

auto required_user_id(const nlohmann::json& j) -> UserId {
    auto it = j.find("user_id");
    if (it == j.end() || !it->is_number_integer()) {
        throw std::invalid_argument{"field 'user_id' must be an integer"};
    }
    return it->get<UserId>();
}

auto required_object(const nlohmann::json& j, const char* key) -> const nlohmann::json& {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        throw std::invalid_argument{std::string{"field '"} + key + "' must be an object"};
    }
    return *it;
}

auto required_ops(const nlohmann::json& j) -> std::vector<Operation> {
    auto it = j.find("ops");
    if (it == j.end() || !it->is_array()) {
        throw std::invalid_argument{"field 'ops' must be an array"};
    }
    auto ops = std::vector<Operation>{};
    ops.reserve(it->size());
    for (const auto& entry : *it) {
        ops.push_back(entry.get<Operation>());
    }
    return ops;
}

auto required_status(const nlohmann::json& j) -> PresenceStatus {
    auto it = j.find("status");
    if (it == j.end()) throw std::invalid_argument{"field 'status' is missing"};
    return it->get<PresenceStatus>();
}

// Parse the frame into a JSON object, or nullopt if it is not one.
auto parse_object(std::string_view frame) -> std::optional<nlohmann::json> {
    auto j = nlohmann::json::parse(frame, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

auto client_from_json(const nlohmann::json& j) -> std::optional<ClientMessage> {
    const auto action = optional_string(j, "action");
    if (action == "crdt_op") {
        return OpMessage{required_object(j, "op").get<Operation>()};
    }
    if (action == "crdt_batch") {
        return BatchMessage{required_ops(j)};
    }
    if (action == "cursor_move") {
        auto it = j.find("position");
        auto position = (it == j.end() || it->is_null()) ? Position{} : it->get<Position>();
        return CursorMove{position};
    }
    if (action == "snapshot_request") {
        return SnapshotRequest{};
    }
    if (action == "sync_request") {
        return SyncRequest{optional_version(j, "since_version").value_or(0)};
    }
    if (action == "presence_update") {
        auto it = j.find("status");
        auto status = (it == j.end() || it->is_null()) ? PresenceStatus::idle
                                                       : it->get<PresenceStatus>();
        return StatusUpdate{status};
    }
    if (action == "ping") {
        return Ping{};
    }
    return std::nullopt;
}

auto server_from_json(const nlohmann::json& j) -> std::optional<ServerMessage> {
    const auto type = optional_string(j, "type");
    if (type == "crdt_ops") {
        return OpsBroadcast{
            .ops = required_ops(j),
            .version = optional_version(j, "version"),
            .origin = optional_string(j, "origin"),
        };
    }
    if (type == "snapshot") {
        return SnapshotMessage{required_object(j, "data").get<SnapshotData>()};
    }
    if (type == "state_vector") {
        return StateVectorMessage{required_object(j, "data").get<StateVector>()};
    }
    if (type == "cursor_update") {
        return CursorUpdate{
            .user_id = required_user_id(j),
            .username = optional_string(j, "username"),
            .position = required_object(j, "position").get<Position>(),
        };
    }
    if (type == "user_joined") {
        return UserJoined{required_user_id(j), optional_string(j, "username")};
    }
    if (type == "user_left") {
        return UserLeft{required_user_id(j), optional_string(j, "username")};
    }
    if (type == "presence_update") {
        return PresenceUpdate{
            .user_id = required_user_id(j),
            .username = optional_string(j, "username"),
            .status = required_status(j),
        };
    }
    if (type == "pong") {
        return Pong{};
    }
    return std::nullopt;
}

}  // anonymous namespace

auto parse_presence_status(std::string_view name) -> std::optional<PresenceStatus> {
    if (name == "idle")    return PresenceStatus::idle;
    if (name == "editing") return PresenceStatus::editing;
    if (name == "away")    return PresenceStatus::away;
    return std::nullopt;
}

// =============================================================================
// Names
// =============================================================================

auto action_name(const ClientMessage& msg) -> std::string_view {
    return std::visit(overload{
        [](const OpMessage&) -> std::string_view { return "crdt_op"; },
        [](const BatchMessage&) -> std::string_view { return "crdt_batch"; },
        [](const CursorMove&) -> std::string_view { return "cursor_move"; },
        [](const SnapshotRequest&) -> std::string_view { return "snapshot_request"; },
        [](const SyncRequest&) -> std::string_view { return "sync_request"; },
        [](const StatusUpdate&) -> std::string_view { return "presence_update"; },
        [](const Ping&) -> std::string_view { return "ping"; },
    }, msg);
}

auto type_name(const ServerMessage& msg) -> std::string_view {
    return std::visit(overload{
        [](const OpsBroadcast&) -> std::string_view { return "crdt_ops"; },
        [](const SnapshotMessage&) -> std::string_view { return "snapshot"; },
        [](const StateVectorMessage&) -> std::string_view { return "state_vector"; },
        [](const CursorUpdate&) -> std::string_view { return "cursor_update"; },
        [](const UserJoined&) -> std::string_view { return "user_joined"; },
        [](const UserLeft&) -> std::string_view { return "user_left"; },
        [](const PresenceUpdate&) -> std::string_view { return "presence_update"; },
        [](const Pong&) -> std::string_view { return "pong"; },
    }, msg);
}

// =============================================================================
// Encoding
// =============================================================================

auto encode(const ClientMessage& msg) -> std::string {
    auto j = nlohmann::json{{"action", std::string{action_name(msg)}}};
    std::visit(overload{
        [&](const OpMessage& m) { j["op"] = m.op; },
        [&](const BatchMessage& m) { j["ops"] = m.ops; },
        [&](const CursorMove& m) { j["position"] = m.position; },
        [&](const SnapshotRequest&) {},
        [&](const SyncRequest& m) { j["since_version"] = m.since_version; },
        [&](const StatusUpdate& m) { j["status"] = m.status; },
        [&](const Ping&) {},
    }, msg);
    return j.dump();
}

auto encode(const ServerMessage& msg) -> std::string {
    auto j = nlohmann::json{{"type", std::string{type_name(msg)}}};
    std::visit(overload{
        [&](const OpsBroadcast& m) {
            j["ops"] = m.ops;
            if (m.version) j["version"] = *m.version;
            j["origin"] = m.origin;
        },
        [&](const SnapshotMessage& m) { j["data"] = m.data; },
        [&](const StateVectorMessage& m) { j["data"] = m.data; },
        [&](const CursorUpdate& m) {
            j["user_id"] = m.user_id;
            j["username"] = m.username;
            j["position"] = m.position;
        },
        [&](const UserJoined& m) {
            j["user_id"] = m.user_id;
            j["username"] = m.username;
        },
        [&](const UserLeft& m) {
            j["user_id"] = m.user_id;
            j["username"] = m.username;
        },
        [&](const PresenceUpdate& m) {
            j["user_id"] = m.user_id;
            j["username"] = m.username;
            j["status"] = m.status;
        },
        [&](const Pong&) {},
    }, msg);
    // Usernames come from the upgrade URL and may hold any bytes; invalid
    // UTF-8 becomes U+FFFD instead of failing the whole frame.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// =============================================================================
// Decoding
// =============================================================================

auto decode_client_message(std::string_view frame) -> std::optional<ClientMessage> {
    auto j = parse_object(frame);
    if (!j) {
        logger("protocol")->debug("dropping unparseable client frame ({} bytes)", frame.size());
        return std::nullopt;
    }
    try {
        return client_from_json(*j);
    } catch (const std::exception& e) {
        logger("protocol")->debug("dropping invalid client frame: {}", e.what());
        return std::nullopt;
    }
}

auto decode_server_message(std::string_view frame) -> std::optional<ServerMessage> {
    auto j = parse_object(frame);
    if (!j) {
        logger("protocol")->debug("dropping unparseable server frame ({} bytes)", frame.size());
        return std::nullopt;
    }
    try {
        return server_from_json(*j);
    } catch (const std::exception& e) {
        logger("protocol")->debug("dropping invalid server frame: {}", e.what());
        return std::nullopt;
    }
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json{{"x", p.x}, {"y", p.y}};
}

void from_json(const nlohmann::json& j, Position& p) {
    if (!j.is_object()) throw std::invalid_argument{"position must be an object"};
    p = Position{};
    for (auto [key, out] : {std::pair{"x", &p.x}, std::pair{"y", &p.y}}) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (!it->is_number()) {
            throw std::invalid_argument{std::string{"position."} + key + " must be a number"};
        }
        *out = it->get<double>();
    }
}

void to_json(nlohmann::json& j, PresenceStatus status) {
    j = std::string{to_string_view(status)};
}

void from_json(const nlohmann::json& j, PresenceStatus& status) {
    if (!j.is_string()) throw std::invalid_argument{"status must be a string"};
    auto parsed = parse_presence_status(j.get_ref<const std::string&>());
    if (!parsed) throw std::invalid_argument{"unknown status: " + j.get<std::string>()};
    status = *parsed;
}

void to_json(nlohmann::json& j, const SnapshotData& s) {
    j = nlohmann::json{
        {"document_id", s.document_id},
        {"version", s.version},
        {"elements", s.elements},
    };
}

void from_json(const nlohmann::json& j, SnapshotData& s) {
    if (!j.is_object()) throw std::invalid_argument{"snapshot data must be an object"};
    s = SnapshotData{};
    s.document_id = optional_string(j, "document_id");
    s.version = optional_version(j, "version").value_or(0);
    s.elements = required_object(j, "elements");
}

void to_json(nlohmann::json& j, const StateVector& s) {
    j = nlohmann::json{
        {"document_id", s.document_id},
        {"version", s.version},
        {"element_count", s.element_count},
        {"checksum", s.checksum},
    };
}

void from_json(const nlohmann::json& j, StateVector& s) {
    if (!j.is_object()) throw std::invalid_argument{"state vector must be an object"};
    s = StateVector{};
    s.document_id = optional_string(j, "document_id");
    s.version = optional_version(j, "version").value_or(0);
    s.element_count = optional_version(j, "element_count").value_or(0);
    s.checksum = optional_string(j, "checksum");
}

}  // namespace canvas_sync
