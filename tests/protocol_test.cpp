#include <canvas-sync/protocol.hpp>

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

using namespace canvas_sync;
using json = nlohmann::json;

namespace {

auto sample_op() -> Operation {
    return make_set("e1", "x", 10, ClockValue{.physical = 100, .logical = 1, .node_id = "nodeA"});
}

}  // namespace

// -- Names --------------------------------------------------------------------

TEST(Protocol, action_names_match_wire) {
    EXPECT_EQ(action_name(OpMessage{}), "crdt_op");
    EXPECT_EQ(action_name(BatchMessage{}), "crdt_batch");
    EXPECT_EQ(action_name(CursorMove{}), "cursor_move");
    EXPECT_EQ(action_name(SnapshotRequest{}), "snapshot_request");
    EXPECT_EQ(action_name(SyncRequest{}), "sync_request");
    EXPECT_EQ(action_name(StatusUpdate{}), "presence_update");
    EXPECT_EQ(action_name(Ping{}), "ping");
}

TEST(Protocol, type_names_match_wire) {
    EXPECT_EQ(type_name(OpsBroadcast{}), "crdt_ops");
    EXPECT_EQ(type_name(SnapshotMessage{}), "snapshot");
    EXPECT_EQ(type_name(StateVectorMessage{}), "state_vector");
    EXPECT_EQ(type_name(CursorUpdate{}), "cursor_update");
    EXPECT_EQ(type_name(UserJoined{}), "user_joined");
    EXPECT_EQ(type_name(UserLeft{}), "user_left");
    EXPECT_EQ(type_name(PresenceUpdate{}), "presence_update");
    EXPECT_EQ(type_name(Pong{}), "pong");
}

TEST(PresenceStatus, names_round_trip) {
    for (auto status : {PresenceStatus::idle, PresenceStatus::editing, PresenceStatus::away}) {
        EXPECT_EQ(parse_presence_status(to_string_view(status)), status);
    }
    EXPECT_FALSE(parse_presence_status("busy").has_value());
}

// -- Client frames ------------------------------------------------------------

TEST(ClientFrames, op_frame_layout) {
    const auto j = json::parse(encode(ClientMessage{OpMessage{sample_op()}}));
    EXPECT_EQ(j["action"], "crdt_op");
    EXPECT_EQ(j["op"]["element_id"], "e1");
    EXPECT_EQ(j["op"]["clock"]["node_id"], "nodeA");
}

TEST(ClientFrames, batch_preserves_order) {
    const auto first = sample_op();
    auto second = first;
    second.value = 20;
    second.clock.logical = 2;

    const auto frame = encode(ClientMessage{BatchMessage{{first, second}}});
    const auto decoded = decode_client_message(frame);
    ASSERT_TRUE(decoded.has_value());
    const auto* batch = std::get_if<BatchMessage>(&*decoded);
    ASSERT_NE(batch, nullptr);
    ASSERT_EQ(batch->ops.size(), 2u);
    EXPECT_EQ(batch->ops[0].value, 10);
    EXPECT_EQ(batch->ops[1].value, 20);
}

TEST(ClientFrames, every_action_decodes_to_itself) {
    const auto messages = std::vector<ClientMessage>{
        OpMessage{sample_op()},
        BatchMessage{{sample_op()}},
        CursorMove{Position{.x = 12.5, .y = -3.0}},
        SnapshotRequest{},
        SyncRequest{42},
        StatusUpdate{PresenceStatus::away},
        Ping{},
    };
    for (const auto& msg : messages) {
        const auto decoded = decode_client_message(encode(msg));
        ASSERT_TRUE(decoded.has_value()) << action_name(msg);
        EXPECT_EQ(*decoded, msg) << action_name(msg);
    }
}

TEST(ClientFrames, optional_fields_take_defaults) {
    const auto sync = decode_client_message(R"({"action": "sync_request"})");
    ASSERT_TRUE(sync.has_value());
    EXPECT_EQ(std::get<SyncRequest>(*sync).since_version, 0u);

    const auto cursor = decode_client_message(R"({"action": "cursor_move"})");
    ASSERT_TRUE(cursor.has_value());
    EXPECT_EQ(std::get<CursorMove>(*cursor).position, Position{});

    const auto status = decode_client_message(R"({"action": "presence_update"})");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(std::get<StatusUpdate>(*status).status, PresenceStatus::idle);
}

TEST(ClientFrames, malformed_frames_are_dropped) {
    EXPECT_FALSE(decode_client_message("").has_value());
    EXPECT_FALSE(decode_client_message("{not json").has_value());
    EXPECT_FALSE(decode_client_message("[1, 2, 3]").has_value());
    EXPECT_FALSE(decode_client_message(R"({"action": "teleport"})").has_value());
    EXPECT_FALSE(decode_client_message(R"({"action": 5})").has_value());
    EXPECT_FALSE(decode_client_message(R"({"action": "crdt_op"})").has_value());
    EXPECT_FALSE(decode_client_message(R"({"action": "crdt_batch", "ops": {}})").has_value());
    EXPECT_FALSE(decode_client_message(R"({"action": "presence_update", "status": "busy"})").has_value());
    EXPECT_FALSE(decode_client_message(R"({"action": "sync_request", "since_version": -1})").has_value());
    EXPECT_FALSE(decode_client_message(R"({"action": "cursor_move", "position": {"x": "left"}})").has_value());
}

// -- Server frames ------------------------------------------------------------

TEST(ServerFrames, ops_broadcast_layout) {
    const auto frame = encode(ServerMessage{OpsBroadcast{{sample_op()}, 7, "session-1"}});
    const auto j = json::parse(frame);
    EXPECT_EQ(j["type"], "crdt_ops");
    EXPECT_EQ(j["version"], 7);
    EXPECT_EQ(j["origin"], "session-1");
    EXPECT_EQ(j["ops"].size(), 1u);
}

TEST(ServerFrames, ops_broadcast_version_is_optional) {
    const auto decoded = decode_server_message(R"({"type": "crdt_ops", "ops": []})");
    ASSERT_TRUE(decoded.has_value());
    const auto& ops = std::get<OpsBroadcast>(*decoded);
    EXPECT_TRUE(ops.ops.empty());
    EXPECT_FALSE(ops.version.has_value());
    EXPECT_TRUE(ops.origin.empty());
}

TEST(ServerFrames, every_type_decodes_to_itself) {
    const auto messages = std::vector<ServerMessage>{
        OpsBroadcast{{sample_op()}, 3, "s"},
        SnapshotMessage{SnapshotData{.document_id = "doc", .version = 3, .elements = {{"e1", json::object()}}}},
        StateVectorMessage{StateVector{.document_id = "doc", .version = 3, .element_count = 1, .checksum = "abc"}},
        CursorUpdate{.user_id = 5, .username = "guest-5", .position = {.x = 1.0, .y = 2.0}},
        UserJoined{5, "guest-5"},
        UserLeft{5, "guest-5"},
        PresenceUpdate{.user_id = 5, .username = "guest-5", .status = PresenceStatus::editing},
        Pong{},
    };
    for (const auto& msg : messages) {
        const auto decoded = decode_server_message(encode(msg));
        ASSERT_TRUE(decoded.has_value()) << type_name(msg);
        EXPECT_EQ(*decoded, msg) << type_name(msg);
    }
}

TEST(ServerFrames, malformed_frames_are_dropped) {
    EXPECT_FALSE(decode_server_message("null").has_value());
    EXPECT_FALSE(decode_server_message(R"({"ops": []})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "earthquake"})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "crdt_ops"})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "crdt_ops", "ops": [{"op_type": "move"}]})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "snapshot", "data": []})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "snapshot", "data": {"version": 1}})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "user_joined", "user_id": "five"})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "presence_update", "user_id": 5})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "cursor_update", "user_id": 5})").has_value());
}

TEST(ServerFrames, clocks_that_would_wrap_are_dropped) {
    EXPECT_FALSE(decode_server_message(
        R"({"type": "crdt_ops", "ops": [{"op_type": "set", "element_id": "e1", "prop": "x", "value": 1,)"
        R"( "clock": {"physical": 5000, "logical": 18446744073709551615, "node_id": "evil"}}]})").has_value());
    EXPECT_FALSE(decode_server_message(
        R"({"type": "crdt_ops", "ops": [{"op_type": "set", "element_id": "e1", "prop": "x", "value": 1,)"
        R"( "clock": {"physical": 18446744073709551615, "logical": 0, "node_id": "evil"}}]})").has_value());
}

TEST(ServerFrames, invalid_utf8_text_is_replaced_not_thrown) {
    auto frame = std::string{};
    ASSERT_NO_THROW(frame = encode(ServerMessage{UserJoined{7, "\xFF"}}));
    const auto decoded = decode_server_message(frame);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<UserJoined>(*decoded).username, "\xEF\xBF\xBD");
}
