#include <canvas-sync/server/document_store.hpp>
#include <canvas-sync/server/hub.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace canvas_sync;
using namespace canvas_sync::server;
using canvas_sync::testing::fixed_wall;
using json = nlohmann::json;

namespace {

class RecordingPeer : public Peer {
public:
    void send(std::string frame) override { frames.push_back(std::move(frame)); }

    auto types() const -> std::vector<std::string> {
        auto result = std::vector<std::string>{};
        for (const auto& f : frames) result.push_back(json::parse(f)["type"].get<std::string>());
        return result;
    }

    auto last() const -> json { return json::parse(frames.back()); }

    std::vector<std::string> frames;
};

auto client_op(std::string element_id, std::string prop, Value value, std::int64_t physical,
               std::string node) -> std::string {
    return encode(ClientMessage{OpMessage{make_set(
        std::move(element_id), std::move(prop), std::move(value),
        ClockValue{.physical = physical, .logical = 0, .node_id = std::move(node)})}});
}

struct HubFixture : ::testing::Test {
    DocumentStore store;
    Hub hub{store, fixed_wall(1000)};
    RecordingPeer alice;
    RecordingPeer bob;
};

}  // namespace

// -- Room targets -------------------------------------------------------------

TEST(RoomTarget, accepts_document_paths) {
    EXPECT_EQ(parse_room_target("/ws/project/p1/crdt/"), (RoomTarget{"p1", ""}));
    EXPECT_EQ(parse_room_target("/ws/project/p1/crdt"), (RoomTarget{"p1", ""}));
    EXPECT_EQ(parse_room_target("/project/p2/crdt/"), (RoomTarget{"p2", ""}));
    EXPECT_EQ(parse_room_target("/ws/project/p1/crdt/?user=ann%20b"), (RoomTarget{"p1", "ann b"}));
}

TEST(RoomTarget, rejects_other_paths) {
    EXPECT_FALSE(parse_room_target("/").has_value());
    EXPECT_FALSE(parse_room_target("/ws/project/p1").has_value());
    EXPECT_FALSE(parse_room_target("/ws/project/p1/chat/").has_value());
    EXPECT_FALSE(parse_room_target("/ws/project//crdt/").has_value());
    EXPECT_FALSE(parse_room_target("/api/project/p1/crdt/").has_value());
}

// -- Join and leave -----------------------------------------------------------

TEST_F(HubFixture, join_sends_snapshot_then_state_vector) {
    const auto info = hub.join("doc", "alice", alice);
    EXPECT_EQ(info.user_id, 1);
    EXPECT_EQ(info.username, "alice");
    EXPECT_EQ(info.document_id, "doc");
    EXPECT_FALSE(info.session_id.empty());

    EXPECT_EQ(alice.types(), (std::vector<std::string>{"snapshot", "state_vector"}));
    const auto snapshot = json::parse(alice.frames[0]);
    EXPECT_EQ(snapshot["data"]["document_id"], "doc");
    EXPECT_EQ(snapshot["data"]["version"], 0);
    EXPECT_EQ(snapshot["data"]["elements"], json::object());

    const auto vector = json::parse(alice.frames[1]);
    EXPECT_EQ(vector["data"]["element_count"], 0);
    EXPECT_EQ(vector["data"]["checksum"], content_checksum(json::object()));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(HubFixture, others_hear_about_joins_and_leaves) {
    const auto a = hub.join("doc", "alice", alice);
    const auto b = hub.join("doc", "", bob);
    EXPECT_EQ(b.user_id, 2);
    EXPECT_EQ(b.username, "guest-2");

    EXPECT_EQ(alice.types().back(), "user_joined");
    EXPECT_EQ(alice.last()["user_id"], 2);
    EXPECT_EQ(alice.last()["username"], "guest-2");
    EXPECT_EQ(bob.types(), (std::vector<std::string>{"snapshot", "state_vector"}));

    EXPECT_EQ(hub.room_members("doc"), (std::vector<std::string>{a.session_id, b.session_id}));

    hub.leave(b.session_id);
    EXPECT_EQ(alice.types().back(), "user_left");
    EXPECT_EQ(alice.last()["user_id"], 2);
    EXPECT_EQ(hub.session_count(), 1u);
    EXPECT_FALSE(hub.session(b.session_id).has_value());

    hub.leave(b.session_id);  // unknown now: ignored
    hub.leave(a.session_id);
    EXPECT_TRUE(hub.room_members("doc").empty());
}

TEST_F(HubFixture, username_with_invalid_utf8_is_still_announced) {
    const auto target = parse_room_target("/ws/project/doc/crdt/?user=%FF");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->username, "\xFF");

    hub.join("doc", "alice", alice);
    auto info = SessionInfo{};
    ASSERT_NO_THROW(info = hub.join(target->document_id, target->username, bob));
    EXPECT_EQ(hub.session_count(), 2u);
    EXPECT_EQ(alice.types().back(), "user_joined");
    EXPECT_EQ(alice.last()["username"], "\xEF\xBF\xBD");

    hub.receive(info.session_id, R"({"action": "cursor_move", "position": {"x": 1, "y": 2}})");
    EXPECT_EQ(alice.types().back(), "cursor_update");
    ASSERT_NO_THROW(hub.leave(info.session_id));
    EXPECT_EQ(alice.types().back(), "user_left");
}

TEST_F(HubFixture, idle_documents_are_kept_by_default) {
    const auto a = hub.join("doc", "alice", alice);
    hub.receive(a.session_id, client_op("e1", "x", 1, 500, "A"));
    hub.leave(a.session_id);
    ASSERT_NE(store.find("doc"), nullptr);
    EXPECT_EQ(store.find("doc")->version(), 1u);
}

TEST_F(HubFixture, idle_documents_are_released_when_enabled) {
    hub.set_release_idle_documents(true);
    const auto a = hub.join("doc", "alice", alice);
    const auto b = hub.join("doc", "bob", bob);
    hub.receive(a.session_id, client_op("e1", "x", 1, 500, "A"));

    hub.leave(a.session_id);
    EXPECT_NE(store.find("doc"), nullptr);
    hub.leave(b.session_id);
    EXPECT_EQ(store.find("doc"), nullptr);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(HubFixture, rooms_are_isolated) {
    const auto a = hub.join("doc-1", "alice", alice);
    hub.join("doc-2", "bob", bob);
    const auto bob_frames = bob.frames.size();

    hub.receive(a.session_id, client_op("e1", "x", 1, 1, "alice-node"));
    EXPECT_EQ(bob.frames.size(), bob_frames);
    EXPECT_EQ(store.find("doc-1")->version(), 1u);
    EXPECT_EQ(store.find("doc-2")->version(), 0u);
}

// -- Operations ---------------------------------------------------------------

TEST_F(HubFixture, ops_are_restamped_and_broadcast_to_everyone) {
    const auto a = hub.join("doc", "alice", alice);
    hub.join("doc", "bob", bob);

    hub.receive(a.session_id, client_op("e1", "x", 10, 500, "alice-node"));

    ASSERT_EQ(alice.types().back(), "crdt_ops");
    ASSERT_EQ(bob.types().back(), "crdt_ops");
    const auto frame = bob.last();
    EXPECT_EQ(frame, alice.last());
    EXPECT_EQ(frame["version"], 1);
    EXPECT_EQ(frame["origin"], a.session_id);
    ASSERT_EQ(frame["ops"].size(), 1u);

    const auto op = frame["ops"][0].get<Operation>();
    EXPECT_EQ(op.origin, a.session_id);
    EXPECT_EQ(op.clock.node_id, a.session_id);
    EXPECT_GT(op.clock, (ClockValue{.physical = 500, .logical = 0, .node_id = "alice-node"}));
}

TEST_F(HubFixture, restamp_dominates_client_clock_from_the_future) {
    const auto a = hub.join("doc", "alice", alice);
    hub.receive(a.session_id, client_op("e1", "x", 1, 99999, "fast-clock"));
    const auto op = alice.last()["ops"][0].get<Operation>();
    EXPECT_EQ(op.clock.physical, 99999);
    EXPECT_EQ(op.clock.logical, 2u);
}

TEST_F(HubFixture, later_write_from_any_session_wins) {
    const auto a = hub.join("doc", "alice", alice);
    const auto b = hub.join("doc", "bob", bob);

    hub.receive(a.session_id, client_op("e1", "fill", "red", 1, "a"));
    hub.receive(b.session_id, client_op("e1", "fill", "blue", 5000, "b"));

    const auto& state = store.find("doc")->state();
    EXPECT_EQ(state.get("e1", "fill"), json("blue"));
    EXPECT_EQ(store.find("doc")->version(), 2u);
}

TEST_F(HubFixture, batch_is_applied_in_order) {
    const auto a = hub.join("doc", "alice", alice);
    const auto clock = [](std::uint64_t logical) {
        return ClockValue{.physical = 10, .logical = logical, .node_id = "a"};
    };
    hub.receive(a.session_id, encode(ClientMessage{BatchMessage{{
        make_add_element("e1", {{"x", 1}}, clock(0)),
        make_set("e1", "x", 2, clock(1)),
        make_set("e1", "y", 3, clock(2)),
    }}}));

    const auto frame = alice.last();
    EXPECT_EQ(frame["type"], "crdt_ops");
    EXPECT_EQ(frame["ops"].size(), 3u);
    EXPECT_EQ(frame["version"], 3);
    EXPECT_EQ(store.find("doc")->state().snapshot(), (json{{"e1", {{"x", 2}, {"y", 3}}}}));
}

TEST_F(HubFixture, malformed_frames_are_ignored) {
    const auto a = hub.join("doc", "alice", alice);
    const auto before = alice.frames.size();
    hub.receive(a.session_id, "{{{");
    hub.receive(a.session_id, R"({"action": "explode"})");
    hub.receive("no-such-session", R"({"action": "ping"})");
    EXPECT_EQ(alice.frames.size(), before);
}

// -- Requests -----------------------------------------------------------------

TEST_F(HubFixture, sync_request_returns_ops_after_version) {
    const auto a = hub.join("doc", "alice", alice);
    hub.receive(a.session_id, client_op("e1", "x", 1, 1, "a"));
    hub.receive(a.session_id, client_op("e1", "y", 2, 2, "a"));
    hub.receive(a.session_id, client_op("e1", "z", 3, 3, "a"));

    hub.receive(a.session_id, encode(ClientMessage{SyncRequest{1}}));
    const auto reply = alice.last();
    EXPECT_EQ(reply["type"], "crdt_ops");
    EXPECT_EQ(reply["version"], 3);
    ASSERT_EQ(reply["ops"].size(), 2u);
    EXPECT_EQ(reply["ops"][0]["prop"], "y");
    EXPECT_EQ(reply["ops"][1]["prop"], "z");
}

TEST_F(HubFixture, sync_request_ahead_of_server_gets_snapshot) {
    const auto a = hub.join("doc", "alice", alice);
    hub.receive(a.session_id, encode(ClientMessage{SyncRequest{50}}));
    EXPECT_EQ(alice.last()["type"], "snapshot");
}

TEST_F(HubFixture, snapshot_request_and_ping) {
    const auto a = hub.join("doc", "alice", alice);
    hub.receive(a.session_id, client_op("e1", "x", 1, 1, "a"));

    hub.receive(a.session_id, encode(ClientMessage{SnapshotRequest{}}));
    const auto snapshot = alice.last();
    EXPECT_EQ(snapshot["type"], "snapshot");
    EXPECT_EQ(snapshot["data"]["version"], 1);
    EXPECT_TRUE(snapshot["data"]["elements"].contains("e1"));

    hub.receive(a.session_id, encode(ClientMessage{Ping{}}));
    EXPECT_EQ(alice.last(), (json{{"type", "pong"}}));
}

// -- Presence -----------------------------------------------------------------

TEST_F(HubFixture, cursor_and_status_go_to_others_only) {
    const auto a = hub.join("doc", "alice", alice);
    hub.join("doc", "bob", bob);
    const auto alice_frames = alice.frames.size();

    hub.receive(a.session_id, encode(ClientMessage{CursorMove{Position{.x = 4, .y = 5}}}));
    EXPECT_EQ(bob.last()["type"], "cursor_update");
    EXPECT_EQ(bob.last()["user_id"], 1);
    EXPECT_EQ(bob.last()["username"], "alice");
    EXPECT_EQ(bob.last()["position"]["x"], 4.0);

    hub.receive(a.session_id, encode(ClientMessage{StatusUpdate{PresenceStatus::editing}}));
    EXPECT_EQ(bob.last()["type"], "presence_update");
    EXPECT_EQ(bob.last()["status"], "editing");

    EXPECT_EQ(alice.frames.size(), alice_frames);
}

// -- Authoritative document ---------------------------------------------------

TEST(AuthoritativeDocument, version_counts_state_changes_only) {
    auto doc = AuthoritativeDocument{"doc"};
    const auto op = make_set("e", "p", 1, ClockValue{.physical = 1, .logical = 0, .node_id = "n"});
    EXPECT_TRUE(doc.apply(op));
    EXPECT_FALSE(doc.apply(op));
    EXPECT_EQ(doc.version(), 1u);
    EXPECT_EQ(doc.ops_since(0).size(), 1u);
    EXPECT_TRUE(doc.ops_since(1).empty());
    EXPECT_TRUE(doc.ops_since(9).empty());
}

TEST(AuthoritativeDocument, state_vector_counts_live_elements) {
    auto doc = AuthoritativeDocument{"doc"};
    const auto clock = [](std::int64_t t) { return ClockValue{.physical = t, .logical = 0, .node_id = "n"}; };
    doc.apply(make_add_element("a", {}, clock(1)));
    doc.apply(make_add_element("b", {{"x", 1}}, clock(2)));
    doc.apply(make_remove_element("a", clock(3)));

    const auto vector = doc.state_vector();
    EXPECT_EQ(vector.document_id, "doc");
    EXPECT_EQ(vector.version, 3u);
    EXPECT_EQ(vector.element_count, 1u);
    EXPECT_EQ(vector.checksum, content_checksum(json{{"b", {{"x", 1}}}}));
}

TEST(ContentChecksum, is_a_truncated_sha256_of_compact_json) {
    // SHA-256("{}") = 44136fa355b3678a1146ad16f7e8649e...
    EXPECT_EQ(content_checksum(json::object()), "44136fa355b3");
    EXPECT_EQ(content_checksum(json{{"a", 1}}).size(), 12u);
    EXPECT_NE(content_checksum(json{{"a", 1}}), content_checksum(json{{"a", 2}}));
}

TEST(DocumentStore, open_creates_once) {
    auto store = DocumentStore{};
    auto& first = store.open("d");
    EXPECT_EQ(&store.open("d"), &first);
    store.open("c");
    EXPECT_EQ(store.document_ids(), (std::vector<std::string>{"c", "d"}));
    EXPECT_TRUE(store.remove("d"));
    EXPECT_FALSE(store.remove("d"));
    EXPECT_EQ(store.find("d"), nullptr);
    EXPECT_NE(std::as_const(store).find("c"), nullptr);
}
