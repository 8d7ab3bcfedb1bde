// Engines and the hub talking through real sockets on 127.0.0.1.

#include <canvas-sync/engine.hpp>
#include <canvas-sync/server/document_store.hpp>
#include <canvas-sync/server/hub.hpp>
#include <canvas-sync/server/websocket_server.hpp>
#include <canvas-sync/websocket_transport.hpp>

#include <boost/asio/io_context.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace canvas_sync;
using namespace std::chrono_literals;
using canvas_sync::server::DocumentStore;
using canvas_sync::server::Hub;
using canvas_sync::server::WebSocketServer;
using json = nlohmann::json;
namespace net = boost::asio;

namespace {

// Drive the io_context until `done` holds; false if that takes too long.
auto run_until(net::io_context& io, const std::function<bool()>& done) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        io.restart();
        io.run_for(10ms);
    }
    return true;
}

struct WebSocketFixture : ::testing::Test {
    net::io_context io;
    DocumentStore store;
    Hub hub{store};
    // Stopped servers stay alive until their aborted accepts have completed.
    std::vector<std::unique_ptr<WebSocketServer>> servers;

    auto start_server(std::size_t max_queued_frames = 1024, std::uint16_t port = 0) -> WebSocketServer& {
        servers.push_back(std::make_unique<WebSocketServer>(
            io, hub,
            ServerConfig{.address = "127.0.0.1", .port = port, .max_queued_frames = max_queued_frames}));
        servers.back()->start();
        return *servers.back();
    }

    auto base_url() const -> std::string {
        return "ws://127.0.0.1:" + std::to_string(servers.back()->port());
    }

    auto make_engine(std::string node_id, std::string url) -> std::unique_ptr<Engine> {
        return make_websocket_engine(io, EngineConfig{.url = std::move(url),
                                                      .document_id = "board",
                                                      .node_id = std::move(node_id),
                                                      .initial_backoff = 50ms});
    }

    auto board_version() const -> std::uint64_t {
        const auto* doc = store.find("board");
        return doc ? doc->version() : 0;
    }
};

}  // namespace

TEST_F(WebSocketFixture, two_engines_converge) {
    start_server();
    const auto url = base_url() + "/ws/project/board/crdt/?user=ann";
    auto a = make_engine("A", url);
    auto b = make_engine("B", base_url() + "/ws/project/board/crdt/");

    a->connect();
    ASSERT_TRUE(run_until(io, [&] { return a->connection_state() == ConnectionState::connected; }));
    b->connect();
    ASSERT_TRUE(run_until(io, [&] { return a->peers().size() == 1 && hub.session_count() == 2; }));
    EXPECT_EQ(a->peers().begin()->second.username, "guest-2");

    // A burst larger than one write: frames queue behind each other.
    a->add_element("rect", {{"x", 0}});
    for (int i = 1; i <= 20; ++i) a->set_property("rect", "x", i);
    b->set_property("rect", "fill", "blue");

    ASSERT_TRUE(run_until(io, [&] {
        return board_version() == 22 && a->version() == 22 && b->version() == 22;
    }));
    EXPECT_EQ(a->snapshot(), store.find("board")->state().snapshot());
    EXPECT_EQ(b->snapshot(), a->snapshot());
    EXPECT_EQ(b->get("rect", "x"), json(20));
    EXPECT_EQ(a->get("rect", "fill"), json("blue"));

    b->move_cursor(3, 4);
    ASSERT_TRUE(run_until(io, [&] { return a->cursors().size() == 1; }));
    EXPECT_EQ(a->cursors().begin()->second.position, (Position{.x = 3, .y = 4}));
}

TEST_F(WebSocketFixture, reconnects_after_the_server_drops_the_session) {
    // One queued frame is the limit, so the join itself overflows it.
    const auto port = start_server(1).port();
    auto a = make_engine("A", base_url() + "/ws/project/board/crdt/");
    auto disconnects = std::vector<Disconnected>{};
    a->on<Disconnected>([&](const Disconnected& e) { disconnects.push_back(e); });

    a->connect();
    ASSERT_TRUE(run_until(io, [&] { return !disconnects.empty(); }));
    EXPECT_EQ(disconnects[0].retry_in, std::optional{50ms});
    EXPECT_EQ(hub.session_count(), 0u);

    a->set_property("note", "text", "offline");
    EXPECT_EQ(a->pending_count(), 1u);

    servers.back()->stop();
    start_server(1024, port);
    ASSERT_TRUE(run_until(io, [&] {
        return a->connection_state() == ConnectionState::connected && a->pending_count() == 0 &&
               board_version() == 1 && a->version() == 1;
    }));
    EXPECT_EQ(store.find("board")->state().get("note", "text"), json("offline"));
    EXPECT_EQ(hub.session_count(), 1u);
}

TEST_F(WebSocketFixture, unknown_target_is_refused) {
    start_server();
    auto engine = make_engine("X", base_url() + "/nowhere");
    auto reasons = std::vector<Error>{};
    engine->on<Disconnected>([&](const Disconnected& e) {
        if (e.reason) reasons.push_back(*e.reason);
    });

    engine->connect();
    ASSERT_TRUE(run_until(io, [&] { return !reasons.empty(); }));
    EXPECT_EQ(reasons[0].kind, ErrorKind::transport_error);
    EXPECT_EQ(reasons[0].message.rfind("handshake: ", 0), 0u) << reasons[0].message;
    EXPECT_EQ(hub.session_count(), 0u);
    engine->disconnect();
}

TEST_F(WebSocketFixture, invalid_url_fails_like_a_dropped_connection) {
    auto engine = make_engine("X", "http://127.0.0.1/ws/project/board/crdt/");
    auto disconnects = std::vector<Disconnected>{};
    engine->on<Disconnected>([&](const Disconnected& e) { disconnects.push_back(e); });

    engine->connect();
    EXPECT_TRUE(disconnects.empty());  // reported from the io_context, not from connect()
    ASSERT_TRUE(run_until(io, [&] { return !disconnects.empty(); }));
    ASSERT_TRUE(disconnects[0].reason.has_value());
    EXPECT_EQ(disconnects[0].reason->kind, ErrorKind::transport_error);
    EXPECT_NE(disconnects[0].reason->message.find("invalid url"), std::string::npos);
    EXPECT_TRUE(disconnects[0].retry_in.has_value());
    engine->disconnect();
}

// -- AsioReconnectTimer -------------------------------------------------------

TEST(AsioReconnectTimer, rearming_replaces_the_pending_callback) {
    auto io = net::io_context{};
    auto timer = AsioReconnectTimer{io};
    auto fired = std::vector<int>{};

    timer.arm(10ms, [&] { fired.push_back(1); });
    timer.arm(20ms, [&] { fired.push_back(2); });
    EXPECT_TRUE(timer.armed());
    io.run();
    EXPECT_EQ(fired, (std::vector<int>{2}));
    EXPECT_FALSE(timer.armed());
}

TEST(AsioReconnectTimer, cancel_prevents_the_callback) {
    auto io = net::io_context{};
    auto timer = AsioReconnectTimer{io};
    auto fired = false;

    timer.arm(10ms, [&] { fired = true; });
    timer.cancel();
    EXPECT_FALSE(timer.armed());
    io.run();
    EXPECT_FALSE(fired);
}
