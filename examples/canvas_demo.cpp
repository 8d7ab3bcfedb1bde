// canvas_demo: two editors and a server sharing one board in-process
//
// Demonstrates: Engine, Hub, LoopbackNetwork, concurrent last-writer-wins
//               edits, offline buffering, presence

#include <canvas-sync/engine.hpp>
#include <canvas-sync/log.hpp>
#include <canvas-sync/server/document_store.hpp>
#include <canvas-sync/server/hub.hpp>
#include <canvas-sync/server/loopback.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace cs = canvas_sync;
using namespace std::chrono_literals;

// Wall clocks that disagree by seconds; the hybrid clock keeps order anyway.
static auto skewed_wall(std::int64_t offset_ms) -> cs::WallClock {
    return [offset_ms] { return cs::system_wall_clock()() + offset_ms; };
}

static auto make_editor(cs::server::LoopbackNetwork& network, std::string name,
                        std::int64_t skew_ms, cs::server::LoopbackTransport** link = nullptr)
    -> std::unique_ptr<cs::Engine> {
    auto transport = std::make_unique<cs::server::LoopbackTransport>(network);
    if (link) *link = transport.get();
    return std::make_unique<cs::Engine>(
        cs::EngineConfig{.url = "ws://loopback/ws/project/board/crdt/?user=" + name,
                         .document_id = "board",
                         .node_id = name},
        std::move(transport), network.make_timer(), skewed_wall(skew_ms));
}

static void print_board(const char* who, const cs::Engine& engine) {
    std::printf("  %-6s v%llu %s\n", who, static_cast<unsigned long long>(engine.version()),
                engine.snapshot().dump().c_str());
}

int main() {
    cs::set_log_level("warn");

    auto store = cs::server::DocumentStore{};
    auto hub = cs::server::Hub{store};
    auto network = cs::server::LoopbackNetwork{hub};

    cs::server::LoopbackTransport* bob_link = nullptr;
    auto ann = make_editor(network, "ann", 0);
    auto bob = make_editor(network, "bob", -5000, &bob_link);

    auto joined = ann->on<cs::PeerJoined>([](const cs::PeerJoined& e) {
        std::printf("  ann sees %s join in %s\n", e.peer.username.c_str(), e.peer.color.c_str());
    });

    std::printf("=== Connect ===\n");
    ann->connect();
    bob->connect();
    network.pump();
    std::printf("  sessions on server: %zu\n", hub.session_count());

    std::printf("\n=== Shared edits ===\n");
    ann->add_element("title", {{"text", "Roadmap"}, {"x", 40}, {"y", 20}});
    network.pump();
    bob->set_property("title", "fill", "#1e88e5");
    ann->set_property("title", "text", "Roadmap 2025");
    network.pump();
    print_board("ann", *ann);
    print_board("bob", *bob);

    std::printf("\n=== Concurrent writes to one property ===\n");
    // Bob's wall clock runs 5s behind, but both writes happen after
    // everything each side has seen, so the server order decides.
    ann->set_property("title", "x", 100);
    bob->set_property("title", "x", 200);
    network.pump();
    std::printf("  ann x = %s, bob x = %s\n", ann->get("title", "x")->dump().c_str(),
                bob->get("title", "x")->dump().c_str());

    std::printf("\n=== Offline editing ===\n");
    network.set_reachable(false);
    bob_link->drop();
    bob->add_element("sticky", {{"text", "draft"}});
    bob->set_property("sticky", "text", "ship it");
    std::printf("  bob offline with %zu pending edits\n", bob->pending_count());

    network.advance(1s);
    std::printf("  retry failed, bob still %s\n", cs::to_string_view(bob->connection_state()).data());

    network.set_reachable(true);
    network.advance(2s);
    std::printf("  bob %s, pending %zu\n", cs::to_string_view(bob->connection_state()).data(),
                bob->pending_count());
    print_board("ann", *ann);
    print_board("bob", *bob);

    std::printf("\n=== Presence ===\n");
    bob->move_cursor(320, 180);
    bob->set_status(cs::PresenceStatus::editing);
    network.pump();
    for (const auto& [id, cursor] : ann->cursors()) {
        std::printf("  cursor %s at (%.0f, %.0f)\n", cursor.username.c_str(), cursor.position.x,
                    cursor.position.y);
    }
    for (const auto& [id, peer] : ann->peers()) {
        std::printf("  peer %s is %s\n", peer.username.c_str(), cs::to_string_view(peer.status).data());
    }

    std::printf("\n=== Leave ===\n");
    bob.reset();
    network.pump();
    std::printf("  ann has %zu peers, server has %zu sessions\n", ann->peers().size(),
                hub.session_count());
    std::printf("  server version %llu, checksum %s\n",
                static_cast<unsigned long long>(store.find("board")->version()),
                store.find("board")->state_vector().checksum.c_str());

    joined.unsubscribe();
    return 0;
}
