// headless_client: joins a canvas document over WebSocket and logs traffic
//
// Demonstrates: make_websocket_engine, load_engine_config, typed event
//               subscriptions, automatic reconnect
//
// Usage: headless_client [--config <file>] [--server <url>]
//                        [--document <id>] [--log-level <level>]

#include <canvas-sync/config.hpp>
#include <canvas-sync/engine.hpp>
#include <canvas-sync/log.hpp>
#include <canvas-sync/websocket_transport.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cs = canvas_sync;

namespace {

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> server;
    std::optional<std::string> document_id;
    std::optional<std::string> log_level;
};

void print_usage(const char* program) {
    std::fprintf(stderr,
                 "usage: %s [--config <file>] [--server <url>] [--document <id>] [--log-level <level>]\n",
                 program);
}

auto parse_args(int argc, char* argv[]) -> std::optional<Options> {
    auto options = Options{};
    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (i + 1 >= argc) return std::nullopt;
        const auto value = std::string{argv[++i]};

        if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--server") {
            options.server = value;
        } else if (arg == "--document") {
            options.document_id = value;
        } else if (arg == "--log-level") {
            options.log_level = value;
        } else {
            return std::nullopt;
        }
    }
    return options;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    auto config = cs::EngineConfig{.document_id = "demo"};
    try {
        if (options->config_path) config = cs::load_engine_config(*options->config_path);
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    if (options->server) config.server = *options->server;
    if (options->document_id) config.document_id = *options->document_id;
    if (options->log_level) config.log_level = *options->log_level;

    try {
        cs::set_log_level(config.log_level);
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "%s\n", e.what());
        print_usage(argv[0]);
        return 2;
    }

    auto io = boost::asio::io_context{};
    auto engine = cs::make_websocket_engine(io, config);
    auto log = cs::logger("client");
    log->info("node {} joining {}", engine->node_id(), engine->url());

    auto subscriptions = std::vector<cs::Subscription>{};
    subscriptions.push_back(engine->on<cs::Connected>([&](const cs::Connected&) {
        log->info("connected; {} elements, {} pending", engine->element_ids().size(),
                  engine->pending_count());
    }));
    subscriptions.push_back(engine->on<cs::Disconnected>([&](const cs::Disconnected& e) {
        if (e.retry_in) {
            log->warn("disconnected ({}), retrying in {}ms",
                      e.reason ? e.reason->message : "closed", e.retry_in->count());
        } else {
            log->info("disconnected");
        }
    }));
    subscriptions.push_back(engine->on<cs::RemoteChanges>([&](const cs::RemoteChanges& e) {
        log->info("{} of {} ops from {} applied, version {}", e.changes.size(), e.received,
                  e.origin, e.version);
        for (const auto& change : e.changes) {
            log->debug("  {} {}.{} = {}", cs::to_string_view(change.kind), change.element_id,
                       change.prop, change.value.dump());
        }
    }));
    subscriptions.push_back(engine->on<cs::SnapshotApplied>([&](const cs::SnapshotApplied& e) {
        log->info("snapshot at version {}: {}", e.version, e.elements.dump());
    }));
    subscriptions.push_back(engine->on<cs::PeerJoined>([&](const cs::PeerJoined& e) {
        log->info("{} joined ({})", e.peer.username, e.peer.color);
    }));
    subscriptions.push_back(engine->on<cs::PeerLeft>([&](const cs::PeerLeft& e) {
        log->info("{} left", e.username.empty() ? std::to_string(e.user_id) : e.username);
    }));
    subscriptions.push_back(engine->on<cs::PresenceChanged>([&](const cs::PresenceChanged& e) {
        log->info("user {} is {}", e.user_id, cs::to_string_view(e.status));
    }));
    subscriptions.push_back(engine->on<cs::CursorMoved>([&](const cs::CursorMoved& e) {
        log->debug("cursor {} at ({}, {})", e.cursor.username, e.cursor.position.x, e.cursor.position.y);
    }));

    // Keep-alive: ping every 20 seconds while connected.
    auto heartbeat = boost::asio::steady_timer{io};
    std::function<void()> schedule_ping = [&] {
        heartbeat.expires_after(std::chrono::seconds{20});
        heartbeat.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            engine->ping();
            schedule_ping();
        });
    };

    auto signals = boost::asio::signal_set{io, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        log->info("leaving with {} unsent edits", engine->pending_count());
        heartbeat.cancel();
        engine->disconnect();
        io.stop();
    });

    engine->connect();
    schedule_ping();
    io.run();
    return 0;
}
