// canvas-sync-server: authoritative sync server for canvas documents
//
// Usage: canvas-sync-server [--config <file>] [--address <addr>] [--port <n>]
//                           [--log-level <level>]
//
// Command-line values override the config file.

#include <canvas-sync/config.hpp>
#include <canvas-sync/log.hpp>
#include <canvas-sync/server/document_store.hpp>
#include <canvas-sync/server/hub.hpp>
#include <canvas-sync/server/websocket_server.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include <charconv>
#include <cstdint>
#include <csignal>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cs = canvas_sync;

namespace {

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> address;
    std::optional<std::uint16_t> port;
    std::optional<std::string> log_level;
};

void print_usage(const char* program) {
    std::fprintf(stderr,
                 "usage: %s [--config <file>] [--address <addr>] [--port <n>] [--log-level <level>]\n",
                 program);
}

auto parse_port(std::string_view text) -> std::optional<std::uint16_t> {
    auto value = unsigned{0};
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value > 65535) return std::nullopt;
    return static_cast<std::uint16_t>(value);
}

// Nullopt on an unknown flag, a missing value or a bad port.
auto parse_args(int argc, char* argv[]) -> std::optional<Options> {
    auto options = Options{};
    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (i + 1 >= argc) return std::nullopt;
        const auto value = std::string{argv[++i]};

        if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--address") {
            options.address = value;
        } else if (arg == "--port") {
            options.port = parse_port(value);
            if (!options.port) return std::nullopt;
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

    auto config = cs::ServerConfig{};
    try {
        if (options->config_path) config = cs::load_server_config(*options->config_path);
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    if (options->address) config.address = *options->address;
    if (options->port) config.port = *options->port;
    if (options->log_level) config.log_level = *options->log_level;

    try {
        cs::set_log_level(config.log_level);
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "%s\n", e.what());
        print_usage(argv[0]);
        return 2;
    }

    auto store = cs::server::DocumentStore{};
    auto hub = cs::server::Hub{store};
    hub.set_release_idle_documents(config.release_idle_documents);
    auto io = boost::asio::io_context{};
    auto server = cs::server::WebSocketServer{io, hub, config};

    try {
        server.start();
    } catch (const boost::system::system_error& e) {
        cs::logger("server")->error("cannot listen on {}:{}: {}", config.address, config.port, e.what());
        return 1;
    }

    auto signals = boost::asio::signal_set{io, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (ec) return;
        cs::logger("server")->info("signal {}, shutting down", signal);
        server.stop();
        io.stop();
    });

    io.run();
    cs::logger("server")->info("served {} documents", store.size());
    return 0;
}
