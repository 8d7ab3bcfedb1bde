/// @file websocket_transport.hpp
/// @brief Boost.Beast implementations of Transport and ReconnectTimer.

#pragma once

#include <canvas-sync/config.hpp>
#include <canvas-sync/transport.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace canvas_sync {

class Engine;

/// @cond DETAIL
namespace detail {
class Connection;
}  // namespace detail
/// @endcond

/// A WebSocket client over Boost.Beast, for `ws://` and `wss://` URLs.
///
/// Each open() starts a fresh connection on the io_context; callbacks run
/// on that io_context. Outbound frames are queued and written one at a
/// time. A failed resolve, connect, TLS or WebSocket handshake, read, or
/// write ends the connection with on_close carrying a transport_error.
class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(boost::asio::io_context& io);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    auto operator=(const WebSocketTransport&) -> WebSocketTransport& = delete;

    void set_handlers(TransportHandlers handlers) override;
    void open(const std::string& url) override;
    auto send(std::string frame) -> bool override;
    void close() override;

    /// The TLS context used for `wss://`; verifies peers against the
    /// system trust store by default.
    auto ssl_context() -> boost::asio::ssl::context& { return ssl_ctx_; }

private:
    boost::asio::io_context& io_;
    boost::asio::ssl::context ssl_ctx_;
    TransportHandlers handlers_;
    std::shared_ptr<detail::Connection> connection_;
};

/// ReconnectTimer on a boost::asio::steady_timer.
class AsioReconnectTimer : public ReconnectTimer {
public:
    explicit AsioReconnectTimer(boost::asio::io_context& io) : timer_{io} {}

    void arm(std::chrono::milliseconds delay, std::function<void()> fn) override;
    void cancel() override;
    auto armed() const -> bool override { return armed_; }

private:
    boost::asio::steady_timer timer_;
    std::uint64_t generation_{0};
    bool armed_{false};
};

/// An Engine wired to a WebSocketTransport and an AsioReconnectTimer on `io`.
auto make_websocket_engine(boost::asio::io_context& io, EngineConfig config)
    -> std::unique_ptr<Engine>;

}  // namespace canvas_sync
