/// @file websocket_server.hpp
/// @brief Boost.Beast WebSocket front end for the Hub.

#pragma once

#include <canvas-sync/config.hpp>
#include <canvas-sync/server/hub.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include <cstdint>

namespace canvas_sync::server {

/// Accepts WebSocket upgrades on `/ws/project/<id>/crdt/` and attaches
/// each connection to the hub. Other targets get HTTP 404.
///
/// Every connection has a bounded outbound queue; a client that falls
/// more than `max_queued_frames` behind is disconnected.
class WebSocketServer {
public:
    WebSocketServer(boost::asio::io_context& io, Hub& hub, ServerConfig config);

    /// Bind, listen and start accepting.
    /// @throws boost::system::system_error if the address cannot be bound.
    void start();

    /// Stop accepting new connections. Open connections are left alone.
    void stop();

    /// The bound port (useful when configured with port 0).
    auto port() const -> std::uint16_t;

private:
    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    Hub& hub_;
    ServerConfig config_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

}  // namespace canvas_sync::server
