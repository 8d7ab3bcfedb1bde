#include <canvas-sync/server/websocket_server.hpp>

#include <canvas-sync/log.hpp>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace canvas_sync::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

/// One client connection: HTTP upgrade, then the frame loop.
class ServerSession : public Peer, public std::enable_shared_from_this<ServerSession> {
public:
    ServerSession(tcp::socket socket, Hub& hub, std::size_t max_queued_frames)
        : ws_{std::move(socket)}, hub_{hub}, max_queued_frames_{max_queued_frames} {}

    void run() {
        http::async_read(ws_.next_layer(), buffer_, request_,
                         beast::bind_front_handler(&ServerSession::on_request, shared_from_this()));
    }

    void send(std::string frame) override {
        if (closing_) return;
        if (queue_.size() >= max_queued_frames_) {
            logger("server")->warn("session {} has {} frames queued, disconnecting",
                                   session_id_, queue_.size());
            closing_ = true;
            // Not from here: send() runs inside Hub broadcasts.
            net::post(ws_.get_executor(), [self = shared_from_this()] { self->shutdown(); });
            return;
        }
        queue_.push_back(std::move(frame));
        if (!writing_) write_next();
    }

private:
    void on_request(beast::error_code ec, std::size_t) {
        if (ec) {
            logger("server")->debug("upgrade request failed: {}", ec.message());
            return;
        }

        const auto target = std::string{request_.target().data(), request_.target().size()};
        target_ = parse_room_target(target);
        if (!websocket::is_upgrade(request_) || !target_) {
            logger("server")->warn("refusing {}", target);
            return reject();
        }

        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "canvas-sync-server");
        }));
        ws_.async_accept(request_,
                         beast::bind_front_handler(&ServerSession::on_accept, shared_from_this()));
    }

    void reject() {
        response_.version(request_.version());
        response_.result(http::status::not_found);
        response_.set(http::field::server, "canvas-sync-server");
        response_.set(http::field::content_type, "text/plain");
        response_.keep_alive(false);
        response_.body() = "not found\n";
        response_.prepare_payload();
        http::async_write(ws_.next_layer(), response_,
                          [self = shared_from_this()](beast::error_code ec, std::size_t) {
                              if (ec) logger("server")->debug("404 write: {}", ec.message());
                              beast::error_code ignored;
                              self->ws_.next_layer().socket().shutdown(tcp::socket::shutdown_send, ignored);
                          });
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            logger("server")->debug("websocket accept failed: {}", ec.message());
            return;
        }
        ws_.text(true);
        session_id_ = hub_.join(target_->document_id, target_->username, *this).session_id;
        joined_ = true;
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&ServerSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
                logger("server")->debug("session {} read: {}", session_id_, ec.message());
            }
            leave();
            return;
        }
        const auto frame = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (!joined_) return;
        hub_.receive(session_id_, frame);
        do_read();
    }

    void write_next() {
        writing_ = true;
        ws_.async_write(net::buffer(queue_.front()),
                        beast::bind_front_handler(&ServerSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) {
            logger("server")->debug("session {} write: {}", session_id_, ec.message());
            leave();
            return;
        }
        queue_.pop_front();
        if (close_after_write_) return close();
        if (!queue_.empty() && !closing_) write_next();
    }

    void shutdown() {
        leave();
        if (writing_) {
            // The frame in flight must outlive its async_write; close after it.
            queue_.erase(std::next(queue_.begin()), queue_.end());
            close_after_write_ = true;
            return;
        }
        queue_.clear();
        close();
    }

    void close() {
        close_after_write_ = false;
        ws_.async_close(websocket::close_code::try_again_later,
                        [self = shared_from_this()](beast::error_code ec) {
                            if (ec) logger("server")->debug("close: {}", ec.message());
                        });
    }

    void leave() {
        if (!joined_) return;
        joined_ = false;
        closing_ = true;
        hub_.leave(session_id_);
    }

    websocket::stream<beast::tcp_stream> ws_;
    Hub& hub_;
    std::size_t max_queued_frames_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    std::optional<RoomTarget> target_;
    std::string session_id_;
    std::deque<std::string> queue_;
    bool writing_{false};
    bool closing_{false};
    bool joined_{false};
    bool close_after_write_{false};
};

}  // namespace

WebSocketServer::WebSocketServer(net::io_context& io, Hub& hub, ServerConfig config)
    : hub_{hub}, config_{std::move(config)}, acceptor_{io} {}

void WebSocketServer::start() {
    const auto endpoint = tcp::endpoint{net::ip::make_address(config_.address), config_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    logger("server")->info("listening on {}:{}", config_.address, port());
    do_accept();
}

void WebSocketServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) logger("server")->warn("closing acceptor: {}", ec.message());
}

auto WebSocketServer::port() const -> std::uint16_t {
    beast::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? config_.port : endpoint.port();
}

void WebSocketServer::do_accept() {
    acceptor_.async_accept(beast::bind_front_handler(&WebSocketServer::on_accept, this));
}

void WebSocketServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) return;
    if (ec) {
        logger("server")->warn("accept: {}", ec.message());
    } else {
        std::make_shared<ServerSession>(std::move(socket), hub_, config_.max_queued_frames)->run();
    }
    do_accept();
}

}  // namespace canvas_sync::server
