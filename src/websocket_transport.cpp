#include <canvas-sync/websocket_transport.hpp>

#include <canvas-sync/engine.hpp>
#include <canvas-sync/log.hpp>
#include <canvas-sync/url.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <deque>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

namespace canvas_sync {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace detail {

/// One connection attempt and, if it succeeds, the session that follows.
///
/// After close() or after on_close was delivered the connection is
/// detached: pending completions still run but reach no handler.
class Connection {
public:
    virtual ~Connection() = default;

    virtual void start(const Url& url) = 0;
    virtual void send(std::string frame) = 0;
    virtual void close() = 0;

    /// Deliver on_close with `error` from the io_context, not from the caller's stack.
    virtual void fail_later(Error error) = 0;

    virtual auto is_open() const -> bool = 0;
};

namespace {

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

constexpr auto connect_timeout = std::chrono::seconds{30};

template <typename Stream>
class WebSocketConnection : public Connection,
                            public std::enable_shared_from_this<WebSocketConnection<Stream>> {
public:
    template <typename... StreamArgs>
    WebSocketConnection(net::io_context& io, TransportHandlers handlers, StreamArgs&&... args)
        : resolver_{io},
          ws_{io, std::forward<StreamArgs>(args)...},
          handlers_{std::move(handlers)} {}

    void start(const Url& url) override {
        host_ = url.host;
        port_ = url.port;
        target_ = url.target;
        resolver_.async_resolve(
            host_, std::to_string(port_),
            beast::bind_front_handler(&WebSocketConnection::on_resolve, this->shared_from_this()));
    }

    void send(std::string frame) override {
        queue_.push_back(std::move(frame));
        if (!writing_) write_next();
    }

    void close() override {
        if (detached_) return;
        detached_ = true;
        handlers_ = TransportHandlers{};
        resolver_.cancel();
        if (open_) {
            open_ = false;
            ws_.async_close(websocket::close_code::normal,
                            [self = this->shared_from_this()](beast::error_code ec) {
                                if (ec) logger("transport")->debug("close: {}", ec.message());
                            });
        } else {
            beast::get_lowest_layer(ws_).close();
        }
    }

    void fail_later(Error error) override {
        net::post(ws_.get_executor(),
                  [self = this->shared_from_this(), error = std::move(error)]() mutable {
                      self->finish(std::move(error));
                  });
    }

    auto is_open() const -> bool override { return open_ && !detached_; }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");
        beast::get_lowest_layer(ws_).expires_after(connect_timeout);
        beast::get_lowest_layer(ws_).async_connect(
            results,
            beast::bind_front_handler(&WebSocketConnection::on_connect, this->shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail(ec, "connect");
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str())) {
                return fail(beast::error_code{static_cast<int>(::ERR_get_error()),
                                              net::error::get_ssl_category()},
                            "tls server name");
            }
            ws_.next_layer().async_handshake(
                net::ssl::stream_base::client,
                beast::bind_front_handler(&WebSocketConnection::on_tls_handshake,
                                          this->shared_from_this()));
        } else {
            handshake();
        }
    }

    void on_tls_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "tls handshake");
        handshake();
    }

    void handshake() {
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "canvas-sync");
        }));
        ws_.async_handshake(
            host_ + ":" + std::to_string(port_), target_,
            beast::bind_front_handler(&WebSocketConnection::on_handshake, this->shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "handshake");
        if (detached_) return;
        open_ = true;
        ws_.text(true);
        logger("transport")->info("connected to {}:{}{}", host_, port_, target_);

        // Copies: the owner may close() from inside a handler.
        if (auto on_open = handlers_.on_open) on_open();
        if (!detached_) do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketConnection::on_read,
                                                          this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == websocket::error::closed) return finish(std::nullopt);
        if (ec) return fail(ec, "read");

        auto frame = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (detached_) return;
        if (auto on_message = handlers_.on_message) on_message(frame);
        if (!detached_) do_read();
    }

    void write_next() {
        writing_ = true;
        ws_.async_write(net::buffer(queue_.front()),
                        beast::bind_front_handler(&WebSocketConnection::on_write,
                                                  this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) return fail(ec, "write");
        queue_.pop_front();
        if (!queue_.empty() && !detached_) write_next();
    }

    void fail(beast::error_code ec, std::string_view what) {
        if (detached_) return;
        finish(Error{ErrorKind::transport_error, std::string{what} + ": " + ec.message()});
    }

    void finish(std::optional<Error> reason) {
        if (detached_) return;
        detached_ = true;
        open_ = false;
        auto on_close = std::move(handlers_.on_close);
        handlers_ = TransportHandlers{};
        beast::get_lowest_layer(ws_).close();

        if (reason) {
            logger("transport")->warn("{}:{} {}", host_, port_, reason->message);
        } else {
            logger("transport")->info("{}:{} closed by peer", host_, port_);
        }
        if (on_close) on_close(std::move(reason));
    }

    tcp::resolver resolver_;
    Stream ws_;
    beast::flat_buffer buffer_;
    TransportHandlers handlers_;
    std::deque<std::string> queue_;
    std::string host_;
    std::uint16_t port_{0};
    std::string target_;
    bool writing_{false};
    bool open_{false};
    bool detached_{false};
};

}  // namespace
}  // namespace detail

// =============================================================================
// WebSocketTransport
// =============================================================================

WebSocketTransport::WebSocketTransport(net::io_context& io)
    : io_{io}, ssl_ctx_{net::ssl::context::tls_client} {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(net::ssl::verify_peer);
}

WebSocketTransport::~WebSocketTransport() {
    close();
}

void WebSocketTransport::set_handlers(TransportHandlers handlers) {
    handlers_ = std::move(handlers);
}

void WebSocketTransport::open(const std::string& url) {
    close();

    auto parsed = Url{};
    try {
        parsed = parse_url(url);
    } catch (const std::runtime_error& e) {
        logger("transport")->warn("{}", e.what());
        auto failed = std::make_shared<detail::WebSocketConnection<detail::PlainStream>>(io_, handlers_);
        failed->fail_later(Error{ErrorKind::transport_error, e.what()});
        connection_ = std::move(failed);
        return;
    }

    logger("transport")->debug("opening {}", url);
    if (parsed.secure()) {
        auto connection =
            std::make_shared<detail::WebSocketConnection<detail::TlsStream>>(io_, handlers_, ssl_ctx_);
        connection->start(parsed);
        connection_ = std::move(connection);
    } else {
        auto connection =
            std::make_shared<detail::WebSocketConnection<detail::PlainStream>>(io_, handlers_);
        connection->start(parsed);
        connection_ = std::move(connection);
    }
}

auto WebSocketTransport::send(std::string frame) -> bool {
    if (!connection_ || !connection_->is_open()) return false;
    connection_->send(std::move(frame));
    return true;
}

void WebSocketTransport::close() {
    if (!connection_) return;
    connection_->close();
    connection_.reset();
}

// =============================================================================
// AsioReconnectTimer
// =============================================================================

void AsioReconnectTimer::arm(std::chrono::milliseconds delay, std::function<void()> fn) {
    const auto generation = ++generation_;
    timer_.expires_after(delay);
    armed_ = true;
    timer_.async_wait([this, generation, fn = std::move(fn)](const boost::system::error_code& ec) {
        // Aborted waits may complete after the timer is gone; touch nothing.
        if (ec == net::error::operation_aborted) return;
        if (generation != generation_) return;
        armed_ = false;
        fn();
    });
}

void AsioReconnectTimer::cancel() {
    ++generation_;
    armed_ = false;
    timer_.cancel();
}

auto make_websocket_engine(net::io_context& io, EngineConfig config) -> std::unique_ptr<Engine> {
    return std::make_unique<Engine>(std::move(config), std::make_unique<WebSocketTransport>(io),
                                    std::make_unique<AsioReconnectTimer>(io));
}

}  // namespace canvas_sync
