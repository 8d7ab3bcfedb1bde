#include <canvas-sync/server/loopback.hpp>

#include <canvas-sync/log.hpp>
#include <canvas-sync/url.hpp>

#include <stdexcept>
#include <utility>

namespace canvas_sync::server {

// =============================================================================
// LoopbackNetwork
// =============================================================================

void LoopbackNetwork::post(std::function<void()> task) {
    tasks_.push_back(std::move(task));
}

auto LoopbackNetwork::pump() -> std::size_t {
    auto count = std::size_t{0};
    while (!tasks_.empty()) {
        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        task();
        ++count;
    }
    return count;
}

void LoopbackNetwork::advance(std::chrono::milliseconds by) {
    const auto target = now_ + by;
    for (;;) {
        auto next = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due <= target && (next == timers_.end() || it->second.due < next->second.due)) {
                next = it;
            }
        }
        if (next == timers_.end()) break;

        now_ = next->second.due;
        auto fn = std::move(next->second.fn);
        timers_.erase(next);
        fn();
        pump();
    }
    now_ = target;
    pump();
}

/// One-shot timer on the network's virtual clock.
class LoopbackTimer : public ReconnectTimer {
public:
    explicit LoopbackTimer(LoopbackNetwork& network)
        : network_{network}, id_{network.next_timer_id_++} {}

    ~LoopbackTimer() override { cancel(); }

    void arm(std::chrono::milliseconds delay, std::function<void()> fn) override {
        network_.timers_.insert_or_assign(
            id_, LoopbackNetwork::Scheduled{.due = network_.now_ + delay, .fn = std::move(fn)});
    }

    void cancel() override { network_.timers_.erase(id_); }

    auto armed() const -> bool override { return network_.timers_.contains(id_); }

private:
    LoopbackNetwork& network_;
    std::uint64_t id_;
};

auto LoopbackNetwork::make_timer() -> std::unique_ptr<ReconnectTimer> {
    return std::make_unique<LoopbackTimer>(*this);
}

// =============================================================================
// LoopbackTransport
// =============================================================================

/// The connection as both ends see it. Queued deliveries hold it, so it
/// outlives the transport; `closed` turns them into no-ops.
struct LoopbackTransport::Link : Peer, std::enable_shared_from_this<Link> {
    LoopbackNetwork& network;
    TransportHandlers handlers;
    std::string session_id;
    bool open{false};
    bool closed{false};

    Link(LoopbackNetwork& n, TransportHandlers h) : network{n}, handlers{std::move(h)} {}

    void send(std::string frame) override {
        network.post([self = shared_from_this(), frame = std::move(frame)] {
            if (self->closed) return;
            if (auto on_message = self->handlers.on_message) on_message(frame);
        });
    }
};

LoopbackTransport::~LoopbackTransport() {
    close();
}

void LoopbackTransport::set_handlers(TransportHandlers handlers) {
    handlers_ = std::move(handlers);
}

void LoopbackTransport::open(const std::string& url) {
    close();

    auto target = std::optional<RoomTarget>{};
    try {
        target = parse_room_target(parse_url(url).target);
    } catch (const std::runtime_error& e) {
        link_ = std::make_shared<Link>(network_, handlers_);
        fail_later(e.what());
        return;
    }

    link_ = std::make_shared<Link>(network_, handlers_);
    if (!target) {
        fail_later("handshake: 404 Not Found");
        return;
    }

    network_.post([link = link_, target = std::move(*target)] {
        if (link->closed) return;
        if (!link->network.reachable()) {
            link->closed = true;
            if (auto on_close = link->handlers.on_close) {
                on_close(Error{ErrorKind::transport_error, "connect: network unreachable"});
            }
            return;
        }
        link->session_id = link->network.hub().join(target.document_id, target.username, *link).session_id;
        link->open = true;
        if (auto on_open = link->handlers.on_open) on_open();
    });
}

auto LoopbackTransport::send(std::string frame) -> bool {
    if (!link_ || !link_->open || link_->closed) return false;
    network_.post([link = link_, frame = std::move(frame)] {
        if (link->closed) return;
        link->network.hub().receive(link->session_id, frame);
    });
    return true;
}

void LoopbackTransport::close() {
    if (!link_) return;
    auto link = std::move(link_);
    const auto was_open = link->open && !link->closed;
    link->closed = true;
    link->open = false;
    link->handlers = TransportHandlers{};
    if (was_open) network_.hub().leave(link->session_id);
}

void LoopbackTransport::drop() {
    if (!link_ || link_->closed) return;
    auto on_close = link_->handlers.on_close;
    close();
    logger("transport")->info("loopback connection dropped");
    if (on_close) on_close(Error{ErrorKind::transport_error, "connection dropped"});
}

auto LoopbackTransport::session_id() const -> std::string {
    return link_ && link_->open && !link_->closed ? link_->session_id : std::string{};
}

void LoopbackTransport::fail_later(std::string message) {
    network_.post([link = link_, message = std::move(message)] {
        if (link->closed) return;
        link->closed = true;
        if (auto on_close = link->handlers.on_close) {
            on_close(Error{ErrorKind::transport_error, message});
        }
    });
}

}  // namespace canvas_sync::server
