/// @file loopback.hpp
/// @brief In-process Transport and ReconnectTimer connected to a Hub.
///
/// Lets engines talk to the real server logic without sockets: frames in
/// both directions are queued on a LoopbackNetwork and delivered when it
/// is pumped, and reconnect timers run on its virtual clock.

#pragma once

#include <canvas-sync/server/hub.hpp>
#include <canvas-sync/transport.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace canvas_sync::server {

/// The shared event queue and virtual clock behind loopback transports.
class LoopbackNetwork {
public:
    explicit LoopbackNetwork(Hub& hub) : hub_{hub} {}

    LoopbackNetwork(const LoopbackNetwork&) = delete;
    auto operator=(const LoopbackNetwork&) -> LoopbackNetwork& = delete;

    auto hub() -> Hub& { return hub_; }

    /// Queue a task for the next pump().
    void post(std::function<void()> task);

    /// Run queued tasks, including ones they queue, until none are left.
    /// @return Number of tasks run.
    auto pump() -> std::size_t;

    /// Move the virtual clock forward, firing due timers in order and
    /// pumping after each.
    void advance(std::chrono::milliseconds by);

    /// Virtual time since construction.
    auto now() const -> std::chrono::milliseconds { return now_; }

    /// While unreachable, new connection attempts fail with a transport error.
    void set_reachable(bool reachable) { reachable_ = reachable; }
    auto reachable() const -> bool { return reachable_; }

    /// A reconnect timer on this network's virtual clock.
    auto make_timer() -> std::unique_ptr<ReconnectTimer>;

private:
    friend class LoopbackTimer;

    struct Scheduled {
        std::chrono::milliseconds due;
        std::function<void()> fn;
    };

    Hub& hub_;
    std::deque<std::function<void()>> tasks_;
    std::map<std::uint64_t, Scheduled> timers_;
    std::uint64_t next_timer_id_{1};
    std::chrono::milliseconds now_{0};
    bool reachable_{true};
};

/// A client Transport whose server is the network's Hub.
///
/// The URL must name a room target (`ws://host/ws/project/<id>/crdt/`);
/// other URLs fail the attempt like an HTTP 404 would.
class LoopbackTransport : public Transport {
public:
    explicit LoopbackTransport(LoopbackNetwork& network) : network_{network} {}
    ~LoopbackTransport() override;

    LoopbackTransport(const LoopbackTransport&) = delete;
    auto operator=(const LoopbackTransport&) -> LoopbackTransport& = delete;

    void set_handlers(TransportHandlers handlers) override;
    void open(const std::string& url) override;
    auto send(std::string frame) -> bool override;
    void close() override;

    /// Break the connection as a network failure would: the server sees
    /// the session leave and on_close reports a transport error.
    void drop();

    /// The hub session id while connected, else empty.
    auto session_id() const -> std::string;

private:
    struct Link;

    void fail_later(std::string message);

    LoopbackNetwork& network_;
    TransportHandlers handlers_;
    std::shared_ptr<Link> link_;
};

}  // namespace canvas_sync::server
