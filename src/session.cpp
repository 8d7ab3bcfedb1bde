#include <canvas-sync/session.hpp>

#include <canvas-sync/log.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace canvas_sync {

// =============================================================================
// ReconnectBackoff
// =============================================================================

ReconnectBackoff::ReconnectBackoff(std::chrono::milliseconds initial,
                                   std::chrono::milliseconds max)
    : initial_{initial}, max_{std::max(initial, max)}, current_{initial} {}

void ReconnectBackoff::advance() {
    current_ = std::min(current_ * 2, max_);
}

// =============================================================================
// PendingBuffer
// =============================================================================

auto PendingBuffer::push(Operation op) -> bool {
    auto kept_all = true;
    if (capacity_ != 0 && ops_.size() >= capacity_) {
        ops_.pop_front();
        ++dropped_;
        kept_all = false;
    }
    ops_.push_back(std::move(op));
    return kept_all;
}

auto PendingBuffer::take() -> std::vector<Operation> {
    auto result = std::vector<Operation>{std::make_move_iterator(ops_.begin()),
                                         std::make_move_iterator(ops_.end())};
    ops_.clear();
    return result;
}

// =============================================================================
// SessionManager
// =============================================================================

SessionManager::SessionManager(Transport& transport, ReconnectTimer& timer,
                               SessionState& state, SessionOptions options)
    : transport_{transport},
      timer_{timer},
      session_{state},
      options_{std::move(options)},
      backoff_{options_.initial_backoff, options_.max_backoff} {
    transport_.set_handlers(TransportHandlers{
        .on_open = [this] { handle_open(); },
        .on_message = [this](std::string_view frame) {
            if (state_ == ConnectionState::connected && callbacks_.on_frame) {
                callbacks_.on_frame(frame);
            }
        },
        .on_close = [this](std::optional<Error> reason) { handle_close(std::move(reason)); },
    });
}

SessionManager::~SessionManager() {
    timer_.cancel();
    transport_.close();
    transport_.set_handlers(TransportHandlers{});
}

void SessionManager::connect() {
    if (stopped_) {
        stopped_ = false;
        backoff_.reset();
    }
    if (state_ != ConnectionState::disconnected) {
        logger("session")->debug("connect ignored: session is {}", to_string_view(state_));
        return;
    }
    timer_.cancel();
    start_attempt();
}

void SessionManager::disconnect() {
    stopped_ = true;
    timer_.cancel();
    if (state_ == ConnectionState::disconnected) return;

    transport_.close();
    state_ = ConnectionState::disconnected;
    logger("session")->info("session {} closed by request ({} operations buffered)",
                            session_.session_id, session_.pending.size());
    if (callbacks_.on_disconnected) {
        callbacks_.on_disconnected(Disconnected{.reason = std::nullopt, .retry_in = std::nullopt});
    }
}

auto SessionManager::submit(const Operation& op) -> bool {
    if (state_ == ConnectionState::connected) {
        // Anything still buffered must go out first to keep per-node FIFO.
        if (!session_.pending.empty()) flush_pending();
        if (session_.pending.empty() && transport_.send(encode(ClientMessage{OpMessage{op}}))) {
            return true;
        }
    }
    if (!session_.pending.push(op)) {
        logger("session")->warn("pending buffer full ({}), dropped oldest operation ({} dropped so far)",
                                session_.pending.capacity(), session_.pending.dropped_count());
    }
    return false;
}

auto SessionManager::send(const ClientMessage& msg) -> bool {
    if (state_ != ConnectionState::connected) {
        logger("session")->debug("not connected, dropping {}", action_name(msg));
        return false;
    }
    return transport_.send(encode(msg));
}

void SessionManager::start_attempt() {
    state_ = ConnectionState::connecting;
    logger("session")->info("connecting to {}", options_.url);
    transport_.open(options_.url);
}

void SessionManager::handle_open() {
    if (state_ != ConnectionState::connecting) {
        logger("session")->debug("ignoring open while {}", to_string_view(state_));
        return;
    }
    state_ = ConnectionState::connected;
    backoff_.reset();
    logger("session")->info("connected to {}", options_.url);
    flush_pending();
    if (callbacks_.on_connected) callbacks_.on_connected();
}

void SessionManager::handle_close(std::optional<Error> reason) {
    if (state_ == ConnectionState::disconnected) return;
    state_ = ConnectionState::disconnected;

    if (reason) {
        logger("session")->warn("session closed: {}", reason->message);
    } else {
        logger("session")->info("session closed");
    }

    auto retry_in = std::optional<std::chrono::milliseconds>{};
    if (!stopped_) {
        schedule_reconnect();
        retry_in = backoff_.current();
    }
    if (callbacks_.on_disconnected) {
        callbacks_.on_disconnected(Disconnected{.reason = std::move(reason), .retry_in = retry_in});
    }
}

void SessionManager::schedule_reconnect() {
    logger("session")->info("reconnecting in {} ms", backoff_.current().count());
    timer_.arm(backoff_.current(), [this] {
        backoff_.advance();
        if (state_ == ConnectionState::disconnected && !stopped_) start_attempt();
    });
}

void SessionManager::flush_pending() {
    if (session_.pending.empty()) return;
    const auto& buffered = session_.pending.ops();
    auto batch = BatchMessage{std::vector<Operation>{buffered.begin(), buffered.end()}};
    const auto count = batch.ops.size();
    if (!transport_.send(encode(ClientMessage{std::move(batch)}))) {
        logger("session")->warn("flush of {} buffered operations failed, keeping them", count);
        return;
    }
    session_.pending.take();
    logger("session")->info("flushed {} buffered operations", count);
}

}  // namespace canvas_sync
