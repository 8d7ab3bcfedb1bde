/// @file transport.hpp
/// @brief Abstract network seams: Transport and ReconnectTimer.

#pragma once

#include <canvas-sync/error.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace canvas_sync {

/// Callbacks a Transport delivers on its owner's event loop.
struct TransportHandlers {
    std::function<void()> on_open;                       ///< The session is ready for frames.
    std::function<void(std::string_view)> on_message;    ///< One inbound text frame.
    std::function<void(std::optional<Error>)> on_close;  ///< The session ended (error if it failed).
};

/// One message-oriented network session at a time.
///
/// Contract: after open(), the transport delivers on_open at most once,
/// then any number of on_message, and finally exactly one on_close when
/// the session ends or the attempt fails. A socket error tears the
/// session down and is reported through on_close with the error.
/// Calling close() ends the session from the owner's side; nothing more
/// is delivered for that session afterwards.
class Transport {
public:
    virtual ~Transport() = default;

    /// Install the callbacks. Must be called before open().
    virtual void set_handlers(TransportHandlers handlers) = 0;

    /// Start connecting to `url`. Any previous session is closed first.
    virtual void open(const std::string& url) = 0;

    /// Queue a text frame for sending.
    /// @return False if no session is open.
    virtual auto send(std::string frame) -> bool = 0;

    /// Close the current session, if any.
    virtual void close() = 0;
};

/// A single re-armable one-shot timer.
///
/// Arming while armed replaces the pending callback, so at most one
/// callback is ever outstanding.
class ReconnectTimer {
public:
    virtual ~ReconnectTimer() = default;

    /// Run `fn` once after `delay`, cancelling any pending callback.
    virtual void arm(std::chrono::milliseconds delay, std::function<void()> fn) = 0;

    /// Cancel the pending callback, if any.
    virtual void cancel() = 0;

    /// True while a callback is pending.
    virtual auto armed() const -> bool = 0;
};

}  // namespace canvas_sync
