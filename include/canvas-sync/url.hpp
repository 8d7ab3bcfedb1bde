/// @file url.hpp
/// @brief WebSocket URL and request-target parsing.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace canvas_sync {

/// The parts of a `ws://` or `wss://` URL.
struct Url {
    std::string scheme;       ///< "ws" or "wss".
    std::string host;         ///< Host name or address, without IPv6 brackets.
    std::uint16_t port{0};    ///< Explicit port, or 80 / 443 by scheme.
    std::string target{"/"};  ///< Path plus query, always starting with '/'.

    auto secure() const -> bool { return scheme == "wss"; }

    auto operator==(const Url&) const -> bool = default;
};

/// Split `scheme://host[:port][/target]`.
/// @throws std::runtime_error if the scheme is not ws/wss, the host is
///         empty, or the port is not a number in 1..65535.
auto parse_url(std::string_view url) -> Url;

/// The path of a request target, without its query string.
auto target_path(std::string_view target) -> std::string_view;

/// The percent-decoded value of a query parameter in a request target,
/// or nullopt if the parameter is absent.
auto query_parameter(std::string_view target, std::string_view key) -> std::optional<std::string>;

}  // namespace canvas_sync
