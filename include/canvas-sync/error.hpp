/// @file error.hpp
/// @brief Error types for the canvas-sync library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace canvas_sync {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_frame,      ///< An inbound frame could not be parsed or validated.
    invalid_operation,  ///< An operation record is malformed.
    transport_error,    ///< The network session failed (resolve, connect, read, write).
    config_error,       ///< A configuration file or value is invalid.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_frame:     return "invalid_frame";
        case ErrorKind::invalid_operation: return "invalid_operation";
        case ErrorKind::transport_error:   return "transport_error";
        case ErrorKind::config_error:      return "config_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

}  // namespace canvas_sync
