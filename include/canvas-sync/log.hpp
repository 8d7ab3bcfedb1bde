/// @file log.hpp
/// @brief Named spdlog loggers shared across the library.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace canvas_sync {

/// Get (or lazily create) the named logger.
///
/// Loggers write to a colored stdout sink and follow the global level
/// set by set_log_level(). Names used by the library: "session",
/// "integrator", "presence", "engine", "protocol", "transport", "server".
auto logger(std::string_view name) -> std::shared_ptr<spdlog::logger>;

/// Set the level of every logger, present and future.
/// @param level One of trace, debug, info, warn, error, critical, off.
/// @throws std::invalid_argument if the level name is unknown.
void set_log_level(std::string_view level);

}  // namespace canvas_sync
