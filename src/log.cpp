#include <canvas-sync/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <stdexcept>
#include <string>

namespace canvas_sync {

auto logger(std::string_view name) -> std::shared_ptr<spdlog::logger> {
    static auto mutex = std::mutex{};
    auto lock = std::scoped_lock{mutex};
    const auto key = std::string{name};
    if (auto existing = spdlog::get(key)) return existing;
    return spdlog::stdout_color_mt(key);
}

void set_log_level(std::string_view level) {
    const auto parsed = spdlog::level::from_str(std::string{level});
    // from_str maps unknown names to `off`; only accept "off" when asked for.
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument{"unknown log level: " + std::string{level}};
    }
    spdlog::set_level(parsed);
}

}  // namespace canvas_sync
