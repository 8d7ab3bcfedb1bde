#include <canvas-sync/clock.hpp>

#include <algorithm>
#include <chrono>
#include <utility>

namespace canvas_sync {

auto system_wall_clock() -> WallClock {
    return [] {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    };
}

HybridClock::HybridClock(std::string node_id, WallClock wall)
    : node_id_{std::move(node_id)}, wall_{std::move(wall)} {}

auto HybridClock::tick() -> ClockValue {
    const auto now = wall_();
    if (now > physical_) {
        physical_ = now;
        logical_ = 0;
    } else {
        ++logical_;
    }
    return current();
}

void HybridClock::merge(const ClockValue& remote) {
    const auto now = wall_();
    if (now > std::max(physical_, remote.physical)) {
        physical_ = now;
        logical_ = 0;
    } else if (physical_ == remote.physical) {
        logical_ = std::max(logical_, remote.logical) + 1;
    } else if (remote.physical > physical_) {
        physical_ = remote.physical;
        logical_ = remote.logical + 1;
    } else {
        ++logical_;
    }
}

auto HybridClock::current() const -> ClockValue {
    return ClockValue{.physical = physical_, .logical = logical_, .node_id = node_id_};
}

}  // namespace canvas_sync
