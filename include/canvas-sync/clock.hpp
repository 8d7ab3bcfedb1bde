/// @file clock.hpp
/// @brief Hybrid logical clock: ClockValue and HybridClock.

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace canvas_sync {

/// A causally ordered timestamp produced by one node.
///
/// Ordering is lexicographic on (physical, logical, node_id). The node id
/// is the final tie-break, so two distinct nodes never produce equal
/// values and every pair of clocks is comparable.
struct ClockValue {
    std::int64_t physical{0};   ///< Wall-clock milliseconds since Unix epoch.
    std::uint64_t logical{0};   ///< Counter for events within the same millisecond.
    std::string node_id;        ///< The node that produced this timestamp.

    auto operator<=>(const ClockValue&) const = default;
    auto operator==(const ClockValue&) const -> bool = default;
};

/// Source of wall-clock time in milliseconds since Unix epoch.
using WallClock = std::function<std::int64_t()>;

/// The system clock, read through std::chrono::system_clock.
auto system_wall_clock() -> WallClock;

/// A hybrid logical clock owned by a single node.
///
/// tick() stamps a locally issued event; merge() folds in a timestamp
/// observed on a remote event so that later ticks dominate it. Wall
/// clocks across nodes need not be synchronized: when the local wall
/// clock lags, the logical counter carries causality forward.
///
/// @code
/// auto clock = HybridClock{"node-a"};
/// auto t1 = clock.tick();
/// clock.merge(remote_op.clock);
/// auto t2 = clock.tick();  // t2 > t1 and t2 > remote_op.clock
/// @endcode
class HybridClock {
public:
    /// Construct a clock for the given node, reading time from `wall`.
    explicit HybridClock(std::string node_id, WallClock wall = system_wall_clock());

    /// Advance the clock for a local event and return the new timestamp.
    ///
    /// The result is strictly greater than every value previously
    /// returned by tick() or folded in by merge().
    auto tick() -> ClockValue;

    /// Fold a remote timestamp into the local clock.
    ///
    /// Afterwards the local (physical, logical) pair is at least as large
    /// as both its previous value and the remote pair.
    void merge(const ClockValue& remote);

    /// The current timestamp without advancing the clock.
    auto current() const -> ClockValue;

    /// The node id stamped into every value this clock produces.
    auto node_id() const -> const std::string& { return node_id_; }

private:
    std::string node_id_;
    WallClock wall_;
    std::int64_t physical_{0};
    std::uint64_t logical_{0};
};

}  // namespace canvas_sync
