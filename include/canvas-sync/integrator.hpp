/// @file integrator.hpp
/// @brief Applies local and remote operations to the replica and tracks
///        the server version.

#pragma once

#include <canvas-sync/clock.hpp>
#include <canvas-sync/document_state.hpp>
#include <canvas-sync/operation.hpp>
#include <canvas-sync/protocol.hpp>
#include <canvas-sync/session.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace canvas_sync {

/// Owns the replica of the document and merges everything into it.
///
/// Remote operations first fold their clocks into the local clock, so the
/// next local tick dominates everything observed, and are then applied
/// under the last-writer-wins rule. A snapshot is handled as one large
/// remote batch.
class RemoteStateIntegrator {
public:
    RemoteStateIntegrator(HybridClock& clock, SessionState& session);

    /// Apply an operation this node just issued.
    /// @return True if it changed the replica.
    auto apply_local(const Operation& op) -> bool;

    /// Merge a remote batch.
    /// @param version Server version after the batch, if the frame carried one.
    /// @return The operations that changed the replica, in batch order.
    auto apply_remote(std::span<const Operation> ops,
                      std::optional<std::uint64_t> version = std::nullopt)
        -> std::vector<Operation>;

    /// Merge a full snapshot and adopt its version.
    /// @return The operations that changed the replica, or nullopt if the
    ///         snapshot's element map is malformed (nothing is applied then).
    auto apply_snapshot(const SnapshotData& snapshot) -> std::optional<std::vector<Operation>>;

    /// Record the server's version.
    void observe_version(std::uint64_t version);

    /// Last server version observed.
    auto version() const -> std::uint64_t { return session_.version; }

    /// Build a request for the full document.
    auto snapshot_request() const -> SnapshotRequest { return SnapshotRequest{}; }

    /// Build a request for the operations after `since`, defaulting to the
    /// last observed version.
    auto sync_request(std::optional<std::uint64_t> since = std::nullopt) const -> SyncRequest;

    auto state() const -> const DocumentState& { return state_; }

private:
    HybridClock& clock_;
    SessionState& session_;
    DocumentState state_;
};

}  // namespace canvas_sync
