#include <canvas-sync/integrator.hpp>

#include <canvas-sync/log.hpp>

#include <stdexcept>

namespace canvas_sync {

RemoteStateIntegrator::RemoteStateIntegrator(HybridClock& clock, SessionState& session)
    : clock_{clock}, session_{session} {}

auto RemoteStateIntegrator::apply_local(const Operation& op) -> bool {
    return state_.apply(op);
}

auto RemoteStateIntegrator::apply_remote(std::span<const Operation> ops,
                                         std::optional<std::uint64_t> version)
    -> std::vector<Operation> {
    for (const auto& op : ops) clock_.merge(op.clock);

    auto applied = state_.apply(ops);
    if (version) observe_version(*version);

    logger("integrator")->debug("merged {} of {} remote operations (version {})",
                                applied.size(), ops.size(), session_.version);
    return applied;
}

auto RemoteStateIntegrator::apply_snapshot(const SnapshotData& snapshot)
    -> std::optional<std::vector<Operation>> {
    auto ops = std::vector<Operation>{};
    try {
        ops = DocumentState::expand(snapshot.elements);
    } catch (const std::invalid_argument& e) {
        logger("integrator")->warn("discarding snapshot of {}: {}", snapshot.document_id, e.what());
        return std::nullopt;
    }

    auto applied = apply_remote(ops, snapshot.version);
    logger("integrator")->info("snapshot of {} at version {}: {} elements, {} registers changed",
                               snapshot.document_id, snapshot.version,
                               state_.element_ids().size(), applied.size());
    return applied;
}

void RemoteStateIntegrator::observe_version(std::uint64_t version) {
    session_.version = version;
}

auto RemoteStateIntegrator::sync_request(std::optional<std::uint64_t> since) const
    -> SyncRequest {
    return SyncRequest{.since_version = since.value_or(session_.version)};
}

}  // namespace canvas_sync
