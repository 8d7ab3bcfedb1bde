#include <canvas-sync/integrator.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <tuple>
#include <vector>

using namespace canvas_sync;
using canvas_sync::testing::fixed_wall;
using json = nlohmann::json;

namespace {

auto at(std::int64_t physical, std::uint64_t logical, std::string node) -> ClockValue {
    return ClockValue{.physical = physical, .logical = logical, .node_id = std::move(node)};
}

struct Replica {
    HybridClock clock{"local", fixed_wall(1000)};
    SessionState session{.session_id = "local"};
    RemoteStateIntegrator integrator{clock, session};
};

}  // namespace

TEST(RemoteStateIntegrator, local_ops_apply_directly) {
    auto r = Replica{};
    const auto op = make_set("e1", "x", 1, r.clock.tick());
    EXPECT_TRUE(r.integrator.apply_local(op));
    EXPECT_EQ(r.integrator.state().get("e1", "x"), json(1));
}

TEST(RemoteStateIntegrator, remote_clocks_are_merged_before_next_tick) {
    auto r = Replica{};
    const auto remote = std::vector<Operation>{
        make_set("e1", "x", 5, at(9000, 3, "remote")),
    };
    r.integrator.apply_remote(remote);

    // The local wall clock is far behind, yet the next local write wins.
    const auto local = make_set("e1", "x", 6, r.clock.tick());
    EXPECT_GT(local.clock, remote[0].clock);
    EXPECT_TRUE(r.integrator.apply_local(local));
    EXPECT_EQ(r.integrator.state().get("e1", "x"), json(6));
}

TEST(RemoteStateIntegrator, clock_passes_every_op_in_a_batch) {
    auto r = Replica{};
    const auto batch = std::vector<Operation>{
        make_set("e1", "x", 1, at(7000, 4, "z")),
        make_set("e2", "x", 1, at(3000, 0, "a")),
    };
    r.integrator.apply_remote(batch);
    const auto next = r.clock.tick();
    EXPECT_GT(std::tuple(next.physical, next.logical), std::tuple(std::int64_t{7000}, std::uint64_t{4}));
}

TEST(RemoteStateIntegrator, remote_batch_reports_changed_ops_and_version) {
    auto r = Replica{};
    r.integrator.apply_local(make_set("e1", "x", 1, at(5000, 0, "local")));

    const auto batch = std::vector<Operation>{
        make_set("e1", "x", 2, at(4000, 0, "remote")),  // loses
        make_set("e1", "y", 3, at(4000, 1, "remote")),  // wins
    };
    const auto applied = r.integrator.apply_remote(batch, 12);
    ASSERT_EQ(applied.size(), 1u);
    EXPECT_EQ(applied[0].prop, "y");
    EXPECT_EQ(r.integrator.version(), 12u);
    EXPECT_EQ(r.session.version, 12u);
}

TEST(RemoteStateIntegrator, batch_without_version_keeps_last_version) {
    auto r = Replica{};
    r.integrator.observe_version(4);
    r.integrator.apply_remote(std::vector<Operation>{make_set("e", "p", 1, at(1, 0, "r"))});
    EXPECT_EQ(r.integrator.version(), 4u);
}

TEST(RemoteStateIntegrator, snapshot_is_merged_not_replaced) {
    auto r = Replica{};
    r.integrator.apply_local(make_add_element("mine", {{"x", 1}}, at(2000, 0, "local")));

    auto source = DocumentState{};
    source.apply(make_add_element("theirs", {{"y", 2}}, at(1500, 0, "remote")));
    const auto applied = r.integrator.apply_snapshot(
        SnapshotData{.document_id = "doc", .version = 9, .elements = source.to_json()});

    ASSERT_TRUE(applied.has_value());
    EXPECT_FALSE(applied->empty());
    EXPECT_TRUE(r.integrator.state().exists("mine"));
    EXPECT_TRUE(r.integrator.state().exists("theirs"));
    EXPECT_EQ(r.integrator.version(), 9u);
}

TEST(RemoteStateIntegrator, malformed_snapshot_applies_nothing) {
    auto r = Replica{};
    r.integrator.observe_version(3);
    const auto applied = r.integrator.apply_snapshot(SnapshotData{
        .document_id = "doc",
        .version = 50,
        .elements = json{{"ok", {{"lifecycle", {{"value", true}, {"clock", {{"physical", 1}}}}}}},
                         {"bad", "not an element"}},
    });
    EXPECT_FALSE(applied.has_value());
    EXPECT_EQ(r.integrator.version(), 3u);
    EXPECT_EQ(r.integrator.state().size(), 0u);
}

TEST(RemoteStateIntegrator, sync_request_defaults_to_last_version) {
    auto r = Replica{};
    EXPECT_EQ(r.integrator.sync_request().since_version, 0u);
    r.integrator.observe_version(17);
    EXPECT_EQ(r.integrator.sync_request().since_version, 17u);
    EXPECT_EQ(r.integrator.sync_request(5).since_version, 5u);
    EXPECT_EQ(r.integrator.snapshot_request(), SnapshotRequest{});
}
