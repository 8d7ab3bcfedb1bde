// canvas-sync benchmarks: measures throughput of core operations.

#include <canvas-sync/clock.hpp>
#include <canvas-sync/document_state.hpp>
#include <canvas-sync/operation.hpp>
#include <canvas-sync/protocol.hpp>
#include <canvas-sync/server/authoritative_document.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace canvas_sync;

static auto stamp(std::int64_t physical, std::string node = "bench") -> ClockValue {
    return ClockValue{.physical = physical, .logical = 0, .node_id = std::move(node)};
}

// A board of `elements` shapes with a handful of properties each.
static auto make_board(int elements) -> std::vector<Operation> {
    auto ops = std::vector<Operation>{};
    std::int64_t t = 1;
    for (int i = 0; i < elements; ++i) {
        const auto id = "el-" + std::to_string(i);
        ops.push_back(make_add_element(id, {{"x", i}, {"y", i * 2}, {"w", 80}, {"h", 40}}, stamp(t++)));
        ops.push_back(make_set(id, "fill", "#336699", stamp(t++)));
        ops.push_back(make_set(id, "label", "shape " + std::to_string(i), stamp(t++)));
    }
    return ops;
}

// =============================================================================
// Hybrid clock
// =============================================================================

static void bm_clock_tick(benchmark::State& state) {
    auto clock = HybridClock{"bench"};
    for (auto _ : state) {
        auto value = clock.tick();
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_clock_tick);

static void bm_clock_merge_tick(benchmark::State& state) {
    auto clock = HybridClock{"bench"};
    std::int64_t remote = 0;
    for (auto _ : state) {
        clock.merge(stamp(++remote, "peer"));
        auto value = clock.tick();
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_clock_merge_tick);

// =============================================================================
// Document state
// =============================================================================

static void bm_apply_set_same_register(benchmark::State& state) {
    auto doc = DocumentState{};
    std::int64_t t = 0;
    for (auto _ : state) {
        ++t;
        auto changed = doc.apply(make_set("rect", "x", t, stamp(t)));
        benchmark::DoNotOptimize(changed);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_set_same_register);

static void bm_apply_stale_set(benchmark::State& state) {
    auto doc = DocumentState{};
    doc.apply(make_set("rect", "x", 1, stamp(1000000)));
    const auto stale = make_set("rect", "x", 2, stamp(1));
    for (auto _ : state) {
        auto changed = doc.apply(stale);
        benchmark::DoNotOptimize(changed);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_stale_set);

static void bm_apply_board(benchmark::State& state) {
    const auto ops = make_board(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto doc = DocumentState{};
        auto applied = doc.apply(ops);
        benchmark::DoNotOptimize(applied);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * ops.size()));
}
BENCHMARK(bm_apply_board)->Range(10, 1000);

static void bm_snapshot(benchmark::State& state) {
    auto doc = DocumentState{};
    doc.apply(make_board(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto view = doc.snapshot();
        benchmark::DoNotOptimize(view);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_snapshot)->Range(10, 1000);

static void bm_expand_snapshot(benchmark::State& state) {
    auto doc = DocumentState{};
    doc.apply(make_board(static_cast<int>(state.range(0))));
    const auto full = doc.to_json();
    for (auto _ : state) {
        auto ops = DocumentState::expand(full);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_expand_snapshot)->Range(10, 1000);

// =============================================================================
// Wire codec
// =============================================================================

static void bm_encode_op(benchmark::State& state) {
    const auto msg = ClientMessage{OpMessage{make_set("rect", "fill", "#ff0000", stamp(42))}};
    for (auto _ : state) {
        auto frame = encode(msg);
        benchmark::DoNotOptimize(frame);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_encode_op);

static void bm_decode_broadcast(benchmark::State& state) {
    const auto frame = encode(ServerMessage{OpsBroadcast{
        .ops = make_board(static_cast<int>(state.range(0))), .version = 1, .origin = "peer"}});
    for (auto _ : state) {
        auto msg = decode_server_message(frame);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * frame.size()));
}
BENCHMARK(bm_decode_broadcast)->Range(1, 100);

// =============================================================================
// Server document
// =============================================================================

static void bm_ops_since(benchmark::State& state) {
    auto doc = server::AuthoritativeDocument{"bench"};
    doc.apply(make_board(1000));
    const auto since = doc.version() - static_cast<std::uint64_t>(state.range(0));
    for (auto _ : state) {
        auto ops = doc.ops_since(since);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_ops_since)->Range(1, 1000);

static void bm_state_vector(benchmark::State& state) {
    auto doc = server::AuthoritativeDocument{"bench"};
    doc.apply(make_board(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto vector = doc.state_vector();
        benchmark::DoNotOptimize(vector);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_state_vector)->Range(10, 1000);
