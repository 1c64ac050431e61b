// outliner-cpp benchmarks - measures throughput of core operations.

#include <outliner-cpp/outliner.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace outliner_cpp;

// A forest of `n` nodes: top-level trees of ten children each.
static auto make_forest(std::size_t n) -> Forest {
    auto ids = SequentialIdGenerator{};
    auto nodes = std::vector<Node>{make_root_node()};
    nodes.reserve(n + 1);
    auto parent = forest_root_id;
    auto top_level = 0.0;
    auto in_group = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        auto id = ids.next();
        if (i % 11 == 0) {
            nodes.push_back(Node{.id = id, .text = "top", .parent_id = forest_root_id,
                                 .order = top_level++});
            parent = id;
            in_group = 0.0;
        } else {
            nodes.push_back(Node{.id = id, .text = "child " + std::to_string(i),
                                 .parent_id = parent, .order = in_group++});
        }
    }
    return Forest{std::move(nodes)};
}

// A second child in the middle of the forest, so indent always applies.
static auto middle_id(const Forest& forest) -> NodeId {
    const auto top = get_children(forest, forest_root_id);
    const auto& parent = top[top.size() / 2];
    const auto group = get_children(forest, parent.id);
    return group.size() > 1 ? group[1].id : parent.id;
}

// =============================================================================
// Queries
// =============================================================================

static void bm_flattened_order(benchmark::State& state) {
    const auto forest = make_forest(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto order = get_flattened_order(forest);
        benchmark::DoNotOptimize(order);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_flattened_order)->Range(64, 4096);

static void bm_descendant_ids(benchmark::State& state) {
    const auto forest = make_forest(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto ids = get_descendant_ids(forest, forest_root_id);
        benchmark::DoNotOptimize(ids);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_descendant_ids)->Range(64, 4096);

// =============================================================================
// Structural edits
// =============================================================================

static void bm_indent(benchmark::State& state) {
    const auto forest = make_forest(static_cast<std::size_t>(state.range(0)));
    const auto target = middle_id(forest);
    for (auto _ : state) {
        auto result = indent_node(forest, target);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_indent)->Range(64, 4096);

static void bm_move_after(benchmark::State& state) {
    const auto forest = make_forest(static_cast<std::size_t>(state.range(0)));
    const auto first = forest.nodes()[2].id;
    const auto last = forest.nodes().back().id;
    for (auto _ : state) {
        auto result = move_node_after(forest, first, last);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_move_after)->Range(64, 4096);

static void bm_delete(benchmark::State& state) {
    const auto forest = make_forest(static_cast<std::size_t>(state.range(0)));
    const auto target = forest.nodes()[1].id;
    for (auto _ : state) {
        auto result = delete_node(forest, target);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_delete)->Range(64, 4096);

// =============================================================================
// Outline text
// =============================================================================

static void bm_format_outline(benchmark::State& state) {
    const auto forest = make_forest(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto text = format_outline(forest);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_format_outline)->Range(64, 4096);

static void bm_parse_outline(benchmark::State& state) {
    const auto text = format_outline(make_forest(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto ids = SequentialIdGenerator{};
        auto forest = parse_outline(text, ids);
        benchmark::DoNotOptimize(forest);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_parse_outline)->Range(64, 4096);

// =============================================================================
// Drop-target resolution
// =============================================================================

static void bm_resolve_drop_target(benchmark::State& state) {
    const auto forest = make_forest(static_cast<std::size_t>(state.range(0)));
    auto layout = std::vector<NodeRect>{};
    auto row = 0.0;
    for (const auto& node : get_flattened_order(forest)) {
        layout.push_back(NodeRect{
            .id = node.id,
            .x = static_cast<double>(get_depth(forest, node.id)) * 160.0,
            .y = row++ * 60.0,
            .label = node.text,
        });
    }
    const auto dragged = NodeRect{.id = NodeId{"dragged"}, .x = 160.0, .y = row * 30.0,
                                  .label = "dragged"};
    for (auto _ : state) {
        auto target = resolve_drop_target(dragged, layout);
        benchmark::DoNotOptimize(target);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_resolve_drop_target)->Range(64, 4096);

// =============================================================================
// Store with history
// =============================================================================

static void bm_store_indent_undo(benchmark::State& state) {
    auto store = Store{StoreConfig{.autosave = false}, nullptr,
                       std::make_shared<SequentialIdGenerator>()};
    if (!store.set_forest(make_forest(static_cast<std::size_t>(state.range(0))))) {
        state.SkipWithError("generated forest is invalid");
        return;
    }
    const auto target = middle_id(store.forest());
    for (auto _ : state) {
        benchmark::DoNotOptimize(store.indent(target));
        benchmark::DoNotOptimize(store.undo());
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_store_indent_undo)->Range(64, 4096);
