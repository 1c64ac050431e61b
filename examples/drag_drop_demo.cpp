// drag_drop_demo - drop-target resolution against a toy diagram layout
//
// Demonstrates: LayoutFunction, drop_candidates, resolve_drop_target,
//               Store::drop, the no-target case
//
// Build: cmake --build build
// Run:   ./build/examples/drag_drop_demo

#include <outliner-cpp/outliner.hpp>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace ol = outliner_cpp;

// One column per depth, one row per node in display order.
static auto column_layout(const ol::Forest& forest) -> std::vector<ol::NodeRect> {
    constexpr auto column_width = 160.0;
    constexpr auto row_height = 60.0;

    auto rects = std::vector<ol::NodeRect>{};
    auto row = 0.0;
    for (const auto& node : ol::get_flattened_order(forest)) {
        rects.push_back(ol::NodeRect{
            .id = node.id,
            .x = static_cast<double>(ol::get_depth(forest, node.id)) * column_width,
            .y = row++ * row_height,
            .label = node.text,
        });
    }
    return rects;
}

static auto label_of(const ol::Forest& forest, const ol::NodeId& id) -> std::string {
    const auto* node = forest.find(id);
    return node ? node->text : id.value;
}

static void print_layout(const ol::Forest& forest, const ol::LayoutFunction& layout) {
    for (const auto& r : layout(forest)) {
        std::printf("  (%4.0f, %4.0f) w=%3.0f  %s\n", r.x, r.y, r.width(), r.label.c_str());
    }
    std::printf("\n");
}

// Drag `text` so that its box lands at (x, y), then release.
static void drag(ol::Store& store, const ol::LayoutFunction& layout, const std::string& text,
                 double x, double y) {
    const auto rects = layout(store.forest());
    auto dragged = ol::NodeRect{};
    for (const auto& r : rects) {
        if (r.label == text) dragged = r;
    }
    dragged.x = x;
    dragged.y = y;

    const auto candidates = ol::drop_candidates(rects, dragged.id);
    const auto target = ol::resolve_drop_target(dragged, candidates);
    if (target) {
        const auto mode = ol::to_string_view(target->mode);
        std::printf("drop '%s' at (%.0f, %.0f): %.*s '%s'\n", text.c_str(), x, y,
                    static_cast<int>(mode.size()), mode.data(),
                    label_of(store.forest(), target->target_id).c_str());
    } else {
        std::printf("drop '%s' at (%.0f, %.0f): no target, move to top level\n",
                    text.c_str(), x, y);
    }

    if (!store.drop(dragged.id, target) && store.last_error()) {
        std::printf("  rejected: %s\n", store.last_error()->message.c_str());
    }
    print_layout(store.forest(), layout);
}

int main() {
    const auto layout = ol::LayoutFunction{column_layout};
    auto store = ol::Store{ol::StoreConfig{}, nullptr,
                           std::make_shared<ol::SequentialIdGenerator>()};

    std::printf("initial layout:\n");
    print_layout(store.forest(), layout);

    // Same column, just above "Child 2.1": becomes its previous sibling.
    drag(store, layout, "Child 1.2", 160, 280);

    // Right of every box, level with "Root 2": becomes its first child.
    drag(store, layout, "Child 1.1", 500, 180);

    // Just above its own child: rejected, nothing changes.
    drag(store, layout, "Child 1.1", 320, 160);

    // Nothing else on screen: no target. The node is already top-level, so the
    // drop is rejected with no_op.
    store.import_text("solo");
    drag(store, layout, "solo", 0, 0);

    return 0;
}
