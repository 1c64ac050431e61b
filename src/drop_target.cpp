#include <outliner-cpp/drop_target.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>

namespace outliner_cpp {

namespace {

auto code_points(std::string_view text) -> std::size_t {
    // Count every byte that is not a UTF-8 continuation byte (10xxxxxx).
    return static_cast<std::size_t>(std::ranges::count_if(text, [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

// Closest candidate by |dy|, then |dx| of left edges. Strict comparisons
// keep the earliest candidate on exact ties.
auto closest(const NodeRect& dragged, const std::vector<const NodeRect*>& pool)
    -> const NodeRect* {
    const NodeRect* best = nullptr;
    auto best_dy = 0.0;
    auto best_dx = 0.0;
    const auto dragged_cy = dragged.center_y();
    for (const auto* candidate : pool) {
        const auto dy = std::abs(dragged_cy - candidate->center_y());
        const auto dx = std::abs(dragged.x - candidate->x);
        if (!best || dy < best_dy || (dy == best_dy && dx < best_dx)) {
            best = candidate;
            best_dy = dy;
            best_dx = dx;
        }
    }
    return best;
}

}  // anonymous namespace

auto node_width(std::string_view label) -> double {
    const auto text_width = static_cast<double>(code_points(label)) * char_width;
    return std::max(base_node_width, text_width + horizontal_padding);
}

auto resolve_drop_target(const NodeRect& dragged, std::span<const NodeRect> candidates)
    -> std::optional<DropTarget> {
    auto left_nodes = std::vector<const NodeRect*>{};
    auto same_column = std::vector<const NodeRect*>{};
    for (const auto& candidate : candidates) {
        if (candidate.right() < dragged.x) {
            left_nodes.push_back(&candidate);
        } else {
            same_column.push_back(&candidate);
        }
    }

    if (const auto* target = closest(dragged, same_column)) {
        const auto mode = dragged.center_y() < target->center_y() ? InsertMode::before
                                                                  : InsertMode::after;
        return DropTarget{.target_id = target->id, .mode = mode};
    }
    if (const auto* target = closest(dragged, left_nodes)) {
        return DropTarget{.target_id = target->id, .mode = InsertMode::child};
    }
    return std::nullopt;
}

auto drop_candidates(std::span<const NodeRect> layout, const NodeId& dragged_id)
    -> std::vector<NodeRect> {
    auto result = std::vector<NodeRect>{};
    result.reserve(layout.size());
    std::ranges::copy_if(layout, std::back_inserter(result), [&](const NodeRect& r) {
        return r.id != dragged_id && !r.id.is_root();
    });
    return result;
}

auto apply_drop(const Forest& forest, const NodeId& dragged_id,
                const std::optional<DropTarget>& target) -> EditResult {
    if (!target) {
        return move_node(forest, dragged_id, forest_root_id);
    }
    switch (target->mode) {
        case InsertMode::before: return move_node_before(forest, dragged_id, target->target_id);
        case InsertMode::after:  return move_node_after(forest, dragged_id, target->target_id);
        case InsertMode::child:
            return move_node_as_first_child(forest, dragged_id, target->target_id);
    }
    return Error{ErrorKind::invalid_operation, "unknown insert mode"};
}

}  // namespace outliner_cpp
