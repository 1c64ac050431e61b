/// @file drop_target.hpp
/// @brief Drag-and-drop target resolution for the node diagram.
///
/// The diagram is laid out left to right: parents sit in a column to the
/// left of their children. While a node is dragged, its rectangle is
/// compared against every other visible rectangle to decide whether the
/// gesture means "insert before", "insert after" or "become first child"
/// of some node.

#pragma once

#include <outliner-cpp/forest.hpp>
#include <outliner-cpp/tree_ops.hpp>
#include <outliner-cpp/types.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace outliner_cpp {

// -- Layout constants ---------------------------------------------------------

/// Fixed height of a node box, in pixels.
inline constexpr double node_height = 40.0;
/// Minimum width of a node box, in pixels.
inline constexpr double base_node_width = 80.0;
/// Approximate advance of one character, in pixels.
inline constexpr double char_width = 8.0;
/// Left plus right padding inside a node box, in pixels.
inline constexpr double horizontal_padding = 32.0;

/// Approximate rendered width of a node box for `label`.
/// Counts UTF-8 code points, not bytes.
auto node_width(std::string_view label) -> double;

// -- Geometry -----------------------------------------------------------------

/// A node's on-screen box as produced by the layout collaborator.
/// The width is derived from the label; the height is node_height.
struct NodeRect {
    NodeId id;          ///< The node this box draws.
    double x{0.0};      ///< Left edge.
    double y{0.0};      ///< Top edge.
    std::string label;  ///< Displayed text, used to approximate width.

    auto width() const -> double { return node_width(label); }
    auto right() const -> double { return x + width(); }
    auto center_y() const -> double { return y + node_height / 2; }

    auto operator==(const NodeRect&) const -> bool = default;
};

/// The layout collaborator: positions every visible node of a snapshot.
using LayoutFunction = std::function<std::vector<NodeRect>(const Forest&)>;

// -- Resolution ---------------------------------------------------------------

/// Where a dropped node goes relative to the target.
enum class InsertMode : std::uint8_t {
    before,  ///< Sibling directly before the target.
    after,   ///< Sibling directly after the target.
    child,   ///< First child of the target.
};

/// Convert an InsertMode to its string representation.
constexpr auto to_string_view(InsertMode mode) noexcept -> std::string_view {
    switch (mode) {
        case InsertMode::before: return "before";
        case InsertMode::after:  return "after";
        case InsertMode::child:  return "child";
    }
    return "unknown";
}

/// The structural intent of a drag gesture.
struct DropTarget {
    NodeId target_id;  ///< The node the dragged node is placed against.
    InsertMode mode;   ///< How it is placed.

    auto operator==(const DropTarget&) const -> bool = default;
};

/// Classify a drag gesture.
///
/// Candidates whose right edge lies strictly left of the dragged box are
/// "left nodes"; all others share the dragged node's column. A same-column
/// candidate always wins over a left node. Within the chosen class the
/// candidate with the smallest vertical centre distance is picked, then the
/// smallest horizontal distance between left edges, then the earliest in
/// `candidates`. Same-column targets yield before/after depending on which
/// side of the target's centre the dragged centre lies; left targets yield
/// child.
///
/// @param dragged The box of the node being dragged.
/// @param candidates Every other visible box (see drop_candidates()).
/// @return The target, or nullopt when there is no candidate at all.
auto resolve_drop_target(const NodeRect& dragged, std::span<const NodeRect> candidates)
    -> std::optional<DropTarget>;

/// Filter a full layout down to drop candidates for `dragged_id`:
/// everything except the dragged node itself and the forest root.
auto drop_candidates(std::span<const NodeRect> layout, const NodeId& dragged_id)
    -> std::vector<NodeRect>;

/// Apply a resolved drop to a snapshot.
///
/// before/after/child map to move_node_before/move_node_after/
/// move_node_as_first_child. No target promotes the node to the top level,
/// appended after the existing top-level nodes. Dropping a node where it
/// already is fails with no_op.
auto apply_drop(const Forest& forest, const NodeId& dragged_id,
                const std::optional<DropTarget>& target) -> EditResult;

}  // namespace outliner_cpp
