/// @file tree_ops.hpp
/// @brief Pure structural edits over Forest snapshots.
///
/// Every function here takes a snapshot by const reference and never mutates
/// it. Queries return plain values; edits return an EditResult holding
/// either the new snapshot or the Error explaining why none was produced.
/// Any sibling group an edit touches is renormalized to 0..n-1 before the
/// new snapshot is returned.

#pragma once

#include <outliner-cpp/error.hpp>
#include <outliner-cpp/forest.hpp>
#include <outliner-cpp/node.hpp>
#include <outliner-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace outliner_cpp {

/// The outcome of a structural edit.
///
/// Holds the new snapshot on success. On failure it holds an Error whose
/// kind is not_found, invalid_operation or no_op; in every failure case the
/// input snapshot is still the valid current state.
struct EditResult {
    std::variant<Forest, Error> inner;  ///< The new snapshot or the failure reason.

    EditResult(Forest f) : inner{std::move(f)} {}
    EditResult(Error e) : inner{std::move(e)} {}

    /// Check if the edit produced a new snapshot.
    auto ok() const -> bool { return std::holds_alternative<Forest>(inner); }
    explicit operator bool() const { return ok(); }

    /// The new snapshot. Only valid when ok().
    auto forest() const& -> const Forest& { return std::get<Forest>(inner); }
    auto forest() && -> Forest { return std::get<Forest>(std::move(inner)); }

    /// The failure reason. Only valid when !ok().
    auto error() const -> const Error& { return std::get<Error>(inner); }
};

// -- Queries ------------------------------------------------------------------

/// Children of `parent_id` sorted ascending by order. Ties keep storage order.
auto get_children(const Forest& forest, const NodeId& parent_id) -> std::vector<Node>;

/// Every id transitively below `node_id`, excluding `node_id` itself.
auto get_descendant_ids(const Forest& forest, const NodeId& node_id)
    -> std::unordered_set<NodeId>;

/// Depth-first pre-order starting from the sentinel's children.
/// This is the display order of the text view and of keyboard navigation.
auto get_flattened_order(const Forest& forest) -> std::vector<Node>;

/// Number of hops from `node_id` up to the sentinel's children (which have
/// depth 0). Returns 0 for an unknown id and for the sentinel.
auto get_depth(const Forest& forest, const NodeId& node_id) -> std::size_t;

/// The node displayed just before `node_id`, or nullopt at the top.
auto previous_in_order(const Forest& forest, const NodeId& node_id) -> std::optional<NodeId>;

/// The node displayed just after `node_id`, or nullopt at the bottom.
auto next_in_order(const Forest& forest, const NodeId& node_id) -> std::optional<NodeId>;

// -- Ordering -----------------------------------------------------------------

/// Reassign orders 0..n-1 to the children of `parent_id`, keeping their
/// relative order. Other sibling groups are left untouched.
auto normalize_orders(const Forest& forest, const NodeId& parent_id) -> Forest;

// -- Structural edits ---------------------------------------------------------

/// Make `node_id` the last child of its immediately preceding sibling.
/// Fails with no_op when the node is the first of its siblings.
auto indent_node(const Forest& forest, const NodeId& node_id) -> EditResult;

/// Make `node_id` the sibling that directly follows its former parent.
/// Fails with no_op when the node is already top-level.
auto outdent_node(const Forest& forest, const NodeId& node_id) -> EditResult;

/// Insert `new_node` as the sibling right after `after_id`.
///
/// If `after_id` does not exist, `new_node` is appended with its own
/// parent_id (the forest root when that parent is unset or missing) and
/// its own order. Fails with invalid_operation when the new id is already
/// in use or `after_id` is the sentinel.
auto add_node_after(const Forest& forest, const NodeId& after_id, Node new_node) -> EditResult;

/// Append `new_node` as the last child of `parent_id`.
auto add_child(const Forest& forest, const NodeId& parent_id, Node new_node) -> EditResult;

/// Remove `node_id`. Its children take its place under its former parent,
/// in their existing relative order.
auto delete_node(const Forest& forest, const NodeId& node_id) -> EditResult;

/// Reparent `node_id` under `new_parent_id`.
/// @param insert_order Order value to give the node before renormalization;
///   nullopt appends it after the existing children.
/// Fails with invalid_operation when the move would create a cycle.
/// All moves fail with no_op when the node would keep its parent and its
/// position among its siblings.
auto move_node(const Forest& forest, const NodeId& node_id, const NodeId& new_parent_id,
               std::optional<double> insert_order = std::nullopt) -> EditResult;

/// Move `node_id` to be the sibling directly before `target_id`.
auto move_node_before(const Forest& forest, const NodeId& node_id, const NodeId& target_id)
    -> EditResult;

/// Move `node_id` to be the sibling directly after `target_id`.
auto move_node_after(const Forest& forest, const NodeId& node_id, const NodeId& target_id)
    -> EditResult;

/// Move `node_id` to be the first child of `target_id`.
auto move_node_as_first_child(const Forest& forest, const NodeId& node_id,
                              const NodeId& target_id) -> EditResult;

/// Replace the label of `node_id`. Not a structural edit.
auto update_node_text(const Forest& forest, const NodeId& node_id, std::string text)
    -> EditResult;

}  // namespace outliner_cpp
