#include <outliner-cpp/tree_ops.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <limits>
#include <ranges>
#include <string_view>
#include <unordered_map>

namespace outliner_cpp {

namespace {

using NodeList = std::vector<Node>;
using Group = std::vector<std::size_t>;  // indices into a NodeList

constexpr auto append_position = std::numeric_limits<std::size_t>::max();

auto not_found(const NodeId& id) -> Error {
    return Error{ErrorKind::not_found, "node '" + id.value + "' does not exist"};
}

auto root_operand(std::string_view op) -> Error {
    return Error{ErrorKind::invalid_operation,
                 std::string{op} + ": the forest root is not a valid operand"};
}

auto index_of(const NodeList& nodes, const NodeId& id) -> std::optional<std::size_t> {
    auto it = std::ranges::find(nodes, id, &Node::id);
    if (it == nodes.end()) return std::nullopt;
    return static_cast<std::size_t>(std::distance(nodes.begin(), it));
}

// Children of `parent` sorted by order (stable on storage position),
// leaving out `skip` when given.
auto sorted_group(const NodeList& nodes, const NodeId& parent,
                  std::optional<std::size_t> skip = std::nullopt) -> Group {
    auto group = Group{};
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (skip && *skip == i) continue;
        if (nodes[i].parent_id == parent) group.push_back(i);
    }
    std::ranges::stable_sort(group, [&](std::size_t a, std::size_t b) {
        return nodes[a].order < nodes[b].order;
    });
    return group;
}

void renumber(NodeList& nodes, const Group& group) {
    for (std::size_t i = 0; i < group.size(); ++i) {
        nodes[group[i]].order = static_cast<double>(i);
    }
}

void renumber(NodeList& nodes, const NodeId& parent) {
    renumber(nodes, sorted_group(nodes, parent));
}

auto position_in(const Group& group, std::size_t idx) -> std::size_t {
    return static_cast<std::size_t>(std::distance(group.begin(), std::ranges::find(group, idx)));
}

// Reparent nodes[idx] under `parent`, slotting it into `others` (the new
// sibling group without the node) at `position`. Both the destination group
// and the group the node left are renumbered.
void splice_into(NodeList& nodes, std::size_t idx, const NodeId& parent, Group others,
                 std::size_t position) {
    const auto old_parent = nodes[idx].parent_id;
    position = std::min(position, others.size());
    others.insert(others.begin() + static_cast<std::ptrdiff_t>(position), idx);
    nodes[idx].parent_id = parent;
    renumber(nodes, others);
    if (old_parent && *old_parent != parent) {
        renumber(nodes, *old_parent);
    }
}

// parent id -> child indices, each list sorted by order.
auto child_index(const NodeList& nodes) -> std::unordered_map<NodeId, Group> {
    auto index = std::unordered_map<NodeId, Group>{};
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].parent_id) index[*nodes[i].parent_id].push_back(i);
    }
    for (auto& [_, group] : index) {
        std::ranges::stable_sort(group, [&](std::size_t a, std::size_t b) {
            return nodes[a].order < nodes[b].order;
        });
    }
    return index;
}

// Shared precondition of every move: the node exists and is not the root,
// the new parent exists, and the new parent is not inside the moved subtree.
auto check_move(const Forest& forest, const NodeId& node_id, const NodeId& new_parent_id)
    -> std::optional<Error> {
    if (node_id == new_parent_id) {
        return Error{ErrorKind::invalid_operation,
                     "node '" + node_id.value + "' cannot become its own parent"};
    }
    if (node_id.is_root()) return root_operand("move");
    if (!forest.contains(node_id)) return not_found(node_id);
    if (!forest.contains(new_parent_id)) return not_found(new_parent_id);
    if (get_descendant_ids(forest, node_id).contains(new_parent_id)) {
        return Error{ErrorKind::invalid_operation,
                     "moving '" + node_id.value + "' under its descendant '" +
                     new_parent_id.value + "' would create a cycle"};
    }
    return std::nullopt;
}

auto check_new_node(const Forest& forest, const Node& node) -> std::optional<Error> {
    if (node.id.empty()) {
        return Error{ErrorKind::invalid_operation, "new node has an empty id"};
    }
    if (forest.contains(node.id)) {
        return Error{ErrorKind::invalid_operation,
                     "node id '" + node.id.value + "' is already in use"};
    }
    return std::nullopt;
}

// True when reparenting nodes[idx] under `parent` at `position` (an index
// into the group without the node) would leave it exactly where it is.
auto stays_put(const NodeList& nodes, std::size_t idx, const NodeId& parent,
               std::size_t position) -> bool {
    if (nodes[idx].parent_id != parent) return false;
    const auto group = sorted_group(nodes, parent);
    return position_in(group, idx) == std::min(position, group.size() - 1);
}

auto unmoved(const NodeId& id) -> Error {
    return Error{ErrorKind::no_op, "node '" + id.value + "' is already in that position"};
}

// Move relative to a sibling: the node lands directly before or after `target_id`.
auto move_beside(const Forest& forest, const NodeId& node_id, const NodeId& target_id,
                 bool after) -> EditResult {
    const auto* target = forest.find(target_id);
    if (!target) return not_found(target_id);
    if (target->is_root()) return root_operand(after ? "move after" : "move before");
    if (node_id == target_id) {
        return Error{ErrorKind::no_op, "node '" + node_id.value + "' cannot move beside itself"};
    }
    const auto parent = *target->parent_id;
    if (auto err = check_move(forest, node_id, parent)) return *err;

    auto nodes = forest.nodes();
    const auto idx = *index_of(nodes, node_id);
    const auto target_idx = *index_of(nodes, target_id);
    auto others = sorted_group(nodes, parent, idx);
    const auto position = position_in(others, target_idx) + (after ? 1 : 0);
    if (stays_put(nodes, idx, parent, position)) return unmoved(node_id);
    splice_into(nodes, idx, parent, std::move(others), position);
    return Forest{std::move(nodes)};
}

}  // anonymous namespace

// -- Queries ------------------------------------------------------------------

auto get_children(const Forest& forest, const NodeId& parent_id) -> std::vector<Node> {
    const auto& nodes = forest.nodes();
    auto result = std::vector<Node>{};
    for (auto i : sorted_group(nodes, parent_id)) {
        result.push_back(nodes[i]);
    }
    return result;
}

auto get_descendant_ids(const Forest& forest, const NodeId& node_id)
    -> std::unordered_set<NodeId> {
    const auto& nodes = forest.nodes();
    const auto index = child_index(nodes);

    auto result = std::unordered_set<NodeId>{};
    auto pending = std::vector<NodeId>{node_id};
    while (!pending.empty()) {
        auto current = std::move(pending.back());
        pending.pop_back();
        auto it = index.find(current);
        if (it == index.end()) continue;
        for (auto i : it->second) {
            // insert() failing means a malformed cycle; never walk it twice.
            if (nodes[i].id != node_id && result.insert(nodes[i].id).second) {
                pending.push_back(nodes[i].id);
            }
        }
    }
    return result;
}

auto get_flattened_order(const Forest& forest) -> std::vector<Node> {
    const auto& nodes = forest.nodes();
    const auto index = child_index(nodes);

    auto result = std::vector<Node>{};
    result.reserve(forest.size());

    auto visited = std::unordered_set<std::size_t>{};
    auto stack = Group{};
    auto push_children = [&](const NodeId& parent) {
        auto it = index.find(parent);
        if (it == index.end()) return;
        for (auto i : std::views::reverse(it->second)) stack.push_back(i);
    };

    push_children(forest_root_id);
    while (!stack.empty()) {
        auto i = stack.back();
        stack.pop_back();
        if (!visited.insert(i).second) continue;
        result.push_back(nodes[i]);
        push_children(nodes[i].id);
    }
    return result;
}

auto get_depth(const Forest& forest, const NodeId& node_id) -> std::size_t {
    const auto* node = forest.find(node_id);
    if (!node || node->is_root()) return 0;

    auto depth = std::size_t{0};
    while (node->parent_id && !node->parent_id->is_root() && depth < forest.size()) {
        node = forest.find(*node->parent_id);
        if (!node) break;
        ++depth;
    }
    return depth;
}

auto previous_in_order(const Forest& forest, const NodeId& node_id) -> std::optional<NodeId> {
    const auto order = get_flattened_order(forest);
    auto it = std::ranges::find(order, node_id, &Node::id);
    if (it == order.end() || it == order.begin()) return std::nullopt;
    return std::prev(it)->id;
}

auto next_in_order(const Forest& forest, const NodeId& node_id) -> std::optional<NodeId> {
    const auto order = get_flattened_order(forest);
    auto it = std::ranges::find(order, node_id, &Node::id);
    if (it == order.end() || std::next(it) == order.end()) return std::nullopt;
    return std::next(it)->id;
}

// -- Ordering -----------------------------------------------------------------

auto normalize_orders(const Forest& forest, const NodeId& parent_id) -> Forest {
    auto nodes = forest.nodes();
    renumber(nodes, parent_id);
    return Forest{std::move(nodes)};
}

// -- Structural edits ---------------------------------------------------------

auto indent_node(const Forest& forest, const NodeId& node_id) -> EditResult {
    if (node_id.is_root()) return root_operand("indent");
    auto nodes = forest.nodes();
    auto idx = index_of(nodes, node_id);
    if (!idx) return not_found(node_id);
    if (nodes[*idx].is_root()) return root_operand("indent");

    const auto parent = *nodes[*idx].parent_id;
    const auto siblings = sorted_group(nodes, parent);
    const auto pos = position_in(siblings, *idx);
    if (pos == 0) {
        return Error{ErrorKind::no_op,
                     "node '" + node_id.value + "' has no previous sibling to indent under"};
    }

    const auto new_parent = nodes[siblings[pos - 1]].id;
    splice_into(nodes, *idx, new_parent, sorted_group(nodes, new_parent), append_position);
    return Forest{std::move(nodes)};
}

auto outdent_node(const Forest& forest, const NodeId& node_id) -> EditResult {
    if (node_id.is_root()) return root_operand("outdent");
    auto nodes = forest.nodes();
    auto idx = index_of(nodes, node_id);
    if (!idx) return not_found(node_id);
    if (nodes[*idx].is_root()) return root_operand("outdent");

    const auto parent_id = *nodes[*idx].parent_id;
    if (parent_id.is_root()) {
        return Error{ErrorKind::no_op, "node '" + node_id.value + "' is already top-level"};
    }
    auto parent_idx = index_of(nodes, parent_id);
    if (!parent_idx) return not_found(parent_id);

    const auto grandparent = *nodes[*parent_idx].parent_id;
    auto others = sorted_group(nodes, grandparent);
    const auto position = position_in(others, *parent_idx) + 1;
    splice_into(nodes, *idx, grandparent, std::move(others), position);
    return Forest{std::move(nodes)};
}

auto add_node_after(const Forest& forest, const NodeId& after_id, Node new_node) -> EditResult {
    if (after_id.is_root()) return root_operand("add after");
    if (auto err = check_new_node(forest, new_node)) return *err;

    auto nodes = forest.nodes();
    auto after_idx = index_of(nodes, after_id);
    if (!after_idx) {
        // No anchor: keep the caller's placement, falling back to top level.
        if (!new_node.parent_id || !forest.contains(*new_node.parent_id)) {
            new_node.parent_id = forest_root_id;
        }
        const auto parent = *new_node.parent_id;
        nodes.push_back(std::move(new_node));
        renumber(nodes, parent);
        return Forest{std::move(nodes)};
    }

    const auto parent = *nodes[*after_idx].parent_id;
    auto others = sorted_group(nodes, parent);
    const auto position = position_in(others, *after_idx) + 1;
    nodes.push_back(std::move(new_node));
    splice_into(nodes, nodes.size() - 1, parent, std::move(others), position);
    return Forest{std::move(nodes)};
}

auto add_child(const Forest& forest, const NodeId& parent_id, Node new_node) -> EditResult {
    if (!forest.contains(parent_id)) return not_found(parent_id);
    if (auto err = check_new_node(forest, new_node)) return *err;

    auto nodes = forest.nodes();
    auto others = sorted_group(nodes, parent_id);
    new_node.parent_id = parent_id;
    nodes.push_back(std::move(new_node));
    splice_into(nodes, nodes.size() - 1, parent_id, std::move(others), append_position);
    return Forest{std::move(nodes)};
}

auto delete_node(const Forest& forest, const NodeId& node_id) -> EditResult {
    if (node_id.is_root()) return root_operand("delete");
    auto nodes = forest.nodes();
    auto idx = index_of(nodes, node_id);
    if (!idx) return not_found(node_id);
    if (nodes[*idx].is_root()) return root_operand("delete");

    const auto parent = *nodes[*idx].parent_id;
    auto siblings = sorted_group(nodes, parent);
    const auto pos = position_in(siblings, *idx);
    const auto children = sorted_group(nodes, node_id);

    // Children take the deleted node's slot, keeping their relative order.
    siblings.erase(siblings.begin() + static_cast<std::ptrdiff_t>(pos));
    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(pos),
                    children.begin(), children.end());
    for (auto c : children) nodes[c].parent_id = parent;
    renumber(nodes, siblings);

    nodes.erase(nodes.begin() + static_cast<std::ptrdiff_t>(*idx));
    return Forest{std::move(nodes)};
}

auto move_node(const Forest& forest, const NodeId& node_id, const NodeId& new_parent_id,
               std::optional<double> insert_order) -> EditResult {
    if (auto err = check_move(forest, node_id, new_parent_id)) return *err;
    if (insert_order && !std::isfinite(*insert_order)) {
        return Error{ErrorKind::invalid_operation, "insert order must be finite"};
    }

    auto nodes = forest.nodes();
    const auto idx = *index_of(nodes, node_id);
    if (!insert_order) {
        if (stays_put(nodes, idx, new_parent_id, append_position)) return unmoved(node_id);
        splice_into(nodes, idx, new_parent_id, sorted_group(nodes, new_parent_id, idx),
                    append_position);
        return Forest{std::move(nodes)};
    }

    const auto old_parent = *nodes[idx].parent_id;
    const auto old_rank = position_in(sorted_group(nodes, old_parent), idx);
    nodes[idx].parent_id = new_parent_id;
    nodes[idx].order = *insert_order;
    if (old_parent == new_parent_id &&
        position_in(sorted_group(nodes, new_parent_id), idx) == old_rank) {
        return unmoved(node_id);
    }
    renumber(nodes, new_parent_id);
    if (old_parent != new_parent_id) renumber(nodes, old_parent);
    return Forest{std::move(nodes)};
}

auto move_node_before(const Forest& forest, const NodeId& node_id, const NodeId& target_id)
    -> EditResult {
    return move_beside(forest, node_id, target_id, false);
}

auto move_node_after(const Forest& forest, const NodeId& node_id, const NodeId& target_id)
    -> EditResult {
    return move_beside(forest, node_id, target_id, true);
}

auto move_node_as_first_child(const Forest& forest, const NodeId& node_id,
                              const NodeId& target_id) -> EditResult {
    if (auto err = check_move(forest, node_id, target_id)) return *err;

    auto nodes = forest.nodes();
    const auto idx = *index_of(nodes, node_id);
    if (stays_put(nodes, idx, target_id, 0)) return unmoved(node_id);
    splice_into(nodes, idx, target_id, sorted_group(nodes, target_id, idx), 0);
    return Forest{std::move(nodes)};
}

auto update_node_text(const Forest& forest, const NodeId& node_id, std::string text)
    -> EditResult {
    if (node_id.is_root()) return root_operand("update text");
    auto nodes = forest.nodes();
    auto idx = index_of(nodes, node_id);
    if (!idx) return not_found(node_id);
    if (nodes[*idx].is_root()) return root_operand("update text");
    nodes[*idx].text = std::move(text);
    return Forest{std::move(nodes)};
}

}  // namespace outliner_cpp
