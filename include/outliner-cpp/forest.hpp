/// @file forest.hpp
/// @brief Forest -- an immutable snapshot of the whole node collection.

#pragma once

#include <outliner-cpp/error.hpp>
#include <outliner-cpp/node.hpp>
#include <outliner-cpp/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace outliner_cpp {

/// An immutable snapshot of every node, including the forest root sentinel.
///
/// Forest is a value type with shared storage: copying is O(1) and never
/// duplicates nodes, and no member function mutates the nodes. Every edit in
/// tree_ops.hpp builds a new Forest instead, so a snapshot held by a view or
/// by History stays consistent for as long as it is referenced.
///
/// @code
/// auto forest = Forest{};                 // sentinel only
/// auto ids = SequentialIdGenerator{};
/// auto result = add_child(forest, forest_root_id, Node{.id = ids.next(), .text = "a"});
/// if (result) forest = result.forest();
/// @endcode
class Forest {
public:
    using const_iterator = std::vector<Node>::const_iterator;

    /// Construct a forest holding only the sentinel.
    Forest();

    /// Adopt a node list as-is. No invariant is checked; call validate()
    /// for nodes that did not come out of this library.
    explicit Forest(std::vector<Node> nodes);

    /// All nodes, in storage order (not display order).
    auto nodes() const -> const std::vector<Node>& { return *nodes_; }

    /// Number of nodes including the sentinel.
    auto size() const -> std::size_t { return nodes_->size(); }

    /// Number of nodes excluding the sentinel.
    auto visible_size() const -> std::size_t;

    auto begin() const -> const_iterator { return nodes_->begin(); }
    auto end() const -> const_iterator { return nodes_->end(); }

    /// Look up a node by id.
    /// @return A pointer into this snapshot, or nullptr if absent.
    auto find(const NodeId& id) const -> const Node*;

    /// Check whether a node with this id exists.
    auto contains(const NodeId& id) const -> bool { return find(id) != nullptr; }

    /// True when both snapshots share the same node storage.
    auto shares_storage_with(const Forest& other) const -> bool {
        return nodes_ == other.nodes_;
    }

    /// Deep equality over the node lists.
    auto operator==(const Forest& other) const -> bool;

private:
    std::shared_ptr<const std::vector<Node>> nodes_;
};

/// Check the structural invariants of a snapshot:
/// exactly one parentless node (the sentinel), unique ids, every parent
/// present, no cycles, finite orders, and no duplicate order within a
/// sibling group.
/// @return The first violation found, or nullopt if the forest is sound.
auto validate(const Forest& forest) -> std::optional<Error>;

}  // namespace outliner_cpp
