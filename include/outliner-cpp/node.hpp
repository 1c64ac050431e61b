/// @file node.hpp
/// @brief The Node record stored in a Forest.

#pragma once

#include <outliner-cpp/types.hpp>

#include <optional>
#include <string>

namespace outliner_cpp {

/// A single outline entry.
///
/// The forest is stored flat: each node names its parent, and siblings are
/// sorted by `order`. Only the forest root sentinel has no parent.
struct Node {
    NodeId id;                         ///< Unique, immutable identifier.
    std::string text;                  ///< The label shown in both views.
    std::optional<NodeId> parent_id;   ///< Parent node; nullopt only for the sentinel.
    double order{0.0};                 ///< Sibling position hint (ascending).

    auto operator==(const Node&) const -> bool = default;

    /// Check if this node is the forest root sentinel.
    auto is_root() const -> bool { return !parent_id.has_value(); }
};

/// Build the forest root sentinel node.
inline auto make_root_node() -> Node {
    return Node{
        .id = forest_root_id,
        .text = std::string{forest_root_text},
        .parent_id = std::nullopt,
        .order = 0.0,
    };
}

}  // namespace outliner_cpp
