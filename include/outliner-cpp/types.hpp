/// @file types.hpp
/// @brief Core identity types: NodeId and the forest root sentinel id.

#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace outliner_cpp {

/// Opaque identifier of a node in the forest.
///
/// Ids are generated once when a node is created (see IdGenerator) and are
/// never mutated or reused. Ordering is lexicographic on the underlying
/// string and only exists so ids can key ordered containers.
struct NodeId {
    std::string value;  ///< The raw identifier text.

    NodeId() = default;

    /// Construct from raw identifier text.
    explicit NodeId(std::string v) : value{std::move(v)} {}

    /// Construct from a string literal.
    explicit NodeId(const char* v) : value{v} {}

    auto operator<=>(const NodeId&) const = default;
    auto operator==(const NodeId&) const -> bool = default;

    /// Check if the id is the empty string.
    auto empty() const -> bool { return value.empty(); }

    /// Check if this is the forest root sentinel id.
    auto is_root() const -> bool;
};

/// Reserved id of the hidden forest root. Every top-level node is its child.
inline const auto forest_root_id = NodeId{"__root__"};

/// Text carried by the forest root sentinel. Never displayed.
inline constexpr std::string_view forest_root_text = "__root__";

inline auto NodeId::is_root() const -> bool { return *this == forest_root_id; }

}  // namespace outliner_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<outliner_cpp::NodeId> {
    auto operator()(const outliner_cpp::NodeId& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

/// @endcond
