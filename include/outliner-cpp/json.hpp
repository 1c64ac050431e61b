/// @file json.hpp
/// @brief nlohmann/json interoperability for outliner-cpp.
///
/// The persisted form of a forest is a JSON array of node objects:
///
/// @code{.json}
/// [
///   {"id": "__root__", "text": "__root__", "parentId": null, "order": 0},
///   {"id": "n1", "text": "Root 1", "parentId": "__root__", "order": 0}
/// ]
/// @endcode

#pragma once

#include <outliner-cpp/forest.hpp>
#include <outliner-cpp/node.hpp>
#include <outliner-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>

namespace outliner_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, const NodeId& id);
void from_json(const nlohmann::json& j, NodeId& id);

void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

/// Serializes every node in storage order. Deserialization does not
/// validate; prefer import_json() for untrusted input.
void to_json(nlohmann::json& j, const Forest& forest);
void from_json(const nlohmann::json& j, Forest& forest);

// =============================================================================
// Forest export / import
// =============================================================================

/// Export a forest as a JSON array of nodes.
auto export_json(const Forest& forest) -> nlohmann::json;

/// Import a forest from a JSON array of nodes.
/// @return The forest, or nullopt if the JSON is malformed or the nodes
///   violate a structural invariant (see validate()).
auto import_json(const nlohmann::json& j) -> std::optional<Forest>;

}  // namespace outliner_cpp
