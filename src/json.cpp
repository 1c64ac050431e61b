#include <outliner-cpp/json.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

namespace outliner_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, const NodeId& id) {
    j = id.value;
}

void from_json(const nlohmann::json& j, NodeId& id) {
    id = NodeId{j.get<std::string>()};
}

void to_json(nlohmann::json& j, const Node& node) {
    j = nlohmann::json{
        {"id", node.id},
        {"text", node.text},
        {"parentId", nullptr},
        {"order", node.order},
    };
    if (node.parent_id) j["parentId"] = *node.parent_id;
}

void from_json(const nlohmann::json& j, Node& node) {
    node.id = j.at("id").get<NodeId>();
    node.text = j.value("text", std::string{});
    const auto& parent = j.at("parentId");
    if (parent.is_null()) {
        node.parent_id.reset();
    } else {
        node.parent_id = parent.get<NodeId>();
    }
    node.order = j.value("order", 0.0);
}

void to_json(nlohmann::json& j, const Forest& forest) {
    j = nlohmann::json::array();
    for (const auto& node : forest) {
        j.push_back(node);
    }
}

void from_json(const nlohmann::json& j, Forest& forest) {
    forest = Forest{j.get<std::vector<Node>>()};
}

// =============================================================================
// Forest export / import
// =============================================================================

auto export_json(const Forest& forest) -> nlohmann::json {
    auto j = nlohmann::json{};
    to_json(j, forest);
    return j;
}

auto import_json(const nlohmann::json& j) -> std::optional<Forest> {
    if (!j.is_array()) {
        spdlog::warn("import_json: expected an array of nodes, got {}", j.type_name());
        return std::nullopt;
    }
    try {
        auto forest = j.get<Forest>();
        if (auto err = validate(forest)) {
            spdlog::warn("import_json: {}: {}", to_string_view(err->kind), err->message);
            return std::nullopt;
        }
        return forest;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("import_json: malformed node: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace outliner_cpp
