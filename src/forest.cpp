#include <outliner-cpp/forest.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <ranges>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace outliner_cpp {

Forest::Forest()
    : nodes_{std::make_shared<const std::vector<Node>>(std::vector<Node>{make_root_node()})} {}

Forest::Forest(std::vector<Node> nodes)
    : nodes_{std::make_shared<const std::vector<Node>>(std::move(nodes))} {}

auto Forest::visible_size() const -> std::size_t {
    return static_cast<std::size_t>(
        std::ranges::count_if(*nodes_, [](const Node& n) { return !n.is_root(); }));
}

auto Forest::find(const NodeId& id) const -> const Node* {
    auto it = std::ranges::find(*nodes_, id, &Node::id);
    return it != nodes_->end() ? &*it : nullptr;
}

auto Forest::operator==(const Forest& other) const -> bool {
    return shares_storage_with(other) || *nodes_ == *other.nodes_;
}

auto validate(const Forest& forest) -> std::optional<Error> {
    auto by_id = std::unordered_map<NodeId, const Node*>{};
    by_id.reserve(forest.size());

    const Node* sentinel = nullptr;
    for (const auto& node : forest) {
        if (node.id.empty()) {
            return Error{ErrorKind::invalid_forest, "node with empty id"};
        }
        if (!std::isfinite(node.order)) {
            return Error{ErrorKind::invalid_forest,
                         "node '" + node.id.value + "' has a non-finite order"};
        }
        if (!by_id.emplace(node.id, &node).second) {
            return Error{ErrorKind::invalid_forest, "duplicate node id '" + node.id.value + "'"};
        }
        if (!node.parent_id) {
            if (sentinel) {
                return Error{ErrorKind::invalid_forest,
                             "more than one parentless node ('" + sentinel->id.value +
                             "', '" + node.id.value + "')"};
            }
            sentinel = &node;
        }
    }

    if (!sentinel) {
        return Error{ErrorKind::invalid_forest, "forest has no root sentinel"};
    }
    if (!sentinel->id.is_root()) {
        return Error{ErrorKind::invalid_forest,
                     "parentless node '" + sentinel->id.value + "' is not the forest root"};
    }

    for (const auto& node : forest) {
        if (node.parent_id && !by_id.contains(*node.parent_id)) {
            return Error{ErrorKind::invalid_forest,
                         "node '" + node.id.value + "' references missing parent '" +
                         node.parent_id->value + "'"};
        }
    }

    // Every walk towards the sentinel must finish within size() hops.
    const auto limit = forest.size();
    for (const auto& node : forest) {
        const Node* cur = &node;
        auto hops = std::size_t{0};
        while (cur->parent_id) {
            if (++hops > limit) {
                return Error{ErrorKind::invalid_forest,
                             "cycle through node '" + node.id.value + "'"};
            }
            cur = by_id.at(*cur->parent_id);
        }
    }

    auto orders = std::map<std::pair<NodeId, double>, const Node*>{};
    for (const auto& node : forest) {
        if (!node.parent_id) continue;
        auto [it, inserted] = orders.emplace(std::pair{*node.parent_id, node.order}, &node);
        if (!inserted) {
            return Error{ErrorKind::invalid_forest,
                         "siblings '" + it->second->id.value + "' and '" + node.id.value +
                         "' share order " + std::to_string(node.order)};
        }
    }

    return std::nullopt;
}

}  // namespace outliner_cpp
