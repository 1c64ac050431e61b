#include <outliner-cpp/outline_text.hpp>

#include <outliner-cpp/tree_ops.hpp>

#include <algorithm>
#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace outliner_cpp {

namespace {

constexpr std::string_view whitespace = " \t\r\v\f";

auto trim(std::string_view s) -> std::string_view {
    const auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

auto leading_whitespace(std::string_view line) -> std::string_view {
    const auto end = line.find_first_not_of(whitespace);
    return line.substr(0, end == std::string_view::npos ? line.size() : end);
}

// Non-blank lines of `text`, split on '\n'.
auto content_lines(std::string_view text) -> std::vector<std::string_view> {
    auto lines = std::vector<std::string_view>{};
    auto start = std::size_t{0};
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!trim(line).empty()) lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

auto detect_unit(const std::vector<std::string_view>& lines) -> char {
    for (auto line : lines) {
        auto indent = leading_whitespace(line);
        if (!indent.empty()) return indent.front() == '\t' ? '\t' : ' ';
    }
    return ' ';
}

struct OpenAncestor {
    std::size_t depth;
    NodeId id;
};

}  // anonymous namespace

auto detect_indent_unit(std::string_view text) -> char {
    return detect_unit(content_lines(text));
}

auto parse_outline(std::string_view text, IdGenerator& ids) -> Forest {
    const auto lines = content_lines(text);
    const auto unit = detect_unit(lines);

    auto nodes = std::vector<Node>{make_root_node()};
    nodes.reserve(lines.size() + 1);

    auto stack = std::vector<OpenAncestor>{};
    auto child_counts = std::unordered_map<NodeId, std::size_t>{};

    for (auto line : lines) {
        const auto depth = static_cast<std::size_t>(
            std::ranges::count(leading_whitespace(line), unit));

        while (!stack.empty() && stack.back().depth >= depth) {
            stack.pop_back();
        }
        auto parent = stack.empty() ? forest_root_id : stack.back().id;
        auto& siblings = child_counts[parent];

        auto id = ids.next();
        nodes.push_back(Node{
            .id = id,
            .text = std::string{trim(line)},
            .parent_id = std::move(parent),
            .order = static_cast<double>(siblings++),
        });
        stack.push_back(OpenAncestor{.depth = depth, .id = std::move(id)});
    }

    return Forest{std::move(nodes)};
}

auto parse_outline(std::string_view text) -> Forest {
    auto ids = RandomIdGenerator{};
    return parse_outline(text, ids);
}

auto format_outline(const Forest& forest) -> std::string {
    auto depths = std::unordered_map<NodeId, std::size_t>{};
    auto out = std::string{};
    auto first = true;

    // Pre-order guarantees a parent's depth is known before its children.
    for (const auto& node : get_flattened_order(forest)) {
        auto depth = std::size_t{0};
        if (node.parent_id && !node.parent_id->is_root()) {
            auto it = depths.find(*node.parent_id);
            depth = it != depths.end() ? it->second + 1 : 0;
        }
        depths.emplace(node.id, depth);

        if (!first) out.push_back('\n');
        first = false;
        out.append(depth, ' ');
        out.append(node.text);
    }
    return out;
}

}  // namespace outliner_cpp
