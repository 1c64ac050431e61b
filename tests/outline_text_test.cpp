#include <outliner-cpp/outline_text.hpp>
#include <outliner-cpp/tree_ops.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace outliner_cpp;

namespace {

auto texts(const Forest& forest) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    for (const auto& node : get_flattened_order(forest)) result.push_back(node.text);
    return result;
}

auto depths(const Forest& forest) -> std::vector<std::size_t> {
    auto result = std::vector<std::size_t>{};
    for (const auto& node : get_flattened_order(forest)) {
        result.push_back(get_depth(forest, node.id));
    }
    return result;
}

auto parse(std::string_view text) -> Forest {
    auto ids = SequentialIdGenerator{};
    return parse_outline(text, ids);
}

constexpr auto sample_text =
    "Root 1\n"
    " Child 1.1\n"
    "  Child 1.1.1\n"
    " Child 1.2\n"
    "Root 2";

}  // anonymous namespace

// -- detect_indent_unit -------------------------------------------------------

TEST(DetectIndentUnit, spaces_by_default) {
    EXPECT_EQ(detect_indent_unit(""), ' ');
    EXPECT_EQ(detect_indent_unit("a\nb"), ' ');
    EXPECT_EQ(detect_indent_unit("a\n  b"), ' ');
}

TEST(DetectIndentUnit, first_indented_line_decides) {
    EXPECT_EQ(detect_indent_unit("a\n\tb\n  c"), '\t');
    EXPECT_EQ(detect_indent_unit("a\n b\n\tc"), ' ');
}

TEST(DetectIndentUnit, blank_lines_are_ignored) {
    EXPECT_EQ(detect_indent_unit("a\n\t\n\tb"), '\t');
    EXPECT_EQ(detect_indent_unit("a\n   \n\tb"), '\t');
}

// -- parse_outline ------------------------------------------------------------

TEST(ParseOutline, builds_nested_forest) {
    const auto forest = parse(sample_text);
    EXPECT_EQ(forest.visible_size(), 5u);
    EXPECT_EQ(forest.size(), 6u);
    EXPECT_EQ(texts(forest),
              (std::vector<std::string>{"Root 1", "Child 1.1", "Child 1.1.1", "Child 1.2",
                                        "Root 2"}));
    EXPECT_EQ(depths(forest), (std::vector<std::size_t>{0, 1, 2, 1, 0}));
    EXPECT_FALSE(validate(forest).has_value());
}

TEST(ParseOutline, empty_input_yields_sentinel_only) {
    const auto forest = parse("");
    EXPECT_EQ(forest.size(), 1u);
    EXPECT_TRUE(forest.contains(forest_root_id));
    EXPECT_EQ(parse("\n  \n\t\n").size(), 1u);
}

TEST(ParseOutline, blank_lines_are_skipped) {
    const auto forest = parse("a\n\n   \n b\n\nc\n");
    EXPECT_EQ(texts(forest), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(depths(forest), (std::vector<std::size_t>{0, 1, 0}));
}

TEST(ParseOutline, text_is_trimmed) {
    const auto forest = parse("  a  \r\n\tb\t");
    ASSERT_EQ(forest.visible_size(), 2u);
    EXPECT_EQ(texts(forest), (std::vector<std::string>{"a", "b"}));
}

TEST(ParseOutline, tabs_as_indent_unit) {
    const auto forest = parse("a\n\tb\n\t\tc\n\td");
    EXPECT_EQ(depths(forest), (std::vector<std::size_t>{0, 1, 2, 1}));
}

TEST(ParseOutline, multi_space_indent_counts_each_space) {
    // Two spaces are depth 2; there is no depth-1 parent, so the line
    // attaches to the nearest shallower line.
    const auto forest = parse("a\n  b\n  c\nd");
    EXPECT_EQ(texts(forest), (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(depths(forest), (std::vector<std::size_t>{0, 1, 1, 0}));
}

TEST(ParseOutline, dedent_to_intermediate_depth) {
    const auto forest = parse("a\n   b\n c");
    const auto order = get_flattened_order(forest);
    ASSERT_EQ(order.size(), 3u);
    // "c" (depth 1) is shallower than "b" (depth 3) but deeper than "a".
    EXPECT_EQ(order[2].parent_id, order[0].id);
}

TEST(ParseOutline, first_line_indented) {
    const auto forest = parse("  a\nb");
    EXPECT_EQ(depths(forest), (std::vector<std::size_t>{0, 0}));
}

TEST(ParseOutline, sibling_orders_are_dense) {
    const auto forest = parse("a\nb\nc\n x\n y");
    const auto top = get_children(forest, forest_root_id);
    ASSERT_EQ(top.size(), 3u);
    for (std::size_t i = 0; i < top.size(); ++i) {
        EXPECT_EQ(top[i].order, static_cast<double>(i));
    }
    const auto nested = get_children(forest, top[2].id);
    ASSERT_EQ(nested.size(), 2u);
    EXPECT_EQ(nested[1].order, 1.0);
}

TEST(ParseOutline, draws_ids_from_generator) {
    auto ids = SequentialIdGenerator{"line-"};
    const auto forest = parse_outline("a\nb", ids);
    EXPECT_TRUE(forest.contains(NodeId{"line-1"}));
    EXPECT_TRUE(forest.contains(NodeId{"line-2"}));
    EXPECT_EQ(ids.issued(), 2u);
}

TEST(ParseOutline, default_generator_gives_unique_ids) {
    const auto forest = parse_outline("a\nb\nc");
    EXPECT_FALSE(validate(forest).has_value());
}

// -- format_outline -----------------------------------------------------------

TEST(FormatOutline, one_space_per_level_no_trailing_newline) {
    EXPECT_EQ(format_outline(parse(sample_text)), sample_text);
}

TEST(FormatOutline, empty_forest_is_empty_text) {
    EXPECT_EQ(format_outline(Forest{}), "");
}

TEST(FormatOutline, normalizes_tabs_to_spaces) {
    EXPECT_EQ(format_outline(parse("a\n\tb\n\t\tc")), "a\n b\n  c");
}

TEST(FormatOutline, reflects_edits) {
    auto forest = parse("a\nb\nc");
    const auto c = get_flattened_order(forest).back().id;
    auto result = indent_node(forest, c);
    ASSERT_TRUE(result);
    EXPECT_EQ(format_outline(result.forest()), "a\nb\n c");
}

TEST(OutlineText, round_trip_preserves_structure) {
    const auto texts_in = std::vector<std::string>{
        sample_text,
        "single",
        "a\n b\n  c\n   d\n e\nf\n g",
    };
    for (const auto& text : texts_in) {
        const auto once = format_outline(parse(text));
        EXPECT_EQ(once, text);
        EXPECT_EQ(format_outline(parse(once)), once);
    }
}
