#include <outliner-cpp/forest.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace outliner_cpp;

namespace {

auto child(const char* id, const char* parent, double order, const char* text = "x") -> Node {
    return Node{.id = NodeId{id}, .text = text, .parent_id = NodeId{parent}, .order = order};
}

}  // anonymous namespace

// -- Construction -------------------------------------------------------------

TEST(Forest, default_holds_only_the_sentinel) {
    const auto forest = Forest{};
    ASSERT_EQ(forest.size(), 1u);
    EXPECT_EQ(forest.visible_size(), 0u);
    EXPECT_TRUE(forest.contains(forest_root_id));
    EXPECT_TRUE(forest.nodes().front().is_root());
}

TEST(Forest, find_returns_node_or_nullptr) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("a", "__root__", 0, "A"),
    }};
    const auto* a = forest.find(NodeId{"a"});
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->text, "A");
    EXPECT_EQ(forest.find(NodeId{"missing"}), nullptr);
    EXPECT_EQ(forest.visible_size(), 1u);
}

TEST(Forest, copies_share_storage) {
    const auto a = Forest{};
    const auto b = a;
    EXPECT_TRUE(a.shares_storage_with(b));
    EXPECT_EQ(a, b);
}

TEST(Forest, equality_is_deep) {
    const auto a = Forest{std::vector<Node>{make_root_node(), child("a", "__root__", 0)}};
    const auto b = Forest{std::vector<Node>{make_root_node(), child("a", "__root__", 0)}};
    const auto c = Forest{std::vector<Node>{make_root_node(), child("a", "__root__", 1)}};
    EXPECT_FALSE(a.shares_storage_with(b));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(Forest, iterates_in_storage_order) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("b", "__root__", 1),
        child("a", "__root__", 0),
    }};
    auto ids = std::vector<NodeId>{};
    for (const auto& node : forest) ids.push_back(node.id);
    EXPECT_EQ(ids, (std::vector<NodeId>{forest_root_id, NodeId{"b"}, NodeId{"a"}}));
}

// -- validate -----------------------------------------------------------------

TEST(Validate, accepts_well_formed_forest) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("a", "__root__", 0),
        child("b", "__root__", 1),
        child("a1", "a", 0),
    }};
    EXPECT_FALSE(validate(forest).has_value());
    EXPECT_FALSE(validate(Forest{}).has_value());
}

TEST(Validate, rejects_missing_sentinel) {
    const auto forest = Forest{std::vector<Node>{child("a", "__root__", 0)}};
    auto err = validate(forest);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::invalid_forest);
}

TEST(Validate, rejects_two_parentless_nodes) {
    auto stray = Node{.id = NodeId{"stray"}, .text = "x"};
    const auto forest = Forest{std::vector<Node>{make_root_node(), stray}};
    auto err = validate(forest);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::invalid_forest);
}

TEST(Validate, rejects_parentless_node_with_wrong_id) {
    auto fake = Node{.id = NodeId{"top"}, .text = "x"};
    const auto forest = Forest{std::vector<Node>{fake}};
    ASSERT_TRUE(validate(forest).has_value());
}

TEST(Validate, rejects_duplicate_ids) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("a", "__root__", 0),
        child("a", "__root__", 1),
    }};
    auto err = validate(forest);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("duplicate"), std::string::npos);
}

TEST(Validate, rejects_empty_id) {
    const auto forest = Forest{std::vector<Node>{make_root_node(), child("", "__root__", 0)}};
    ASSERT_TRUE(validate(forest).has_value());
}

TEST(Validate, rejects_missing_parent) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("a", "ghost", 0),
    }};
    auto err = validate(forest);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("ghost"), std::string::npos);
}

TEST(Validate, rejects_cycle) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("a", "b", 0),
        child("b", "a", 0),
    }};
    auto err = validate(forest);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("cycle"), std::string::npos);
}

TEST(Validate, rejects_self_parent) {
    const auto forest = Forest{std::vector<Node>{make_root_node(), child("a", "a", 0)}};
    ASSERT_TRUE(validate(forest).has_value());
}

TEST(Validate, rejects_duplicate_sibling_order) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("a", "__root__", 0),
        child("b", "__root__", 0),
    }};
    auto err = validate(forest);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("share order"), std::string::npos);
}

TEST(Validate, rejects_non_finite_order) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("a", "__root__", std::numeric_limits<double>::infinity()),
    }};
    ASSERT_TRUE(validate(forest).has_value());
}

TEST(Validate, same_order_under_different_parents_is_fine) {
    const auto forest = Forest{std::vector<Node>{
        make_root_node(),
        child("a", "__root__", 0),
        child("b", "a", 0),
    }};
    EXPECT_FALSE(validate(forest).has_value());
}
