#include <outliner-cpp/node.hpp>
#include <outliner-cpp/types.hpp>

#include <gtest/gtest.h>

#include <map>
#include <unordered_set>

using namespace outliner_cpp;

// -- NodeId -------------------------------------------------------------------

TEST(NodeId, default_constructed_is_empty) {
    const auto id = NodeId{};
    EXPECT_TRUE(id.empty());
    EXPECT_FALSE(id.is_root());
}

TEST(NodeId, equality_is_by_value) {
    EXPECT_EQ(NodeId{"a"}, NodeId{std::string{"a"}});
    EXPECT_NE(NodeId{"a"}, NodeId{"b"});
}

TEST(NodeId, ordering_is_lexicographic) {
    EXPECT_LT(NodeId{"a"}, NodeId{"b"});
    EXPECT_LT(NodeId{"a"}, NodeId{"aa"});
    EXPECT_GT(NodeId{"b"}, NodeId{"aa"});
}

TEST(NodeId, forest_root_id_is_root) {
    EXPECT_TRUE(forest_root_id.is_root());
    EXPECT_TRUE(NodeId{"__root__"}.is_root());
    EXPECT_FALSE(NodeId{"root"}.is_root());
}

TEST(NodeId, hashable_and_usable_in_unordered_set) {
    auto set = std::unordered_set<NodeId>{};
    set.insert(NodeId{"a"});
    set.insert(NodeId{"b"});
    set.insert(NodeId{"a"});
    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.contains(NodeId{"b"}));
}

TEST(NodeId, usable_as_map_key) {
    auto map = std::map<NodeId, int>{};
    map[NodeId{"z"}] = 1;
    map[NodeId{"a"}] = 2;
    EXPECT_EQ(map.begin()->first, NodeId{"a"});
}

// -- Node ---------------------------------------------------------------------

TEST(Node, root_node_has_no_parent) {
    const auto root = make_root_node();
    EXPECT_TRUE(root.is_root());
    EXPECT_EQ(root.id, forest_root_id);
    EXPECT_EQ(root.text, forest_root_text);
    EXPECT_EQ(root.order, 0.0);
}

TEST(Node, node_with_parent_is_not_root) {
    const auto node = Node{.id = NodeId{"a"}, .text = "A", .parent_id = forest_root_id};
    EXPECT_FALSE(node.is_root());
}

TEST(Node, equality_compares_every_field) {
    const auto a = Node{.id = NodeId{"a"}, .text = "A", .parent_id = forest_root_id, .order = 0};
    auto b = a;
    EXPECT_EQ(a, b);
    b.order = 1;
    EXPECT_NE(a, b);
}
