#include <outliner-cpp/error.hpp>

#include <gtest/gtest.h>

using namespace outliner_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::not_found),         "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation), "invalid_operation");
    EXPECT_EQ(to_string_view(ErrorKind::no_op),             "no_op");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_forest),    "invalid_forest");
    EXPECT_EQ(to_string_view(ErrorKind::storage_error),     "storage_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::not_found, "node 'x' does not exist"};
    const auto e2 = Error{ErrorKind::not_found, "node 'x' does not exist"};
    const auto e3 = Error{ErrorKind::no_op, "node 'x' does not exist"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::invalid_operation, "foo"};
    const auto e2 = Error{ErrorKind::invalid_operation, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Error, kind_and_message_are_accessible) {
    const auto e = Error{ErrorKind::storage_error, "disk full"};

    EXPECT_EQ(e.kind, ErrorKind::storage_error);
    EXPECT_EQ(e.message, "disk full");
}
