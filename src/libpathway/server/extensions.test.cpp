#include <pathway/server/captures.hpp>
#include <pathway/server/extensions.hpp>

#include <gtest/gtest.h>

using pathway::server::capture;
using pathway::server::captures;
using pathway::server::extensions;

TEST(Extensions, InsertAndFind) {
    auto table = extensions();

    EXPECT_TRUE(table.empty());
    EXPECT_EQ(nullptr, table.find<int>());

    table.insert(42);

    ASSERT_NE(nullptr, table.find<int>());
    EXPECT_EQ(42, *table.find<int>());
    EXPECT_EQ(1, table.size());
}

TEST(Extensions, InsertReplaces) {
    auto table = extensions();

    table.insert(std::string("first"));
    table.insert(std::string("second"));

    EXPECT_EQ("second", table.get<std::string>());
    EXPECT_EQ(1, table.size());
}

TEST(Extensions, KeyedByType) {
    auto table = extensions();

    table.insert(1);
    table.insert(captures(std::vector<capture> {{"id", "7"}}));

    EXPECT_EQ(2, table.size());
    EXPECT_EQ(1, table.get<int>());
    EXPECT_EQ(1, table.get<captures>().size());
}

TEST(Extensions, GetMutable) {
    auto table = extensions();
    table.insert(captures());

    table.get<captures>().insert("id", "7");

    ASSERT_NE(nullptr, table.get<captures>().find("id"));
    EXPECT_EQ("7", *table.get<captures>().find("id"));
}

TEST(Extensions, GetMissing) {
    const auto table = extensions();

    EXPECT_THROW(table.get<captures>(), pathway::server::missing_extension);
}

TEST(Extensions, Remove) {
    auto table = extensions();
    table.insert(1);

    EXPECT_TRUE(table.remove<int>());
    EXPECT_FALSE(table.remove<int>());
    EXPECT_TRUE(table.empty());
}
