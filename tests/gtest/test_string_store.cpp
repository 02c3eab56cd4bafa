// =============================================================================
// StringStore Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lexis/error.hpp"
#include "lexis/string_store.hpp"
#include <string>
#include <vector>

using namespace lexis;

class StringStoreTest : public ::testing::Test {
protected:
    StringStore store;
};

TEST_F(StringStoreTest, EmptyStringIsIdZero) {
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.add(""), 0u);
    EXPECT_EQ(store[0], "");
    EXPECT_TRUE(store.contains(attr_t{0}));
}

TEST_F(StringStoreTest, IdsAreDenseAndStable) {
    attr_t apple = store.add("apple");
    attr_t pear = store.add("pear");

    EXPECT_EQ(apple, 1u);
    EXPECT_EQ(pear, 2u);
    EXPECT_EQ(store.add("apple"), apple);
    EXPECT_EQ(store.size(), 3u);
}

TEST_F(StringStoreTest, RoundTrip) {
    for (const char* s : {"a", "Hello", "naïve", "東京", "  "}) {
        attr_t id = store[std::string_view(s)];
        EXPECT_EQ(store[id], s);
        EXPECT_EQ(store[store[id]], id);
    }
}

TEST_F(StringStoreTest, ViewsSurviveGrowth) {
    std::string_view first = store[store.add("first")];
    for (int i = 0; i < 10000; ++i) {
        store.add("s" + std::to_string(i));
    }
    EXPECT_EQ(first, "first");
    EXPECT_TRUE(store.contains("s9999"));
}

TEST_F(StringStoreTest, UnknownIdThrows) {
    EXPECT_FALSE(store.contains(attr_t{42}));
    EXPECT_THROW(store[attr_t{42}], InvalidArgumentError);
}

TEST_F(StringStoreTest, IteratesInIdOrder) {
    store.add("x");
    store.add("y");
    std::vector<std::string> seen(store.begin(), store.end());
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "");
    EXPECT_EQ(seen[1], "x");
    EXPECT_EQ(seen[2], "y");
}
