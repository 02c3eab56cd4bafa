// =============================================================================
// Arena Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lexis/arena.hpp"
#include "lexis/error.hpp"
#include "lexis/types.hpp"
#include <cstdint>

using namespace lexis;

class ArenaTest : public ::testing::Test {
protected:
    Arena arena{256};
};

TEST_F(ArenaTest, AllocationsAreZeroed) {
    float* values = arena.alloc<float>(16);
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(values[i], 0.0f);
    }

    LexemeC* lex = arena.alloc<LexemeC>();
    EXPECT_EQ(lex->orth, 0u);
    EXPECT_EQ(lex->flags, 0u);
    EXPECT_EQ(lex->vector, nullptr);
}

TEST_F(ArenaTest, RespectsAlignment) {
    arena.allocate(3, 1);
    void* p = arena.allocate(8, 64);
    EXPECT_EQ(reinterpret_cast<uintptr_t>(p) % 64, 0u);
    EXPECT_THROW(arena.allocate(8, 3), InvalidArgumentError);
}

TEST_F(ArenaTest, ZeroSizeGivesDistinctPointers) {
    void* a = arena.allocate(0);
    void* b = arena.allocate(0);
    EXPECT_NE(a, nullptr);
    EXPECT_NE(a, b);
}

TEST_F(ArenaTest, LargeRequestsGetTheirOwnBlock) {
    size_t before = arena.block_count();
    float* big = arena.alloc<float>(1024);
    EXPECT_GT(arena.block_count(), before);
    EXPECT_TRUE(arena.owns(big));
    EXPECT_TRUE(arena.owns(big + 1023));
}

TEST_F(ArenaTest, OwnsOnlyItsMemory) {
    Arena other;
    int* mine = arena.alloc<int>();
    int* theirs = other.alloc<int>();
    int local = 0;

    EXPECT_TRUE(arena.owns(mine));
    EXPECT_FALSE(arena.owns(theirs));
    EXPECT_FALSE(arena.owns(&local));
}

TEST_F(ArenaTest, ReallocKeepsPrefixAndZeroFillsTail) {
    float* v = arena.alloc<float>(3);
    v[0] = 1.0f;
    v[1] = 2.0f;
    v[2] = 3.0f;

    float* grown = arena.realloc(v, 3, 5);
    EXPECT_EQ(grown[0], 1.0f);
    EXPECT_EQ(grown[2], 3.0f);
    EXPECT_EQ(grown[3], 0.0f);
    EXPECT_EQ(grown[4], 0.0f);

    float* shrunk = arena.realloc(grown, 5, 2);
    EXPECT_EQ(shrunk[0], 1.0f);
    EXPECT_EQ(shrunk[1], 2.0f);

    // Old storage stays valid until the arena dies
    EXPECT_EQ(v[2], 3.0f);
}
