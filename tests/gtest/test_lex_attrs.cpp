// =============================================================================
// Default Lexical Attribute Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lexis/lex_attrs.hpp"
#include <string>

using namespace lexis;
using namespace lexis::lex_attrs;

class LexAttrsTest : public ::testing::Test {};

TEST_F(LexAttrsTest, WordShape) {
    EXPECT_EQ(word_shape("Hello"), "Xxxxx");
    EXPECT_EQ(word_shape("HELLO"), "XXXX");
    EXPECT_EQ(word_shape("aaaaaaa"), "xxxx");
    EXPECT_EQ(word_shape("3.14"), "d.dd");
    EXPECT_EQ(word_shape("C3PO"), "XdXX");
    EXPECT_EQ(word_shape("Été"), "Xxx");
    EXPECT_EQ(word_shape(std::string(100, 'a')), "LONG");
}

TEST_F(LexAttrsTest, AffixesAndLower) {
    EXPECT_EQ(prefix("Hello"), "H");
    EXPECT_EQ(suffix("Hello"), "llo");
    EXPECT_EQ(suffix("ab"), "ab");
    EXPECT_EQ(prefix("été"), "é");
    EXPECT_EQ(lower("ÉCOLE"), "école");
}

TEST_F(LexAttrsTest, CaseFlags) {
    EXPECT_TRUE(is_lower("hello"));
    EXPECT_FALSE(is_lower("Hello"));
    EXPECT_FALSE(is_lower("123"));
    EXPECT_TRUE(is_upper("NASA"));
    EXPECT_FALSE(is_upper("NaSA"));
    EXPECT_TRUE(is_title("Hello"));
    EXPECT_TRUE(is_title("New-York"));
    EXPECT_FALSE(is_title("HeLLo"));
    EXPECT_FALSE(is_title("hello"));
}

TEST_F(LexAttrsTest, CharacterClassFlags) {
    EXPECT_TRUE(is_alpha("naïve"));
    EXPECT_TRUE(is_alpha("東京"));
    EXPECT_FALSE(is_alpha("a1"));
    EXPECT_FALSE(is_alpha(""));
    EXPECT_TRUE(is_ascii("plain"));
    EXPECT_FALSE(is_ascii("naïve"));
    EXPECT_TRUE(is_digit("2024"));
    EXPECT_FALSE(is_digit("20.24"));
    EXPECT_TRUE(is_punct("!?"));
    EXPECT_FALSE(is_punct("a!"));
    EXPECT_TRUE(is_space(" \t"));
    EXPECT_FALSE(is_space(""));
}

TEST_F(LexAttrsTest, PunctuationSets) {
    EXPECT_TRUE(is_bracket("("));
    EXPECT_FALSE(is_bracket("(("));
    EXPECT_TRUE(is_quote("“"));
    EXPECT_TRUE(is_quote("''"));
    EXPECT_TRUE(is_left_punct("«"));
    EXPECT_FALSE(is_left_punct("»"));
    EXPECT_TRUE(is_right_punct("»"));
}

TEST_F(LexAttrsTest, LikeNum) {
    EXPECT_TRUE(like_num("10"));
    EXPECT_TRUE(like_num("-3"));
    EXPECT_TRUE(like_num("1,000.5"));
    EXPECT_TRUE(like_num("3/4"));
    EXPECT_TRUE(like_num("ten"));
    EXPECT_TRUE(like_num("Million"));
    EXPECT_FALSE(like_num("abc"));
    EXPECT_FALSE(like_num("1/2/3"));
    EXPECT_FALSE(like_num(""));
}

TEST_F(LexAttrsTest, LikeUrl) {
    EXPECT_TRUE(like_url("www.google.com"));
    EXPECT_TRUE(like_url("https://x"));
    EXPECT_TRUE(like_url("example.org"));
    EXPECT_TRUE(like_url("google.com/"));
    EXPECT_FALSE(like_url("hello"));
    EXPECT_FALSE(like_url("e.g."));
    EXPECT_FALSE(like_url("user@example.com"));
}

TEST_F(LexAttrsTest, LikeEmail) {
    EXPECT_TRUE(like_email("user@example.com"));
    EXPECT_TRUE(like_email("a.b+c@mail.co.uk"));
    EXPECT_FALSE(like_email("user@"));
    EXPECT_FALSE(like_email("@example.com"));
    EXPECT_FALSE(like_email("user@localhost"));
    EXPECT_FALSE(like_email("a@b@c.com"));
}

TEST_F(LexAttrsTest, DefaultGetterSet) {
    LexAttrGetters getters = default_getters();
    EXPECT_EQ(getters.size(), 20u);
    EXPECT_TRUE(getters.contains(LOWER));
    EXPECT_TRUE(getters.contains(IS_RIGHT_PUNCT));
    EXPECT_FALSE(getters.contains(IS_STOP));

    const AttrGetter* shape = getters.find(SHAPE);
    ASSERT_NE(shape, nullptr);
    EXPECT_EQ(std::get<std::string>((*shape)("Hello")), "Xxxxx");

    LexAttrGetters with_stops = default_getters({"The", "a"});
    const AttrGetter* stop = with_stops.find(IS_STOP);
    ASSERT_NE(stop, nullptr);
    EXPECT_TRUE(std::get<bool>((*stop)("the")));
    EXPECT_TRUE(std::get<bool>((*stop)("A")));
    EXPECT_FALSE(std::get<bool>((*stop)("cat")));
}
