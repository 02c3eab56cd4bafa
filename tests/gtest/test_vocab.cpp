// =============================================================================
// Vocab Lexicon Index Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lexis/error.hpp"
#include "lexis/lex_attrs.hpp"
#include "lexis/lexeme.hpp"
#include "lexis/symbols.hpp"
#include "lexis/vocab.hpp"
#include <string>

using namespace lexis;

class VocabTest : public ::testing::Test {
protected:
    Vocab vocab{lex_attrs::default_getters()};
};

TEST_F(VocabTest, StartsWithOnlyTheEmptySlot) {
    EXPECT_EQ(vocab.size(), 1u);
    EXPECT_TRUE(vocab.begin() == vocab.end());

    const LexemeC* empty = vocab.get("");
    EXPECT_EQ(empty, &vocab.empty_lexeme());
    EXPECT_EQ(empty->orth, 0u);
    EXPECT_EQ(empty->id, 0u);
    EXPECT_EQ(empty->prob, 0.0f);
    EXPECT_NE(empty->vector, nullptr);
    EXPECT_EQ(vocab.size(), 1u);
}

TEST_F(VocabTest, GetIsIdempotent) {
    const LexemeC* first = vocab.get("apple");
    EXPECT_EQ(vocab.size(), 2u);
    EXPECT_EQ(first->id, 1u);

    const LexemeC* second = vocab.get("apple");
    EXPECT_EQ(first, second);
    EXPECT_EQ(vocab.size(), 2u);
    EXPECT_TRUE(vocab.contains("apple"));
    EXPECT_FALSE(vocab.contains("pear"));
}

TEST_F(VocabTest, IdsFollowInsertionOrder) {
    EXPECT_EQ(vocab.get("one")->id, 1u);
    EXPECT_EQ(vocab.get("two")->id, 2u);
    EXPECT_EQ(vocab.get("one")->id, 1u);
    EXPECT_EQ(vocab.get("three")->id, 3u);
    EXPECT_EQ(vocab.size(), 4u);
}

TEST_F(VocabTest, NewLexemeFields) {
    const LexemeC* lex = vocab.get("Été");
    EXPECT_EQ(lex->orth, vocab.strings()["Été"]);
    EXPECT_EQ(vocab.strings()[lex->orth], "Été");
    EXPECT_EQ(lex->length, 3u);
    EXPECT_EQ(lex->prob, constants::OOV_PROB);
    EXPECT_EQ(lex->sentiment, 0.0f);
    EXPECT_EQ(vocab.strings()[lex->lower], "été");
    EXPECT_EQ(vocab.strings()[lex->shape], "Xxx");
    EXPECT_EQ(vocab.strings()[lex->suffix], "Été");
    EXPECT_TRUE(check_flag(*lex, IS_ALPHA));
    EXPECT_TRUE(check_flag(*lex, IS_TITLE));
    EXPECT_FALSE(check_flag(*lex, IS_ASCII));
    EXPECT_TRUE(vocab.is_zero_vector(lex->vector));
}

TEST_F(VocabTest, SymbolsAndTagsAreInternedFirst) {
    Vocab tagged({}, {"VBZ", "DT", "NN"});
    const auto& symbols = symbol_names();
    ASSERT_FALSE(symbols.empty());

    EXPECT_EQ(tagged.strings()[symbols.front()], 1u);
    const attr_t first_tag = static_cast<attr_t>(symbols.size() + 1);
    EXPECT_EQ(tagged.strings()["DT"], first_tag);
    EXPECT_EQ(tagged.strings()["NN"], first_tag + 1);
    EXPECT_EQ(tagged.strings()["VBZ"], first_tag + 2);
    EXPECT_EQ(tagged.size(), 1u);
}

TEST_F(VocabTest, SharedStringStore) {
    Vocab other({}, {}, vocab.shared_strings());
    const LexemeC* a = vocab.get("shared");
    const LexemeC* b = other.get("shared");
    EXPECT_NE(a, b);
    EXPECT_EQ(a->orth, b->orth);
    EXPECT_EQ(&vocab.strings(), &other.strings());
}

TEST_F(VocabTest, ScratchLookupIsIsolated) {
    Arena scratch;
    const LexemeC* lex = vocab.get("transient", scratch);

    EXPECT_EQ(lex->id, 0u);
    EXPECT_FALSE(vocab.contains("transient"));
    EXPECT_EQ(vocab.size(), 1u);
    EXPECT_TRUE(vocab.begin() == vocab.end());
    EXPECT_EQ(vocab.strings()[lex->orth], "transient");
    EXPECT_TRUE(check_flag(*lex, IS_ALPHA));

    // Still a miss: a second scratch lookup builds a new record
    const LexemeC* again = vocab.get("transient", scratch);
    EXPECT_NE(lex, again);
}

TEST_F(VocabTest, ScratchLookupFindsPermanentRecords) {
    const LexemeC* permanent = vocab.get("kept");
    Arena scratch;
    EXPECT_EQ(vocab.get("kept", scratch), permanent);
    EXPECT_EQ(scratch.block_count(), 0u);
}

TEST_F(VocabTest, ScratchRecordsComeFromScratchArena) {
    Arena scratch;
    const LexemeC* longer = vocab.get("transient", scratch);
    const LexemeC* shorter = vocab.get("ab", scratch);

    EXPECT_TRUE(scratch.owns(longer));
    EXPECT_TRUE(scratch.owns(shorter));
    EXPECT_FALSE(vocab.arena().owns(longer));
    EXPECT_FALSE(vocab.arena().owns(shorter));
    EXPECT_EQ(shorter->id, 0u);
    EXPECT_FALSE(vocab.contains("ab"));
}

TEST_F(VocabTest, RepeatedScratchLookupsLeaveVocabArenaAlone) {
    vocab.get("kept");
    const size_t before = vocab.arena().bytes_allocated();

    Arena scratch;
    vocab.get("ab", scratch);
    vocab.get("transient", scratch);
    const size_t strings_after_first = vocab.strings().size();

    for (int i = 0; i < 1000; ++i) {
        vocab.get("ab", scratch);
        vocab.get("transient", scratch);
    }

    EXPECT_EQ(vocab.arena().bytes_allocated(), before);
    EXPECT_EQ(vocab.strings().size(), strings_after_first);
    EXPECT_EQ(vocab.size(), 2u);
    EXPECT_GT(scratch.bytes_allocated(), 0u);
}

TEST_F(VocabTest, ScratchLookupsAfterManyEntries) {
    Vocab plain;
    for (int i = 0; i < 10000; ++i) {
        plain.get("w" + std::to_string(i));
    }
    const size_t before = plain.arena().bytes_allocated();

    Arena scratch;
    const LexemeC* longer = plain.get("longword", scratch);
    EXPECT_TRUE(scratch.owns(longer));
    EXPECT_EQ(longer->id, 0u);
    EXPECT_FALSE(plain.contains("longword"));
    EXPECT_EQ(plain.arena().bytes_allocated(), before);
}

TEST_F(VocabTest, GetByOrth) {
    EXPECT_EQ(vocab.get_by_orth(0), &vocab.empty_lexeme());

    const LexemeC* apple = vocab.get("apple");
    EXPECT_EQ(vocab.get_by_orth(apple->orth), apple);

    // Interned but never looked up: created on demand
    attr_t orth = vocab.strings().add("pear");
    const LexemeC* pear = vocab.get_by_orth(orth);
    EXPECT_EQ(pear->orth, orth);
    EXPECT_TRUE(vocab.contains("pear"));

    EXPECT_THROW(vocab.get_by_orth(999999), InvalidArgumentError);
}

TEST_F(VocabTest, GetByOrthWithScratch) {
    attr_t orth = vocab.strings().add("ephemeral");
    Arena scratch;
    const LexemeC* lex = vocab.get_by_orth(orth, scratch);
    EXPECT_EQ(lex->orth, orth);
    EXPECT_EQ(lex->id, 0u);
    EXPECT_FALSE(vocab.contains("ephemeral"));
}

TEST_F(VocabTest, SubscriptReturnsView) {
    Lexeme lex = vocab["Hello"];
    EXPECT_EQ(lex.text(), "Hello");
    EXPECT_EQ(lex.id(), 1u);

    Lexeme same = vocab[lex.orth()];
    EXPECT_EQ(&same.c(), &lex.c());
}

TEST_F(VocabTest, IndexMismatchIsConsistencyError) {
    const LexemeC* apple = vocab.get("apple");
    attr_t pear = vocab.strings().add("pear");

    set_struct_attr(const_cast<LexemeC&>(*apple), ORTH, pear);
    EXPECT_THROW(vocab.get("apple"), ConsistencyError);
}

TEST_F(VocabTest, IterationVisitsPermanentRecords) {
    vocab.get("a");
    vocab.get("b");
    vocab.get("c");
    Arena scratch;
    vocab.get("not-indexed", scratch);

    size_t count = 0;
    for (const LexemeC& lex : vocab) {
        EXPECT_NE(lex.id, 0u);
        ++count;
    }
    EXPECT_EQ(count, vocab.size() - 1);
    EXPECT_EQ(count, 3u);
}

// =============================================================================
// Getter registration
// =============================================================================

class VocabGetterTest : public ::testing::Test {
protected:
    Vocab vocab;
};

TEST_F(VocabGetterTest, RejectsIndexOwnedAttributes) {
    auto getter = [](std::string_view) -> AttrValue { return int64_t{1}; };
    EXPECT_THROW(vocab.set_getter(ORTH, getter), InvalidArgumentError);
    EXPECT_THROW(vocab.set_getter(ID, getter), InvalidArgumentError);
    EXPECT_THROW(vocab.set_getter(LENGTH, getter), InvalidArgumentError);
    EXPECT_THROW(vocab.set_getter(NULL_ATTR, getter), InvalidArgumentError);
    EXPECT_THROW(vocab.set_getter(POS, getter), InvalidArgumentError);
    EXPECT_THROW(vocab.set_getter(PROB, AttrGetter{}), InvalidArgumentError);
    EXPECT_TRUE(vocab.getters().empty());
}

TEST_F(VocabGetterTest, NumericGetters) {
    vocab.set_getter(PROB, [](std::string_view s) -> AttrValue {
        return -static_cast<double>(s.size());
    });
    vocab.set_getter(CLUSTER, [](std::string_view) -> AttrValue { return int64_t{42}; });
    vocab.set_getter(SENTIMENT, [](std::string_view s) -> AttrValue {
        if (s == "good") return 0.5;
        return std::monostate{};
    });

    const LexemeC* good = vocab.get("good");
    EXPECT_FLOAT_EQ(good->prob, -4.0f);
    EXPECT_EQ(good->cluster, 42u);
    EXPECT_FLOAT_EQ(good->sentiment, 0.5f);

    const LexemeC* other = vocab.get("other");
    EXPECT_FLOAT_EQ(other->sentiment, 0.0f);
}

TEST_F(VocabGetterTest, StringResultsAreInterned) {
    vocab.set_getter(LANG, [](std::string_view) -> AttrValue { return std::string("en"); });
    const LexemeC* lex = vocab.get("word");
    EXPECT_EQ(lex->lang, vocab.strings()["en"]);
    EXPECT_EQ(vocab["word"].lang_text(), "en");
}

TEST_F(VocabGetterTest, AbsentResultKeepsDefault) {
    vocab.set_getter(PROB, [](std::string_view) -> AttrValue { return std::monostate{}; });
    EXPECT_EQ(vocab.get("unset")->prob, constants::OOV_PROB);
}

TEST_F(VocabGetterTest, GettersRunOncePerLexemeInOrder) {
    std::string order;
    int calls = 0;
    vocab.set_getter(NORM, [&](std::string_view) -> AttrValue {
        order += "n";
        ++calls;
        return std::monostate{};
    });
    vocab.set_getter(LOWER, [&](std::string_view) -> AttrValue {
        order += "l";
        return std::monostate{};
    });
    // Replacing keeps NORM's slot ahead of LOWER
    vocab.set_getter(NORM, [&](std::string_view) -> AttrValue {
        order += "N";
        ++calls;
        return std::monostate{};
    });

    vocab.get("x");
    vocab.get("x");
    vocab.get("y");
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(order, "NlNl");
}

TEST_F(VocabGetterTest, GettersOnlyAffectLaterLexemes) {
    const LexemeC* before = vocab.get("early");
    vocab.set_getter(CLUSTER, [](std::string_view) -> AttrValue { return int64_t{7}; });
    const LexemeC* after = vocab.get("late");

    EXPECT_EQ(before->cluster, 0u);
    EXPECT_EQ(after->cluster, 7u);
}

TEST_F(VocabGetterTest, StringForProbIsRejected) {
    vocab.set_getter(PROB, [](std::string_view) -> AttrValue { return std::string("high"); });
    EXPECT_THROW(vocab.get("word"), InvalidArgumentError);
}

TEST_F(VocabGetterTest, OutOfRangeIntegerIsRejected) {
    vocab.set_getter(CLUSTER, [](std::string_view s) -> AttrValue {
        if (s == "negative") return int64_t{-1};
        if (s == "huge") return int64_t{1} << 40;
        return int64_t{4294967295};
    });

    EXPECT_THROW(vocab.get("negative"), InvalidArgumentError);
    EXPECT_THROW(vocab.get("huge"), InvalidArgumentError);
    EXPECT_FALSE(vocab.contains("negative"));
    EXPECT_EQ(vocab.get("max")->cluster, 4294967295u);
}

TEST_F(VocabGetterTest, OutOfRangeFloatingIsRejected) {
    vocab.set_getter(CLUSTER, [](std::string_view) -> AttrValue { return -2.5; });
    EXPECT_THROW(vocab.get("word"), InvalidArgumentError);
}
