// =============================================================================
// Lexeme Binary Codec Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lexis/error.hpp"
#include "lexis/lex_attrs.hpp"
#include "lexis/lexeme.hpp"
#include "lexis/lexeme_codec.hpp"
#include "lexis/vocab.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace lexis;
namespace fs = std::filesystem;

class LexemeCodecTest : public ::testing::Test {};

TEST_F(LexemeCodecTest, RecordIsFiftySixBytes) {
    EXPECT_EQ(LexemeCodec::RECORD_SIZE, 56u);
}

TEST_F(LexemeCodecTest, EncodeDecode) {
    float vec[2] = {1.0f, 2.0f};
    LexemeC lex;
    lex.orth = 17;
    lex.flags = (flags_t{1} << 3) | (flags_t{1} << 63);
    lex.id = 5;
    lex.length = 4;
    lex.lang = 9;
    lex.lower = 18;
    lex.norm = 19;
    lex.shape = 20;
    lex.prefix = 21;
    lex.suffix = 22;
    lex.cluster = 300;
    lex.prob = -3.5f;
    lex.sentiment = 0.75f;
    lex.l2_norm = 2.2f;
    lex.vector = vec;

    const auto record = LexemeCodec::encode(lex);
    LexemeC back = LexemeCodec::decode(record);

    EXPECT_EQ(back.orth, 17u);
    EXPECT_EQ(back.flags, lex.flags);
    EXPECT_EQ(back.id, 5u);
    EXPECT_EQ(back.length, 4u);
    EXPECT_EQ(back.lang, 9u);
    EXPECT_EQ(back.lower, 18u);
    EXPECT_EQ(back.norm, 19u);
    EXPECT_EQ(back.shape, 20u);
    EXPECT_EQ(back.prefix, 21u);
    EXPECT_EQ(back.suffix, 22u);
    EXPECT_EQ(back.cluster, 300u);
    EXPECT_EQ(back.prob, -3.5f);
    EXPECT_EQ(back.sentiment, 0.75f);
    EXPECT_EQ(back.l2_norm, 0.0f);
    EXPECT_EQ(back.vector, nullptr);
}

TEST_F(LexemeCodecTest, FieldsAreLittleEndian) {
    LexemeC lex;
    lex.orth = 0x01020304;
    lex.flags = 0x1122334455667788ULL;
    lex.prob = 1.0f;  // 0x3f800000
    const auto record = LexemeCodec::encode(lex);

    // orth leads the record, low byte first
    EXPECT_EQ(record[0], 0x04);
    EXPECT_EQ(record[1], 0x03);
    EXPECT_EQ(record[2], 0x02);
    EXPECT_EQ(record[3], 0x01);

    // flags follow at offset 4
    EXPECT_EQ(record[4], 0x88);
    EXPECT_EQ(record[11], 0x11);

    // prob sits after the eleven integer slots
    EXPECT_EQ(record[48], 0x00);
    EXPECT_EQ(record[49], 0x00);
    EXPECT_EQ(record[50], 0x80);
    EXPECT_EQ(record[51], 0x3f);
}

TEST_F(LexemeCodecTest, DecodesHandWrittenRecord) {
    std::vector<uint8_t> bytes(LexemeCodec::RECORD_SIZE, 0);
    bytes[0] = 0x2a;             // orth = 42
    bytes[4] = 0x06;             // flags = bits 1 and 2
    bytes[12] = 0x00;
    bytes[13] = 0x01;            // id = 256
    bytes[55] = 0xbf;            // sentiment = -0.5f (0xbf000000)

    LexemeC lex = LexemeCodec::decode(bytes);
    EXPECT_EQ(lex.orth, 42u);
    EXPECT_EQ(lex.flags, 6u);
    EXPECT_EQ(lex.id, 256u);
    EXPECT_EQ(lex.sentiment, -0.5f);
}

TEST_F(LexemeCodecTest, ShortInputIsFormatError) {
    std::vector<uint8_t> short_record(LexemeCodec::RECORD_SIZE - 1);
    EXPECT_THROW(LexemeCodec::decode(short_record), FormatError);
}

// =============================================================================
// Bulk import / export
// =============================================================================

class VocabCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* word : {"The", "quick", "brown", "fox", "42", "!"}) {
            source.get(word);
        }
        source["fox"].set_prob(-4.25f);
        source["quick"].set_sentiment(0.5f);
        source["brown"].set_flag(40, true);

        std::istringstream vectors("fox 1 2\nquick 3 4\n");
        source.load_vectors(vectors);
    }

    Vocab source{lex_attrs::default_getters()};
};

TEST_F(VocabCodecTest, ExportSize) {
    const auto bytes = source.lexemes_to_bytes();
    EXPECT_EQ(bytes.size(), (source.size() - 1) * LexemeCodec::RECORD_SIZE);
}

TEST_F(VocabCodecTest, RoundTripIntoFreshVocab) {
    const auto bytes = source.lexemes_to_bytes();

    Vocab target({}, {}, source.shared_strings());
    target.resize_vectors(2);
    target.lexemes_from_bytes(bytes);

    EXPECT_EQ(target.size(), source.size());
    for (const LexemeC& original : source) {
        std::string_view text = source.strings()[original.orth];
        ASSERT_TRUE(target.contains(text)) << text;

        const LexemeC* copy = target.get(text);
        EXPECT_EQ(copy->orth, original.orth);
        EXPECT_EQ(copy->id, original.id);
        EXPECT_EQ(copy->length, original.length);
        EXPECT_EQ(copy->flags, original.flags);
        EXPECT_EQ(copy->lower, original.lower);
        EXPECT_EQ(copy->shape, original.shape);
        EXPECT_EQ(copy->prob, original.prob);
        EXPECT_EQ(copy->sentiment, original.sentiment);

        // Vectors are not part of the record
        EXPECT_TRUE(target.is_zero_vector(copy->vector));
        EXPECT_EQ(copy->l2_norm, 0.0f);
        EXPECT_EQ(target.vector(*copy).size(), 2u);
    }

    EXPECT_FLOAT_EQ(target["fox"].prob(), -4.25f);
    EXPECT_TRUE(target["brown"].check_flag(40));
    EXPECT_TRUE(target["The"].is_title());
}

TEST_F(VocabCodecTest, ReimportReplacesWithoutGrowing) {
    const auto bytes = source.lexemes_to_bytes();
    Vocab target({}, {}, source.shared_strings());
    target.lexemes_from_bytes(bytes);

    const size_t size = target.size();
    const LexemeC* fox = target.get("fox");
    target["fox"].set_prob(0.0f);

    target.lexemes_from_bytes(bytes);
    EXPECT_EQ(target.size(), size);
    EXPECT_EQ(target.get("fox"), fox);
    EXPECT_FLOAT_EQ(fox->prob, -4.25f);
}

TEST_F(VocabCodecTest, ImportedAndNewIdsCoexist) {
    Vocab target({}, {}, source.shared_strings());
    target.lexemes_from_bytes(source.lexemes_to_bytes());

    const LexemeC* fresh = target.get("jumps");
    EXPECT_EQ(fresh->id, static_cast<attr_t>(source.size()));
    EXPECT_EQ(target.size(), source.size() + 1);
}

TEST_F(VocabCodecTest, UnknownOrthIsSkipped) {
    LexemeC bogus;
    bogus.orth = 999999;
    LexemeC empty;
    const auto a = LexemeCodec::encode(bogus);
    const auto b = LexemeCodec::encode(empty);

    std::vector<uint8_t> bytes(a.begin(), a.end());
    bytes.insert(bytes.end(), b.begin(), b.end());

    Vocab target({}, {}, source.shared_strings());
    EXPECT_NO_THROW(target.lexemes_from_bytes(bytes));
    EXPECT_EQ(target.size(), 1u);
}

TEST_F(VocabCodecTest, PartialRecordIsFormatError) {
    auto bytes = source.lexemes_to_bytes();
    bytes.pop_back();

    Vocab target({}, {}, source.shared_strings());
    EXPECT_THROW(target.lexemes_from_bytes(bytes), FormatError);
    EXPECT_EQ(target.size(), 1u);
}

TEST_F(VocabCodecTest, FileRoundTrip) {
    const fs::path path = fs::temp_directory_path() / "lexis_codec_lexemes.bin";
    source.dump_lexemes(path);

    Vocab target({}, {}, source.shared_strings());
    target.load_lexemes(path);
    EXPECT_EQ(target.size(), source.size());
    EXPECT_FLOAT_EQ(target["fox"].prob(), -4.25f);

    fs::remove(path);
    EXPECT_THROW(target.load_lexemes(path), IOError);
}

TEST_F(VocabCodecTest, WholeVocabSerializationNotImplemented) {
    EXPECT_THROW(source.to_bytes(), NotImplementedError);
    std::vector<uint8_t> bytes;
    EXPECT_THROW(source.from_bytes(bytes), NotImplementedError);
}
