#include "lexis/lexeme_codec.hpp"
#include "lexis/error.hpp"

#include <bit>
#include <string>

namespace lexis {

namespace {

// Little-endian, independent of the host byte order
template<typename T>
void put(uint8_t*& out, T value) noexcept {
    for (size_t i = 0; i < sizeof(T); ++i) {
        *out++ = static_cast<uint8_t>(value >> (8 * i));
    }
}

void put(uint8_t*& out, float value) noexcept {
    put(out, std::bit_cast<uint32_t>(value));
}

template<typename T>
T take(const uint8_t*& in) noexcept {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(*in++) << (8 * i);
    }
    return value;
}

float take_float(const uint8_t*& in) noexcept {
    return std::bit_cast<float>(take<uint32_t>(in));
}

} // namespace

LexemeCodec::Record LexemeCodec::encode(const LexemeC& lex) noexcept {
    Record record{};
    uint8_t* out = record.data();
    put(out, lex.orth);
    put(out, lex.flags);
    put(out, lex.id);
    put(out, lex.length);
    put(out, lex.lang);
    put(out, lex.lower);
    put(out, lex.norm);
    put(out, lex.shape);
    put(out, lex.prefix);
    put(out, lex.suffix);
    put(out, lex.cluster);
    put(out, lex.prob);
    put(out, lex.sentiment);
    return record;
}

LexemeC LexemeCodec::decode(std::span<const uint8_t> data) {
    if (data.size() < RECORD_SIZE) {
        LEXIS_THROW_FORMAT("Lexeme record needs " + std::to_string(RECORD_SIZE) +
                           " bytes, got " + std::to_string(data.size()));
    }

    const uint8_t* in = data.data();
    LexemeC lex;
    lex.orth = take<attr_t>(in);
    lex.flags = take<flags_t>(in);
    lex.id = take<attr_t>(in);
    lex.length = take<attr_t>(in);
    lex.lang = take<attr_t>(in);
    lex.lower = take<attr_t>(in);
    lex.norm = take<attr_t>(in);
    lex.shape = take<attr_t>(in);
    lex.prefix = take<attr_t>(in);
    lex.suffix = take<attr_t>(in);
    lex.cluster = take<attr_t>(in);
    lex.prob = take_float(in);
    lex.sentiment = take_float(in);
    lex.l2_norm = 0.0f;
    lex.vector = nullptr;
    return lex;
}

} // namespace lexis
