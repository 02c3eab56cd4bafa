#pragma once

#include <cstddef>
#include <cstdint>

namespace lexis {

// String-store id / attribute value
using attr_t = uint32_t;
// Per-lexeme flag bitset; bit 0 is never assigned
using flags_t = uint64_t;
using hash_t = uint64_t;
using attr_id_t = uint32_t;

/**
 * Attribute ids. Values 1..63 double as flag bit positions, so a getter
 * registered under IS_ALPHA writes bit 1 of LexemeC::flags.
 */
enum AttrId : attr_id_t {
    NULL_ATTR = 0,
    IS_ALPHA,
    IS_ASCII,
    IS_DIGIT,
    IS_LOWER,
    IS_PUNCT,
    IS_SPACE,
    IS_TITLE,
    IS_UPPER,
    LIKE_URL,
    LIKE_NUM,
    LIKE_EMAIL,
    IS_STOP,
    IS_OOV,
    IS_BRACKET,
    IS_QUOTE,
    IS_LEFT_PUNCT,
    IS_RIGHT_PUNCT,

    // 18..63 are free for caller-defined flags

    ID = 64,
    ORTH,
    LOWER,
    NORM,
    SHAPE,
    PREFIX,
    SUFFIX,
    LENGTH,
    CLUSTER,
    LEMMA,
    POS,
    TAG,
    DEP,
    ENT_IOB,
    ENT_TYPE,
    HEAD,
    SPACY,
    PROB,
    LANG,
    SENTIMENT
};

namespace constants {
    constexpr attr_id_t MIN_FLAG_ID = 1;
    constexpr attr_id_t MAX_FLAG_ID = 63;
    constexpr attr_id_t FLAG_BITS = sizeof(flags_t) * 8;

    // Exclusive upper bound on vector components in binary vector files
    constexpr int32_t MAX_VECTOR_SIZE = 100000;

    constexpr float OOV_PROB = -20.0f;
}

/**
 * Lexeme record. Identity is `orth`; the vector pointer is owned by an
 * arena (or is the vocabulary's zero sentinel) and never null once the
 * record is reachable through a Vocab.
 */
struct LexemeC {
    flags_t flags = 0;

    attr_t lang = 0;
    attr_t id = 0;
    attr_t length = 0;

    attr_t orth = 0;
    attr_t lower = 0;
    attr_t norm = 0;
    attr_t shape = 0;
    attr_t prefix = 0;
    attr_t suffix = 0;

    attr_t cluster = 0;

    float prob = 0.0f;
    float sentiment = 0.0f;
    float l2_norm = 0.0f;

    float* vector = nullptr;
};

constexpr bool is_flag_id(attr_id_t attr) noexcept {
    return attr >= constants::MIN_FLAG_ID && attr <= constants::MAX_FLAG_ID;
}

inline bool check_flag(const LexemeC& lex, attr_id_t flag_id) noexcept {
    return (lex.flags & (flags_t{1} << flag_id)) != 0;
}

inline void set_flag(LexemeC& lex, attr_id_t flag_id, bool value) noexcept {
    const flags_t bit = flags_t{1} << flag_id;
    if (value) {
        lex.flags |= bit;
    } else {
        lex.flags &= ~bit;
    }
}

} // namespace lexis
