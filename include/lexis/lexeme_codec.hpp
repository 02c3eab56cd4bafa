#pragma once

#include "lexis/types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace lexis {

/**
 * Fixed-width binary form of a LexemeC.
 *
 * Layout (little-endian on every host, 56 bytes):
 *   orth u32 | flags u64 | id u32 | length u32 | lang u32 | lower u32 |
 *   norm u32 | shape u32 | prefix u32 | suffix u32 | cluster u32 |
 *   prob f32 | sentiment f32
 *
 * The string itself is not stored; it is recovered from the string store
 * through `orth`. The vector and its norm are not stored either.
 */
class LexemeCodec {
public:
    static constexpr size_t RECORD_SIZE =
        sizeof(flags_t) + 10 * sizeof(attr_t) + 2 * sizeof(float);

    using Record = std::array<uint8_t, RECORD_SIZE>;

    static Record encode(const LexemeC& lex) noexcept;

    /// Decode one record. @p data must hold at least RECORD_SIZE bytes.
    /// The result has vector == nullptr and l2_norm == 0.
    static LexemeC decode(std::span<const uint8_t> data);
};

} // namespace lexis
