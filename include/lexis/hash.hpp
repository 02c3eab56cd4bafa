#pragma once

#include "lexis/types.hpp"
#include <string_view>

namespace lexis {

// 64-bit FNV-1a over the UTF-8 bytes; key of the vocabulary's by-hash index
constexpr hash_t hash_string(std::string_view str) noexcept {
    hash_t h = 0xcbf29ce484222325ULL;
    for (char c : str) {
        h ^= static_cast<unsigned char>(c);
        h *= 0x100000001b3ULL;
    }
    return h;
}

} // namespace lexis
