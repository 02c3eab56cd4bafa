#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lexis::util {

// Decode UTF-8 bytes to Unicode codepoints; invalid sequences become U+FFFD
std::vector<uint32_t> decode_utf8(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

void append_utf8(std::string& out, uint32_t codepoint);

// Number of codepoints, counting each invalid byte as one
size_t count_codepoints(std::string_view data) noexcept;

/// Codepoint-indexed substring. A negative @p start counts from the end,
/// so utf8_slice(s, -3, 3) is the last three characters.
std::string utf8_slice(std::string_view data, std::ptrdiff_t start, size_t count);

} // namespace lexis::util
