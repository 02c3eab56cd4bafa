#include "lexis/util/utf8.hpp"

namespace lexis::util {

namespace {

// Length of the sequence starting at p, or 0 when the lead byte is invalid
// or the sequence is truncated.
size_t sequence_length(const uint8_t* p, const uint8_t* end) noexcept {
    if (*p < 0x80) return 1;
    size_t len = 0;
    if ((*p & 0xE0) == 0xC0) len = 2;
    else if ((*p & 0xF0) == 0xE0) len = 3;
    else if ((*p & 0xF8) == 0xF0) len = 4;
    else return 0;

    if (static_cast<size_t>(end - p) < len) return 0;
    for (size_t i = 1; i < len; ++i) {
        if ((p[i] & 0xC0) != 0x80) return 0;
    }
    return len;
}

} // namespace

std::vector<uint32_t> decode_utf8(std::string_view data) {
    std::vector<uint32_t> codepoints;
    codepoints.reserve(data.size());

    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* end = p + data.size();

    while (p < end) {
        uint32_t cp;
        size_t len = sequence_length(p, end);

        switch (len) {
            case 1:
                cp = *p;
                break;
            case 2:
                cp = ((p[0] & 0x1F) << 6) | (p[1] & 0x3F);
                if (cp < 0x80) cp = 0xFFFD; // Overlong
                break;
            case 3:
                cp = ((p[0] & 0x0F) << 12) | ((p[1] & 0x3F) << 6) | (p[2] & 0x3F);
                if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
                break;
            case 4:
                cp = ((p[0] & 0x07) << 18) | ((p[1] & 0x3F) << 12) | ((p[2] & 0x3F) << 6) | (p[3] & 0x3F);
                if (cp < 0x10000 || cp > 0x10FFFF) cp = 0xFFFD;
                break;
            default:
                // Invalid start byte or truncated sequence: consume one byte
                cp = 0xFFFD;
                len = 1;
                break;
        }

        p += len;
        codepoints.push_back(cp);
    }

    return codepoints;
}

void append_utf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        append_utf8(out, 0xFFFD);
    }
}

std::string encode_utf8(uint32_t codepoint) {
    std::string out;
    append_utf8(out, codepoint);
    return out;
}

size_t count_codepoints(std::string_view data) noexcept {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* end = p + data.size();
    size_t count = 0;
    while (p < end) {
        size_t len = sequence_length(p, end);
        p += len ? len : 1;
        ++count;
    }
    return count;
}

std::string utf8_slice(std::string_view data, std::ptrdiff_t start, size_t count) {
    std::vector<uint32_t> cps = decode_utf8(data);
    const auto total = static_cast<std::ptrdiff_t>(cps.size());
    if (start < 0) start = total + start < 0 ? 0 : total + start;
    if (start > total) start = total;

    std::string out;
    size_t stop = static_cast<size_t>(start) + count;
    if (stop > cps.size()) stop = cps.size();
    for (size_t i = static_cast<size_t>(start); i < stop; ++i) {
        append_utf8(out, cps[i]);
    }
    return out;
}

} // namespace lexis::util
