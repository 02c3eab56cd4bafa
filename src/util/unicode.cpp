#include "lexis/util/unicode.hpp"
#include "lexis/util/utf8.hpp"

namespace lexis::util {

CharCategory CharClassifier::categorize(uint32_t codepoint) noexcept
{
    if ((codepoint & 0xFFFF) >= 0xFFFE) {
        return CharCategory::Noncharacter;
    }

    size_t lo = 0, hi = num_char_blocks;
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (codepoint > char_blocks[mid].end) {
            lo = mid + 1;
        } else if (codepoint < char_blocks[mid].start) {
            hi = mid;
        } else {
            return char_blocks[mid].category;
        }
    }

    if (codepoint <= 0x10FFFF) {
        return CharCategory::LetterOther;
    }
    return CharCategory::SymbolOther;
}

bool CharClassifier::is_alpha(uint32_t cp) noexcept
{
    switch (categorize(cp)) {
        case CharCategory::LetterUpper:
        case CharCategory::LetterLower:
        case CharCategory::LetterModifier:
        case CharCategory::LetterOther:
            return true;
        default:
            return false;
    }
}

bool CharClassifier::is_digit(uint32_t cp) noexcept
{
    return categorize(cp) == CharCategory::Digit;
}

bool CharClassifier::is_space(uint32_t cp) noexcept
{
    CharCategory cat = categorize(cp);
    return cat == CharCategory::Space || cat == CharCategory::Separator;
}

bool CharClassifier::is_punct(uint32_t cp) noexcept
{
    switch (categorize(cp)) {
        case CharCategory::PunctuationOpen:
        case CharCategory::PunctuationClose:
        case CharCategory::PunctuationQuote:
        case CharCategory::PunctuationOther:
            return true;
        default:
            return false;
    }
}

bool CharClassifier::is_upper(uint32_t cp) noexcept
{
    return categorize(cp) == CharCategory::LetterUpper || to_lower(cp) != cp;
}

bool CharClassifier::is_lower(uint32_t cp) noexcept
{
    return categorize(cp) == CharCategory::LetterLower || to_upper(cp) != cp;
}

uint32_t CharClassifier::to_lower(uint32_t cp) noexcept
{
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp < 0xC0) return cp;
    if ((cp >= 0xC0 && cp <= 0xD6) || (cp >= 0xD8 && cp <= 0xDE)) return cp + 0x20;

    // Latin Extended-A alternates upper/lower in pairs
    if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
        (cp >= 0x14A && cp <= 0x177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x178) return 0xFF;

    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    return cp;
}

uint32_t CharClassifier::to_upper(uint32_t cp) noexcept
{
    if (cp >= 'a' && cp <= 'z') return cp - 0x20;
    if (cp < 0xE0) return cp;
    if ((cp >= 0xE0 && cp <= 0xF6) || (cp >= 0xF8 && cp <= 0xFE)) return cp - 0x20;
    if (cp == 0xFF) return 0x178;

    if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
        (cp >= 0x14A && cp <= 0x177)) {
        return (cp % 2 == 1) ? cp - 1 : cp;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp % 2 == 0) ? cp - 1 : cp;
    }

    if (cp >= 0x3B1 && cp <= 0x3C9 && cp != 0x3C2) return cp - 0x20;
    if (cp >= 0x430 && cp <= 0x44F) return cp - 0x20;
    if (cp >= 0x450 && cp <= 0x45F) return cp - 0x50;
    return cp;
}

std::string to_lower(std::string_view str)
{
    std::string out;
    out.reserve(str.size());
    for (uint32_t cp : decode_utf8(str)) {
        append_utf8(out, CharClassifier::to_lower(cp));
    }
    return out;
}

} // namespace lexis::util
