#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lexis::util {

enum class CharCategory : uint8_t {
    Control = 0,
    Format,
    PrivateUse,
    Surrogate,
    Noncharacter,
    Space,
    PunctuationOpen,
    PunctuationClose,
    PunctuationQuote,
    PunctuationOther,
    Digit,
    MathSymbol,
    Currency,
    LetterUpper,
    LetterLower,
    LetterModifier,
    LetterOther,
    MarkNonspacing,
    SymbolOther,
    Separator,
};

/**
 * Block-table classifier covering Latin, Greek, Cyrillic, common CJK and
 * punctuation ranges. Unlisted codepoints are treated as LetterOther.
 */
class CharClassifier {
public:
    static CharCategory categorize(uint32_t codepoint) noexcept;

    static bool is_alpha(uint32_t cp) noexcept;
    static bool is_digit(uint32_t cp) noexcept;
    static bool is_space(uint32_t cp) noexcept;
    static bool is_punct(uint32_t cp) noexcept;
    static bool is_upper(uint32_t cp) noexcept;
    static bool is_lower(uint32_t cp) noexcept;

    // Simple one-to-one case mappings; codepoints without a mapping are returned unchanged
    static uint32_t to_lower(uint32_t cp) noexcept;
    static uint32_t to_upper(uint32_t cp) noexcept;

private:
    struct CharBlock {
        uint32_t start;
        uint32_t end;
        CharCategory category;
    };

    // Must stay sorted by start; categorize() binary-searches it
    static constexpr CharBlock char_blocks[] = {
        {0x0000, 0x0008, CharCategory::Control},
        {0x0009, 0x000D, CharCategory::Space},
        {0x000E, 0x001F, CharCategory::Control},
        {0x0020, 0x0020, CharCategory::Space},
        {0x0021, 0x0021, CharCategory::PunctuationOther}, // !
        {0x0022, 0x0022, CharCategory::PunctuationQuote}, // "
        {0x0023, 0x0023, CharCategory::PunctuationOther}, // #
        {0x0024, 0x0024, CharCategory::Currency},         // $
        {0x0025, 0x0026, CharCategory::PunctuationOther}, // % &
        {0x0027, 0x0027, CharCategory::PunctuationQuote}, // '
        {0x0028, 0x0028, CharCategory::PunctuationOpen},  // (
        {0x0029, 0x0029, CharCategory::PunctuationClose}, // )
        {0x002A, 0x002A, CharCategory::PunctuationOther}, // *
        {0x002B, 0x002B, CharCategory::MathSymbol},       // +
        {0x002C, 0x002F, CharCategory::PunctuationOther}, // , - . /
        {0x0030, 0x0039, CharCategory::Digit},
        {0x003A, 0x003B, CharCategory::PunctuationOther}, // : ;
        {0x003C, 0x003E, CharCategory::MathSymbol},       // < = >
        {0x003F, 0x0040, CharCategory::PunctuationOther}, // ? @
        {0x0041, 0x005A, CharCategory::LetterUpper},
        {0x005B, 0x005B, CharCategory::PunctuationOpen},
        {0x005C, 0x005C, CharCategory::PunctuationOther},
        {0x005D, 0x005D, CharCategory::PunctuationClose},
        {0x005E, 0x005E, CharCategory::SymbolOther},
        {0x005F, 0x005F, CharCategory::PunctuationOther},
        {0x0060, 0x0060, CharCategory::PunctuationQuote}, // `
        {0x0061, 0x007A, CharCategory::LetterLower},
        {0x007B, 0x007B, CharCategory::PunctuationOpen},
        {0x007C, 0x007C, CharCategory::MathSymbol},
        {0x007D, 0x007D, CharCategory::PunctuationClose},
        {0x007E, 0x007E, CharCategory::MathSymbol},
        {0x007F, 0x0084, CharCategory::Control},
        {0x0085, 0x0085, CharCategory::Space},
        {0x0086, 0x009F, CharCategory::Control},
        {0x00A0, 0x00A0, CharCategory::Space},
        {0x00A1, 0x00A1, CharCategory::PunctuationOther},
        {0x00A2, 0x00A5, CharCategory::Currency},
        {0x00A6, 0x00AA, CharCategory::SymbolOther},
        {0x00AB, 0x00AB, CharCategory::PunctuationQuote}, // «
        {0x00AC, 0x00AC, CharCategory::MathSymbol},
        {0x00AD, 0x00AD, CharCategory::Format},
        {0x00AE, 0x00B0, CharCategory::SymbolOther},
        {0x00B1, 0x00B1, CharCategory::MathSymbol},
        {0x00B2, 0x00B3, CharCategory::Digit},
        {0x00B4, 0x00B6, CharCategory::SymbolOther},
        {0x00B7, 0x00B7, CharCategory::PunctuationOther},
        {0x00B8, 0x00BA, CharCategory::SymbolOther},
        {0x00BB, 0x00BB, CharCategory::PunctuationQuote}, // »
        {0x00BC, 0x00BE, CharCategory::SymbolOther},
        {0x00BF, 0x00BF, CharCategory::PunctuationOther},
        {0x00C0, 0x00D6, CharCategory::LetterUpper},
        {0x00D7, 0x00D7, CharCategory::MathSymbol},
        {0x00D8, 0x00DE, CharCategory::LetterUpper},
        {0x00DF, 0x00F6, CharCategory::LetterLower},
        {0x00F7, 0x00F7, CharCategory::MathSymbol},
        {0x00F8, 0x00FF, CharCategory::LetterLower},
        {0x0100, 0x02AF, CharCategory::LetterOther},
        {0x02B0, 0x02FF, CharCategory::LetterModifier},
        {0x0300, 0x036F, CharCategory::MarkNonspacing},
        {0x0370, 0x0390, CharCategory::LetterOther},
        {0x0391, 0x03A9, CharCategory::LetterUpper},
        {0x03AA, 0x03B0, CharCategory::LetterOther},
        {0x03B1, 0x03C9, CharCategory::LetterLower},
        {0x03CA, 0x03FF, CharCategory::LetterOther},
        {0x0400, 0x042F, CharCategory::LetterUpper},
        {0x0430, 0x045F, CharCategory::LetterLower},
        {0x0460, 0x04FF, CharCategory::LetterOther},
        {0x0590, 0x05FF, CharCategory::LetterOther},
        {0x0600, 0x06FF, CharCategory::LetterOther},
        {0x0900, 0x097F, CharCategory::LetterOther},
        {0x2000, 0x200A, CharCategory::Space},
        {0x200B, 0x200F, CharCategory::Format},
        {0x2010, 0x2017, CharCategory::PunctuationOther},
        {0x2018, 0x201F, CharCategory::PunctuationQuote},
        {0x2020, 0x2027, CharCategory::PunctuationOther},
        {0x2028, 0x2029, CharCategory::Separator},
        {0x202A, 0x202E, CharCategory::Format},
        {0x202F, 0x202F, CharCategory::Space},
        {0x2030, 0x2038, CharCategory::PunctuationOther},
        {0x2039, 0x203A, CharCategory::PunctuationQuote},
        {0x203B, 0x205E, CharCategory::PunctuationOther},
        {0x205F, 0x205F, CharCategory::Space},
        {0x2060, 0x206F, CharCategory::Format},
        {0x20A0, 0x20CF, CharCategory::Currency},
        {0x2190, 0x21FF, CharCategory::SymbolOther},
        {0x2200, 0x22FF, CharCategory::MathSymbol},
        {0x2500, 0x27BF, CharCategory::SymbolOther},
        {0x2A00, 0x2AFF, CharCategory::MathSymbol},
        {0x3000, 0x3000, CharCategory::Space},
        {0x3001, 0x3003, CharCategory::PunctuationOther},
        {0x3008, 0x3008, CharCategory::PunctuationOpen},
        {0x3009, 0x3009, CharCategory::PunctuationClose},
        {0x300A, 0x300A, CharCategory::PunctuationOpen},
        {0x300B, 0x300B, CharCategory::PunctuationClose},
        {0x300C, 0x300F, CharCategory::PunctuationQuote},
        {0x3010, 0x3010, CharCategory::PunctuationOpen},
        {0x3011, 0x3011, CharCategory::PunctuationClose},
        {0x3400, 0x4DBF, CharCategory::LetterOther},
        {0x4E00, 0x9FFF, CharCategory::LetterOther},
        {0xAC00, 0xD7AF, CharCategory::LetterOther},
        {0xD800, 0xDFFF, CharCategory::Surrogate},
        {0xE000, 0xF8FF, CharCategory::PrivateUse},
        {0xFF01, 0xFF0F, CharCategory::PunctuationOther},
        {0xFF10, 0xFF19, CharCategory::Digit},
        {0xFFFE, 0xFFFF, CharCategory::Noncharacter},
        {0x1F300, 0x1F64F, CharCategory::SymbolOther},
        {0x1F680, 0x1F6FF, CharCategory::SymbolOther},
        {0x1F900, 0x1F9FF, CharCategory::SymbolOther},
        {0x20000, 0x2A6DF, CharCategory::LetterOther},
        {0xF0000, 0xFFFFD, CharCategory::PrivateUse},
        {0x100000, 0x10FFFD, CharCategory::PrivateUse},
    };

    static constexpr size_t num_char_blocks = sizeof(char_blocks) / sizeof(char_blocks[0]);
};

// Codepoint-wise lowercase of a UTF-8 string
std::string to_lower(std::string_view str);

} // namespace lexis::util
