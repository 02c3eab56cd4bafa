#include "lexis/lex_attrs.hpp"
#include "lexis/util/unicode.hpp"
#include "lexis/util/utf8.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <unordered_set>

namespace lexis {
namespace lex_attrs {

using util::CharClassifier;

namespace {

constexpr size_t LONG_SHAPE_LENGTH = 100;
constexpr size_t MAX_SHAPE_RUN = 4;

template<typename Pred>
bool all_codepoints(std::string_view text, Pred pred) {
    if (text.empty()) return false;
    for (uint32_t cp : util::decode_utf8(text)) {
        if (!pred(cp)) return false;
    }
    return true;
}

bool is_cased(uint32_t cp) noexcept {
    return CharClassifier::is_upper(cp) || CharClassifier::is_lower(cp);
}

bool is_ascii_digits(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

bool is_ascii_alpha(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    });
}

bool one_of(std::string_view text, std::initializer_list<std::string_view> options) {
    return std::find(options.begin(), options.end(), text) != options.end();
}

const std::unordered_set<std::string_view>& number_words() {
    static const std::unordered_set<std::string_view> words = {
        "zero", "one", "two", "three", "four", "five", "six", "seven", "eight",
        "nine", "ten", "eleven", "twelve", "thirteen", "fourteen", "fifteen",
        "sixteen", "seventeen", "eighteen", "nineteen", "twenty", "thirty",
        "forty", "fifty", "sixty", "seventy", "eighty", "ninety", "hundred",
        "thousand", "million", "billion", "trillion", "quadrillion",
    };
    return words;
}

const std::unordered_set<std::string_view>& url_tlds() {
    static const std::unordered_set<std::string_view> tlds = {
        "com", "org", "net", "edu", "gov", "mil", "int", "info", "biz", "io",
        "co", "ai", "app", "dev", "us", "uk", "ca", "au", "de", "fr", "es",
        "it", "nl", "be", "ch", "at", "se", "no", "dk", "fi", "pl", "ru",
        "jp", "cn", "kr", "in", "br", "mx", "ar", "za", "nz", "ie", "eu",
        "tv", "me", "ly", "fm", "gl", "to",
    };
    return tlds;
}

bool is_email_local_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

bool is_domain_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-';
}

} // anonymous namespace

// =============================================================================
// String-valued attributes
// =============================================================================

std::string lower(std::string_view text) {
    return util::to_lower(text);
}

std::string word_shape(std::string_view text) {
    if (util::count_codepoints(text) >= LONG_SHAPE_LENGTH) {
        return "LONG";
    }

    std::string shape;
    uint32_t last = 0;
    size_t run = 0;
    for (uint32_t cp : util::decode_utf8(text)) {
        uint32_t shape_char;
        if (CharClassifier::is_alpha(cp)) {
            shape_char = CharClassifier::is_upper(cp) ? 'X' : 'x';
        } else if (CharClassifier::is_digit(cp)) {
            shape_char = 'd';
        } else {
            shape_char = cp;
        }

        if (shape_char == last) {
            ++run;
        } else {
            run = 0;
            last = shape_char;
        }
        if (run < MAX_SHAPE_RUN) {
            util::append_utf8(shape, shape_char);
        }
    }
    return shape;
}

std::string prefix(std::string_view text) {
    return util::utf8_slice(text, 0, 1);
}

std::string suffix(std::string_view text) {
    return util::utf8_slice(text, -3, 3);
}

// =============================================================================
// Flag predicates
// =============================================================================

bool is_alpha(std::string_view text) {
    return all_codepoints(text, CharClassifier::is_alpha);
}

bool is_ascii(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

bool is_digit(std::string_view text) {
    return all_codepoints(text, CharClassifier::is_digit);
}

bool is_lower(std::string_view text) {
    bool has_cased = false;
    for (uint32_t cp : util::decode_utf8(text)) {
        if (CharClassifier::to_lower(cp) != cp) return false;
        has_cased = has_cased || is_cased(cp);
    }
    return has_cased;
}

bool is_upper(std::string_view text) {
    bool has_cased = false;
    for (uint32_t cp : util::decode_utf8(text)) {
        if (CharClassifier::to_upper(cp) != cp) return false;
        has_cased = has_cased || is_cased(cp);
    }
    return has_cased;
}

bool is_title(std::string_view text) {
    // Upper only after an uncased char, lower only after a cased one
    bool has_cased = false;
    bool prev_cased = false;
    for (uint32_t cp : util::decode_utf8(text)) {
        const bool upper = CharClassifier::to_lower(cp) != cp;
        const bool lower = CharClassifier::to_upper(cp) != cp;
        if (upper) {
            if (prev_cased) return false;
            prev_cased = true;
            has_cased = true;
        } else if (lower) {
            if (!prev_cased) return false;
            prev_cased = true;
            has_cased = true;
        } else {
            prev_cased = false;
        }
    }
    return has_cased;
}

bool is_punct(std::string_view text) {
    return all_codepoints(text, CharClassifier::is_punct);
}

bool is_space(std::string_view text) {
    return all_codepoints(text, CharClassifier::is_space);
}

bool is_bracket(std::string_view text) {
    return one_of(text, {"(", ")", "[", "]", "{", "}", "<", ">"});
}

bool is_quote(std::string_view text) {
    return one_of(text, {"\"", "'", "`", "«", "»", "‘", "’", "‚",
                         "‛", "“", "”", "„", "‟", "‹",
                         "›", "❮", "❯", "''", "``"});
}

bool is_left_punct(std::string_view text) {
    return one_of(text, {"(", "[", "{", "<", "\"", "'", "«", "‘", "‚",
                         "‛", "“", "„", "‟", "‹", "❮", "``"});
}

bool is_right_punct(std::string_view text) {
    return one_of(text, {")", "]", "}", ">", "\"", "'", "»", "’", "”",
                         "›", "❯", "''"});
}

bool like_num(std::string_view text) {
    if (text.empty()) return false;

    std::string_view body = text;
    if (body.front() == '+' || body.front() == '-' || body.front() == '~') {
        body.remove_prefix(1);
    } else if (body.substr(0, 2) == "±") {
        body.remove_prefix(2);
    }

    std::string digits;
    digits.reserve(body.size());
    for (char c : body) {
        if (c != ',' && c != '.') digits.push_back(c);
    }
    if (is_ascii_digits(digits)) return true;

    if (std::count(body.begin(), body.end(), '/') == 1) {
        const size_t slash = body.find('/');
        if (is_ascii_digits(body.substr(0, slash)) && is_ascii_digits(body.substr(slash + 1))) {
            return true;
        }
    }

    return number_words().count(util::to_lower(text)) != 0;
}

bool like_url(std::string_view text) {
    if (text.empty()) return false;

    for (std::string_view scheme : {"http://", "https://", "ftp://", "www.", "ftp."}) {
        if (text.substr(0, scheme.size()) == scheme) return true;
    }

    if (text.front() == '.' || text.back() == '.') return false;
    if (text.find('@') != std::string_view::npos) return false;

    const size_t dot = text.rfind('.');
    if (dot == std::string_view::npos) return false;

    std::string_view tld = text.substr(dot + 1);
    tld = tld.substr(0, tld.find(':'));
    if (!tld.empty() && tld.back() == '/') return true;

    const std::string lowered = util::to_lower(tld);
    return is_ascii_alpha(lowered) && url_tlds().count(lowered) != 0;
}

bool like_email(std::string_view text) {
    const size_t at = text.find('@');
    if (at == std::string_view::npos || at == 0) return false;
    if (text.find('@', at + 1) != std::string_view::npos) return false;

    std::string_view local = text.substr(0, at);
    std::string_view domain = text.substr(at + 1);
    if (!std::all_of(local.begin(), local.end(), is_email_local_char)) return false;

    const size_t dot = domain.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return false;

    size_t start = 0;
    while (start <= dot) {
        size_t end = domain.find('.', start);
        std::string_view label = domain.substr(start, end - start);
        if (label.empty() || !std::all_of(label.begin(), label.end(), is_domain_char)) {
            return false;
        }
        start = end + 1;
    }

    std::string_view tld = domain.substr(dot + 1);
    return tld.size() >= 2 && is_ascii_alpha(tld);
}

// =============================================================================
// Default getter set
// =============================================================================

LexAttrGetters default_getters(const std::vector<std::string>& stop_words) {
    auto str_getter = [](std::string (*fn)(std::string_view)) -> AttrGetter {
        return [fn](std::string_view s) -> AttrValue { return fn(s); };
    };

    LexAttrGetters getters{
        {LOWER, str_getter(lower)},
        {NORM, str_getter(lower)},
        {SHAPE, str_getter(word_shape)},
        {PREFIX, str_getter(prefix)},
        {SUFFIX, str_getter(suffix)},
        {IS_ALPHA, flag_getter(is_alpha)},
        {IS_ASCII, flag_getter(is_ascii)},
        {IS_DIGIT, flag_getter(is_digit)},
        {IS_LOWER, flag_getter(is_lower)},
        {IS_PUNCT, flag_getter(is_punct)},
        {IS_SPACE, flag_getter(is_space)},
        {IS_TITLE, flag_getter(is_title)},
        {IS_UPPER, flag_getter(is_upper)},
        {LIKE_URL, flag_getter(like_url)},
        {LIKE_NUM, flag_getter(like_num)},
        {LIKE_EMAIL, flag_getter(like_email)},
        {IS_BRACKET, flag_getter(is_bracket)},
        {IS_QUOTE, flag_getter(is_quote)},
        {IS_LEFT_PUNCT, flag_getter(is_left_punct)},
        {IS_RIGHT_PUNCT, flag_getter(is_right_punct)},
    };

    if (!stop_words.empty()) {
        auto stops = std::make_shared<std::unordered_set<std::string>>();
        for (const auto& word : stop_words) {
            stops->insert(util::to_lower(word));
        }
        getters.set(IS_STOP, flag_getter([stops](std::string_view s) {
            return stops->count(util::to_lower(s)) != 0;
        }));
    }

    return getters;
}

} // namespace lex_attrs
} // namespace lexis
