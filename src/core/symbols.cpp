#include "lexis/symbols.hpp"

#include <array>
#include <string>

namespace lexis {

namespace {

struct NamedAttr {
    attr_id_t id;
    std::string_view name;
};

constexpr NamedAttr kAttrNames[] = {
    {IS_ALPHA, "IS_ALPHA"},
    {IS_ASCII, "IS_ASCII"},
    {IS_DIGIT, "IS_DIGIT"},
    {IS_LOWER, "IS_LOWER"},
    {IS_PUNCT, "IS_PUNCT"},
    {IS_SPACE, "IS_SPACE"},
    {IS_TITLE, "IS_TITLE"},
    {IS_UPPER, "IS_UPPER"},
    {LIKE_URL, "LIKE_URL"},
    {LIKE_NUM, "LIKE_NUM"},
    {LIKE_EMAIL, "LIKE_EMAIL"},
    {IS_STOP, "IS_STOP"},
    {IS_OOV, "IS_OOV"},
    {IS_BRACKET, "IS_BRACKET"},
    {IS_QUOTE, "IS_QUOTE"},
    {IS_LEFT_PUNCT, "IS_LEFT_PUNCT"},
    {IS_RIGHT_PUNCT, "IS_RIGHT_PUNCT"},
    {ID, "ID"},
    {ORTH, "ORTH"},
    {LOWER, "LOWER"},
    {NORM, "NORM"},
    {SHAPE, "SHAPE"},
    {PREFIX, "PREFIX"},
    {SUFFIX, "SUFFIX"},
    {LENGTH, "LENGTH"},
    {CLUSTER, "CLUSTER"},
    {LEMMA, "LEMMA"},
    {POS, "POS"},
    {TAG, "TAG"},
    {DEP, "DEP"},
    {ENT_IOB, "ENT_IOB"},
    {ENT_TYPE, "ENT_TYPE"},
    {HEAD, "HEAD"},
    {SPACY, "SPACY"},
    {PROB, "PROB"},
    {LANG, "LANG"},
    {SENTIMENT, "SENTIMENT"},
};

constexpr std::string_view kPartsOfSpeech[] = {
    "ADJ", "ADP", "ADV", "AUX", "CONJ", "CCONJ", "DET", "INTJ", "NOUN", "NUM",
    "PART", "PRON", "PROPN", "PUNCT", "SCONJ", "SYM", "VERB", "X", "EOL", "SPACE",
};

// "FLAG18" .. "FLAG63"
const std::array<std::string, constants::FLAG_BITS>& flag_names() {
    static const std::array<std::string, constants::FLAG_BITS> names = [] {
        std::array<std::string, constants::FLAG_BITS> out;
        for (attr_id_t i = 0; i < constants::FLAG_BITS; ++i) {
            out[i] = "FLAG" + std::to_string(i);
        }
        return out;
    }();
    return names;
}

} // namespace

const std::vector<std::string_view>& symbol_names() {
    static const std::vector<std::string_view> names = [] {
        std::vector<std::string_view> out;
        for (const auto& attr : kAttrNames) out.push_back(attr.name);
        for (auto pos : kPartsOfSpeech) out.push_back(pos);
        return out;
    }();
    return names;
}

std::string_view attr_name(attr_id_t attr) {
    for (const auto& named : kAttrNames) {
        if (named.id == attr) return named.name;
    }
    if (is_flag_id(attr)) {
        return flag_names()[attr];
    }
    return {};
}

} // namespace lexis
