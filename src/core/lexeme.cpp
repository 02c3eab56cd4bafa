#include "lexis/lexeme.hpp"
#include "lexis/error.hpp"
#include "lexis/util/vector_math.hpp"
#include "lexis/vocab.hpp"

#include <cstring>
#include <string>

namespace lexis {

attr_t get_struct_attr(const LexemeC& lex, attr_id_t attr) noexcept {
    if (is_flag_id(attr)) {
        return check_flag(lex, attr) ? 1 : 0;
    }
    switch (attr) {
        case ID: return lex.id;
        case ORTH: return lex.orth;
        case LOWER: return lex.lower;
        case NORM: return lex.norm;
        case SHAPE: return lex.shape;
        case PREFIX: return lex.prefix;
        case SUFFIX: return lex.suffix;
        case LENGTH: return lex.length;
        case CLUSTER: return lex.cluster;
        case LANG: return lex.lang;
        default: return 0;
    }
}

bool set_struct_attr(LexemeC& lex, attr_id_t attr, attr_t value) noexcept {
    if (is_flag_id(attr)) {
        set_flag(lex, attr, value != 0);
        return true;
    }
    switch (attr) {
        case ID: lex.id = value; return true;
        case ORTH: lex.orth = value; return true;
        case LOWER: lex.lower = value; return true;
        case NORM: lex.norm = value; return true;
        case SHAPE: lex.shape = value; return true;
        case PREFIX: lex.prefix = value; return true;
        case SUFFIX: lex.suffix = value; return true;
        case LENGTH: lex.length = value; return true;
        case CLUSTER: lex.cluster = value; return true;
        case LANG: lex.lang = value; return true;
        default: return false;
    }
}

std::string_view Lexeme::string_for(attr_t id) const {
    return vocab_->strings()[id];
}

std::string_view Lexeme::text() const { return string_for(c_->orth); }
std::string_view Lexeme::lower_text() const { return string_for(c_->lower); }
std::string_view Lexeme::norm_text() const { return string_for(c_->norm); }
std::string_view Lexeme::shape_text() const { return string_for(c_->shape); }
std::string_view Lexeme::prefix_text() const { return string_for(c_->prefix); }
std::string_view Lexeme::suffix_text() const { return string_for(c_->suffix); }
std::string_view Lexeme::lang_text() const { return string_for(c_->lang); }

void Lexeme::require_mutable(const char* what) const {
    if (c_->orth == 0) {
        throw InvalidArgumentError(std::string("Cannot modify the empty lexeme: ") + what,
                                   "Lexeme");
    }
}

void Lexeme::set_lower(std::string_view value) {
    require_mutable("lower");
    c_->lower = vocab_->strings().add(value);
}

void Lexeme::set_norm(std::string_view value) {
    require_mutable("norm");
    c_->norm = vocab_->strings().add(value);
}

void Lexeme::set_shape(std::string_view value) {
    require_mutable("shape");
    c_->shape = vocab_->strings().add(value);
}

void Lexeme::set_prefix(std::string_view value) {
    require_mutable("prefix");
    c_->prefix = vocab_->strings().add(value);
}

void Lexeme::set_suffix(std::string_view value) {
    require_mutable("suffix");
    c_->suffix = vocab_->strings().add(value);
}

void Lexeme::set_lang(std::string_view value) {
    require_mutable("lang");
    c_->lang = vocab_->strings().add(value);
}

void Lexeme::set_cluster(attr_t value) {
    require_mutable("cluster");
    c_->cluster = value;
}

void Lexeme::set_prob(float value) {
    require_mutable("prob");
    c_->prob = value;
}

void Lexeme::set_sentiment(float value) {
    require_mutable("sentiment");
    c_->sentiment = value;
}

bool Lexeme::check_flag(attr_id_t flag_id) const {
    LEXIS_CHECK_ARGUMENT(is_flag_id(flag_id),
                         "Flag ids must be between 1 and 63, got " + std::to_string(flag_id));
    return lexis::check_flag(*c_, flag_id);
}

void Lexeme::set_flag(attr_id_t flag_id, bool value) {
    LEXIS_CHECK_ARGUMENT(is_flag_id(flag_id),
                         "Flag ids must be between 1 and 63, got " + std::to_string(flag_id));
    require_mutable("flags");
    lexis::set_flag(*c_, flag_id, value);
}

std::span<const float> Lexeme::vector() const noexcept {
    return vocab_->vector(*c_);
}

bool Lexeme::has_vector() const noexcept {
    if (vocab_->is_zero_vector(c_->vector)) return false;
    auto v = vector();
    return !util::all_zero(v.data(), v.size());
}

void Lexeme::set_vector(std::span<const float> values) {
    require_mutable("vector");
    const auto expected = static_cast<size_t>(vocab_->vectors_length());
    if (values.size() != expected) {
        throw InvalidArgumentError("Vector has " + std::to_string(values.size()) +
                                   " components, vocabulary expects " + std::to_string(expected),
                                   "Lexeme::set_vector",
                                   "Call Vocab::resize_vectors() first");
    }
    vocab_->assign_vector(*c_, values.data(), values.size());
}

float Lexeme::similarity(const Lexeme& other) const noexcept {
    auto a = vector();
    auto b = other.vector();
    size_t n = a.size() < b.size() ? a.size() : b.size();
    return util::cosine_similarity(a.data(), c_->l2_norm, b.data(), other.c_->l2_norm, n);
}

} // namespace lexis
