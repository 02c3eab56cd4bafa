#pragma once

#include "lexis/types.hpp"
#include <span>
#include <string_view>

namespace lexis {

class Vocab;

/// Integer value of a lexeme attribute; flags read as 0/1, unknown ids as 0.
attr_t get_struct_attr(const LexemeC& lex, attr_id_t attr) noexcept;

/// Store an integer attribute. Returns false for ids that are not LexemeC fields.
bool set_struct_attr(LexemeC& lex, attr_id_t attr, attr_t value) noexcept;

/**
 * Lexeme - typed view of a vocabulary record
 *
 * Cheap to copy; valid as long as the owning Vocab. Setters write through
 * to the shared record, so every later lookup sees the change. The empty
 * lexeme is read-only.
 */
class Lexeme {
public:
    Lexeme(Vocab& vocab, LexemeC* c) noexcept : vocab_(&vocab), c_(c) {}

    const LexemeC& c() const noexcept { return *c_; }
    Vocab& vocab() const noexcept { return *vocab_; }

    attr_t orth() const noexcept { return c_->orth; }
    std::string_view text() const;
    attr_t id() const noexcept { return c_->id; }
    attr_t length() const noexcept { return c_->length; }
    flags_t flags() const noexcept { return c_->flags; }

    attr_t lower() const noexcept { return c_->lower; }
    attr_t norm() const noexcept { return c_->norm; }
    attr_t shape() const noexcept { return c_->shape; }
    attr_t prefix() const noexcept { return c_->prefix; }
    attr_t suffix() const noexcept { return c_->suffix; }
    attr_t lang() const noexcept { return c_->lang; }
    attr_t cluster() const noexcept { return c_->cluster; }
    float prob() const noexcept { return c_->prob; }
    float sentiment() const noexcept { return c_->sentiment; }

    // String forms of the id-valued attributes
    std::string_view lower_text() const;
    std::string_view norm_text() const;
    std::string_view shape_text() const;
    std::string_view prefix_text() const;
    std::string_view suffix_text() const;
    std::string_view lang_text() const;

    void set_lower(std::string_view value);
    void set_norm(std::string_view value);
    void set_shape(std::string_view value);
    void set_prefix(std::string_view value);
    void set_suffix(std::string_view value);
    void set_lang(std::string_view value);
    void set_cluster(attr_t value);
    void set_prob(float value);
    void set_sentiment(float value);

    bool check_flag(attr_id_t flag_id) const;
    void set_flag(attr_id_t flag_id, bool value);

    bool is_alpha() const noexcept { return lexis::check_flag(*c_, IS_ALPHA); }
    bool is_ascii() const noexcept { return lexis::check_flag(*c_, IS_ASCII); }
    bool is_digit() const noexcept { return lexis::check_flag(*c_, IS_DIGIT); }
    bool is_lower() const noexcept { return lexis::check_flag(*c_, IS_LOWER); }
    bool is_upper() const noexcept { return lexis::check_flag(*c_, IS_UPPER); }
    bool is_title() const noexcept { return lexis::check_flag(*c_, IS_TITLE); }
    bool is_punct() const noexcept { return lexis::check_flag(*c_, IS_PUNCT); }
    bool is_space() const noexcept { return lexis::check_flag(*c_, IS_SPACE); }
    bool is_bracket() const noexcept { return lexis::check_flag(*c_, IS_BRACKET); }
    bool is_quote() const noexcept { return lexis::check_flag(*c_, IS_QUOTE); }
    bool is_left_punct() const noexcept { return lexis::check_flag(*c_, IS_LEFT_PUNCT); }
    bool is_right_punct() const noexcept { return lexis::check_flag(*c_, IS_RIGHT_PUNCT); }
    bool like_url() const noexcept { return lexis::check_flag(*c_, LIKE_URL); }
    bool like_num() const noexcept { return lexis::check_flag(*c_, LIKE_NUM); }
    bool like_email() const noexcept { return lexis::check_flag(*c_, LIKE_EMAIL); }
    bool is_stop() const noexcept { return lexis::check_flag(*c_, IS_STOP); }
    bool is_oov() const noexcept { return lexis::check_flag(*c_, IS_OOV); }

    std::span<const float> vector() const noexcept;
    float vector_norm() const noexcept { return c_->l2_norm; }
    bool has_vector() const noexcept;

    /**
     * Replace the vector. @p values must hold exactly vectors_length()
     * components; the norm is recomputed.
     * @throws InvalidArgumentError on a size mismatch
     */
    void set_vector(std::span<const float> values);

    /// Cosine similarity of the two vectors; 0 if either is all zeros.
    float similarity(const Lexeme& other) const noexcept;

private:
    void require_mutable(const char* what) const;
    std::string_view string_for(attr_t id) const;

    Vocab* vocab_;
    LexemeC* c_;
};

} // namespace lexis
