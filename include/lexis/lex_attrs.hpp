#pragma once

#include "lexis/attr_getters.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace lexis {
namespace lex_attrs {

// =============================================================================
// String-valued attributes
// =============================================================================

std::string lower(std::string_view text);

/**
 * Orthographic shape: letters map to X/x, digits to d, everything else is
 * kept. Runs of one shape character are capped at 4 ("Xxxxx" for
 * "Hello"). Strings of 100 characters or more are "LONG".
 */
std::string word_shape(std::string_view text);

/// First character.
std::string prefix(std::string_view text);

/// Last three characters (the whole string when shorter).
std::string suffix(std::string_view text);

// =============================================================================
// Flag predicates
// =============================================================================

bool is_alpha(std::string_view text);
bool is_ascii(std::string_view text);
bool is_digit(std::string_view text);
bool is_lower(std::string_view text);
bool is_upper(std::string_view text);
bool is_title(std::string_view text);
bool is_punct(std::string_view text);
bool is_space(std::string_view text);
bool is_bracket(std::string_view text);
bool is_quote(std::string_view text);
bool is_left_punct(std::string_view text);
bool is_right_punct(std::string_view text);

// Digits with optional sign and separators, simple fractions, English number words
bool like_num(std::string_view text);
bool like_url(std::string_view text);
bool like_email(std::string_view text);

/**
 * Standard getter set: LOWER, NORM, SHAPE, PREFIX, SUFFIX and the
 * orthographic flags. IS_STOP is added when @p stop_words is non-empty;
 * membership is tested on the lowercased string.
 */
LexAttrGetters default_getters(const std::vector<std::string>& stop_words = {});

} // namespace lex_attrs
} // namespace lexis
