#pragma once

#include "lexis/types.hpp"
#include <string_view>
#include <vector>

namespace lexis {

/**
 * Structural strings interned by every vocabulary before any lexeme, in
 * this order, so their ids form a stable low-numbered prefix: attribute
 * names first, then universal part-of-speech names.
 */
const std::vector<std::string_view>& symbol_names();

/// Name of an attribute id ("IS_ALPHA", "LOWER", ...); "FLAG<n>" for
/// unnamed flag bits and an empty view for unknown ids.
std::string_view attr_name(attr_id_t attr);

} // namespace lexis
