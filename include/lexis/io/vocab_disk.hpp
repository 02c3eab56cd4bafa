#pragma once

#include <filesystem>

namespace lexis {

class StringStore;
class Vocab;

namespace io {

/**
 * On-disk vocabulary: a directory holding
 *
 *   strings.json  JSON array of the interned strings in id order, id 0 omitted
 *   lexemes.bin   concatenated LexemeCodec records
 *
 * Vectors are not part of the layout; use Vocab::dump_vectors for those.
 */

constexpr const char* STRINGS_FILE = "strings.json";
constexpr const char* LEXEMES_FILE = "lexemes.bin";

void save_strings(const StringStore& strings, const std::filesystem::path& path);

/// Append the strings of @p path to @p strings in file order.
/// @return Number of strings read
size_t load_strings(StringStore& strings, const std::filesystem::path& path);

/// Write strings.json and lexemes.bin into @p dir, creating it if needed.
void save_vocab(const Vocab& vocab, const std::filesystem::path& dir);

/**
 * Restore a directory written by save_vocab into @p vocab. The vocabulary
 * must intern the same leading strings (same tag names) as the one saved.
 * @throws IOError for missing files, ConsistencyError if string ids disagree
 */
void load_vocab(Vocab& vocab, const std::filesystem::path& dir);

} // namespace io
} // namespace lexis
