/**
 * Vocabulary vector storage: text and binary loading, resizing, dumping
 */

#include "lexis/vocab.hpp"
#include "lexis/error.hpp"
#include "lexis/io/vector_io.hpp"
#include "lexis/logging.hpp"
#include "lexis/util/vector_math.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <istream>

namespace lexis {

// =============================================================================
// Vector access
// =============================================================================

std::span<const float> Vocab::vector(const LexemeC& lex) const noexcept {
    const auto n = static_cast<size_t>(vectors_length_);
    if (!lex.vector || is_zero_vector(lex.vector)) {
        return {zero_vector_, n};
    }
    return {lex.vector, n};
}

bool Vocab::is_zero_vector(const float* ptr) const noexcept {
    if (ptr == zero_vector_) return true;
    return std::find(retired_zero_vectors_.begin(), retired_zero_vectors_.end(), ptr) !=
           retired_zero_vectors_.end();
}

void Vocab::assign_vector(LexemeC& lex, const float* values, size_t count) {
    float* buffer = mem_.alloc<float>(count);
    if (count) {
        std::memcpy(buffer, values, count * sizeof(float));
    }
    lex.vector = buffer;
    lex.l2_norm = util::l2_norm(buffer, count);
}

void Vocab::replace_zero_vector(int new_size) {
    // Records outside the index (transient ones) may still point at the old sentinel
    if (zero_vector_) {
        retired_zero_vectors_.push_back(zero_vector_);
    }
    zero_vector_ = mem_.alloc<float>(static_cast<size_t>(new_size));
    empty_lexeme_.vector = zero_vector_;
    empty_lexeme_.l2_norm = 0.0f;
}

// =============================================================================
// Resizing
// =============================================================================

void Vocab::resize_vectors(int new_size) {
    LEXIS_CHECK_ARGUMENT(new_size >= 0,
                         "Vector size must be non-negative, got " + std::to_string(new_size));
    if (new_size == vectors_length_) return;

    const auto old_n = static_cast<size_t>(vectors_length_);
    const auto new_n = static_cast<size_t>(new_size);

    replace_zero_vector(new_size);

    for (auto& [key, lex] : by_hash_) {
        if (is_zero_vector(lex->vector)) {
            lex->vector = zero_vector_;
            lex->l2_norm = 0.0f;
            continue;
        }
        lex->vector = mem_.realloc(lex->vector, old_n, new_n);
        if (new_n < old_n) {
            lex->l2_norm = util::l2_norm(lex->vector, new_n);
        }
    }

    vectors_length_ = new_size;
    LOG_DEBUG("Resized vectors from ", old_n, " to ", new_n, " components");
}

// =============================================================================
// Text vectors
// =============================================================================

int Vocab::load_vectors(std::istream& in) {
    std::string line;
    std::vector<float> values;
    size_t line_index = 0;
    int vec_len = -1;

    for (; std::getline(in, line); ++line_index) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        const auto tokens = io::split_whitespace(line);
        // A line starting with whitespace carries the vector for " "
        const bool space_entry = line.empty() || std::isspace(static_cast<unsigned char>(line[0]));
        const std::string_view word = space_entry ? std::string_view(" ") : tokens[0];
        const size_t first = space_entry ? 0 : 1;
        const int count = static_cast<int>(tokens.size() - first);

        if (vec_len < 0) {
            vec_len = count;
            if (vec_len != vectors_length_) {
                resize_vectors(vec_len);
            }
        } else if (count != vec_len) {
            throw FormatError("Vector on line " + std::to_string(line_index) + " has " +
                                  std::to_string(count) + " components, expected " +
                                  std::to_string(vec_len),
                              "Vocab::load_vectors");
        }

        values.clear();
        for (size_t i = first; i < tokens.size(); ++i) {
            values.push_back(io::parse_component(tokens[i], line_index));
        }

        LexemeC* lex = lookup(word, nullptr);
        assign_vector(*lex, values.data(), values.size());
    }

    if (in.bad()) {
        throw IOError("Failed reading vector stream after line " + std::to_string(line_index),
                      "Vocab::load_vectors", "", ErrorCode::READ_FAILED);
    }
    if (vec_len < 0) {
        LOG_DEBUG("Empty vector stream");
        return 0;
    }

    vectors_length_ = vec_len;
    LOG_INFO("Loaded ", line_index, " text vectors of dimension ", vec_len);
    return vec_len;
}

// =============================================================================
// Binary vectors
// =============================================================================

int Vocab::load_vectors_from_bin_loc(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Could not open vector file " + path.string(),
                      "Vocab::load_vectors_from_bin_loc", "Check that the file exists");
    }

    io::BinaryVectorReader reader(file, path.string());
    io::VectorRecord record;
    // Indexed by the word's lower id; empty slots mean "no vector"
    std::vector<std::vector<float>> slots;

    while (reader.next(record)) {
        if (record.word.empty()) {
            LOG_WARN("Skipping record ", reader.records_read() - 1, " in ", path.string(),
                     ": empty word");
            continue;
        }
        const LexemeC* lex = lookup(record.word, nullptr);
        if (lex->lower == 0) {
            LOG_DEBUG("No lower form for '", record.word, "'; vector dropped");
            continue;
        }
        if (lex->lower >= slots.size()) {
            slots.resize(lex->lower + 1);
        }
        slots[lex->lower] = std::move(record.values);
    }

    const int vec_len = reader.vector_length();
    if (reader.records_read() == 0) {
        LOG_WARN("No vectors in ", path.string());
        return 0;
    }

    if (vec_len != vectors_length_) {
        replace_zero_vector(vec_len);
    }

    size_t with_vector = 0;
    for (auto& [key, lex] : by_hash_) {
        if (lex->lower < slots.size() && !slots[lex->lower].empty()) {
            assign_vector(*lex, slots[lex->lower].data(), slots[lex->lower].size());
            ++with_vector;
        } else {
            lex->vector = zero_vector_;
            lex->l2_norm = 0.0f;
        }
    }

    vectors_length_ = vec_len;
    LOG_INFO("Loaded ", reader.records_read(), " vectors of dimension ", vec_len, " from ",
             path.string(), "; ", with_vector, " of ", by_hash_.size(), " lexemes have vectors");
    return vec_len;
}

void Vocab::dump_vectors(const std::filesystem::path& path) const {
    LEXIS_CHECK_ARGUMENT(vectors_length_ > 0, "No vectors to dump: vector length is 0");

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOError("Could not open " + path.string() + " for writing",
                      "Vocab::dump_vectors", "", ErrorCode::WRITE_FAILED);
    }

    io::BinaryVectorWriter writer(file);
    for (const auto& [key, lex] : by_hash_) {
        writer.write((*strings_)[lex->orth], vector(*lex));
    }

    if (!file) {
        throw IOError("Failed writing " + path.string(), "Vocab::dump_vectors", "",
                      ErrorCode::WRITE_FAILED);
    }
    LOG_INFO("Wrote ", writer.records_written(), " vectors to ", path.string());
}

} // namespace lexis
