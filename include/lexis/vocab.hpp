#pragma once

#include "lexis/arena.hpp"
#include "lexis/attr_getters.hpp"
#include "lexis/string_store.hpp"
#include "lexis/types.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lexis {

class Lexeme;

/**
 * Vocab - deduplicated lexeme table
 *
 * One record per distinct string, indexed both by the 64-bit hash of the
 * string and by its orth id. Records are created lazily on first lookup,
 * computed once through the registered attribute getters, and live until
 * the vocabulary is destroyed.
 *
 * Lookups that pass a scratch arena are out-of-vocabulary: a record the
 * table does not already hold is built for the caller only (id 0), is
 * inserted into neither index, and is allocated from and released with the
 * caller's arena. Such lookups never grow the vocabulary's own arena.
 *
 * Not thread-safe; one owner per instance.
 */
class Vocab {
    using HashIndex = std::unordered_map<hash_t, LexemeC*>;

public:
    /// Iterates permanent records in by-hash order (unspecified).
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = LexemeC;
        using difference_type = std::ptrdiff_t;
        using pointer = const LexemeC*;
        using reference = const LexemeC&;

        const_iterator() = default;
        explicit const_iterator(HashIndex::const_iterator it) : it_(it) {}

        reference operator*() const { return *it_->second; }
        pointer operator->() const { return it_->second; }
        const_iterator& operator++() { ++it_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++it_; return tmp; }
        bool operator==(const const_iterator& other) const { return it_ == other.it_; }
        bool operator!=(const const_iterator& other) const { return it_ != other.it_; }

    private:
        HashIndex::const_iterator it_;
    };

    /**
     * @param getters    Attribute getters run once per new lexeme
     * @param tag_names  Tag-map keys; interned (sorted) after the symbol table
     * @param strings    Shared string store; a fresh one is created when null
     */
    explicit Vocab(LexAttrGetters getters = {},
                   const std::vector<std::string>& tag_names = {},
                   std::shared_ptr<StringStore> strings = nullptr);
    ~Vocab();

    Vocab(const Vocab&) = delete;
    Vocab& operator=(const Vocab&) = delete;

    // =========================================================================
    // Lexicon index
    // =========================================================================

    /// Record for @p string, created in the permanent table if missing.
    /// Throws ConsistencyError if the indexed record disagrees with the string store.
    const LexemeC* get(std::string_view string);

    /// Out-of-vocabulary lookup: misses are built for the caller only.
    const LexemeC* get(std::string_view string, Arena& scratch);

    /// Record for an orth id; 0 yields the empty lexeme.
    /// Throws InvalidArgumentError for ids unknown to the string store.
    const LexemeC* get_by_orth(attr_t orth);
    const LexemeC* get_by_orth(attr_t orth, Arena& scratch);

    Lexeme operator[](std::string_view string);
    Lexeme operator[](attr_t orth);

    bool contains(std::string_view string) const;

    /// Insertion counter. Starts at 1: slot 0 belongs to the empty lexeme.
    size_t size() const noexcept { return length_; }

    const_iterator begin() const { return const_iterator(by_hash_.begin()); }
    const_iterator end() const { return const_iterator(by_hash_.end()); }

    StringStore& strings() noexcept { return *strings_; }
    const StringStore& strings() const noexcept { return *strings_; }
    const std::shared_ptr<StringStore>& shared_strings() const noexcept { return strings_; }

    const LexemeC& empty_lexeme() const noexcept { return empty_lexeme_; }
    const Arena& arena() const noexcept { return mem_; }

    // =========================================================================
    // Attribute pipeline
    // =========================================================================

    /**
     * Register (or replace) the getter for @p attr. Applies to lexemes
     * created afterwards. ORTH, ID and LENGTH belong to the index and are
     * rejected with InvalidArgumentError, as is NULL_ATTR.
     */
    void set_getter(attr_id_t attr, AttrGetter getter);

    /**
     * Register a boolean flag, applying it to every permanent lexeme now
     * and to every lexeme created later.
     *
     * @param flag_id Bit in [1, 63], or -1 for the lowest bit with no getter
     * @return The flag id used
     * @throws InvalidArgumentError for ids outside [1, 63] or when no bit is free
     */
    attr_id_t add_flag(FlagGetter getter, int flag_id = -1);

    const LexAttrGetters& getters() const noexcept { return getters_; }

    // =========================================================================
    // Vectors
    // =========================================================================

    int vectors_length() const noexcept { return vectors_length_; }

    /**
     * Load whitespace-delimited text vectors, one word per line.
     * @return The vector dimension (0 for an empty stream)
     * @throws FormatError when a line's component count disagrees with the first line
     */
    int load_vectors(std::istream& in);

    /**
     * Load length-prefixed binary vectors. Each permanent lexeme receives
     * the vector stored under its `lower` form, or the zero vector.
     * @throws FormatError, IOError
     */
    int load_vectors_from_bin_loc(const std::filesystem::path& path);

    /// Reallocate every vector to @p new_size components, keeping the common prefix.
    void resize_vectors(int new_size);

    /// Write every permanent lexeme's vector in the binary vector format.
    void dump_vectors(const std::filesystem::path& path) const;

    /// Vector of @p lex, vectors_length() components long.
    std::span<const float> vector(const LexemeC& lex) const noexcept;

    /// True for the shared zero vector (current or from before a resize).
    bool is_zero_vector(const float* ptr) const noexcept;

    // =========================================================================
    // Binary codec
    // =========================================================================

    /// One fixed-width record per permanent lexeme, in by-hash order.
    std::vector<uint8_t> lexemes_to_bytes() const;

    /// Insert the records of a lexemes_to_bytes() blob. Vectors start at zero.
    void lexemes_from_bytes(std::span<const uint8_t> data);

    void dump_lexemes(const std::filesystem::path& path) const;
    void load_lexemes(const std::filesystem::path& path);

    /// Whole-table opaque serialization is not supported: always throws NotImplementedError.
    std::vector<uint8_t> to_bytes() const;
    void from_bytes(std::span<const uint8_t> data);

private:
    friend class Lexeme;

    LexemeC* lookup(std::string_view string, Arena* scratch);
    LexemeC* lookup_by_orth(attr_t orth, Arena* scratch);
    LexemeC* new_lexeme(std::string_view string, Arena* scratch);
    void add_lex_to_vocab(hash_t key, LexemeC* lex);

    void apply_getters(LexemeC& lex, std::string_view string);
    void store_attr(LexemeC& lex, attr_id_t attr, const AttrValue& value);

    // Copies @p values into a fresh permanent buffer and refreshes the norm
    void assign_vector(LexemeC& lex, const float* values, size_t count);
    void replace_zero_vector(int new_size);

    std::shared_ptr<StringStore> strings_;
    Arena mem_;
    HashIndex by_hash_;
    std::unordered_map<attr_t, LexemeC*> by_orth_;
    LexAttrGetters getters_;

    attr_t length_ = 1;
    int vectors_length_ = 0;

    float* zero_vector_ = nullptr;
    std::vector<const float*> retired_zero_vectors_;
    LexemeC empty_lexeme_;
};

} // namespace lexis
