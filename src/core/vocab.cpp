/**
 * Vocabulary: lexicon index, attribute pipeline and binary codec
 *
 * Vector operations live in vocab_vectors.cpp.
 */

#include "lexis/vocab.hpp"
#include "lexis/error.hpp"
#include "lexis/hash.hpp"
#include "lexis/lexeme.hpp"
#include "lexis/lexeme_codec.hpp"
#include "lexis/logging.hpp"
#include "lexis/symbols.hpp"
#include "lexis/util/utf8.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <type_traits>

namespace lexis {

namespace {

// Attributes a getter may target: flag bits and the computed LexemeC slots
bool is_computed_attr(attr_id_t attr) noexcept {
    if (is_flag_id(attr)) return true;
    switch (attr) {
        case LOWER:
        case NORM:
        case SHAPE:
        case PREFIX:
        case SUFFIX:
        case CLUSTER:
        case LANG:
        case PROB:
        case SENTIMENT:
            return true;
        default:
            return false;
    }
}

std::string attr_label(attr_id_t attr) {
    std::string_view name = attr_name(attr);
    return name.empty() ? std::to_string(attr) : std::string(name);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Vocab::Vocab(LexAttrGetters getters,
             const std::vector<std::string>& tag_names,
             std::shared_ptr<StringStore> strings)
    : strings_(strings ? std::move(strings) : std::make_shared<StringStore>())
{
    for (std::string_view name : symbol_names()) {
        strings_->add(name);
    }

    std::vector<std::string> tags(tag_names);
    std::sort(tags.begin(), tags.end());
    for (const auto& tag : tags) {
        strings_->add(tag);
    }

    for (const auto& entry : getters) {
        set_getter(entry.attr, entry.getter);
    }

    replace_zero_vector(0);

    LOG_DEBUG("Vocab created: ", strings_->size(), " strings, ",
              getters_.size(), " getters");
}

Vocab::~Vocab() = default;

// =============================================================================
// Lexicon index
// =============================================================================

const LexemeC* Vocab::get(std::string_view string) {
    return lookup(string, nullptr);
}

const LexemeC* Vocab::get(std::string_view string, Arena& scratch) {
    return lookup(string, &scratch);
}

const LexemeC* Vocab::get_by_orth(attr_t orth) {
    return lookup_by_orth(orth, nullptr);
}

const LexemeC* Vocab::get_by_orth(attr_t orth, Arena& scratch) {
    return lookup_by_orth(orth, &scratch);
}

Lexeme Vocab::operator[](std::string_view string) {
    return Lexeme(*this, lookup(string, nullptr));
}

Lexeme Vocab::operator[](attr_t orth) {
    return Lexeme(*this, lookup_by_orth(orth, nullptr));
}

bool Vocab::contains(std::string_view string) const {
    if (string.empty()) return false;
    return by_hash_.count(hash_string(string)) != 0;
}

LexemeC* Vocab::lookup(std::string_view string, Arena* scratch) {
    if (string.empty()) {
        return &empty_lexeme_;
    }

    const hash_t key = hash_string(string);
    auto it = by_hash_.find(key);
    if (it != by_hash_.end()) {
        LexemeC* lex = it->second;
        if ((*strings_)[lex->orth] != string) {
            throw ConsistencyError(
                "Indexed lexeme " + std::to_string(lex->orth) + " does not match string '" +
                    std::string(string) + "'",
                "Vocab::lookup",
                "The string store was modified or replaced after lexemes were created");
        }
        return lex;
    }

    return new_lexeme(string, scratch);
}

LexemeC* Vocab::lookup_by_orth(attr_t orth, Arena* scratch) {
    if (orth == 0) {
        return &empty_lexeme_;
    }
    if (!strings_->contains(orth)) {
        throw InvalidArgumentError("Unknown orth id " + std::to_string(orth),
                                   "Vocab::get_by_orth");
    }

    auto it = by_orth_.find(orth);
    if (it != by_orth_.end()) {
        return it->second;
    }
    return lookup((*strings_)[orth], scratch);
}

LexemeC* Vocab::new_lexeme(std::string_view string, Arena* scratch) {
    const bool is_oov = scratch != nullptr;
    const size_t char_count = util::count_codepoints(string);

    // Transient records live and die with the caller's arena
    Arena& mem = is_oov ? *scratch : mem_;

    LexemeC* lex = mem.alloc<LexemeC>();
    lex->orth = strings_->add(string);
    lex->length = static_cast<attr_t>(char_count);
    lex->prob = constants::OOV_PROB;
    lex->vector = zero_vector_;

    apply_getters(*lex, string);

    if (is_oov) {
        LOG_DEBUG("Transient lexeme for '", string, "' (orth ", lex->orth, ")");
        return lex;
    }

    add_lex_to_vocab(hash_string(string), lex);
    return lex;
}

void Vocab::add_lex_to_vocab(hash_t key, LexemeC* lex) {
    lex->id = length_;
    by_hash_[key] = lex;
    by_orth_[lex->orth] = lex;
    ++length_;
}

// =============================================================================
// Attribute pipeline
// =============================================================================

void Vocab::set_getter(attr_id_t attr, AttrGetter getter) {
    if (!is_computed_attr(attr)) {
        throw InvalidArgumentError("No getter can be registered for attribute " + attr_label(attr),
                                   "Vocab::set_getter",
                                   "Use a flag id in [1, 63] or one of LOWER, NORM, SHAPE, PREFIX, "
                                   "SUFFIX, CLUSTER, LANG, PROB, SENTIMENT");
    }
    LEXIS_CHECK_ARGUMENT(static_cast<bool>(getter), "Getter for " + attr_label(attr) + " is empty");

    getters_.set(attr, std::move(getter));
}

attr_id_t Vocab::add_flag(FlagGetter getter, int flag_id) {
    LEXIS_CHECK_ARGUMENT(static_cast<bool>(getter), "Flag getter is empty");

    attr_id_t id = 0;
    if (flag_id == -1) {
        for (attr_id_t bit = constants::MIN_FLAG_ID; bit <= constants::MAX_FLAG_ID; ++bit) {
            if (!getters_.contains(bit)) {
                id = bit;
                break;
            }
        }
        if (id == 0) {
            throw InvalidArgumentError("Cannot find a free flag bit",
                                       "Vocab::add_flag",
                                       "Pass an explicit flag_id to replace an existing flag");
        }
    } else {
        if (flag_id < static_cast<int>(constants::MIN_FLAG_ID) ||
            flag_id > static_cast<int>(constants::MAX_FLAG_ID)) {
            throw InvalidArgumentError("Flag id must be between 1 and 63, got " +
                                           std::to_string(flag_id),
                                       "Vocab::add_flag");
        }
        id = static_cast<attr_id_t>(flag_id);
    }

    for (auto& [key, lex] : by_hash_) {
        set_flag(*lex, id, getter((*strings_)[lex->orth]));
    }
    getters_.set(id, flag_getter(std::move(getter)));

    LOG_DEBUG("Registered flag ", id, " over ", by_hash_.size(), " lexemes");
    return id;
}

void Vocab::apply_getters(LexemeC& lex, std::string_view string) {
    for (const auto& entry : getters_) {
        store_attr(lex, entry.attr, entry.getter(string));
    }
}

void Vocab::store_attr(LexemeC& lex, attr_id_t attr, const AttrValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return;
    }

    if (attr == PROB || attr == SENTIMENT) {
        float number = 0.0f;
        if (const auto* b = std::get_if<bool>(&value)) {
            number = *b ? 1.0f : 0.0f;
        } else if (const auto* i = std::get_if<int64_t>(&value)) {
            number = static_cast<float>(*i);
        } else if (const auto* d = std::get_if<double>(&value)) {
            number = static_cast<float>(*d);
        } else {
            throw InvalidArgumentError("Getter for " + attr_label(attr) + " returned a string",
                                       "Vocab::apply_getters");
        }
        (attr == PROB ? lex.prob : lex.sentiment) = number;
        return;
    }

    // Flags are truthy; a string result counts as set when non-empty
    if (is_flag_id(attr)) {
        const bool set = std::visit([](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return !v.empty();
            } else if constexpr (std::is_same_v<T, std::monostate>) {
                return false;
            } else {
                return v != T{};
            }
        }, value);
        set_flag(lex, attr, set);
        return;
    }

    attr_t stored = 0;
    if (const auto* s = std::get_if<std::string>(&value)) {
        stored = strings_->add(*s);
    } else if (const auto* b = std::get_if<bool>(&value)) {
        stored = *b ? 1 : 0;
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
        if (*i < 0 || *i > static_cast<int64_t>(std::numeric_limits<attr_t>::max())) {
            throw InvalidArgumentError("Getter for " + attr_label(attr) + " returned " +
                                           std::to_string(*i) + ", outside the attribute range",
                                       "Vocab::apply_getters");
        }
        stored = static_cast<attr_t>(*i);
    } else if (const auto* d = std::get_if<double>(&value)) {
        if (!(*d >= 0.0 && *d <= static_cast<double>(std::numeric_limits<attr_t>::max()))) {
            throw InvalidArgumentError("Getter for " + attr_label(attr) + " returned " +
                                           std::to_string(*d) + ", outside the attribute range",
                                       "Vocab::apply_getters");
        }
        stored = static_cast<attr_t>(*d);
    }

    set_struct_attr(lex, attr, stored);
}

// =============================================================================
// Binary codec
// =============================================================================

std::vector<uint8_t> Vocab::lexemes_to_bytes() const {
    std::vector<uint8_t> out;
    out.reserve(by_hash_.size() * LexemeCodec::RECORD_SIZE);

    for (const auto& [key, lex] : by_hash_) {
        if (!lex) continue;
        const auto record = LexemeCodec::encode(*lex);
        out.insert(out.end(), record.begin(), record.end());
    }
    return out;
}

void Vocab::lexemes_from_bytes(std::span<const uint8_t> data) {
    if (data.size() % LexemeCodec::RECORD_SIZE != 0) {
        throw FormatError("Lexeme blob of " + std::to_string(data.size()) +
                              " bytes is not a multiple of the record size " +
                              std::to_string(LexemeCodec::RECORD_SIZE),
                          "Vocab::lexemes_from_bytes");
    }

    size_t inserted = 0;
    size_t replaced = 0;
    size_t skipped = 0;

    for (size_t offset = 0; offset < data.size(); offset += LexemeCodec::RECORD_SIZE) {
        const size_t index = offset / LexemeCodec::RECORD_SIZE;
        LexemeC decoded = LexemeCodec::decode(data.subspan(offset, LexemeCodec::RECORD_SIZE));

        if (decoded.orth == 0 || !strings_->contains(decoded.orth)) {
            LOG_WARN("Skipping lexeme record ", index, ": orth ", decoded.orth,
                     " is not in the string store");
            ++skipped;
            continue;
        }

        std::string_view string = (*strings_)[decoded.orth];
        if (strings_->add(string) != decoded.orth) {
            throw ConsistencyError("String store round trip failed for orth " +
                                       std::to_string(decoded.orth),
                                   "Vocab::lexemes_from_bytes");
        }

        // Replace in place so existing Lexeme views stay valid
        const bool is_new = by_orth_.count(decoded.orth) == 0;
        LexemeC* lex = is_new ? mem_.alloc<LexemeC>() : by_orth_[decoded.orth];
        *lex = decoded;
        lex->vector = zero_vector_;
        lex->l2_norm = 0.0f;

        by_hash_[hash_string(string)] = lex;
        by_orth_[lex->orth] = lex;
        if (is_new) {
            ++length_;
            ++inserted;
        } else {
            ++replaced;
        }
    }

    LOG_INFO("Loaded lexemes: ", inserted, " inserted, ", replaced, " replaced, ",
             skipped, " skipped");
}

void Vocab::dump_lexemes(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOError("Could not open " + path.string() + " for writing",
                      "Vocab::dump_lexemes", "", ErrorCode::WRITE_FAILED);
    }

    const auto bytes = lexemes_to_bytes();
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw IOError("Failed writing " + path.string(), "Vocab::dump_lexemes", "",
                      ErrorCode::WRITE_FAILED);
    }

    LOG_INFO("Wrote ", bytes.size() / LexemeCodec::RECORD_SIZE, " lexemes to ", path.string());
}

void Vocab::load_lexemes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Could not open " + path.string(), "Vocab::load_lexemes",
                      "Check that the file exists");
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("Failed reading " + path.string(), "Vocab::load_lexemes", "",
                      ErrorCode::READ_FAILED);
    }

    lexemes_from_bytes(bytes);
}

std::vector<uint8_t> Vocab::to_bytes() const {
    throw NotImplementedError("Whole-vocabulary serialization is not supported",
                              "Vocab::to_bytes",
                              "Save the string store and lexemes_to_bytes() separately");
}

void Vocab::from_bytes(std::span<const uint8_t> /*data*/) {
    throw NotImplementedError("Whole-vocabulary deserialization is not supported",
                              "Vocab::from_bytes",
                              "Load the string store, then call lexemes_from_bytes()");
}

} // namespace lexis
