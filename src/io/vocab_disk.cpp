#include "lexis/io/vocab_disk.hpp"
#include "lexis/error.hpp"
#include "lexis/logging.hpp"
#include "lexis/string_store.hpp"
#include "lexis/vocab.hpp"

#include <boost/json.hpp>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace lexis {
namespace io {

namespace {

boost::json::array strings_to_json(const StringStore& strings) {
    boost::json::array arr;
    arr.reserve(strings.size() > 0 ? strings.size() - 1 : 0);
    bool first = true;
    for (const auto& s : strings) {
        if (first) {
            first = false;
            continue;
        }
        arr.emplace_back(boost::json::string(s.data(), s.size()));
    }
    return arr;
}

std::string read_file(const std::filesystem::path& path, const char* context) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Could not open " + path.string(), context, "Check that the file exists");
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("Failed reading " + path.string(), context, "", ErrorCode::READ_FAILED);
    }
    return content;
}

std::vector<std::string> parse_strings(const std::filesystem::path& path) {
    const std::string content = read_file(path, "load_strings");

    boost::json::error_code ec;
    boost::json::value root = boost::json::parse(content, ec);
    if (ec) {
        LEXIS_THROW_FORMAT("Invalid JSON in " + path.string() + ": " + ec.message());
    }
    if (!root.is_array()) {
        LEXIS_THROW_FORMAT(path.string() + " must hold a JSON array of strings");
    }

    const auto& arr = root.as_array();
    std::vector<std::string> entries;
    entries.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_string()) {
            LEXIS_THROW_FORMAT("Entry " + std::to_string(i) + " of " + path.string() +
                               " is not a string");
        }
        const auto& s = arr[i].as_string();
        entries.emplace_back(s.data(), s.size());
    }
    return entries;
}

} // anonymous namespace

void save_strings(const StringStore& strings, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOError("Could not open " + path.string() + " for writing", "save_strings", "",
                      ErrorCode::WRITE_FAILED);
    }

    file << boost::json::serialize(strings_to_json(strings));
    if (!file) {
        throw IOError("Failed writing " + path.string(), "save_strings", "",
                      ErrorCode::WRITE_FAILED);
    }
    LOG_DEBUG("Wrote ", strings.size() - 1, " strings to ", path.string());
}

size_t load_strings(StringStore& strings, const std::filesystem::path& path) {
    const auto entries = parse_strings(path);
    for (const auto& entry : entries) {
        strings.add(entry);
    }
    return entries.size();
}

void save_vocab(const Vocab& vocab, const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw IOError("Could not create directory " + dir.string() + ": " + ec.message(),
                      "save_vocab", "", ErrorCode::WRITE_FAILED);
    }

    save_strings(vocab.strings(), dir / STRINGS_FILE);
    vocab.dump_lexemes(dir / LEXEMES_FILE);

    LOG_INFO("Saved vocabulary (", vocab.size() - 1, " lexemes, ", vocab.strings().size(),
             " strings) to ", dir.string());
}

void load_vocab(Vocab& vocab, const std::filesystem::path& dir) {
    const auto strings_path = dir / STRINGS_FILE;
    const auto lexemes_path = dir / LEXEMES_FILE;
    for (const auto& path : {strings_path, lexemes_path}) {
        if (!std::filesystem::exists(path)) {
            throw IOError("Missing " + path.string(), "load_vocab",
                          "Expected a directory written by save_vocab");
        }
    }

    // Saved ids are positional: entry i of the file must land on id i + 1
    StringStore& strings = vocab.strings();
    const auto entries = parse_strings(strings_path);
    for (size_t i = 0; i < entries.size(); ++i) {
        if (strings.add(entries[i]) != i + 1) {
            throw ConsistencyError("String '" + entries[i] + "' in " + strings_path.string() +
                                       " does not keep its id " + std::to_string(i + 1),
                                   "load_vocab",
                                   "Load into a vocabulary built with the same tag names");
        }
    }

    vocab.load_lexemes(lexemes_path);
    LOG_INFO("Loaded vocabulary from ", dir.string(), ": ", vocab.size() - 1, " lexemes");
}

} // namespace io
} // namespace lexis
