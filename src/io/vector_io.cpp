/**
 * Binary and text vector file I/O
 */

#include "lexis/io/vector_io.hpp"
#include "lexis/error.hpp"
#include "lexis/logging.hpp"
#include "lexis/types.hpp"

#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <ostream>

namespace lexis {
namespace io {

// =============================================================================
// BinaryVectorReader
// =============================================================================

BinaryVectorReader::BinaryVectorReader(std::istream& in, std::string source)
    : in_(in), source_(std::move(source)) {}

bool BinaryVectorReader::read_exact(void* dst, size_t size, bool at_boundary) {
    in_.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
    const auto got = static_cast<size_t>(in_.gcount());
    if (got == size) return true;

    if (got == 0 && at_boundary && in_.eof() && !in_.bad()) {
        return false;
    }
    throw FormatError("Truncated vector record " + std::to_string(records_read_) + " in " +
                          source_ + ": expected " + std::to_string(size) + " bytes, got " +
                          std::to_string(got),
                      "BinaryVectorReader::next");
}

bool BinaryVectorReader::next(VectorRecord& record) {
    int32_t word_len = 0;
    int32_t vec_len = 0;

    if (!read_exact(&word_len, sizeof(word_len), true)) {
        return false;
    }
    read_exact(&vec_len, sizeof(vec_len), false);

    const std::string where = "record " + std::to_string(records_read_) + " in " + source_;

    if (word_len < 0) {
        LEXIS_THROW_FORMAT("Negative word length " + std::to_string(word_len) + " at " + where);
    }
    if (vec_len < 1 || vec_len >= constants::MAX_VECTOR_SIZE) {
        LEXIS_THROW_FORMAT("Vector length " + std::to_string(vec_len) + " at " + where +
                           " is outside [1, " + std::to_string(constants::MAX_VECTOR_SIZE) + ")");
    }
    if (vector_length_ == 0) {
        vector_length_ = vec_len;
    } else if (vec_len != vector_length_) {
        LEXIS_THROW_FORMAT("Vector length mismatch at " + where + ": got " +
                           std::to_string(vec_len) + ", expected " +
                           std::to_string(vector_length_));
    }

    record.word.resize(static_cast<size_t>(word_len));
    if (word_len > 0) {
        read_exact(record.word.data(), record.word.size(), false);
    }
    record.values.resize(static_cast<size_t>(vec_len));
    read_exact(record.values.data(), record.values.size() * sizeof(float), false);

    ++records_read_;
    return true;
}

// =============================================================================
// BinaryVectorWriter
// =============================================================================

void BinaryVectorWriter::write(std::string_view word, std::span<const float> values) {
    const auto word_len = static_cast<int32_t>(word.size());
    const auto vec_len = static_cast<int32_t>(values.size());

    out_.write(reinterpret_cast<const char*>(&word_len), sizeof(word_len));
    out_.write(reinterpret_cast<const char*>(&vec_len), sizeof(vec_len));
    out_.write(word.data(), static_cast<std::streamsize>(word.size()));
    out_.write(reinterpret_cast<const char*>(values.data()),
               static_cast<std::streamsize>(values.size() * sizeof(float)));
    ++records_written_;
}

// =============================================================================
// Text helpers
// =============================================================================

namespace {

inline bool is_ascii_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // anonymous namespace

std::vector<std::string_view> split_whitespace(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_ascii_space(line[i])) ++i;
        const size_t start = i;
        while (i < line.size() && !is_ascii_space(line[i])) ++i;
        if (i > start) {
            tokens.push_back(line.substr(start, i - start));
        }
    }
    return tokens;
}

float parse_component(std::string_view token, size_t line_index) {
    const std::string text(token);
    char* end = nullptr;
    errno = 0;
    const float value = std::strtof(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || (errno == ERANGE && std::isinf(value))) {
        LEXIS_THROW_FORMAT("Invalid vector component '" + text + "' on line " +
                           std::to_string(line_index));
    }
    return value;
}

// =============================================================================
// Legacy text -> binary conversion
// =============================================================================

size_t write_binary_vectors(const std::filesystem::path& in_path,
                            const std::filesystem::path& out_path) {
    std::ifstream file(in_path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Could not open vector source " + in_path.string(),
                      "write_binary_vectors", "Check that the file exists");
    }

    boost::iostreams::filtering_istream in;
    const auto ext = in_path.extension();
    if (ext == ".bz2") {
        in.push(boost::iostreams::bzip2_decompressor());
    } else if (ext == ".gz") {
        in.push(boost::iostreams::gzip_decompressor());
    }
    in.push(file);

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Could not open " + out_path.string() + " for writing",
                      "write_binary_vectors", "", ErrorCode::WRITE_FAILED);
    }

    BinaryVectorWriter writer(out);
    std::vector<float> values;
    std::string line;
    size_t line_index = 0;

    for (; std::getline(in, line); ++line_index) {
        auto tokens = split_whitespace(line);
        if (tokens.empty()) continue;
        if (tokens.size() == 1) {
            LOG_WARN("Skipping line ", line_index, " of ", in_path.string(), ": no components");
            continue;
        }

        values.clear();
        for (size_t i = 1; i < tokens.size(); ++i) {
            values.push_back(parse_component(tokens[i], line_index));
        }
        writer.write(tokens[0], values);
    }

    if (in.bad()) {
        LEXIS_THROW_FORMAT("Failed to read " + in_path.string() + " after line " +
                           std::to_string(line_index));
    }
    if (!out) {
        throw IOError("Failed writing " + out_path.string(), "write_binary_vectors", "",
                      ErrorCode::WRITE_FAILED);
    }

    LOG_INFO("Converted ", writer.records_written(), " vectors from ", in_path.string(),
             " to ", out_path.string());
    return writer.records_written();
}

} // namespace io
} // namespace lexis
