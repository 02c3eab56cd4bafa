#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lexis {
namespace io {

/**
 * Binary vector format
 *
 * A sequence of records in native byte order, with no header:
 *
 *   int32 word_byte_length | int32 vector_length | word bytes | float32 x vector_length
 *
 * Every record in a file carries the same vector_length, which lies in
 * [1, 100000).
 */

struct VectorRecord {
    std::string word;
    std::vector<float> values;
};

/**
 * Streaming reader for the binary vector format. Validates each header
 * before reading its payload; a stream that ends exactly on a record
 * boundary ends iteration, anything else is a FormatError.
 */
class BinaryVectorReader {
public:
    /// @param source Name used in error messages (usually the file path)
    explicit BinaryVectorReader(std::istream& in, std::string source = "<stream>");

    /// Read the next record into @p record. Returns false at end of stream.
    bool next(VectorRecord& record);

    size_t records_read() const noexcept { return records_read_; }

    /// Dimension of the first record, 0 before any record was read.
    int vector_length() const noexcept { return vector_length_; }

private:
    // false on a clean end of stream when @p at_boundary; throws on a short read otherwise
    bool read_exact(void* dst, size_t size, bool at_boundary);

    std::istream& in_;
    std::string source_;
    size_t records_read_ = 0;
    int vector_length_ = 0;
};

class BinaryVectorWriter {
public:
    explicit BinaryVectorWriter(std::ostream& out) : out_(out) {}

    void write(std::string_view word, std::span<const float> values);

    size_t records_written() const noexcept { return records_written_; }

private:
    std::ostream& out_;
    size_t records_written_ = 0;
};

// =============================================================================
// Text vector helpers
// =============================================================================

/// Split on runs of ASCII whitespace; empty tokens are never produced.
std::vector<std::string_view> split_whitespace(std::string_view line);

/// Parse one float component. Throws FormatError naming @p line_index.
float parse_component(std::string_view token, size_t line_index);

/**
 * Convert a text vector file ("word c1 c2 ...", one per line) to the binary
 * format. Inputs ending in .bz2 or .gz are decompressed on the fly; blank
 * lines and lines without components are skipped.
 *
 * @return Number of records written
 * @throws IOError if either file cannot be opened, FormatError on bad input
 */
size_t write_binary_vectors(const std::filesystem::path& in_path,
                            const std::filesystem::path& out_path);

} // namespace io
} // namespace lexis
