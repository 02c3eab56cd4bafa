#pragma once

#include <stdexcept>
#include <string>

namespace lexis {

/**
 * Structured error reporting for the lexicon store.
 * Every failure carries a code, the call site and an optional suggestion.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_IMPLEMENTED = 3,

    // Lexicon errors
    CONSISTENCY_FAULT = 100,

    // Input format errors
    FORMAT_ERROR = 200,

    // I/O errors
    FILE_NOT_FOUND = 300,
    READ_FAILED = 301,
    WRITE_FAILED = 302,

    INTERNAL_ERROR = 500
};

class LexisException : public std::runtime_error {
public:
    explicit LexisException(ErrorCode code, const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "lexis error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public LexisException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : LexisException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

/// An indexed record no longer agrees with the string store.
class ConsistencyError : public LexisException {
public:
    explicit ConsistencyError(const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : LexisException(ErrorCode::CONSISTENCY_FAULT, message, context, suggestion) {}
};

/// Malformed vector file or lexeme blob.
class FormatError : public LexisException {
public:
    explicit FormatError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : LexisException(ErrorCode::FORMAT_ERROR, message, context, suggestion) {}
};

class NotImplementedError : public LexisException {
public:
    explicit NotImplementedError(const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : LexisException(ErrorCode::NOT_IMPLEMENTED, message, context, suggestion) {}
};

class IOError : public LexisException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "",
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : LexisException(code, message, context, suggestion) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw LexisException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }

    static void check_pointer(const void* ptr, const std::string& name) {
        if (!ptr) {
            throw InvalidArgumentError("Null pointer: " + name);
        }
    }
};

// Macros for common error checking
#define LEXIS_CHECK(condition, code, message) \
    lexis::ErrorHandler::check_condition(condition, code, message, __func__)

#define LEXIS_CHECK_ARGUMENT(condition, message) \
    lexis::ErrorHandler::check_argument(condition, message, __func__)

#define LEXIS_CHECK_POINTER(ptr, name) \
    lexis::ErrorHandler::check_pointer(ptr, name)

#define LEXIS_THROW_FORMAT(message) \
    throw lexis::FormatError(message, __func__)

} // namespace lexis
