#ifndef STREAMCSV_ERROR_H
#define STREAMCSV_ERROR_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace streamcsv {

// Stream error types
enum class ErrorCode {
    NONE = 0,

    // Character encoding errors
    INVALID_ENCODING,            // Byte sequence invalid for the detected encoding
    TRUNCATED_INPUT,             // Input ended inside a multi-byte code unit
    INVALID_UTF8,                // Invalid UTF-8 sequence in a cell (strict decoding)

    // Row structure errors
    ROW_TOO_LARGE,               // Row exceeds max_row_bytes
    INCONSISTENT_FIELD_COUNT,    // Strict mode: cell count differs from header count
    NO_HEADERS_DEFINED,          // Row assembly attempted before headers were resolved

    // General errors
    INTERNAL_ERROR               // Internal parser error
};

// Error severity levels
enum class ErrorSeverity {
    ERROR,      // Per-row error, the parser can keep going with the next row
    FATAL       // The whole chunk was rejected (encoding failures)
};

// Detailed error information
struct ParseError {
    ErrorCode code;
    ErrorSeverity severity;

    // Location information
    size_t row;           // Logical row number (1-indexed, 0 when not tied to a row)
    size_t byte_offset;   // Offset of the row start in the canonical UTF-8 stream

    // Context
    std::string message;  // Human-readable error message
    std::string context;  // Snippet of problematic data

    ParseError(ErrorCode c, ErrorSeverity s, size_t r, size_t offset,
               const std::string& msg, const std::string& ctx = "")
        : code(c), severity(s), row(r), byte_offset(offset),
          message(msg), context(ctx) {}

    bool is_fatal() const { return severity == ErrorSeverity::FATAL; }

    // Convert error to string
    std::string to_string() const;
};

// Error collector - keeps every error a parser instance has reported
class ErrorCollector {
public:
    ErrorCollector() = default;

    void add_error(const ParseError& error) {
        errors_.push_back(error);
        if (error.severity == ErrorSeverity::FATAL) {
            has_fatal_ = true;
        }
    }

    bool has_errors() const { return !errors_.empty(); }
    bool has_fatal_errors() const { return has_fatal_; }
    size_t error_count() const { return errors_.size(); }
    const std::vector<ParseError>& errors() const { return errors_; }

    // Get summary
    std::string summary() const;

    void clear() {
        errors_.clear();
        has_fatal_ = false;
    }

private:
    std::vector<ParseError> errors_;
    bool has_fatal_ = false;
};

// Exception thrown by the pull-style reader when the parser reports an error
class ParseException : public std::runtime_error {
public:
    explicit ParseException(const ParseError& error)
        : std::runtime_error(error.message), error_(error) {}

    const ParseError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    ParseError error_;
};

// Helper functions
const char* error_code_to_string(ErrorCode code);
const char* error_severity_to_string(ErrorSeverity severity);

// Messages shared by the parser and its callers
extern const char* const MSG_ROW_TOO_LARGE;
extern const char* const MSG_FIELD_COUNT_MISMATCH;
extern const char* const MSG_INVALID_ENCODING;
extern const char* const MSG_TRUNCATED_INPUT;
extern const char* const MSG_INVALID_UTF8;
extern const char* const MSG_NO_HEADERS;

} // namespace streamcsv

#endif // STREAMCSV_ERROR_H
