#include "streamcsv/error.h"
#include <sstream>

namespace streamcsv {

const char* const MSG_ROW_TOO_LARGE = "Row exceeds the maximum size";
const char* const MSG_FIELD_COUNT_MISMATCH = "Row length does not match headers";
const char* const MSG_INVALID_ENCODING = "Encoding conversion error: invalid characters found";
const char* const MSG_TRUNCATED_INPUT = "Encoding conversion error: input ends inside a character";
const char* const MSG_INVALID_UTF8 = "Invalid UTF-8 sequence in cell";
const char* const MSG_NO_HEADERS = "No headers defined";

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_ENCODING: return "INVALID_ENCODING";
        case ErrorCode::TRUNCATED_INPUT: return "TRUNCATED_INPUT";
        case ErrorCode::INVALID_UTF8: return "INVALID_UTF8";
        case ErrorCode::ROW_TOO_LARGE: return "ROW_TOO_LARGE";
        case ErrorCode::INCONSISTENT_FIELD_COUNT: return "INCONSISTENT_FIELD_COUNT";
        case ErrorCode::NO_HEADERS_DEFINED: return "NO_HEADERS_DEFINED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

const char* error_severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string ParseError::to_string() const {
    std::ostringstream ss;
    ss << "[" << error_severity_to_string(severity) << "] "
       << error_code_to_string(code);
    if (row > 0) {
        ss << " at row " << row;
    }
    ss << " (byte " << byte_offset << "): " << message;

    if (!context.empty()) {
        ss << "\n  Context: " << context;
    }

    return ss.str();
}

std::string ErrorCollector::summary() const {
    if (errors_.empty()) {
        return "No errors";
    }

    std::ostringstream ss;
    size_t errors = 0, fatal = 0;

    for (const auto& err : errors_) {
        switch (err.severity) {
            case ErrorSeverity::ERROR: errors++; break;
            case ErrorSeverity::FATAL: fatal++; break;
        }
    }

    ss << "Total errors: " << errors_.size() << " (Errors: " << errors
       << ", Fatal: " << fatal << ")";

    ss << "\n\nDetails:\n";
    for (const auto& err : errors_) {
        ss << err.to_string() << "\n";
    }

    return ss.str();
}

} // namespace streamcsv
