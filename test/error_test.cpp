/**
 * @file error_test.cpp
 * @brief Tests for error codes, error formatting and the error collector.
 */

#include <gtest/gtest.h>
#include "streamcsv/error.h"

#include <string>

using namespace streamcsv;

// ============================================================================
// String conversion
// ============================================================================

TEST(ErrorCodeTest, CodeNames) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::NONE), "NONE");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INVALID_ENCODING), "INVALID_ENCODING");
    EXPECT_STREQ(error_code_to_string(ErrorCode::TRUNCATED_INPUT), "TRUNCATED_INPUT");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INVALID_UTF8), "INVALID_UTF8");
    EXPECT_STREQ(error_code_to_string(ErrorCode::ROW_TOO_LARGE), "ROW_TOO_LARGE");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INCONSISTENT_FIELD_COUNT),
                 "INCONSISTENT_FIELD_COUNT");
    EXPECT_STREQ(error_code_to_string(ErrorCode::NO_HEADERS_DEFINED), "NO_HEADERS_DEFINED");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INTERNAL_ERROR), "INTERNAL_ERROR");
}

TEST(ErrorCodeTest, SeverityNames) {
    EXPECT_STREQ(error_severity_to_string(ErrorSeverity::ERROR), "ERROR");
    EXPECT_STREQ(error_severity_to_string(ErrorSeverity::FATAL), "FATAL");
}

TEST(ErrorCodeTest, UserVisibleMessages) {
    EXPECT_STREQ(MSG_FIELD_COUNT_MISMATCH, "Row length does not match headers");
    EXPECT_STREQ(MSG_ROW_TOO_LARGE, "Row exceeds the maximum size");
    EXPECT_STREQ(MSG_INVALID_ENCODING, "Encoding conversion error: invalid characters found");
}

// ============================================================================
// ParseError
// ============================================================================

TEST(ParseErrorTest, ToStringWithRow) {
    ParseError err(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::ERROR, 3, 17,
                   MSG_FIELD_COUNT_MISMATCH, "1,2,3");
    EXPECT_EQ(err.to_string(),
              "[ERROR] INCONSISTENT_FIELD_COUNT at row 3 (byte 17): "
              "Row length does not match headers\n  Context: 1,2,3");
    EXPECT_FALSE(err.is_fatal());
}

TEST(ParseErrorTest, ToStringWithoutRow) {
    ParseError err(ErrorCode::INVALID_ENCODING, ErrorSeverity::FATAL, 0, 42,
                   MSG_INVALID_ENCODING);
    EXPECT_EQ(err.to_string(),
              "[FATAL] INVALID_ENCODING (byte 42): "
              "Encoding conversion error: invalid characters found");
    EXPECT_TRUE(err.is_fatal());
}

// ============================================================================
// ErrorCollector
// ============================================================================

TEST(ErrorCollectorTest, StartsEmpty) {
    ErrorCollector collector;
    EXPECT_FALSE(collector.has_errors());
    EXPECT_FALSE(collector.has_fatal_errors());
    EXPECT_EQ(collector.error_count(), 0u);
    EXPECT_EQ(collector.summary(), "No errors");
}

TEST(ErrorCollectorTest, TracksFatalErrors) {
    ErrorCollector collector;
    collector.add_error(ParseError(ErrorCode::ROW_TOO_LARGE, ErrorSeverity::ERROR, 1, 0,
                                   MSG_ROW_TOO_LARGE));
    EXPECT_TRUE(collector.has_errors());
    EXPECT_FALSE(collector.has_fatal_errors());

    collector.add_error(ParseError(ErrorCode::INVALID_ENCODING, ErrorSeverity::FATAL, 0, 8,
                                   MSG_INVALID_ENCODING));
    EXPECT_TRUE(collector.has_fatal_errors());
    EXPECT_EQ(collector.error_count(), 2u);
    EXPECT_EQ(collector.errors()[1].code, ErrorCode::INVALID_ENCODING);
}

TEST(ErrorCollectorTest, Summary) {
    ErrorCollector collector;
    collector.add_error(ParseError(ErrorCode::ROW_TOO_LARGE, ErrorSeverity::ERROR, 2, 4,
                                   MSG_ROW_TOO_LARGE));
    collector.add_error(ParseError(ErrorCode::INVALID_ENCODING, ErrorSeverity::FATAL, 0, 9,
                                   MSG_INVALID_ENCODING));

    std::string summary = collector.summary();
    EXPECT_NE(summary.find("Total errors: 2 (Errors: 1, Fatal: 1)"), std::string::npos);
    EXPECT_NE(summary.find("ROW_TOO_LARGE at row 2"), std::string::npos);
    EXPECT_NE(summary.find("INVALID_ENCODING (byte 9)"), std::string::npos);
}

TEST(ErrorCollectorTest, Clear) {
    ErrorCollector collector;
    collector.add_error(ParseError(ErrorCode::INVALID_ENCODING, ErrorSeverity::FATAL, 0, 0,
                                   MSG_INVALID_ENCODING));
    collector.clear();
    EXPECT_FALSE(collector.has_errors());
    EXPECT_FALSE(collector.has_fatal_errors());
}

// ============================================================================
// ParseException
// ============================================================================

TEST(ParseExceptionTest, CarriesError) {
    ParseError err(ErrorCode::INVALID_UTF8, ErrorSeverity::ERROR, 5, 100, MSG_INVALID_UTF8);
    try {
        throw ParseException(err);
    } catch (const ParseException& e) {
        EXPECT_STREQ(e.what(), "Invalid UTF-8 sequence in cell");
        EXPECT_EQ(e.code(), ErrorCode::INVALID_UTF8);
        EXPECT_EQ(e.error().row, 5u);
        EXPECT_EQ(e.error().byte_offset, 100u);
    }
}
