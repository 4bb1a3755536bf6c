/**
 * @file quote_scanner_test.cpp
 * @brief Tests for the shared quote-state machine.
 */

#include <gtest/gtest.h>
#include "streamcsv/quote_scanner.h"

#include <string>

using namespace streamcsv;

static size_t find(QuoteScanner& scanner, const std::string& s, size_t pos, char target) {
    return scanner.find_unquoted(reinterpret_cast<const uint8_t*>(s.data()), pos, s.size(),
                                 static_cast<uint8_t>(target));
}

// ============================================================================
// State transitions
// ============================================================================

TEST(QuoteScannerTest, StartsUnquoted) {
    QuoteScanner scanner('"', '"');
    EXPECT_EQ(scanner.state(), QuoteState::UNQUOTED);
    EXPECT_FALSE(scanner.inside_quotes());
}

TEST(QuoteScannerTest, OpenAndClose) {
    QuoteScanner scanner('"', '"');
    EXPECT_FALSE(scanner.step('"'));
    EXPECT_EQ(scanner.state(), QuoteState::QUOTED);
    EXPECT_FALSE(scanner.step('a'));
    EXPECT_FALSE(scanner.step('"'));
    EXPECT_EQ(scanner.state(), QuoteState::QUOTE_IN_QUOTED);
    EXPECT_TRUE(scanner.step(','));
    EXPECT_EQ(scanner.state(), QuoteState::UNQUOTED);
}

TEST(QuoteScannerTest, DoubledQuoteStaysQuoted) {
    QuoteScanner scanner('"', '"');
    scanner.step('"');
    scanner.step('"');
    EXPECT_FALSE(scanner.step('"'));
    EXPECT_EQ(scanner.state(), QuoteState::QUOTED);
    EXPECT_TRUE(scanner.inside_quotes());
}

TEST(QuoteScannerTest, DistinctEscape) {
    QuoteScanner scanner('"', '\\');
    scanner.step('"');
    EXPECT_FALSE(scanner.step('\\'));
    EXPECT_EQ(scanner.state(), QuoteState::ESCAPE_IN_QUOTED);
    EXPECT_FALSE(scanner.step('"'));
    EXPECT_EQ(scanner.state(), QuoteState::QUOTED);
}

TEST(QuoteScannerTest, EscapeOutsideQuotesIsOrdinary) {
    QuoteScanner scanner('"', '\\');
    EXPECT_TRUE(scanner.step('\\'));
    EXPECT_EQ(scanner.state(), QuoteState::UNQUOTED);
}

// ============================================================================
// find_unquoted
// ============================================================================

TEST(QuoteScannerTest, FindsUnquotedTarget) {
    QuoteScanner scanner('"', '"');
    std::string s = "abc,def";
    EXPECT_EQ(find(scanner, s, 0, ','), 3u);
}

TEST(QuoteScannerTest, SkipsQuotedTarget) {
    QuoteScanner scanner('"', '"');
    std::string s = "\"a,b\",c";
    EXPECT_EQ(find(scanner, s, 0, ','), 5u);
}

TEST(QuoteScannerTest, DoubledQuotesDoNotClose) {
    QuoteScanner scanner('"', '"');
    std::string s = "\"x\"\",y\",z";
    EXPECT_EQ(find(scanner, s, 0, ','), 7u);
}

TEST(QuoteScannerTest, TargetRightAfterClosingQuote) {
    QuoteScanner scanner('"', '"');
    std::string s = "\"a\"\n";
    EXPECT_EQ(find(scanner, s, 0, '\n'), 3u);
}

TEST(QuoteScannerTest, EscapedQuoteDoesNotClose) {
    QuoteScanner scanner('"', '\\');
    std::string s = "\"a\\\",b\",c";
    EXPECT_EQ(find(scanner, s, 0, ','), 7u);
}

TEST(QuoteScannerTest, StateSurvivesAcrossCalls) {
    QuoteScanner scanner('"', '"');
    std::string first = "\"a,b";
    EXPECT_EQ(find(scanner, first, 0, ','), first.size());
    EXPECT_TRUE(scanner.inside_quotes());

    std::string second = "c\",d";
    EXPECT_EQ(find(scanner, second, 0, ','), 2u);
}

TEST(QuoteScannerTest, SplitInsideDoubledQuote) {
    QuoteScanner scanner('"', '"');
    std::string first = "\"a\"";
    EXPECT_EQ(find(scanner, first, 0, ','), first.size());
    EXPECT_EQ(scanner.state(), QuoteState::QUOTE_IN_QUOTED);

    std::string second = "\",b\",c";
    EXPECT_EQ(find(scanner, second, 0, ','), 4u);
}

TEST(QuoteScannerTest, Reset) {
    QuoteScanner scanner('"', '"');
    scanner.step('"');
    scanner.reset();
    EXPECT_EQ(scanner.state(), QuoteState::UNQUOTED);
}
