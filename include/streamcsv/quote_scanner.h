/**
 * @file quote_scanner.h
 * @brief Quote-state machine shared by the row segmenter and cell tokenizer.
 *
 * Both the search for row terminators and the split into cells must agree on
 * which bytes are inside quotes, so both drive the same machine:
 *
 *   UNQUOTED --quote--> QUOTED
 *   QUOTED --quote--> QUOTE_IN_QUOTED       (closing quote, or first half of "")
 *   QUOTED --escape--> ESCAPE_IN_QUOTED     (only when escape != quote)
 *   QUOTE_IN_QUOTED --quote--> QUOTED       ("" is a literal quote)
 *   QUOTE_IN_QUOTED --other--> UNQUOTED     (the byte is then read unquoted)
 *   ESCAPE_IN_QUOTED --escape--> ESCAPE_IN_QUOTED
 *   ESCAPE_IN_QUOTED --other--> QUOTED      (\" is a literal quote)
 *
 * A separator or terminator only counts when it is read in the UNQUOTED
 * state. The state survives across calls, so a row may span any number of
 * chunks.
 */

#ifndef STREAMCSV_QUOTE_SCANNER_H
#define STREAMCSV_QUOTE_SCANNER_H

#include "streamcsv/simd_scan.h"

#include <cstddef>
#include <cstdint>

namespace streamcsv {

enum class QuoteState : uint8_t {
    UNQUOTED,          ///< Outside quotes; separators and terminators are live
    QUOTED,            ///< Inside a quoted section
    QUOTE_IN_QUOTED,   ///< Just read a quote inside a quoted section
    ESCAPE_IN_QUOTED   ///< Just read a distinct escape byte inside quotes
};

class QuoteScanner {
public:
    QuoteScanner(char quote, char escape)
        : quote_(static_cast<uint8_t>(quote)),
          escape_(static_cast<uint8_t>(escape)),
          distinct_escape_(quote != escape) {}

    /**
     * @brief Advance the machine by one byte.
     * @return true if the byte was read outside quotes.
     */
    bool step(uint8_t c) {
        switch (state_) {
            case QuoteState::UNQUOTED:
                if (c == quote_) {
                    state_ = QuoteState::QUOTED;
                    return false;
                }
                return true;

            case QuoteState::QUOTED:
                if (c == quote_) {
                    state_ = QuoteState::QUOTE_IN_QUOTED;
                } else if (distinct_escape_ && c == escape_) {
                    state_ = QuoteState::ESCAPE_IN_QUOTED;
                }
                return false;

            case QuoteState::QUOTE_IN_QUOTED:
                if (c == quote_) {
                    state_ = QuoteState::QUOTED;
                    return false;
                }
                state_ = QuoteState::UNQUOTED;
                return true;

            case QuoteState::ESCAPE_IN_QUOTED:
                // A repeated escape starts a new escape; anything else is content
                state_ = (c == escape_) ? QuoteState::ESCAPE_IN_QUOTED : QuoteState::QUOTED;
                return false;
        }
        return false;
    }

    /**
     * @brief Find the next occurrence of @p target read outside quotes.
     *
     * Scans data[pos, len), updating the quote state for every byte consumed.
     * Runs of ordinary bytes are skipped with a SIMD search.
     *
     * @return Offset of the unquoted @p target, or @p len if there is none
     *         (the state then reflects the whole range).
     */
    size_t find_unquoted(const uint8_t* data, size_t pos, size_t len, uint8_t target) {
        while (pos < len) {
            if (state_ == QuoteState::UNQUOTED) {
                size_t next = pos + find_first_of(data + pos, len - pos, quote_, target);
                if (next >= len) {
                    return len;
                }
                if (data[next] == target) {
                    return next;
                }
                state_ = QuoteState::QUOTED;
                pos = next + 1;
            } else if (state_ == QuoteState::QUOTED) {
                size_t next = pos + find_first_of(data + pos, len - pos, quote_, escape_);
                if (next >= len) {
                    return len;
                }
                step(data[next]);
                pos = next + 1;
            } else {
                if (step(data[pos]) && data[pos] == target) {
                    return pos;
                }
                ++pos;
            }
        }
        return len;
    }

    QuoteState state() const { return state_; }

    bool inside_quotes() const {
        return state_ == QuoteState::QUOTED || state_ == QuoteState::ESCAPE_IN_QUOTED;
    }

    void reset() { state_ = QuoteState::UNQUOTED; }

private:
    uint8_t quote_;
    uint8_t escape_;
    bool distinct_escape_;
    QuoteState state_ = QuoteState::UNQUOTED;
};

} // namespace streamcsv

#endif // STREAMCSV_QUOTE_SCANNER_H
