/**
 * @file dialect.h
 * @brief CSV dialect configuration.
 *
 * A dialect names the four bytes the tokenizer treats specially: the cell
 * separator, the quote byte, the escape byte used inside quoted cells, and
 * the row terminator. All four are single bytes; multi-byte separators are
 * not supported.
 */

#ifndef STREAMCSV_DIALECT_H
#define STREAMCSV_DIALECT_H

#include <optional>
#include <string>

namespace streamcsv {

/**
 * @brief CSV dialect configuration.
 *
 * - separator: cell delimiter (default: comma)
 * - quote_char: byte that toggles quoted-cell state (default: double-quote)
 * - escape_char: byte that, placed before a quote inside a quoted cell,
 *   makes that quote literal. Unset means the quote byte itself, which gives
 *   the RFC 4180 doubled-quote convention whatever the quote byte is.
 * - newline: row terminator. A carriage return right before it is trimmed.
 */
struct Dialect {
    char separator = ',';
    char quote_char = '"';
    std::optional<char> escape_char;
    char newline = '\n';

    /// Factory for standard CSV (comma-separated, double-quoted)
    static Dialect csv() {
        return Dialect{',', '"', std::nullopt, '\n'};
    }

    /// Factory for TSV (tab-separated)
    static Dialect tsv() {
        return Dialect{'\t', '"', std::nullopt, '\n'};
    }

    /// Factory for semicolon-separated (European style)
    static Dialect semicolon() {
        return Dialect{';', '"', std::nullopt, '\n'};
    }

    /// Factory for pipe-separated
    static Dialect pipe() {
        return Dialect{'|', '"', std::nullopt, '\n'};
    }

    /// Effective escape byte
    char escape() const { return escape_char.value_or(quote_char); }

    /// True when the escape byte is distinct from the quote byte
    bool has_distinct_escape() const { return escape() != quote_char; }

    bool operator==(const Dialect& other) const {
        return separator == other.separator &&
               quote_char == other.quote_char &&
               escape() == other.escape() &&
               newline == other.newline;
    }

    bool operator!=(const Dialect& other) const {
        return !(*this == other);
    }

    /// Returns a human-readable description of the dialect
    std::string to_string() const;
};

} // namespace streamcsv

#endif // STREAMCSV_DIALECT_H
