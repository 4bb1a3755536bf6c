/**
 * @file options.h
 * @brief Parser configuration.
 */

#ifndef STREAMCSV_OPTIONS_H
#define STREAMCSV_OPTIONS_H

#include "streamcsv/dialect.h"

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace streamcsv {

/// Comment byte used when comment skipping is turned on without a custom byte
constexpr char DEFAULT_COMMENT_CHAR = '#';

/**
 * @brief Rename or drop a column label.
 *
 * Called once per label when the header is resolved, with the label and its
 * zero-based column index. Returning std::nullopt drops the column.
 */
using HeaderMapper =
    std::function<std::optional<std::string>(const std::string& label, size_t index)>;

/**
 * @brief Transform a cell value before it is stored in a labeled row.
 *
 * Called with the column label, the zero-based column index and the decoded
 * value.
 */
using ValueMapper =
    std::function<std::string(const std::string& label, size_t index, std::string value)>;

/**
 * @brief Configuration for StreamParser.
 *
 * Options are fixed once the parser is constructed.
 *
 * Header policy:
 * - headers unset: the first row that is not skipped becomes the header.
 * - headers set to an empty list: labels are "0", "1", ... sized to the
 *   first data row, and that row is emitted.
 * - headers set to a non-empty list: those labels are used from the start
 *   and every row is data.
 */
struct ParserOptions {
    Dialect dialect;

    /// Replace invalid UTF-8 in cells with U+FFFD instead of failing the row
    bool raw = false;

    /// Fail rows whose cell count differs from the header count
    bool strict = false;

    /// Largest row, terminator included, in canonical UTF-8 bytes
    size_t max_row_bytes = std::numeric_limits<size_t>::max();

    std::optional<std::vector<std::string>> headers;

    /// Rows whose first non-blank byte equals this are dropped
    std::optional<char> skip_comments;

    /// Leading rows dropped before header resolution (comments not counted)
    size_t skip_lines = 0;

    HeaderMapper map_headers;
    ValueMapper map_values;

    /// Turn comment skipping on with the default '#' byte
    ParserOptions& with_comments(char comment = DEFAULT_COMMENT_CHAR) {
        skip_comments = comment;
        return *this;
    }

    /// Throws std::invalid_argument if the dialect bytes are ambiguous
    void validate() const;
};

} // namespace streamcsv

#endif // STREAMCSV_OPTIONS_H
