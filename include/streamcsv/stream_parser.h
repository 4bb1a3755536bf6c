/**
 * @file stream_parser.h
 * @brief Incremental push parser for CSV byte streams.
 *
 * StreamParser accepts raw bytes in chunks of any size and returns every row
 * that became complete. Rows may span any number of chunks; the partial row
 * is carried over between calls.
 *
 * Example:
 * @code
 * streamcsv::StreamParser parser;
 * char buf[65536];
 * while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
 *     auto result = parser.ingest(std::string_view(buf, in.gcount()));
 *     if (!result.ok()) {
 *         std::cerr << result.error->to_string();
 *         break;
 *     }
 *     for (const auto& row : result.rows) {
 *         std::cout << row["name"] << '\n';
 *     }
 * }
 * auto last = parser.finish();
 * @endcode
 *
 * Error reporting: a row-level error found after other rows were already
 * produced by the same call is held back, and the call returns only those
 * rows. The next call returns the held error and parses nothing; any bytes
 * passed to it are kept for the call after. Encoding errors are returned
 * immediately and discard the chunk that caused them.
 */

#ifndef STREAMCSV_STREAM_PARSER_H
#define STREAMCSV_STREAM_PARSER_H

#include "streamcsv/encoding.h"
#include "streamcsv/error.h"
#include "streamcsv/options.h"
#include "streamcsv/row.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace streamcsv {

/**
 * @brief Outcome of one ingest() or finish() call.
 *
 * At most one of the two is non-empty: either rows were produced, or an
 * error is reported.
 */
struct ParseResult {
    std::vector<Row> rows;
    std::optional<ParseError> error;

    bool ok() const { return !error.has_value(); }
};

class StreamParser {
public:
    /// Throws std::invalid_argument if the options are inconsistent
    explicit StreamParser(const ParserOptions& options = ParserOptions());
    ~StreamParser();

    // Non-copyable, movable
    StreamParser(const StreamParser&) = delete;
    StreamParser& operator=(const StreamParser&) = delete;
    StreamParser(StreamParser&&) noexcept;
    StreamParser& operator=(StreamParser&&) noexcept;

    /// Feed the next chunk of raw input
    ParseResult ingest(const uint8_t* data, size_t size);
    ParseResult ingest(std::string_view chunk);

    /**
     * @brief Signal end of input.
     *
     * Parses whatever is still buffered as a final row, which needs no
     * terminator, and clears the buffers. Calling it again returns nothing.
     * The parser can be fed again afterwards; headers stay resolved.
     */
    ParseResult finish();

    /// Resolved column labels, or nullopt while still waiting for the header row
    std::optional<std::vector<std::string>> current_headers() const;

    const ParserOptions& options() const;

    /// Rows returned to the caller so far
    size_t rows_emitted() const;

    /// Logical rows seen, including header, comment, skipped and failed rows
    size_t rows_seen() const;

    /// Canonical UTF-8 bytes consumed (excludes bytes still carried over)
    size_t bytes_processed() const;

    /// Encoding detected from the byte-order mark, UNKNOWN until decided
    Encoding detected_encoding() const;

    /// Every error reported by this parser
    const ErrorCollector& errors() const;

    /// Return to the freshly constructed state
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace streamcsv

#endif // STREAMCSV_STREAM_PARSER_H
