/**
 * @file stream_parser.cpp
 * @brief Implementation of the incremental CSV parser.
 */

#include "streamcsv/stream_parser.h"
#include "streamcsv/cell_tokenizer.h"
#include "streamcsv/row_assembler.h"
#include "streamcsv/row_segmenter.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace streamcsv {

namespace {

// Longest row prefix copied into ParseError::context
constexpr size_t CONTEXT_BYTES = 40;

const char* message_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::ROW_TOO_LARGE:            return MSG_ROW_TOO_LARGE;
        case ErrorCode::INCONSISTENT_FIELD_COUNT: return MSG_FIELD_COUNT_MISMATCH;
        case ErrorCode::INVALID_ENCODING:         return MSG_INVALID_ENCODING;
        case ErrorCode::TRUNCATED_INPUT:          return MSG_TRUNCATED_INPUT;
        case ErrorCode::INVALID_UTF8:             return MSG_INVALID_UTF8;
        case ErrorCode::NO_HEADERS_DEFINED:       return MSG_NO_HEADERS;
        default:                                  return "Internal parser error";
    }
}

bool is_blank(uint8_t c) {
    return c == ' ' || c == '\t';
}

} // namespace

struct StreamParser::Impl {
    ParserOptions options;
    EncodingNormalizer normalizer;
    RowSegmenter segmenter;
    CellTokenizer tokenizer;
    RowAssembler assembler;
    ErrorCollector errors;

    // Canonical UTF-8 bytes not yet consumed; the pending row starts at row_start
    std::vector<uint8_t> buffer;
    size_t row_start = 0;

    // Set after an oversized partial row was reported; bytes are dropped
    // until that row's terminator
    bool discarding = false;

    size_t logical_rows = 0;
    size_t skipped_lines = 0;
    size_t emitted = 0;
    size_t consumed_bytes = 0;

    std::optional<ParseError> pending_error;
    // Truncated UTF-16 tail, reported once the final row has been handled
    std::optional<ParseError> truncation;

    std::vector<std::string> cells;

    explicit Impl(const ParserOptions& opts)
        : options(opts),
          segmenter(opts.dialect),
          tokenizer(opts.dialect, opts.raw),
          assembler(opts) {}

    void reset() {
        normalizer.reset();
        segmenter.reset();
        assembler.reset();
        errors.clear();
        buffer.clear();
        row_start = 0;
        discarding = false;
        logical_rows = 0;
        skipped_lines = 0;
        emitted = 0;
        consumed_bytes = 0;
        pending_error.reset();
        truncation.reset();
        cells.clear();
    }

    std::string context_of(size_t begin, size_t end) const {
        size_t n = std::min(end - begin, CONTEXT_BYTES);
        return std::string(reinterpret_cast<const char*>(buffer.data() + begin), n);
    }

    // Report an error under the deferral rule. Always stops the current scan.
    void raise(ParseError error, ParseResult& result) {
        errors.add_error(error);
        if (result.rows.empty() && !result.error) {
            SPDLOG_DEBUG("{}", error.to_string());
            result.error = std::move(error);
        } else {
            SPDLOG_DEBUG("deferring error after {} row(s): {}", result.rows.size(),
                         error.to_string());
            pending_error = std::move(error);
        }
    }

    ParseError row_error(ErrorCode code, size_t row, size_t begin, size_t end) const {
        return ParseError(code, ErrorSeverity::ERROR, row, consumed_bytes + begin,
                          message_for(code), context_of(begin, end));
    }

    /**
     * Handle one row, terminator included when present.
     * Returns false if an error was raised.
     */
    bool process_row(size_t begin, size_t end, ParseResult& result) {
        const size_t row_number = ++logical_rows;
        const Dialect& dialect = options.dialect;

        if (end - begin > options.max_row_bytes) {
            raise(row_error(ErrorCode::ROW_TOO_LARGE, row_number, begin, end), result);
            return false;
        }

        if (end > begin && buffer[end - 1] == static_cast<uint8_t>(dialect.newline)) {
            --end;
        }
        if (end > begin && buffer[end - 1] == '\r') {
            --end;
        }
        if (end == begin) {
            return true;
        }

        if (options.skip_comments) {
            size_t first = begin;
            while (first < end && is_blank(buffer[first])) {
                ++first;
            }
            if (first < end && buffer[first] == static_cast<uint8_t>(*options.skip_comments)) {
                SPDLOG_TRACE("row {}: comment skipped", row_number);
                return true;
            }
        }

        if (skipped_lines < options.skip_lines) {
            ++skipped_lines;
            SPDLOG_TRACE("row {}: skipped ({} of {})", row_number, skipped_lines,
                         options.skip_lines);
            return true;
        }

        ErrorCode code = tokenizer.tokenize(buffer.data() + begin, end - begin, cells);
        if (code != ErrorCode::NONE) {
            raise(row_error(code, row_number, begin, end), result);
            return false;
        }

        Row row;
        switch (assembler.consume(std::move(cells), row_number, consumed_bytes + begin, row, code)) {
            case AssembleStatus::ROW:
                result.rows.push_back(std::move(row));
                ++emitted;
                break;
            case AssembleStatus::HEADER:
                break;
            case AssembleStatus::ERROR:
                raise(row_error(code, row_number, begin, end), result);
                return false;
        }
        cells.clear();
        return true;
    }

    // Consume every complete row in the buffer. Returns false if an error was raised.
    bool drain(ParseResult& result) {
        RowSpan span;
        while (segmenter.next(buffer.data(), buffer.size(), row_start, span)) {
            row_start = span.end;

            if (discarding) {
                // Tail of a row already reported as too large
                discarding = false;
                continue;
            }
            if (!process_row(span.begin, span.end, result)) {
                return false;
            }
        }

        if (!discarding && buffer.size() - row_start > options.max_row_bytes) {
            // The row is already too large before its terminator arrived
            const size_t row_number = ++logical_rows;
            SPDLOG_DEBUG("row {}: {} byte(s) carried over, limit {}", row_number,
                         buffer.size() - row_start, options.max_row_bytes);
            discarding = true;
            raise(row_error(ErrorCode::ROW_TOO_LARGE, row_number, row_start, buffer.size()),
                  result);
            return false;
        }
        return true;
    }

    // Drop consumed bytes from the front of the buffer
    void compact() {
        size_t consumed = discarding ? segmenter.resume_offset() : row_start;
        if (consumed == 0) {
            return;
        }
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<long>(consumed));
        segmenter.rebase(consumed);
        row_start = row_start > consumed ? row_start - consumed : 0;
        consumed_bytes += consumed;
    }

    ParseResult ingest(const uint8_t* data, size_t size) {
        ParseResult result;

        if (pending_error) {
            normalizer.hold(data, size);
            result.error = std::move(*pending_error);
            pending_error.reset();
            return result;
        }

        ErrorCode code = normalizer.feed(data, size, buffer);
        if (code != ErrorCode::NONE) {
            ParseError error(code, ErrorSeverity::FATAL, 0, consumed_bytes + buffer.size(),
                             message_for(code));
            errors.add_error(error);
            SPDLOG_DEBUG("{}", error.to_string());
            result.error = std::move(error);
            return result;
        }

        drain(result);
        compact();
        return result;
    }

    ParseResult finish() {
        ParseResult result;

        if (pending_error) {
            result.error = std::move(*pending_error);
            pending_error.reset();
            return result;
        }

        ErrorCode flushed = normalizer.flush(buffer);
        if (flushed != ErrorCode::NONE) {
            truncation = ParseError(flushed, ErrorSeverity::FATAL, 0,
                                    consumed_bytes + buffer.size(), message_for(flushed));
        }

        if (!drain(result)) {
            compact();
            return result;
        }

        if (discarding) {
            discarding = false;
        } else if (row_start < buffer.size()) {
            if (segmenter.inside_quotes()) {
                SPDLOG_DEBUG("input ends inside a quoted field");
            }
            process_row(row_start, buffer.size(), result);
        }

        if (truncation) {
            raise(std::move(*truncation), result);
            truncation.reset();
        }

        consumed_bytes += buffer.size();
        buffer.clear();
        row_start = 0;
        segmenter.reset();
        return result;
    }
};

StreamParser::StreamParser(const ParserOptions& options) {
    options.validate();
    impl_ = std::make_unique<Impl>(options);
}

StreamParser::~StreamParser() = default;

StreamParser::StreamParser(StreamParser&&) noexcept = default;
StreamParser& StreamParser::operator=(StreamParser&&) noexcept = default;

ParseResult StreamParser::ingest(const uint8_t* data, size_t size) {
    return impl_->ingest(data, size);
}

ParseResult StreamParser::ingest(std::string_view chunk) {
    return impl_->ingest(reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size());
}

ParseResult StreamParser::finish() {
    return impl_->finish();
}

std::optional<std::vector<std::string>> StreamParser::current_headers() const {
    return impl_->assembler.headers();
}

const ParserOptions& StreamParser::options() const {
    return impl_->options;
}

size_t StreamParser::rows_emitted() const {
    return impl_->emitted;
}

size_t StreamParser::rows_seen() const {
    return impl_->logical_rows;
}

size_t StreamParser::bytes_processed() const {
    return impl_->consumed_bytes;
}

Encoding StreamParser::detected_encoding() const {
    return impl_->normalizer.encoding();
}

const ErrorCollector& StreamParser::errors() const {
    return impl_->errors;
}

void StreamParser::reset() {
    impl_->reset();
}

} // namespace streamcsv
