/**
 * @file stream_reader.h
 * @brief Pull-style reader over an input stream.
 *
 * StreamReader feeds a StreamParser from a std::istream or a file in fixed
 * size chunks and hands out rows one at a time. Parse errors are thrown as
 * ParseException.
 *
 * Example:
 * @code
 * streamcsv::StreamReader reader("data.csv");
 * for (const auto& row : reader) {
 *     std::cout << row["name"] << '\n';
 * }
 * @endcode
 */

#ifndef STREAMCSV_STREAM_READER_H
#define STREAMCSV_STREAM_READER_H

#include "streamcsv/stream_parser.h"

#include <cstddef>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace streamcsv {

/// Default read size for StreamReader
constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

class StreamReader;

/**
 * @brief Input iterator over the rows of a StreamReader.
 */
class RowIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Row;
    using difference_type = std::ptrdiff_t;
    using pointer = const Row*;
    using reference = const Row&;

    /// End iterator
    RowIterator() = default;
    /// Reads the first row; becomes the end iterator if there is none
    explicit RowIterator(StreamReader* reader);

    reference operator*() const;
    pointer operator->() const;
    RowIterator& operator++();

    bool operator==(const RowIterator& other) const { return reader_ == other.reader_; }
    bool operator!=(const RowIterator& other) const { return reader_ != other.reader_; }

private:
    StreamReader* reader_ = nullptr;  ///< nullptr once exhausted
};

class StreamReader {
public:
    /// Throws std::runtime_error if the file cannot be opened
    explicit StreamReader(const std::string& filename,
                          const ParserOptions& options = ParserOptions(),
                          size_t chunk_size = DEFAULT_CHUNK_SIZE);

    /// The stream must outlive the reader
    explicit StreamReader(std::istream& input,
                          const ParserOptions& options = ParserOptions(),
                          size_t chunk_size = DEFAULT_CHUNK_SIZE);

    ~StreamReader();

    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;
    StreamReader(StreamReader&&) noexcept;
    StreamReader& operator=(StreamReader&&) noexcept;

    /**
     * @brief Advance to the next row.
     * @return false at end of input
     * @throws ParseException on a parse error
     */
    bool next_row();

    /// The current row; valid after next_row() returned true
    const Row& row() const;

    /// Resolved column labels (empty until the header row was read)
    std::vector<std::string> header() const;

    const StreamParser& parser() const;

    /// Raw bytes read from the input so far
    size_t bytes_read() const;

    /// True once the input is exhausted and every row was handed out
    bool eof() const;

    RowIterator begin();
    RowIterator end();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace streamcsv

#endif // STREAMCSV_STREAM_READER_H
