#ifndef STREAMCSV_ROW_SEGMENTER_H
#define STREAMCSV_ROW_SEGMENTER_H

#include "streamcsv/dialect.h"
#include "streamcsv/quote_scanner.h"

#include <cstddef>
#include <cstdint>

namespace streamcsv {

/**
 * @brief Byte range of one complete row in the canonical buffer.
 *
 * [begin, end) includes the terminator byte.
 */
struct RowSpan {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }
};

/**
 * @brief Finds unquoted row terminators in the canonical UTF-8 buffer.
 *
 * The segmenter remembers how far it has scanned and the quote state at that
 * point, so bytes are examined once even when a row arrives over many
 * chunks. The caller owns the buffer; after it drops consumed bytes from the
 * front it must call rebase() with the number of bytes dropped.
 */
class RowSegmenter {
public:
    explicit RowSegmenter(const Dialect& dialect);

    /**
     * @brief Find the next complete row starting at @p row_start.
     *
     * @param data Canonical buffer
     * @param len Bytes in the buffer
     * @param row_start Offset where the pending row begins
     * @param[out] span The row, terminator included, when one is found
     * @return false when the buffer ends before an unquoted terminator
     */
    bool next(const uint8_t* data, size_t len, size_t row_start, RowSpan& span);

    /// Shift the resume offset after @p consumed bytes were erased from the buffer front
    void rebase(size_t consumed);

    /// Offset the next scan resumes from
    size_t resume_offset() const { return scan_pos_; }

    /// True if the bytes scanned so far end inside a quoted section
    bool inside_quotes() const { return scanner_.inside_quotes(); }

    void reset();

private:
    QuoteScanner scanner_;
    uint8_t newline_;
    size_t scan_pos_ = 0;
};

} // namespace streamcsv

#endif // STREAMCSV_ROW_SEGMENTER_H
