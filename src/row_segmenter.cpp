#include "streamcsv/row_segmenter.h"

namespace streamcsv {

RowSegmenter::RowSegmenter(const Dialect& dialect)
    : scanner_(dialect.quote_char, dialect.escape()),
      newline_(static_cast<uint8_t>(dialect.newline)) {}

bool RowSegmenter::next(const uint8_t* data, size_t len, size_t row_start, RowSpan& span) {
    if (scan_pos_ < row_start) {
        scan_pos_ = row_start;
    }

    size_t pos = scanner_.find_unquoted(data, scan_pos_, len, newline_);
    if (pos >= len) {
        // Row continues in the next chunk; everything up to len is scanned
        scan_pos_ = len;
        return false;
    }

    span.begin = row_start;
    span.end = pos + 1;
    scan_pos_ = pos + 1;
    return true;
}

void RowSegmenter::rebase(size_t consumed) {
    scan_pos_ = scan_pos_ >= consumed ? scan_pos_ - consumed : 0;
}

void RowSegmenter::reset() {
    scanner_.reset();
    scan_pos_ = 0;
}

} // namespace streamcsv
