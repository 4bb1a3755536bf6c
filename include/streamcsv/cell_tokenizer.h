#ifndef STREAMCSV_CELL_TOKENIZER_H
#define STREAMCSV_CELL_TOKENIZER_H

#include "streamcsv/dialect.h"
#include "streamcsv/error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace streamcsv {

/**
 * @brief Splits one row into decoded cell values.
 *
 * The row must already have its terminator and a trailing carriage return
 * removed. Separators inside quotes do not split. A cell that starts and ends
 * with the quote byte loses those two quotes, and inside it both the doubled
 * quote and (with a distinct escape byte) escape+quote become one literal
 * quote. Unquoted cells are taken verbatim.
 */
class CellTokenizer {
public:
    CellTokenizer(const Dialect& dialect, bool raw);

    /**
     * @brief Tokenize a row.
     *
     * @param data Row bytes
     * @param len Row length
     * @param[out] cells Cleared, then filled with one value per cell
     * @return ErrorCode::NONE, or ErrorCode::INVALID_UTF8 if a cell is not
     *         valid UTF-8 and raw mode is off
     */
    ErrorCode tokenize(const uint8_t* data, size_t len, std::vector<std::string>& cells) const;

    /// Decode one cell: strip wrapping quotes and collapse escaped quotes
    std::string unescape(const uint8_t* data, size_t len) const;

    const Dialect& dialect() const { return dialect_; }
    bool raw() const { return raw_; }

private:
    ErrorCode decode_cell(const uint8_t* data, size_t len, std::string& out) const;

    Dialect dialect_;
    bool raw_;
};

} // namespace streamcsv

#endif // STREAMCSV_CELL_TOKENIZER_H
