#include "streamcsv/options.h"

#include <stdexcept>

namespace streamcsv {

void ParserOptions::validate() const {
    if (dialect.separator == dialect.quote_char) {
        throw std::invalid_argument("Separator and quote character must differ");
    }
    if (dialect.separator == dialect.newline) {
        throw std::invalid_argument("Separator and newline must differ");
    }
    if (dialect.quote_char == dialect.newline) {
        throw std::invalid_argument("Quote character and newline must differ");
    }
    if (max_row_bytes == 0) {
        throw std::invalid_argument("max_row_bytes must be positive");
    }
}

} // namespace streamcsv
