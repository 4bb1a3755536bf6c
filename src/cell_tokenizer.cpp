#include "streamcsv/cell_tokenizer.h"
#include "streamcsv/quote_scanner.h"
#include "streamcsv/utf8.h"

namespace streamcsv {

CellTokenizer::CellTokenizer(const Dialect& dialect, bool raw)
    : dialect_(dialect), raw_(raw) {}

ErrorCode CellTokenizer::tokenize(const uint8_t* data, size_t len,
                                  std::vector<std::string>& cells) const {
    cells.clear();

    QuoteScanner scanner(dialect_.quote_char, dialect_.escape());
    const uint8_t separator = static_cast<uint8_t>(dialect_.separator);

    size_t cell_start = 0;
    while (true) {
        size_t sep = scanner.find_unquoted(data, cell_start, len, separator);

        std::string value;
        ErrorCode code = decode_cell(data + cell_start, sep - cell_start, value);
        if (code != ErrorCode::NONE) {
            return code;
        }
        cells.push_back(std::move(value));

        if (sep >= len) {
            break;
        }
        // A separator as the last byte still yields a trailing empty cell
        cell_start = sep + 1;
    }

    return ErrorCode::NONE;
}

std::string CellTokenizer::unescape(const uint8_t* data, size_t len) const {
    const uint8_t quote = static_cast<uint8_t>(dialect_.quote_char);
    const uint8_t escape = static_cast<uint8_t>(dialect_.escape());

    if (len < 2 || data[0] != quote || data[len - 1] != quote) {
        return std::string(reinterpret_cast<const char*>(data), len);
    }

    // Drop the wrapping quotes
    size_t i = 1;
    size_t end = len - 1;

    std::string result;
    result.reserve(end - i);

    while (i < end) {
        uint8_t c = data[i];
        if ((c == quote || c == escape) && i + 1 < end && data[i + 1] == quote) {
            // Escaped quote: "" or \" -> "
            result += static_cast<char>(quote);
            i += 2;
        } else {
            result += static_cast<char>(c);
            ++i;
        }
    }

    return result;
}

ErrorCode CellTokenizer::decode_cell(const uint8_t* data, size_t len, std::string& out) const {
    out = unescape(data, len);

    if (is_valid_utf8(out)) {
        return ErrorCode::NONE;
    }
    if (!raw_) {
        return ErrorCode::INVALID_UTF8;
    }
    out = utf8_lossy(out);
    return ErrorCode::NONE;
}

} // namespace streamcsv
