#include "streamcsv/dialect.h"

#include <cstdio>

namespace streamcsv {

namespace {

std::string describe_byte(char c) {
    switch (c) {
        case ',':  return "','";
        case '\t': return "'\\t'";
        case '\n': return "'\\n'";
        case '\r': return "'\\r'";
        case '"':  return "'\"'";
        case '\'': return "'\\''";
        case '\\': return "'\\\\'";
        default:
            break;
    }
    unsigned char b = static_cast<unsigned char>(c);
    if (b < 0x20 || b >= 0x7F) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%02X", b);
        return buf;
    }
    return std::string("'") + c + "'";
}

} // namespace

std::string Dialect::to_string() const {
    std::string result = "Dialect{separator=" + describe_byte(separator) +
                         ", quote=" + describe_byte(quote_char);
    if (has_distinct_escape()) {
        result += ", escape=" + describe_byte(escape());
    } else {
        result += ", escape=doubled";
    }
    result += ", newline=" + describe_byte(newline) + "}";
    return result;
}

} // namespace streamcsv
