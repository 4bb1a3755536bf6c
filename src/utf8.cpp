/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 helpers.
 */

#include "streamcsv/utf8.h"

namespace streamcsv {

size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint) {
    if (pos >= str.size()) {
        codepoint = UTF8_INVALID;
        return 0;
    }

    uint8_t byte = static_cast<uint8_t>(str[pos]);

    // ASCII (0xxxxxxx)
    if ((byte & 0x80) == 0) {
        codepoint = byte;
        return 1;
    }

    // Determine sequence length, initial bits and the range allowed for the
    // first continuation byte (this is what rules out overlong forms,
    // surrogates and values above U+10FFFF)
    size_t len;
    uint32_t cp;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;

    if (byte >= 0xC2 && byte <= 0xDF) {
        len = 2;
        cp = byte & 0x1F;
    } else if (byte >= 0xE0 && byte <= 0xEF) {
        len = 3;
        cp = byte & 0x0F;
        if (byte == 0xE0) lo = 0xA0;
        if (byte == 0xED) hi = 0x9F;
    } else if (byte >= 0xF0 && byte <= 0xF4) {
        len = 4;
        cp = byte & 0x07;
        if (byte == 0xF0) lo = 0x90;
        if (byte == 0xF4) hi = 0x8F;
    } else {
        // Continuation byte, C0/C1 or F5..FF: never valid as a lead
        codepoint = UTF8_INVALID;
        return 1;
    }

    for (size_t i = 1; i < len; ++i) {
        if (pos + i >= str.size()) {
            // Truncated sequence: the bytes seen so far form one subpart
            codepoint = UTF8_INVALID;
            return i;
        }
        uint8_t cont = static_cast<uint8_t>(str[pos + i]);
        if (cont < lo || cont > hi) {
            codepoint = UTF8_INVALID;
            return i;
        }
        lo = 0x80;
        hi = 0xBF;
        cp = (cp << 6) | (cont & 0x3F);
    }

    codepoint = cp;
    return len;
}

size_t utf8_encode(uint32_t cp, uint8_t* out) {
    if (cp < 0x80) {
        out[0] = static_cast<uint8_t>(cp);
        return 1;
    } else if (cp < 0x800) {
        out[0] = static_cast<uint8_t>(0xC0 | (cp >> 6));
        out[1] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        return 2;
    } else if (cp < 0x10000) {
        out[0] = static_cast<uint8_t>(0xE0 | (cp >> 12));
        out[1] = static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F));
        out[2] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        return 3;
    } else if (cp <= 0x10FFFF) {
        out[0] = static_cast<uint8_t>(0xF0 | (cp >> 18));
        out[1] = static_cast<uint8_t>(0x80 | ((cp >> 12) & 0x3F));
        out[2] = static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F));
        out[3] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        return 4;
    }
    // Invalid code point - use replacement character
    out[0] = 0xEF;
    out[1] = 0xBF;
    out[2] = 0xBD;  // U+FFFD
    return 3;
}

bool is_valid_utf8(std::string_view str) {
    size_t pos = 0;
    while (pos < str.size()) {
        // Fast path over ASCII runs
        if (static_cast<uint8_t>(str[pos]) < 0x80) {
            ++pos;
            continue;
        }
        uint32_t cp;
        size_t len = utf8_decode(str, pos, cp);
        if (cp == UTF8_INVALID) {
            return false;
        }
        pos += len;
    }
    return true;
}

std::string utf8_lossy(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    size_t pos = 0;
    while (pos < str.size()) {
        uint32_t cp;
        size_t len = utf8_decode(str, pos, cp);
        if (cp == UTF8_INVALID) {
            uint8_t buf[4];
            size_t n = utf8_encode(UTF8_REPLACEMENT, buf);
            result.append(reinterpret_cast<const char*>(buf), n);
        } else {
            result.append(str.data() + pos, len);
        }
        pos += len;
    }

    return result;
}

} // namespace streamcsv
