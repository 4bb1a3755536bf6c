/**
 * @file utf8.h
 * @brief UTF-8 decoding, validation and encoding helpers.
 *
 * Cell values handed to callers are always UTF-8. In strict decoding mode a
 * cell containing an invalid sequence is rejected; in raw mode each maximal
 * invalid subpart is replaced by U+FFFD, the same substitution the Unicode
 * standard recommends for lossy conversion.
 *
 * @see utf8_decode() for decoding a single code point
 * @see utf8_lossy() for replacement-character conversion
 */

#ifndef STREAMCSV_UTF8_H
#define STREAMCSV_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace streamcsv {

/// Code point reported by utf8_decode() for an invalid sequence
constexpr uint32_t UTF8_INVALID = 0xFFFFFFFFu;

/// U+FFFD REPLACEMENT CHARACTER
constexpr uint32_t UTF8_REPLACEMENT = 0xFFFDu;

/**
 * @brief Decode a UTF-8 sequence starting at the given position.
 *
 * Overlong forms, surrogate code points and values above U+10FFFF are
 * invalid. For an invalid sequence the returned length covers the maximal
 * subpart (the lead byte plus any continuation bytes that were still
 * acceptable), so a lossy decoder emits one replacement per subpart.
 *
 * @param str The UTF-8 string
 * @param pos Starting byte position
 * @param[out] codepoint The decoded code point, or UTF8_INVALID
 * @return The number of bytes consumed (0 only when pos is past the end)
 */
size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint);

/**
 * @brief Encode a code point as UTF-8.
 *
 * Code points above U+10FFFF are written as U+FFFD.
 *
 * @param out Destination, at least 4 bytes
 * @return Number of bytes written (1-4)
 */
size_t utf8_encode(uint32_t codepoint, uint8_t* out);

/// Returns true when the whole string is well-formed UTF-8
bool is_valid_utf8(std::string_view str);

/// Copies the string, replacing each invalid subpart with U+FFFD
std::string utf8_lossy(std::string_view str);

} // namespace streamcsv

#endif // STREAMCSV_UTF8_H
