/**
 * @file encoding.h
 * @brief Byte-order-mark detection and incremental transcoding to UTF-8.
 *
 * The stream parser works on a canonical UTF-8 buffer. The normalizer sits in
 * front of it: it sniffs the byte-order mark once per stream, strips it, and
 * converts UTF-16 input to UTF-8 a whole code unit at a time, holding back a
 * trailing odd byte (or a high surrogate waiting for its pair) until the next
 * chunk arrives.
 */

#ifndef STREAMCSV_ENCODING_H
#define STREAMCSV_ENCODING_H

#include "streamcsv/error.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace streamcsv {

/**
 * @brief Input encodings recognized by BOM detection.
 */
enum class Encoding {
    UTF8,      ///< No BOM, bytes passed through
    UTF8_BOM,  ///< EF BB BF, stripped, bytes passed through
    UTF16_LE,  ///< FF FE
    UTF16_BE,  ///< FE FF
    UNKNOWN    ///< Not enough bytes seen yet to decide
};

/**
 * @brief Result of BOM detection.
 */
struct BomResult {
    Encoding encoding = Encoding::UNKNOWN;
    size_t bom_length = 0;   ///< Bytes to strip from the front of the stream
};

/// Human-readable encoding name ("UTF-8", "UTF-16LE", ...)
const char* encoding_to_string(Encoding enc);

/**
 * @brief Detect the encoding of a stream from its first bytes.
 *
 * Needs at least two bytes. With fewer, or with a prefix that could still
 * grow into the UTF-8 BOM (EF BB), the result is Encoding::UNKNOWN unless
 * @p final is set, in which case whatever is there is treated as UTF-8.
 *
 * @param buf First bytes of the stream
 * @param len Number of bytes available
 * @param final True when no more bytes will follow
 */
BomResult detect_bom(const uint8_t* buf, size_t len, bool final = false);

/**
 * @brief Incremental converter from the detected input encoding to UTF-8.
 *
 * Owns the not-yet-decoded input bytes. Detection happens once, on the first
 * call that supplies enough bytes, and never again for the instance's
 * lifetime (until reset()).
 */
class EncodingNormalizer {
public:
    EncodingNormalizer() = default;

    /**
     * @brief Append a chunk and decode every complete character.
     *
     * Decoded UTF-8 is appended to @p out. On an invalid sequence nothing from
     * this call is appended, the buffered input is discarded, and
     * ErrorCode::INVALID_ENCODING is returned.
     */
    ErrorCode feed(const uint8_t* data, size_t len, std::vector<uint8_t>& out);

    /// Buffer a chunk without decoding it; the next feed() or flush() picks it up.
    void hold(const uint8_t* data, size_t len);

    /**
     * @brief Decode everything that is left at end of input.
     *
     * Returns ErrorCode::TRUNCATED_INPUT if the input stops inside a UTF-16
     * code unit or surrogate pair. Leaves the normalizer empty either way.
     */
    ErrorCode flush(std::vector<uint8_t>& out);

    Encoding encoding() const { return encoding_; }
    bool detected() const { return detected_; }
    size_t pending_bytes() const { return raw_.size(); }

    void reset();

private:
    bool detect(bool final);
    ErrorCode decode_available(std::vector<uint8_t>& out, bool final);
    ErrorCode decode_utf16(std::vector<uint8_t>& out, bool big_endian, bool final);

    std::vector<uint8_t> raw_;
    Encoding encoding_ = Encoding::UNKNOWN;
    bool detected_ = false;
};

} // namespace streamcsv

#endif // STREAMCSV_ENCODING_H
