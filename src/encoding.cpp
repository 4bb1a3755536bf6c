#include "streamcsv/encoding.h"
#include "streamcsv/utf8.h"

#include <spdlog/spdlog.h>

#include <cstring>

namespace streamcsv {

const char* encoding_to_string(Encoding enc) {
    switch (enc) {
        case Encoding::UTF8:     return "UTF-8";
        case Encoding::UTF8_BOM: return "UTF-8 (BOM)";
        case Encoding::UTF16_LE: return "UTF-16LE";
        case Encoding::UTF16_BE: return "UTF-16BE";
        case Encoding::UNKNOWN:  return "Unknown";
    }
    return "Unknown";
}

// BOM (Byte Order Mark) patterns
static constexpr uint8_t UTF8_BOM[] = {0xEF, 0xBB, 0xBF};
static constexpr uint8_t UTF16_LE_BOM[] = {0xFF, 0xFE};
static constexpr uint8_t UTF16_BE_BOM[] = {0xFE, 0xFF};

// Check if buffer starts with a specific BOM
static bool has_bom(const uint8_t* buf, size_t len,
                    const uint8_t* bom, size_t bom_len) {
    if (len < bom_len) return false;
    return std::memcmp(buf, bom, bom_len) == 0;
}

BomResult detect_bom(const uint8_t* buf, size_t len, bool final) {
    BomResult result;

    if (len < 2) {
        if (final) {
            result.encoding = Encoding::UTF8;
        }
        return result;
    }

    if (has_bom(buf, len, UTF16_LE_BOM, 2)) {
        result.encoding = Encoding::UTF16_LE;
        result.bom_length = 2;
        return result;
    }
    if (has_bom(buf, len, UTF16_BE_BOM, 2)) {
        result.encoding = Encoding::UTF16_BE;
        result.bom_length = 2;
        return result;
    }

    if (has_bom(buf, len, UTF8_BOM, 3)) {
        result.encoding = Encoding::UTF8_BOM;
        result.bom_length = 3;
        return result;
    }

    // EF BB could still become the UTF-8 BOM once the third byte arrives
    if (len == 2 && !final && has_bom(buf, len, UTF8_BOM, 2)) {
        return result;
    }

    result.encoding = Encoding::UTF8;
    return result;
}

// Helper: Read a UTF-16 code unit
static inline uint16_t read_utf16(const uint8_t* p, bool is_big_endian) {
    if (is_big_endian) {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    } else {
        return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
    }
}

ErrorCode EncodingNormalizer::feed(const uint8_t* data, size_t len,
                                   std::vector<uint8_t>& out) {
    hold(data, len);

    if (!detected_ && !detect(false)) {
        // Not enough bytes to sniff the BOM yet; keep them for the next call
        return ErrorCode::NONE;
    }

    return decode_available(out, false);
}

void EncodingNormalizer::hold(const uint8_t* data, size_t len) {
    if (len > 0) {
        raw_.insert(raw_.end(), data, data + len);
    }
}

ErrorCode EncodingNormalizer::flush(std::vector<uint8_t>& out) {
    if (!detected_) {
        if (raw_.empty()) {
            return ErrorCode::NONE;
        }
        detect(true);
    }
    return decode_available(out, true);
}

void EncodingNormalizer::reset() {
    raw_.clear();
    encoding_ = Encoding::UNKNOWN;
    detected_ = false;
}

bool EncodingNormalizer::detect(bool final) {
    BomResult bom = detect_bom(raw_.data(), raw_.size(), final);
    if (bom.encoding == Encoding::UNKNOWN) {
        return false;
    }

    encoding_ = bom.encoding;
    detected_ = true;
    raw_.erase(raw_.begin(), raw_.begin() + static_cast<long>(bom.bom_length));

    SPDLOG_DEBUG("input encoding: {} (BOM {} bytes)", encoding_to_string(encoding_),
                 bom.bom_length);
    return true;
}

ErrorCode EncodingNormalizer::decode_available(std::vector<uint8_t>& out, bool final) {
    switch (encoding_) {
        case Encoding::UTF16_LE:
            return decode_utf16(out, false, final);

        case Encoding::UTF16_BE:
            return decode_utf16(out, true, final);

        case Encoding::UTF8:
        case Encoding::UTF8_BOM:
        default:
            // Already UTF-8; cell decoding validates it later
            out.insert(out.end(), raw_.begin(), raw_.end());
            raw_.clear();
            return ErrorCode::NONE;
    }
}

ErrorCode EncodingNormalizer::decode_utf16(std::vector<uint8_t>& out,
                                           bool big_endian, bool final) {
    const size_t num_units = raw_.size() / 2;

    std::vector<uint8_t> decoded;
    decoded.reserve(num_units * 3);

    uint8_t buf[4];
    size_t i = 0;
    while (i < num_units) {
        uint16_t cu = read_utf16(raw_.data() + i * 2, big_endian);
        uint32_t cp;

        if (cu >= 0xD800 && cu <= 0xDBFF) {
            if (i + 1 >= num_units) {
                // High surrogate at the end of the chunk: wait for its pair
                break;
            }
            uint16_t cu2 = read_utf16(raw_.data() + (i + 1) * 2, big_endian);
            if (cu2 < 0xDC00 || cu2 > 0xDFFF) {
                SPDLOG_DEBUG("unpaired UTF-16 high surrogate 0x{:04X}", cu);
                raw_.clear();
                return ErrorCode::INVALID_ENCODING;
            }
            cp = 0x10000 + ((static_cast<uint32_t>(cu - 0xD800) << 10) |
                            static_cast<uint32_t>(cu2 - 0xDC00));
            i += 2;
        } else if (cu >= 0xDC00 && cu <= 0xDFFF) {
            SPDLOG_DEBUG("unpaired UTF-16 low surrogate 0x{:04X}", cu);
            raw_.clear();
            return ErrorCode::INVALID_ENCODING;
        } else {
            cp = cu;
            ++i;
        }

        size_t n = utf8_encode(cp, buf);
        decoded.insert(decoded.end(), buf, buf + n);
    }

    // Keep the trailing odd byte and any held-back high surrogate
    raw_.erase(raw_.begin(), raw_.begin() + static_cast<long>(i * 2));
    out.insert(out.end(), decoded.begin(), decoded.end());

    if (final && !raw_.empty()) {
        SPDLOG_DEBUG("UTF-16 input ends with {} undecodable byte(s)", raw_.size());
        raw_.clear();
        return ErrorCode::TRUNCATED_INPUT;
    }

    return ErrorCode::NONE;
}

} // namespace streamcsv
