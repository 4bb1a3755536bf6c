#ifndef STREAMCSV_SIMD_SCAN_H
#define STREAMCSV_SIMD_SCAN_H

// Portable SIMD byte search using Google Highway

#include <cstddef>
#include <cstdint>

namespace streamcsv {

/**
 * @brief Find the first byte equal to @p a or @p b.
 *
 * Compares a full Highway vector at a time and finishes the tail with scalar
 * code.
 *
 * @return Offset of the match, or @p len if neither byte occurs.
 */
size_t find_first_of(const uint8_t* data, size_t len, uint8_t a, uint8_t b);

/// Name of the Highway target this build dispatches to (e.g. "AVX2")
const char* simd_target_name();

} // namespace streamcsv

#endif // STREAMCSV_SIMD_SCAN_H
