#include "streamcsv/simd_scan.h"

#include "hwy/highway.h"
#include "hwy/targets.h"

namespace streamcsv {

// Namespace alias for Highway operations
namespace hn = hwy::HWY_NAMESPACE;

size_t find_first_of(const uint8_t* data, size_t len, uint8_t a, uint8_t b) {
    const hn::ScalableTag<uint8_t> d;
    const size_t N = hn::Lanes(d);

    const auto match_a = hn::Set(d, a);
    const auto match_b = hn::Set(d, b);

    size_t i = 0;
    for (; i + N <= len; i += N) {
        const auto vec = hn::LoadU(d, data + i);
        const auto hits = hn::Or(hn::Eq(vec, match_a), hn::Eq(vec, match_b));
        const intptr_t pos = hn::FindFirstTrue(d, hits);
        if (pos >= 0) {
            return i + static_cast<size_t>(pos);
        }
    }

    // Handle remaining bytes with scalar code
    for (; i < len; ++i) {
        if (data[i] == a || data[i] == b) {
            return i;
        }
    }

    return len;
}

const char* simd_target_name() {
    return hwy::TargetName(HWY_STATIC_TARGET);
}

} // namespace streamcsv
