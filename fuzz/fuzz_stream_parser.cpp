/**
 * @file fuzz_stream_parser.cpp
 * @brief LibFuzzer target for the incremental stream parser.
 *
 * The first two input bytes pick the options and the chunk size; the rest is
 * fed to the parser. Split points come from the input so that chunk
 * boundaries land everywhere over time.
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "streamcsv/stream_parser.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;
    // 64KB limit keeps iterations fast while covering multi-row chunks
    constexpr size_t MAX_INPUT_SIZE = 64 * 1024;
    if (size > MAX_INPUT_SIZE) size = MAX_INPUT_SIZE;

    const uint8_t flags = data[0];
    const size_t chunk_size = static_cast<size_t>(data[1]) + 1;
    data += 2;
    size -= 2;

    streamcsv::ParserOptions opts;
    opts.raw = (flags & 0x01) != 0;
    opts.strict = (flags & 0x02) != 0;
    if (flags & 0x04) opts.headers = std::vector<std::string>{};
    if (flags & 0x08) opts.with_comments();
    if (flags & 0x10) opts.dialect.escape_char = '\\';
    if (flags & 0x20) opts.max_row_bytes = 64;
    opts.skip_lines = (flags >> 6) & 0x03;

    streamcsv::StreamParser parser(opts);

    for (size_t pos = 0; pos < size; pos += chunk_size) {
        size_t n = size - pos < chunk_size ? size - pos : chunk_size;
        parser.ingest(data + pos, n);
    }

    // Drain held errors and leftover rows
    for (int i = 0; i < 64; ++i) {
        streamcsv::ParseResult result = parser.finish();
        if (result.ok() && result.rows.empty()) break;
    }

    return 0;
}
