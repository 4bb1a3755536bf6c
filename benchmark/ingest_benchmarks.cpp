#include <benchmark/benchmark.h>
#include "streamcsv/stream_parser.h"

#include <algorithm>
#include <cstdint>
#include <string>

using namespace streamcsv;

namespace {

// Synthetic CSV with a header, numeric and text columns
std::string make_csv(size_t rows, bool quoted) {
  std::string out = "id,name,amount,comment\n";
  for (size_t i = 0; i < rows; ++i) {
    out += std::to_string(i);
    out += quoted ? ",\"name, " : ",name_";
    out += std::to_string(i % 97);
    out += quoted ? "\"," : ",";
    out += std::to_string(i * 31 % 10007);
    out += quoted ? ",\"said \"\"hello\"\"\nthen left\"\n" : ",plain comment text\n";
  }
  return out;
}

std::string to_utf16le(const std::string& ascii) {
  std::string out("\xFF\xFE", 2);
  out.reserve(2 + ascii.size() * 2);
  for (char c : ascii) {
    out.push_back(c);
    out.push_back('\0');
  }
  return out;
}

void run_chunked(benchmark::State& state, const std::string& data, const ParserOptions& opts) {
  const size_t chunk_size = static_cast<size_t>(state.range(0));
  size_t rows = 0;

  for (auto _ : state) {
    StreamParser parser(opts);
    for (size_t pos = 0; pos < data.size(); pos += chunk_size) {
      size_t n = std::min(chunk_size, data.size() - pos);
      ParseResult result =
          parser.ingest(reinterpret_cast<const uint8_t*>(data.data() + pos), n);
      rows += result.rows.size();
      benchmark::DoNotOptimize(result);
    }
    ParseResult last = parser.finish();
    rows += last.rows.size();
    benchmark::DoNotOptimize(last);
  }

  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
  state.counters["Rows"] = benchmark::Counter(static_cast<double>(rows),
                                              benchmark::Counter::kIsRate);
  state.counters["ChunkSize"] = static_cast<double>(chunk_size);
}

} // namespace

static void BM_IngestPlain(benchmark::State& state) {
  static const std::string data = make_csv(20000, false);
  run_chunked(state, data, ParserOptions());
}
BENCHMARK(BM_IngestPlain)->RangeMultiplier(8)->Range(64, 256 << 10)->Unit(benchmark::kMillisecond);

static void BM_IngestQuoted(benchmark::State& state) {
  static const std::string data = make_csv(20000, true);
  run_chunked(state, data, ParserOptions());
}
BENCHMARK(BM_IngestQuoted)->RangeMultiplier(8)->Range(64, 256 << 10)->Unit(benchmark::kMillisecond);

static void BM_IngestUtf16(benchmark::State& state) {
  static const std::string data = to_utf16le(make_csv(20000, false));
  run_chunked(state, data, ParserOptions());
}
BENCHMARK(BM_IngestUtf16)->Arg(4096)->Arg(64 << 10)->Unit(benchmark::kMillisecond);

static void BM_IngestRawMode(benchmark::State& state) {
  static const std::string data = make_csv(20000, false);
  ParserOptions opts;
  opts.raw = true;
  run_chunked(state, data, opts);
}
BENCHMARK(BM_IngestRawMode)->Arg(64 << 10)->Unit(benchmark::kMillisecond);

static void BM_IngestWithValueMapping(benchmark::State& state) {
  static const std::string data = make_csv(20000, false);
  ParserOptions opts;
  opts.map_values = [](const std::string&, size_t, std::string value) { return value; };
  run_chunked(state, data, opts);
}
BENCHMARK(BM_IngestWithValueMapping)->Arg(64 << 10)->Unit(benchmark::kMillisecond);
