#include <benchmark/benchmark.h>

#include "csv2tsv/chunk_reader.h"
#include "csv2tsv/output_sink.h"
#include "csv2tsv/scan.h"
#include "csv2tsv/transcoder.h"

#include <map>
#include <random>
#include <string>

namespace {

// Synthetic inputs, generated once per kind and cached.
enum class DataKind { Simple, Quoted, Multiline };

std::string generate(DataKind kind, size_t target_size) {
  std::mt19937 rng(12345);
  std::string csv;
  csv.reserve(target_size + 256);
  while (csv.size() < target_size) {
    for (int field = 0; field < 8; ++field) {
      if (field > 0) csv += ',';
      size_t len = 4 + rng() % 20;
      if (kind == DataKind::Simple) {
        for (size_t i = 0; i < len; ++i) csv += static_cast<char>('a' + rng() % 26);
      } else {
        csv += '"';
        for (size_t i = 0; i < len; ++i) {
          unsigned r = rng() % 16;
          if (r == 0) {
            csv += "\"\"";
          } else if (r == 1) {
            csv += ',';
          } else if (r == 2 && kind == DataKind::Multiline) {
            csv += "\r\n";
          } else {
            csv += static_cast<char>('a' + rng() % 26);
          }
        }
        csv += '"';
      }
    }
    csv += '\n';
  }
  return csv;
}

const std::string& data(DataKind kind) {
  static std::map<DataKind, std::string> cache;
  auto it = cache.find(kind);
  if (it == cache.end()) {
    it = cache.emplace(kind, generate(kind, 8 * 1024 * 1024)).first;
  }
  return it->second;
}

void run(benchmark::State& state, DataKind kind, bool simd_scan, size_t chunk_size) {
  const std::string& csv = data(kind);
  csv2tsv::TranscodeOptions options;
  options.simd_scan = simd_scan;
  csv2tsv::Transcoder transcoder(options);
  csv2tsv::NullSink sink;

  for (auto _ : state) {
    csv2tsv::MemorySource source(csv);
    csv2tsv::ChunkReader reader(source, chunk_size);
    csv2tsv::BufferedOutput out(sink);
    transcoder.transcode(reader, out, source.name());
    out.flush();
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
  state.counters["FileSize"] = static_cast<double>(csv.size());
  state.counters["ChunkSize"] = static_cast<double>(chunk_size);
}

}  // namespace

// state.range(0): 1 = SIMD skip on, 0 = byte-at-a-time
static void BM_TranscodeSimple(benchmark::State& state) {
  run(state, DataKind::Simple, state.range(0) != 0, CSV2TSV_DEFAULT_CHUNK_SIZE);
}
BENCHMARK(BM_TranscodeSimple)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);

static void BM_TranscodeQuoted(benchmark::State& state) {
  run(state, DataKind::Quoted, state.range(0) != 0, CSV2TSV_DEFAULT_CHUNK_SIZE);
}
BENCHMARK(BM_TranscodeQuoted)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);

static void BM_TranscodeMultiline(benchmark::State& state) {
  run(state, DataKind::Multiline, state.range(0) != 0, CSV2TSV_DEFAULT_CHUNK_SIZE);
}
BENCHMARK(BM_TranscodeMultiline)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);

static void BM_TranscodeChunkSize(benchmark::State& state) {
  run(state, DataKind::Quoted, true, static_cast<size_t>(state.range(0)));
}
BENCHMARK(BM_TranscodeChunkSize)->RangeMultiplier(8)->Range(512, 1 << 20)->Unit(benchmark::kMillisecond);

static void BM_FindSpecial(benchmark::State& state) {
  const std::string& csv = data(DataKind::Simple);
  const auto* bytes = reinterpret_cast<const uint8_t*>(csv.data());
  const csv2tsv::SpecialBytes special{',', '\t', '\n', '\r'};
  const bool simd = state.range(0) != 0;

  for (auto _ : state) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < csv.size()) {
      pos = simd ? csv2tsv::find_special(bytes, pos, csv.size(), special)
                 : csv2tsv::find_special_scalar(bytes, pos, csv.size(), special);
      if (pos < csv.size()) {
        ++count;
        ++pos;
      }
    }
    benchmark::DoNotOptimize(count);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
}
BENCHMARK(BM_FindSpecial)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
