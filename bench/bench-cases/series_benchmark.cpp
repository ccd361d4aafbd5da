// ---------------------------------------------------------------------------------------------------
#include "benchmark/benchmark.h"
#include "tsblocks.hpp"
#include "compression/BlockCompressor.hpp"
#include "compression/SchemePicker.hpp"
#include "scheme/SchemePool.hpp"
// ---------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cmath>
#include <functional>
#include <random>
// ---------------------------------------------------------------------------------------------------

using namespace tsblocks;
using namespace std;

namespace tsbench {

static constexpr u32 series_length = 4096;
static constexpr u32 batch_size = 256;

using Generator = function<vector<DOUBLE>(u32, u32)>;

static const vector<pair<string, Generator>> datasets{
    {"constant", [](u32 n, u32) { return vector<DOUBLE>(n, 21.5); }},
    {"sparse",
     [](u32 n, u32 seed) {
       mt19937 gen(seed);
       vector<DOUBLE> values(n, 0.0);
       for (auto& value : values) {
         if (gen() % 10 == 0) {
           value = static_cast<DOUBLE>(gen() % 1000) / 8.0;
         }
       }
       return values;
     }},
    {"counter",
     [](u32 n, u32 seed) {
       mt19937 gen(seed);
       vector<DOUBLE> values(n);
       DOUBLE current = 0;
       for (auto& value : values) {
         current += static_cast<DOUBLE>(gen() % 50);
         value = current;
       }
       return values;
     }},
    {"linear",
     [](u32 n, u32) {
       vector<DOUBLE> values(n);
       for (u32 i = 0; i < n; i++) {
         values[i] = 100.0 + 0.25 * i;
       }
       return values;
     }},
    {"periodic",
     [](u32 n, u32) {
       vector<DOUBLE> values(n);
       for (u32 i = 0; i < n; i++) {
         values[i] = static_cast<DOUBLE>((i % 24) * 3 + 1) * 0.5;
       }
       return values;
     }},
    {"quantized",
     [](u32 n, u32 seed) {
       mt19937 gen(seed);
       vector<DOUBLE> values(n);
       for (auto& value : values) {
         value = 0.1 * static_cast<DOUBLE>(gen() % 16);
       }
       return values;
     }},
    {"gauge",
     [](u32 n, u32 seed) {
       mt19937 gen(seed);
       normal_distribution<DOUBLE> noise(0.0, 0.05);
       vector<DOUBLE> values(n);
       for (u32 i = 0; i < n; i++) {
         values[i] = 50.3 + 5.0 * sin(0.01 * i) + noise(gen);
       }
       return values;
     }},
    {"random",
     [](u32 n, u32 seed) {
       mt19937 gen(seed);
       uniform_real_distribution<DOUBLE> dist(-1e6, 1e6);
       vector<DOUBLE> values(n);
       for (auto& value : values) {
         value = dist(gen);
       }
       return values;
     }},
};

static vector<TIMESTAMP> scrapeTimestamps(u32 n, u32 seed) {
  mt19937 gen(seed);
  vector<TIMESTAMP> timestamps(n);
  TIMESTAMP current = 1700000000000;
  for (auto& timestamp : timestamps) {
    current += 15000 + static_cast<TIMESTAMP>(gen() % 5) - 2;
    timestamp = current;
  }
  return timestamps;
}

static vector<Series> makeBatch(const Generator& generator) {
  vector<Series> batch;
  batch.reserve(batch_size);
  for (u32 seed = 0; seed < batch_size; seed++) {
    batch.emplace_back(scrapeTimestamps(series_length, seed), generator(series_length, seed));
  }
  return batch;
}

static void reportBatch(benchmark::State& state, const vector<Block>& blocks) {
  auto stats = BlockCompressor::summarize(blocks);
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * stats.point_count));
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * stats.raw_size));
  state.counters["compressed_data_size"] = static_cast<double>(stats.encoded_size);
  state.counters["comp_ratio"] = stats.compression_ratio;
  auto most_used = max_element(stats.value_schemes.begin(), stats.value_schemes.end());
  state.SetLabel(ConvertSchemeTypeToString(
      static_cast<ValueSchemeType>(distance(stats.value_schemes.begin(), most_used))));
}

static void CompressBenchmark(benchmark::State& state, const Generator& generator) {
  auto batch = makeBatch(generator);
  vector<Block> blocks;
  for (auto _ : state) {
    blocks = BlockCompressor::compress(batch);
    benchmark::DoNotOptimize(blocks.data());
  }
  reportBatch(state, blocks);
}

static void DecompressBenchmark(benchmark::State& state, const Generator& generator) {
  auto blocks = BlockCompressor::compress(makeBatch(generator));
  for (auto _ : state) {
    auto batch = BlockCompressor::decompress(blocks);
    benchmark::DoNotOptimize(batch.data());
  }
  reportBatch(state, blocks);
}

// Single threaded, one scheme forced on every series
static void SchemeBenchmark(benchmark::State& state,
                            ValueSchemeType scheme,
                            const Generator& generator) {
  auto values = generator(series_length, 42);
  auto stats = ValueStats::generateStats(values.data(), series_length);
  auto pattern = PatternDetector::classify(stats);
  const auto& value_scheme = SchemePool::getValueScheme(scheme);
  if (!value_scheme.isUsable(stats, pattern)) {
    state.SkipWithError("scheme not usable on this dataset");
    return;
  }
  ValuePayload payload{scheme, {}};
  for (auto _ : state) {
    payload = SchemePicker::compressWith(value_scheme, stats, pattern);
    auto decoded = decodeValues(payload, series_length);
    benchmark::DoNotOptimize(decoded.data());
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * series_length));
  state.counters["comp_ratio"] =
      static_cast<double>(series_length * sizeof(DOUBLE)) / static_cast<double>(payload.size());
}

void RegisterSeriesBenchmarks() {
  for (auto& [name, generator] : datasets) {
    benchmark::RegisterBenchmark(("COMPRESS/" + name).c_str(), CompressBenchmark, generator)
        ->Unit(benchmark::kMillisecond)
        ->UseRealTime();
    benchmark::RegisterBenchmark(("DECOMPRESS/" + name).c_str(), DecompressBenchmark, generator)
        ->Unit(benchmark::kMillisecond)
        ->UseRealTime();
  }
  for (u8 scheme_i = 0; scheme_i < CB(ValueSchemeType::SCHEME_MAX); scheme_i++) {
    auto scheme = static_cast<ValueSchemeType>(scheme_i);
    for (auto& [name, generator] : datasets) {
      benchmark::RegisterBenchmark(
          ("SCHEME_" + ConvertSchemeTypeToString(scheme) + "/" + name).c_str(), SchemeBenchmark,
          scheme, generator)
          ->Unit(benchmark::kMicrosecond);
    }
  }
}

}  // namespace tsbench
