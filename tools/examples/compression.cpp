// ------------------------------------------------------------------------------
// Simple Example: Compress a batch of series with tsblocks
// ------------------------------------------------------------------------------
#include "tsblocks.hpp"
#include "common/Log.hpp"
#include "compression/BlockCompressor.hpp"
// ------------------------------------------------------------------------------
#include <gflags/gflags.h>
// ------------------------------------------------------------------------------
#include <cmath>
#include <iostream>
#include <random>
#include <sstream>
// ------------------------------------------------------------------------------
DEFINE_uint32(series, 64, "Number of series in the batch");
DEFINE_uint32(length, 1000, "Samples per series");
DEFINE_uint32(interval, 15000, "Nominal scrape interval in milliseconds");
DEFINE_uint32(jitter, 0, "Maximum timestamp jitter in milliseconds");
DEFINE_bool(enhanced, false, "Use the enhanced pattern detector");
DEFINE_string(scheme, "", "Force a value scheme whenever it is usable (e.g. XOR, QUANTIZED)");
DEFINE_string(disable, "", "Comma separated value schemes to disable");
DEFINE_uint64(grain, 16, "Series per worker task");
DEFINE_string(log_level, "info", "spdlog level (trace, debug, info, warn, error, off)");
DEFINE_bool(describe, false, "Print a description of every block");
DEFINE_bool(verify, true, "Verify that decompression reproduces the input");
// ------------------------------------------------------------------------------
using namespace tsblocks;
// ------------------------------------------------------------------------------
// Cycles through a few typical shapes of monitoring data
vector<DOUBLE> generateValues(u32 length, u32 seed) {
  std::mt19937 gen(seed);
  vector<DOUBLE> values(length);
  switch (seed % 5) {
    case 0:  // gauge
      for (u32 i = 0; i < length; i++) {
        values[i] = 40.0 + 10.0 * std::sin(0.05 * i) + (gen() % 100) / 100.0;
      }
      break;
    case 1: {  // counter
      DOUBLE current = 0;
      for (auto& value : values) {
        current += gen() % 10;
        value = current;
      }
      break;
    }
    case 2:  // status
      for (auto& value : values) {
        value = gen() % 50 == 0 ? 0.0 : 1.0;
      }
      break;
    case 3:  // error rate
      for (auto& value : values) {
        value = gen() % 20 == 0 ? (gen() % 1000) / 7.0 : 0.0;
      }
      break;
    default:  // histogram bucket boundaries
      for (u32 i = 0; i < length; i++) {
        values[i] = std::ldexp(1.0, CI(i % 12));
      }
      break;
  }
  return values;
}
// ------------------------------------------------------------------------------
vector<TIMESTAMP> generateTimestamps(u32 length, u32 seed) {
  std::mt19937 gen(seed);
  vector<TIMESTAMP> timestamps(length);
  TIMESTAMP current = 1700000000000;
  for (auto& timestamp : timestamps) {
    current += FLAGS_interval;
    if (FLAGS_jitter > 0) {
      current += static_cast<TIMESTAMP>(gen() % (2 * FLAGS_jitter + 1)) - FLAGS_jitter;
    }
    timestamp = current;
  }
  return timestamps;
}
// ------------------------------------------------------------------------------
ValueSchemeType parseScheme(const string& name) {
  for (u8 scheme_i = 0; scheme_i < CB(ValueSchemeType::SCHEME_MAX); scheme_i++) {
    auto scheme = static_cast<ValueSchemeType>(scheme_i);
    if (ConvertSchemeTypeToString(scheme) == name) {
      return scheme;
    }
  }
  throw Generic_Exception("unknown value scheme " + name);
}
// ------------------------------------------------------------------------------
int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("Compresses a generated batch of series and reports the result");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  Log::set_level(Log::level::from_str(FLAGS_log_level));

  // required before interacting with tsblocks
  TsBlocksConfig::configure([&](TsBlocksConfig& config, SchemeConfig& scheme_config) {
    if (FLAGS_enhanced) {
      scheme_config = SchemeConfig::enhanced();
    }
    if (!FLAGS_scheme.empty()) {
      config.values.override_scheme = parseScheme(FLAGS_scheme);
    }
    std::stringstream disabled(FLAGS_disable);
    string name;
    while (std::getline(disabled, name, ',')) {
      if (!name.empty()) {
        config.values.schemes.disable(parseScheme(name));
      }
    }
    config.batch.grain_size = FLAGS_grain;
  });

  // -------------------------------------------------------------------------------------
  // compression
  // -------------------------------------------------------------------------------------
  vector<Series> batch;
  batch.reserve(FLAGS_series);
  for (u32 series_i = 0; series_i < FLAGS_series; series_i++) {
    batch.emplace_back(generateTimestamps(FLAGS_length, series_i),
                       generateValues(FLAGS_length, series_i));
  }

  BatchStats stats;
  auto blocks = BlockCompressor::compress(batch, stats);
  if (FLAGS_describe) {
    for (const auto& block : blocks) {
      std::cout << describeBlock(block) << std::endl;
    }
  }
  std::cout << "Stats:" << std::endl
            << "- input size " << stats.raw_size << std::endl
            << "- output size " << stats.encoded_size << std::endl
            << "- compression ratio " << stats.compression_ratio << std::endl
            << "- " << stats.toString() << std::endl;

  // -------------------------------------------------------------------------------------
  // decompression
  // -------------------------------------------------------------------------------------
  if (!FLAGS_verify) {
    return 0;
  }
  vector<Bytes> serialized;
  serialized.reserve(blocks.size());
  for (const auto& block : blocks) {
    serialized.push_back(block.serialize());
  }
  vector<Block> restored;
  restored.reserve(serialized.size());
  for (const auto& bytes : serialized) {
    restored.push_back(Block::deserialize(bytes));
  }
  auto decompressed = BlockCompressor::decompress(restored);
  bool check = true;
  for (SIZE series_i = 0; series_i < batch.size(); series_i++) {
    if (decompressed[series_i] != batch[series_i]) {
      std::cout << "series @" << series_i << " does not match: " << describeBlock(blocks[series_i])
                << std::endl;
      check = false;
    }
  }
  std::cout << (check ? "decompressed data matches original data"
                      : "decompressed data does not match original data")
            << std::endl;
  return !check;
}
// ------------------------------------------------------------------------------
