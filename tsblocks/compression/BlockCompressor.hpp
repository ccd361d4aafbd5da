#pragma once
// -------------------------------------------------------------------------------------
#include "compression/Block.hpp"
// -------------------------------------------------------------------------------------
#include <array>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
struct BatchStats {
  SIZE series_count{0};
  SIZE point_count{0};
  SIZE raw_size{0};      // 16 bytes per sample
  SIZE encoded_size{0};  // payload bytes
  double compression_ratio{0};
  // how often each scheme was picked, indexed by tag
  std::array<SIZE, CS(TimestampSchemeType::SCHEME_MAX)> timestamp_schemes{};
  std::array<SIZE, CS(ValueSchemeType::SCHEME_MAX)> value_schemes{};
  // -------------------------------------------------------------------------------------
  [[nodiscard]] string toString() const;
};
// -------------------------------------------------------------------------------------
// Batch interface over independent series. Series are spread over tbb
// worker threads, each one is encoded sequentially.
// -------------------------------------------------------------------------------------
class BlockCompressor {
 public:
  static vector<Block> compress(const vector<Series>& batch);
  static vector<Block> compress(const vector<Series>& batch, BatchStats& stats);
  // throws the first DecodeException any block raises
  static vector<Series> decompress(const vector<Block>& blocks);
  // -------------------------------------------------------------------------------------
  static BatchStats summarize(const vector<Block>& blocks);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
