// -------------------------------------------------------------------------------------
#include "BlockCompressor.hpp"
// -------------------------------------------------------------------------------------
#include "tsblocks.hpp"
#include "common/Log.hpp"
// -------------------------------------------------------------------------------------
#include "tbb/blocked_range.h"
#include "tbb/parallel_for.h"
// -------------------------------------------------------------------------------------
#include <algorithm>
#include <sstream>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
static SIZE grainSize() {
  return std::max<SIZE>(TsBlocksConfig::get().batch.grain_size, 1);
}
// -------------------------------------------------------------------------------------
vector<Block> BlockCompressor::compress(const vector<Series>& batch) {
  vector<Block> blocks(batch.size());
  tbb::parallel_for(tbb::blocked_range<SIZE>(0, batch.size(), grainSize()),
                    [&](const tbb::blocked_range<SIZE>& range) {
                      for (SIZE series_i = range.begin(); series_i < range.end(); series_i++) {
                        blocks[series_i] = encodeBlock(batch[series_i]);
                      }
                    });
  return blocks;
}
// -------------------------------------------------------------------------------------
vector<Block> BlockCompressor::compress(const vector<Series>& batch, BatchStats& stats) {
  auto blocks = compress(batch);
  stats = summarize(blocks);
  Log::info("compressed {}", stats.toString());
  return blocks;
}
// -------------------------------------------------------------------------------------
vector<Series> BlockCompressor::decompress(const vector<Block>& blocks) {
  vector<Series> batch(blocks.size());
  tbb::parallel_for(tbb::blocked_range<SIZE>(0, blocks.size(), grainSize()),
                    [&](const tbb::blocked_range<SIZE>& range) {
                      for (SIZE block_i = range.begin(); block_i < range.end(); block_i++) {
                        batch[block_i] = decodeBlock(blocks[block_i]);
                      }
                    });
  return batch;
}
// -------------------------------------------------------------------------------------
BatchStats BlockCompressor::summarize(const vector<Block>& blocks) {
  BatchStats stats;
  stats.series_count = blocks.size();
  for (const auto& block : blocks) {
    stats.point_count += block.point_count;
    stats.raw_size += block.rawSize();
    stats.encoded_size += block.encodedSize();
    stats.timestamp_schemes[CB(block.timestamps.scheme)]++;
    stats.value_schemes[CB(block.values.scheme)]++;
  }
  if (stats.encoded_size > 0) {
    stats.compression_ratio = CD(stats.raw_size) / CD(stats.encoded_size);
  }
  return stats;
}
// -------------------------------------------------------------------------------------
string BatchStats::toString() const {
  std::ostringstream out;
  out << series_count << " series, " << point_count << " points, " << raw_size << " B -> "
      << encoded_size << " B, ratio " << compression_ratio << "; timestamps:";
  for (u8 scheme_i = 0; scheme_i < timestamp_schemes.size(); scheme_i++) {
    if (timestamp_schemes[scheme_i] > 0) {
      out << " " << ConvertSchemeTypeToString(static_cast<TimestampSchemeType>(scheme_i)) << "="
          << timestamp_schemes[scheme_i];
    }
  }
  out << "; values:";
  for (u8 scheme_i = 0; scheme_i < value_schemes.size(); scheme_i++) {
    if (value_schemes[scheme_i] > 0) {
      out << " " << ConvertSchemeTypeToString(static_cast<ValueSchemeType>(scheme_i)) << "="
          << value_schemes[scheme_i];
    }
  }
  return out.str();
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
