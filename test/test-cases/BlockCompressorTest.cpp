// -------------------------------------------------------------------------------------
#include "TestHelper.hpp"
// -------------------------------------------------------------------------------------
#include "compression/BlockCompressor.hpp"
// -------------------------------------------------------------------------------------
#include <numeric>
// -------------------------------------------------------------------------------------
namespace {
// -------------------------------------------------------------------------------------
vector<Series> MixedBatch()
{
   vector<Series> batch;
   for ( u32 seed = 0; seed < 8; seed++ ) {
      batch.push_back(TestHelper::WithRegularTimestamps(TestHelper::Constant(100 + seed, seed)));
      batch.push_back(TestHelper::WithRegularTimestamps(TestHelper::Sparse(300, seed)));
      batch.push_back(TestHelper::WithRegularTimestamps(TestHelper::MostlyIntegers(250, seed)));
      batch.push_back(Series(TestHelper::JitteredTimestamps(400, seed), TestHelper::Smooth(400, seed)));
      batch.push_back(TestHelper::WithRegularTimestamps(TestHelper::Random(seed, seed)));
   }
   batch.push_back(TestHelper::WithRegularTimestamps(TestHelper::Adversarial()));
   batch.emplace_back();
   return batch;
}
// -------------------------------------------------------------------------------------
SIZE Sum(const vector<Series> &batch)
{
   return std::accumulate(batch.begin(), batch.end(), SIZE(0), [](SIZE sum, const Series &series) { return sum + series.size(); });
}
// -------------------------------------------------------------------------------------
}  // namespace
// -------------------------------------------------------------------------------------
TEST(BlockCompressor, RoundTrip)
{
   auto batch = MixedBatch();
   auto blocks = BlockCompressor::compress(batch);
   ASSERT_EQ(blocks.size(), batch.size());
   auto decoded = BlockCompressor::decompress(blocks);
   ASSERT_EQ(decoded.size(), batch.size());
   for ( SIZE series_i = 0; series_i < batch.size(); series_i++ ) {
      EXPECT_TRUE(decoded[series_i] == batch[series_i]) << "series " << series_i;
      // batch encoding is the same as encoding each series on its own
      EXPECT_EQ(blocks[series_i], encodeBlock(batch[series_i]));
   }
}
// -------------------------------------------------------------------------------------
TEST(BlockCompressor, Stats)
{
   auto batch = MixedBatch();
   BatchStats stats;
   auto blocks = BlockCompressor::compress(batch, stats);
   EXPECT_EQ(stats.series_count, batch.size());
   EXPECT_EQ(stats.point_count, Sum(batch));
   EXPECT_EQ(stats.raw_size, 16 * Sum(batch));
   EXPECT_EQ(std::accumulate(stats.timestamp_schemes.begin(), stats.timestamp_schemes.end(), SIZE(0)), batch.size());
   EXPECT_EQ(std::accumulate(stats.value_schemes.begin(), stats.value_schemes.end(), SIZE(0)), batch.size());
   EXPECT_GE(stats.value_schemes[CS(ValueSchemeType::CONSTANT)], 8u);
   EXPECT_GE(stats.timestamp_schemes[CS(TimestampSchemeType::EMPTY)], 1u);
   EXPECT_GT(stats.compression_ratio, 1.0);
   // -------------------------------------------------------------------------------------
   SIZE encoded_size = 0;
   for ( const auto &block : blocks ) {
      encoded_size += block.encodedSize();
   }
   EXPECT_EQ(stats.encoded_size, encoded_size);
   auto summary = BlockCompressor::summarize(blocks);
   EXPECT_EQ(summary.encoded_size, stats.encoded_size);
   EXPECT_EQ(summary.value_schemes, stats.value_schemes);
   EXPECT_FALSE(summary.toString().empty());
}
// -------------------------------------------------------------------------------------
TEST(BlockCompressor, GrainSize)
{
   auto batch = MixedBatch();
   auto expected = BlockCompressor::compress(batch);
   auto saved = TsBlocksConfig::get().batch.grain_size;
   for ( SIZE grain_size : {SIZE(0), SIZE(1), SIZE(3), SIZE(1000)} ) {
      TsBlocksConfig::get().batch.grain_size = grain_size;
      EXPECT_EQ(BlockCompressor::compress(batch), expected) << "grain " << grain_size;
   }
   TsBlocksConfig::get().batch.grain_size = saved;
}
// -------------------------------------------------------------------------------------
TEST(BlockCompressor, CorruptBlock)
{
   auto blocks = BlockCompressor::compress(MixedBatch());
   blocks[3].values.data.push_back(0x42);
   EXPECT_THROW(BlockCompressor::decompress(blocks), CorruptPayload);
   EXPECT_TRUE(BlockCompressor::compress({}).empty());
}
// -------------------------------------------------------------------------------------
