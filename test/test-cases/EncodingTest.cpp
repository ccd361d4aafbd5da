// -------------------------------------------------------------------------------------
#include "TestHelper.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "encoding/BitStream.hpp"
#include "encoding/RunLength.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
#include <limits>
// -------------------------------------------------------------------------------------
TEST(BitStream, MixedWidths)
{
   BitWriter writer;
   writer.writeBits(0b101, 3);
   writer.writeBit(true);
   writer.writeBits(0xABCD, 16);
   writer.writeBits(std::numeric_limits<u64>::max(), 64);
   writer.writeBits(0, 5);
   EXPECT_EQ(writer.bitCount(), 89u);
   auto bytes = writer.flush();
   ASSERT_EQ(bytes.size(), 12u);
   // MSB first: 101 1 then the top nibble of 0xABCD
   EXPECT_EQ(bytes[0], 0xBA);
   // -------------------------------------------------------------------------------------
   BitReader reader(bytes);
   EXPECT_EQ(reader.readBits(3), 0b101u);
   EXPECT_TRUE(reader.readBit());
   EXPECT_EQ(reader.readBits(16), 0xABCDu);
   EXPECT_EQ(reader.readBits(64), std::numeric_limits<u64>::max());
   EXPECT_EQ(reader.readBits(5), 0u);
   EXPECT_EQ(reader.consumedBytes(), 12u);
   // only padding left
   EXPECT_EQ(reader.remainingBits(), 7u);
}
// -------------------------------------------------------------------------------------
TEST(BitStream, WriteMasksHighBits)
{
   BitWriter writer;
   writer.writeBits(0xFF, 4);
   auto bytes = writer.flush();
   ASSERT_EQ(bytes.size(), 1u);
   EXPECT_EQ(bytes[0], 0xF0);
}
// -------------------------------------------------------------------------------------
TEST(BitStream, ReadPastEnd)
{
   Bytes bytes{0xFF};
   BitReader reader(bytes);
   EXPECT_TRUE(reader.hasBits(8));
   EXPECT_FALSE(reader.hasBits(9));
   EXPECT_THROW(reader.readBits(9), InsufficientBits);
   EXPECT_EQ(reader.readBits(8), 0xFFu);
   EXPECT_THROW(reader.readBit(), InsufficientBits);
}
// -------------------------------------------------------------------------------------
TEST(Varint, Zigzag)
{
   EXPECT_EQ(Varint::zigzag(0), 0u);
   EXPECT_EQ(Varint::zigzag(-1), 1u);
   EXPECT_EQ(Varint::zigzag(1), 2u);
   EXPECT_EQ(Varint::zigzag(-2), 3u);
   EXPECT_EQ(Varint::zigzag(std::numeric_limits<s64>::max()), std::numeric_limits<u64>::max() - 1);
   EXPECT_EQ(Varint::zigzag(std::numeric_limits<s64>::min()), std::numeric_limits<u64>::max());
}
// -------------------------------------------------------------------------------------
TEST(Varint, KnownEncoding)
{
   EXPECT_EQ(Varint::encodeList({300}), (Bytes{0xD8, 0x04}));
   EXPECT_EQ(Varint::encodeList({0, -1, 63, -64}), (Bytes{0x00, 0x01, 0x7E, 0x7F}));
   EXPECT_EQ(Varint::encodeList({64}), (Bytes{0x80, 0x01}));
}
// -------------------------------------------------------------------------------------
TEST(Varint, FullRange)
{
   vector<s64> values{0, 1, -1, 127, -128, 1 << 20, -(1ll << 40), std::numeric_limits<s64>::max(),
                      std::numeric_limits<s64>::min()};
   auto bytes = Varint::encodeList(values);
   EXPECT_EQ(Varint::decodeAll(bytes), values);
   // the extremes need all ten groups
   EXPECT_EQ(Varint::encodeList({std::numeric_limits<s64>::min()}).size(), Varint::MAX_BYTES);
}
// -------------------------------------------------------------------------------------
TEST(Varint, Truncated)
{
   Bytes bytes{0xD8};
   ByteReader reader(bytes);
   EXPECT_THROW(Varint::decode(reader), TruncatedVarint);
   ByteReader empty(nullptr, 0);
   EXPECT_THROW(Varint::decode(empty), TruncatedPayload);
}
// -------------------------------------------------------------------------------------
TEST(Varint, Overlong)
{
   Bytes bytes(11, 0x80);
   ByteReader reader(bytes);
   EXPECT_THROW(Varint::decode(reader), CorruptPayload);
   // a tenth group carrying more than the 64th bit
   Bytes overflow(9, 0xFF);
   overflow.push_back(0x02);
   ByteReader overflow_reader(overflow);
   EXPECT_THROW(Varint::decode(overflow_reader), CorruptPayload);
}
// -------------------------------------------------------------------------------------
TEST(RunLength, EncodeDecode)
{
   vector<s64> values{5, 5, 5, 1, 1, 7, -3, -3};
   auto runs = RunLength::encode(values);
   EXPECT_EQ(runs, (vector<RunLengthPair>{{5, 3}, {1, 2}, {7, 1}, {-3, 2}}));
   EXPECT_EQ(RunLength::expandedCount(runs), values.size());
   EXPECT_EQ(RunLength::decode(runs), values);
   EXPECT_TRUE(RunLength::encode(vector<s64>{}).empty());
}
// -------------------------------------------------------------------------------------
TEST(RunLength, WireFormat)
{
   ByteWriter writer;
   RunLength::write({{0, 1000}}, writer);
   auto bytes = writer.release();
   // value 0, count 1000 (zigzag 2000)
   EXPECT_EQ(bytes, (Bytes{0x00, 0xD0, 0x0F}));
   ByteReader reader(bytes);
   EXPECT_EQ(RunLength::read(reader, 1000), (vector<RunLengthPair>{{0, 1000}}));
   EXPECT_TRUE(reader.exhausted());
}
// -------------------------------------------------------------------------------------
TEST(RunLength, BoundedRead)
{
   ByteWriter writer;
   RunLength::write({{4, 3}, {9, 5}}, writer);
   auto bytes = writer.release();
   {
      ByteReader reader(bytes);
      EXPECT_THROW(RunLength::read(reader, 6), CorruptPayload);
   }
   {
      ByteReader reader(bytes);
      EXPECT_THROW(RunLength::read(reader, 10), TruncatedPayload);
   }
   {
      Bytes zero_run = Varint::encodeList({4, 0});
      ByteReader reader(zero_run);
      EXPECT_THROW(RunLength::read(reader, 1), CorruptPayload);
   }
}
// -------------------------------------------------------------------------------------
TEST(ByteBuffer, BoundsChecked)
{
   ByteWriter writer;
   writer.write<u32>(0xDEADBEEF);
   writer.write<DOUBLE>(-0.0);
   auto bytes = writer.release();
   ASSERT_EQ(bytes.size(), 12u);
   ByteReader reader(bytes);
   EXPECT_EQ(reader.read<u32>(), 0xDEADBEEFu);
   EXPECT_TRUE(Utils::bitEqual(reader.read<DOUBLE>(), -0.0));
   EXPECT_TRUE(reader.exhausted());
   EXPECT_THROW(reader.readByte(), TruncatedPayload);
}
// -------------------------------------------------------------------------------------
