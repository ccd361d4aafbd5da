// -------------------------------------------------------------------------------------
#include "Block.hpp"
// -------------------------------------------------------------------------------------
#include "tsblocks.hpp"
#include "common/Log.hpp"
#include "compression/SchemePicker.hpp"
#include "encoding/Varint.hpp"
#include "scheme/SchemePool.hpp"
// -------------------------------------------------------------------------------------
#include <limits>
#include <sstream>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
static u32 maxPointCount() {
  return TsBlocksConfig::get().blocks.max_point_count;
}
// -------------------------------------------------------------------------------------
static u32 checkedPointCount(SIZE count) {
  if (count > maxPointCount()) {
    throw Generic_Exception("series of " + std::to_string(count) +
                            " samples exceeds the block limit of " +
                            std::to_string(maxPointCount()));
  }
  return CU(count);
}
// -------------------------------------------------------------------------------------
// Output columns are sized from the count, it has to be bounded before allocating
static void checkDecodeCount(u32 tuple_count) {
  if (tuple_count > maxPointCount()) {
    throw CorruptPayload("point count " + std::to_string(tuple_count) + " exceeds the limit of " +
                         std::to_string(maxPointCount()));
  }
}
// -------------------------------------------------------------------------------------
// A decoder must consume its payload exactly, trailing bytes mean the
// payload does not belong to the tag or count it was decoded with
static void checkConsumed(const ByteReader& reader, const string& scheme) {
  if (!reader.exhausted()) {
    throw CorruptPayload(scheme + " payload has " + std::to_string(reader.remaining()) +
                         " trailing bytes");
  }
}
// -------------------------------------------------------------------------------------
TimestampPayload encodeTimestamps(const vector<TIMESTAMP>& timestamps) {
  return SchemePicker::compressTimestamps(timestamps.data(), checkedPointCount(timestamps.size()));
}
// -------------------------------------------------------------------------------------
vector<TIMESTAMP> decodeTimestamps(const TimestampPayload& payload, u32 tuple_count) {
  checkDecodeCount(tuple_count);
  const auto& scheme = SchemePool::getTimestampScheme(payload.scheme);
  if (!scheme.isUsable(tuple_count)) {
    throw CorruptPayload(scheme.selfDescription() + " cannot hold " +
                         std::to_string(tuple_count) + " timestamps");
  }
  vector<TIMESTAMP> result(tuple_count);
  ByteReader reader(payload.data);
  scheme.decompress(result.data(), tuple_count, reader);
  checkConsumed(reader, scheme.selfDescription());
  return result;
}
// -------------------------------------------------------------------------------------
ValuePayload encodeValues(const vector<DOUBLE>& values) {
  return SchemePicker::compressValues(values.data(), checkedPointCount(values.size()));
}
// -------------------------------------------------------------------------------------
vector<DOUBLE> decodeValues(const ValuePayload& payload, u32 tuple_count) {
  checkDecodeCount(tuple_count);
  const auto& scheme = SchemePool::getValueScheme(payload.scheme);
  vector<DOUBLE> result(tuple_count);
  ByteReader reader(payload.data);
  scheme.decompress(result.data(), tuple_count, reader);
  checkConsumed(reader, scheme.selfDescription());
  return result;
}
// -------------------------------------------------------------------------------------
Block encodeBlock(const Series& series) {
  Block block;
  block.point_count = checkedPointCount(series.size());
  block.timestamps = encodeTimestamps(series.timestamps);
  block.values = encodeValues(series.values);
  if (Log::should_log(Log::level::debug)) {
    Log::debug("encoded {}", describeBlock(block));
  }
  return block;
}
// -------------------------------------------------------------------------------------
Series decodeBlock(const Block& block) {
  return Series(decodeTimestamps(block.timestamps, block.point_count),
                decodeValues(block.values, block.point_count));
}
// -------------------------------------------------------------------------------------
bool verifyBlock(const Series& series) {
  return decodeBlock(encodeBlock(series)) == series;
}
// -------------------------------------------------------------------------------------
double Block::compressionRatio() const {
  if (encodedSize() == 0) {
    return 0;
  }
  return CD(rawSize()) / CD(encodedSize());
}
// -------------------------------------------------------------------------------------
Bytes Block::serialize() const {
  ByteWriter writer;
  Varint::encode(point_count, writer);
  writer.writeByte(CB(timestamps.scheme));
  Varint::encode(static_cast<s64>(timestamps.size()), writer);
  writer.writeBytes(timestamps.data);
  writer.writeByte(CB(values.scheme));
  Varint::encode(static_cast<s64>(values.size()), writer);
  writer.writeBytes(values.data);
  return writer.release();
}
// -------------------------------------------------------------------------------------
Block Block::deserialize(const u8* data, SIZE size) {
  ByteReader reader(data, size);
  Block block;
  block.point_count = CU(Varint::decodeCount(reader, maxPointCount()));
  // -------------------------------------------------------------------------------------
  block.timestamps.scheme = ParseTimestampSchemeType(reader.readByte());
  SIZE length = Varint::decodeCount(reader, std::numeric_limits<u32>::max());
  const u8* payload = reader.take(length);
  block.timestamps.data.assign(payload, payload + length);
  // -------------------------------------------------------------------------------------
  block.values.scheme = ParseValueSchemeType(reader.readByte());
  length = Varint::decodeCount(reader, std::numeric_limits<u32>::max());
  payload = reader.take(length);
  block.values.data.assign(payload, payload + length);
  // -------------------------------------------------------------------------------------
  checkConsumed(reader, "block");
  return block;
}
// -------------------------------------------------------------------------------------
string describeBlock(const Block& block) {
  std::ostringstream description;
  description << block.point_count << " points, timestamps "
              << ConvertSchemeTypeToString(block.timestamps.scheme) << " ("
              << block.timestamps.size() << " B), values "
              << SchemePool::getValueScheme(block.values.scheme).fullDescription(block.values.data)
              << " (" << block.values.size() << " B), ratio " << block.compressionRatio();
  return description.str();
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
