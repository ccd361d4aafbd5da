#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
#include "scheme/CompressionScheme.hpp"
#include "storage/Series.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
// The encoded form of one series: timestamps and values are compressed
// independently, each payload carries the tag of its scheme.
//
// Serialized layout:
//   point_count (varint)
//   timestamp tag (1 byte) | timestamp size (varint) | timestamp payload
//   value tag (1 byte)     | value size (varint)     | value payload
// -------------------------------------------------------------------------------------
struct Block {
  u32 point_count{0};
  TimestampPayload timestamps{TimestampSchemeType::EMPTY, {}};
  ValuePayload values{ValueSchemeType::XOR, {}};
  // -------------------------------------------------------------------------------------
  // payload bytes, without the framing of serialize()
  [[nodiscard]] SIZE encodedSize() const { return timestamps.size() + values.size(); }
  [[nodiscard]] SIZE rawSize() const { return CS(point_count) * (sizeof(TIMESTAMP) + sizeof(DOUBLE)); }
  [[nodiscard]] double compressionRatio() const;
  // -------------------------------------------------------------------------------------
  [[nodiscard]] Bytes serialize() const;
  static Block deserialize(const u8* data, SIZE size);
  static Block deserialize(const Bytes& bytes) { return deserialize(bytes.data(), bytes.size()); }
  // -------------------------------------------------------------------------------------
  bool operator==(const Block& other) const {
    return point_count == other.point_count && timestamps == other.timestamps &&
           values == other.values;
  }
};
// -------------------------------------------------------------------------------------
// Column level entry points
TimestampPayload encodeTimestamps(const vector<TIMESTAMP>& timestamps);
vector<TIMESTAMP> decodeTimestamps(const TimestampPayload& payload, u32 tuple_count);
ValuePayload encodeValues(const vector<DOUBLE>& values);
vector<DOUBLE> decodeValues(const ValuePayload& payload, u32 tuple_count);
// -------------------------------------------------------------------------------------
Block encodeBlock(const Series& series);
// throws a DecodeException when the block is malformed
Series decodeBlock(const Block& block);
// Encodes, decodes and compares bit by bit
bool verifyBlock(const Series& series);
// One line summary of schemes, sizes and ratio
string describeBlock(const Block& block);
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
