// -------------------------------------------------------------------------------------
#include "Varint.hpp"
// -------------------------------------------------------------------------------------
#include <string>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
void Varint::encode(s64 value, ByteWriter& dest) {
  u64 encoded = zigzag(value);
  while (encoded >= 0x80) {
    dest.writeByte(static_cast<u8>((encoded & 0x7F) | 0x80));
    encoded >>= 7;
  }
  dest.writeByte(static_cast<u8>(encoded));
}
// -------------------------------------------------------------------------------------
s64 Varint::decode(ByteReader& src) {
  u64 result = 0;
  for (u32 group_i = 0; group_i < MAX_BYTES; group_i++) {
    if (src.exhausted()) {
      throw TruncatedVarint("buffer ends after " + std::to_string(group_i) + " groups");
    }
    const u8 byte = src.readByte();
    if (group_i == MAX_BYTES - 1 && (byte & 0x7E) != 0) {
      throw CorruptPayload("varint exceeds 64 bits");
    }
    result |= static_cast<u64>(byte & 0x7F) << (7 * group_i);
    if ((byte & 0x80) == 0) {
      return unzigzag(result);
    }
  }
  throw CorruptPayload("varint longer than " + std::to_string(MAX_BYTES) + " bytes");
}
// -------------------------------------------------------------------------------------
u64 Varint::decodeCount(ByteReader& src, u64 limit) {
  const s64 value = decode(src);
  if (value < 0 || static_cast<u64>(value) > limit) {
    throw CorruptPayload("count " + std::to_string(value) + " out of range [0, " +
                         std::to_string(limit) + "]");
  }
  return static_cast<u64>(value);
}
// -------------------------------------------------------------------------------------
Bytes Varint::encodeList(const vector<s64>& values) {
  ByteWriter writer;
  encodeList(values, writer);
  return writer.release();
}
// -------------------------------------------------------------------------------------
void Varint::encodeList(const vector<s64>& values, ByteWriter& dest) {
  for (auto value : values) {
    encode(value, dest);
  }
}
// -------------------------------------------------------------------------------------
vector<s64> Varint::decodeList(ByteReader& src, u64 count) {
  vector<s64> result;
  // every value takes at least one byte
  src.require(count);
  result.reserve(count);
  for (u64 value_i = 0; value_i < count; value_i++) {
    result.push_back(decode(src));
  }
  return result;
}
// -------------------------------------------------------------------------------------
vector<s64> Varint::decodeAll(const Bytes& src) {
  ByteReader reader(src);
  vector<s64> result;
  while (!reader.exhausted()) {
    result.push_back(decode(reader));
  }
  return result;
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
