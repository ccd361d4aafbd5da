#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
#include "encoding/ByteBuffer.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
// Zigzag mapped LEB128: 7 bits per byte, least significant group first, the
// high bit of every byte but the last is set.
// -------------------------------------------------------------------------------------
class Varint {
 public:
  static constexpr u32 MAX_BYTES = 10;
  // -------------------------------------------------------------------------------------
  static u64 zigzag(s64 value) {
    return (static_cast<u64>(value) << 1) ^ static_cast<u64>(value >> 63);
  }
  static s64 unzigzag(u64 value) {
    return static_cast<s64>(value >> 1) ^ -static_cast<s64>(value & 1);
  }
  // -------------------------------------------------------------------------------------
  static void encode(s64 value, ByteWriter& dest);
  // throws TruncatedVarint when the buffer ends inside a value
  static s64 decode(ByteReader& src);
  // Non negative quantity that must not exceed limit, e.g. a count
  static u64 decodeCount(ByteReader& src, u64 limit);
  // -------------------------------------------------------------------------------------
  static Bytes encodeList(const vector<s64>& values);
  static void encodeList(const vector<s64>& values, ByteWriter& dest);
  // Decodes exactly count values
  static vector<s64> decodeList(ByteReader& src, u64 count);
  // Decodes until the buffer is exhausted
  static vector<s64> decodeAll(const Bytes& src);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
