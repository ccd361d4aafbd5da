#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
#include "encoding/ByteBuffer.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
struct RunLengthPair {
  s64 value;
  u64 count;  // >= 1
  bool operator==(const RunLengthPair& other) const {
    return value == other.value && count == other.count;
  }
};
// -------------------------------------------------------------------------------------
// Collapses maximal runs of equal adjacent integers. The wire form is a
// flat list of (value, count) varint pairs.
// -------------------------------------------------------------------------------------
class RunLength {
 public:
  static vector<RunLengthPair> encode(const s64* src, SIZE count);
  static vector<RunLengthPair> encode(const vector<s64>& src) { return encode(src.data(), src.size()); }
  static vector<s64> decode(const vector<RunLengthPair>& runs);
  // -------------------------------------------------------------------------------------
  static void write(const vector<RunLengthPair>& runs, ByteWriter& dest);
  // Reads pairs until their counts add up to exactly total_count
  static vector<RunLengthPair> read(ByteReader& src, u64 total_count);
  // -------------------------------------------------------------------------------------
  static u64 expandedCount(const vector<RunLengthPair>& runs);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
