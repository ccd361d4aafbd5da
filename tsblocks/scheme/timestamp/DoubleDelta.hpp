#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::timestamps {
// -------------------------------------------------------------------------------------
// initial (8 bytes) | first delta (varint) | run length encoded double deltas
//
// A regular interval has a double delta of zero everywhere and collapses to a
// single (0, n-2) run, independent of the series length.
// -------------------------------------------------------------------------------------
class DoubleDelta : public TimestampScheme {
 public:
  void compress(const TIMESTAMP* src, u32 tuple_count, ByteWriter& dest) const override;
  void decompress(TIMESTAMP* dest, u32 tuple_count, ByteReader& src) const override;
  bool isUsable(u32 tuple_count) const override { return tuple_count >= 3; }
  inline TimestampSchemeType schemeType() const override { return staticSchemeType(); }
  inline static TimestampSchemeType staticSchemeType() { return TimestampSchemeType::DOUBLE_DELTA; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::timestamps
// -------------------------------------------------------------------------------------
