#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// Integer parts as varints, then (index gap, fraction) pairs for the
// positions the integer part alone does not reproduce. A stored integer part
// of 0 means the fraction holds the whole value, which covers -0.0, values
// without an exact int64 part and non finite values.
// -------------------------------------------------------------------------------------
class MostlyInteger : public ValueScheme {
 public:
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::MOSTLY_INTEGER; }
  bool usesPatches() const override { return true; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
