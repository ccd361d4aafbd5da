#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// length (varint) | non zero count (varint) | first index, then gaps (varint)
// | non zero values (8 bytes each)
//
// Anything but the bit pattern of +0.0 counts as non zero, so -0.0 and NaN
// survive. Only usable when few values are non zero.
// -------------------------------------------------------------------------------------
class Sparse : public ValueScheme {
 public:
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  bool isUsable(const ValueStats& stats, const Pattern& pattern) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::SPARSE; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
