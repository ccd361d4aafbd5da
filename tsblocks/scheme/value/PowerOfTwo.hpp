#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// One varint exponent per value, -1 for values that are not 2^e with e >= 0,
// followed by the 8 byte literals of those values in order.
// -------------------------------------------------------------------------------------
class PowerOfTwo : public ValueScheme {
 public:
  static constexpr s64 LITERAL = -1;
  // -------------------------------------------------------------------------------------
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::POWER_OF_2; }
  bool usesPatches() const override { return true; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
