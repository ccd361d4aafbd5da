#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// base (8 bytes) | precision (8 bytes) | quantized deviations (varint) | patches
//
// Values are reconstructed as base + q * precision. Every position where
// that does not give back the exact bit pattern is patched.
// -------------------------------------------------------------------------------------
class NearConstant : public ValueScheme {
 public:
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::NEAR_CONSTANT; }
  bool usesPatches() const override { return true; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
