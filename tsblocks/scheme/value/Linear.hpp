#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// start (8 bytes) | delta (8 bytes) | count (varint) | patches
// Decodes to start + i * delta, patched where that is not exact.
// -------------------------------------------------------------------------------------
class Linear : public ValueScheme {
 public:
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::LINEAR; }
  bool usesPatches() const override { return true; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
