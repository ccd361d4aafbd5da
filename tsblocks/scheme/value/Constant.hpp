#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// value (8 bytes) | count (8 bytes), independent of the series length
// -------------------------------------------------------------------------------------
class Constant : public ValueScheme {
 public:
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  bool isUsable(const ValueStats& stats, const Pattern& pattern) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::CONSTANT; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
