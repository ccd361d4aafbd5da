#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// first value (8 bytes) | variant (1 byte) | deltas
//
// Deltas are wrapping differences of the IEEE-754 bit patterns, so every
// value including NaN payloads, infinities and signed zeros comes back
// exactly. The plain variant stores every delta as 8 bytes. The zero run
// variant stores zero/non zero markers run length encoded, followed by the
// non zero deltas only.
// -------------------------------------------------------------------------------------
class Delta : public ValueScheme {
 public:
  enum class Variant : u8 { PLAIN = 0, ZERO_RUN = 1 };
  // -------------------------------------------------------------------------------------
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  std::string fullDescription(const Bytes& payload) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::DELTA; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
