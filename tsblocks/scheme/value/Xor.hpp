#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
#include "encoding/BitStream.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// Gorilla style float compression: the first value as 8 byte literal, then a
// bit stream with one residual per later value, the XOR of its bit pattern
// with the predecessor's.
//
// Residual layout:
//   0                                    residual is zero
//   1 | leading (6) | significant (6) | significant bits
// A significant bit count of 64 does not fit six bits and is stored as 0.
// -------------------------------------------------------------------------------------
class Xor : public ValueScheme {
 public:
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::XOR; }
  // -------------------------------------------------------------------------------------
  static void writeResidual(BitWriter& writer, u64 residual);
  // throws CorruptXorStream when the field widths do not add up
  static u64 readResidual(BitReader& reader);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
