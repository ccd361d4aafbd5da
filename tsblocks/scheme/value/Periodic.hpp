#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// period (varint) | base pattern (period x 8 bytes) | deviation bit stream
//
// Every value after the first window is stored as the XOR residual against
// its counterpart in the base pattern, an exact repeat costs a single bit.
// -------------------------------------------------------------------------------------
class Periodic : public ValueScheme {
 public:
  void compress(const DOUBLE* src,
                const ValueStats& stats,
                const Pattern& pattern,
                ByteWriter& dest) const override;
  void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const override;
  bool isUsable(const ValueStats& stats, const Pattern& pattern) const override;
  std::string fullDescription(const Bytes& payload) const override;
  inline ValueSchemeType schemeType() const override { return staticSchemeType(); }
  inline static ValueSchemeType staticSchemeType() { return ValueSchemeType::PERIODIC; }

 private:
  static u32 choosePeriod(const ValueStats& stats, const Pattern& pattern);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
