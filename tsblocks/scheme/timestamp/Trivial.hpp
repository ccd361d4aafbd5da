#pragma once
// -------------------------------------------------------------------------------------
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
// Schemes for series too short to carry a delta chain
// -------------------------------------------------------------------------------------
namespace tsblocks::timestamps {
// -------------------------------------------------------------------------------------
class Empty : public TimestampScheme {
 public:
  void compress(const TIMESTAMP*, u32, ByteWriter&) const override {}
  void decompress(TIMESTAMP*, u32, ByteReader&) const override {}
  bool isUsable(u32 tuple_count) const override { return tuple_count == 0; }
  inline TimestampSchemeType schemeType() const override { return staticSchemeType(); }
  inline static TimestampSchemeType staticSchemeType() { return TimestampSchemeType::EMPTY; }
};
// -------------------------------------------------------------------------------------
// t[0] as 8 bytes
class Single : public TimestampScheme {
 public:
  void compress(const TIMESTAMP* src, u32 tuple_count, ByteWriter& dest) const override;
  void decompress(TIMESTAMP* dest, u32 tuple_count, ByteReader& src) const override;
  bool isUsable(u32 tuple_count) const override { return tuple_count == 1; }
  inline TimestampSchemeType schemeType() const override { return staticSchemeType(); }
  inline static TimestampSchemeType staticSchemeType() { return TimestampSchemeType::SINGLE; }
};
// -------------------------------------------------------------------------------------
// t[0] as 8 bytes, t[1] - t[0] as varint
class Pair : public TimestampScheme {
 public:
  void compress(const TIMESTAMP* src, u32 tuple_count, ByteWriter& dest) const override;
  void decompress(TIMESTAMP* dest, u32 tuple_count, ByteReader& src) const override;
  bool isUsable(u32 tuple_count) const override { return tuple_count == 2; }
  inline TimestampSchemeType schemeType() const override { return staticSchemeType(); }
  inline static TimestampSchemeType staticSchemeType() { return TimestampSchemeType::PAIR; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::timestamps
// -------------------------------------------------------------------------------------
