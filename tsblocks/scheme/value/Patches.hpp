#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
#include "encoding/ByteBuffer.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// Literal values for the positions an approximate representation does not
// reproduce bit-exactly. Wire form: count (varint), then per patch the gap to
// the previous index (varint, the first relative to 0) and the 8 byte value.
// -------------------------------------------------------------------------------------
struct Patch {
  u32 index;
  DOUBLE value;
};
// -------------------------------------------------------------------------------------
class Patches {
 public:
  // indices must be strictly increasing
  void add(u32 index, DOUBLE value) { patches.push_back({index, value}); }
  [[nodiscard]] SIZE size() const { return patches.size(); }
  [[nodiscard]] const vector<Patch>& entries() const { return patches; }
  // -------------------------------------------------------------------------------------
  void write(ByteWriter& dest) const;
  static Patches read(ByteReader& src, u32 tuple_count);
  void apply(DOUBLE* dest) const;

 private:
  vector<Patch> patches;
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
