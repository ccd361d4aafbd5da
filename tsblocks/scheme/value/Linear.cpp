// -------------------------------------------------------------------------------------
#include "Linear.hpp"
#include "Patches.hpp"
// -------------------------------------------------------------------------------------
#include "common/Log.hpp"
#include "common/Utils.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
static inline DOUBLE reconstruct(DOUBLE start, DOUBLE delta, u32 row_i) {
  return start + CD(row_i) * delta;
}
// -------------------------------------------------------------------------------------
void Linear::compress(const DOUBLE* src,
                      const ValueStats& stats,
                      const Pattern&,
                      ByteWriter& dest) const {
  const u32 tuple_count = stats.tuple_count;
  const DOUBLE start = tuple_count > 0 ? src[0] : 0.0;
  const DOUBLE delta = tuple_count > 1 ? src[1] - src[0] : 0.0;
  Patches patches;
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    if (!Utils::bitEqual(reconstruct(start, delta, row_i), src[row_i])) {
      patches.add(row_i, src[row_i]);
    }
  }
  Log::debug("LINEAR: start {} delta {}, {} patches", start, delta, patches.size());
  dest.write<DOUBLE>(start);
  dest.write<DOUBLE>(delta);
  Varint::encode(tuple_count, dest);
  patches.write(dest);
}
// -------------------------------------------------------------------------------------
void Linear::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  const auto start = src.read<DOUBLE>();
  const auto delta = src.read<DOUBLE>();
  const auto count = Varint::decode(src);
  if (count != static_cast<s64>(tuple_count)) {
    throw CorruptPayload("linear run of " + std::to_string(count) + " values, expected " +
                         std::to_string(tuple_count));
  }
  auto patches = Patches::read(src, tuple_count);
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    dest[row_i] = reconstruct(start, delta, row_i);
  }
  patches.apply(dest);
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
