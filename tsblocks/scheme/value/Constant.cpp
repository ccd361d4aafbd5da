// -------------------------------------------------------------------------------------
#include "Constant.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
bool Constant::isUsable(const ValueStats& stats, const Pattern&) const {
  return stats.tuple_count > 0 && stats.all_equal;
}
// -------------------------------------------------------------------------------------
void Constant::compress(const DOUBLE* src,
                        const ValueStats& stats,
                        const Pattern&,
                        ByteWriter& dest) const {
  die_if(stats.tuple_count > 0);
  dest.write<DOUBLE>(src[0]);
  dest.write<u64>(stats.tuple_count);
}
// -------------------------------------------------------------------------------------
void Constant::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  const auto value = src.read<DOUBLE>();
  const auto count = src.read<u64>();
  if (count != tuple_count) {
    throw CorruptPayload("constant run of " + std::to_string(count) + " values, expected " +
                         std::to_string(tuple_count));
  }
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    dest[row_i] = value;
  }
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
