// -------------------------------------------------------------------------------------
#include "Sparse.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
static inline bool isPositiveZero(DOUBLE value) {
  return Utils::doubleToBits(value) == 0;
}
// -------------------------------------------------------------------------------------
bool Sparse::isUsable(const ValueStats& stats, const Pattern&) const {
  return stats.fraction(stats.nonZeroCount()) < SchemeConfig::get().values.sparse_nonzero_fraction;
}
// -------------------------------------------------------------------------------------
void Sparse::compress(const DOUBLE* src,
                      const ValueStats& stats,
                      const Pattern&,
                      ByteWriter& dest) const {
  vector<s64> gaps;
  vector<DOUBLE> non_zero;
  u32 previous_index = 0;
  for (u32 row_i = 0; row_i < stats.tuple_count; row_i++) {
    if (!isPositiveZero(src[row_i])) {
      gaps.push_back(row_i - previous_index);
      non_zero.push_back(src[row_i]);
      previous_index = row_i;
    }
  }
  // -------------------------------------------------------------------------------------
  Varint::encode(stats.tuple_count, dest);
  Varint::encode(static_cast<s64>(non_zero.size()), dest);
  Varint::encodeList(gaps, dest);
  for (auto value : non_zero) {
    dest.write<DOUBLE>(value);
  }
}
// -------------------------------------------------------------------------------------
void Sparse::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  const auto length = Varint::decode(src);
  if (length != static_cast<s64>(tuple_count)) {
    throw CorruptPayload("sparse series of " + std::to_string(length) + " values, expected " +
                         std::to_string(tuple_count));
  }
  const u64 non_zero_count = Varint::decodeCount(src, tuple_count);
  auto gaps = Varint::decodeList(src, non_zero_count);
  // -------------------------------------------------------------------------------------
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    dest[row_i] = 0.0;
  }
  s64 index = 0;
  for (u64 value_i = 0; value_i < non_zero_count; value_i++) {
    const s64 gap = gaps[value_i];
    if (gap < 0 || (value_i > 0 && gap == 0)) {
      throw CorruptPayload("sparse indices not increasing");
    }
    index += gap;
    if (index >= static_cast<s64>(tuple_count)) {
      throw CorruptPayload("sparse index " + std::to_string(index) + " beyond " +
                           std::to_string(tuple_count) + " values");
    }
    dest[index] = src.read<DOUBLE>();
  }
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
