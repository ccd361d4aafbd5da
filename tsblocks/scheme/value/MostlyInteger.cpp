// -------------------------------------------------------------------------------------
#include "MostlyInteger.hpp"
#include "Patches.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
#include <cmath>
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// integers beyond 2^53 are not all representable, leave them to the fractions
static constexpr DOUBLE max_integer_part = 9007199254740992.0;
// -------------------------------------------------------------------------------------
static inline DOUBLE combine(s64 integer_part, DOUBLE fraction) {
  return integer_part == 0 ? fraction : CD(integer_part) + fraction;
}
// -------------------------------------------------------------------------------------
void MostlyInteger::compress(const DOUBLE* src,
                             const ValueStats& stats,
                             const Pattern&,
                             ByteWriter& dest) const {
  vector<s64> integer_parts(stats.tuple_count, 0);
  // fractions reuse the patch layout: index gap plus 8 byte literal
  Patches fractions;
  for (u32 row_i = 0; row_i < stats.tuple_count; row_i++) {
    const DOUBLE value = src[row_i];
    if (std::abs(value) < max_integer_part) {
      const DOUBLE truncated = std::trunc(value);
      const s64 integer_part = static_cast<s64>(truncated);
      if (Utils::bitEqual(CD(integer_part), value)) {
        integer_parts[row_i] = integer_part;
        continue;
      }
      const DOUBLE fraction = value - truncated;
      if (Utils::bitEqual(combine(integer_part, fraction), value)) {
        integer_parts[row_i] = integer_part;
        fractions.add(row_i, fraction);
        continue;
      }
    }
    integer_parts[row_i] = 0;
    fractions.add(row_i, value);
  }
  Varint::encodeList(integer_parts, dest);
  fractions.write(dest);
}
// -------------------------------------------------------------------------------------
void MostlyInteger::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  auto integer_parts = Varint::decodeList(src, tuple_count);
  auto fractions = Patches::read(src, tuple_count);
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    dest[row_i] = CD(integer_parts[row_i]);
  }
  for (const auto& fraction : fractions.entries()) {
    dest[fraction.index] = combine(integer_parts[fraction.index], fraction.value);
  }
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
