// -------------------------------------------------------------------------------------
#include "PowerOfTwo.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
#include <cmath>
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// largest finite power of two
static constexpr s64 max_exponent = 1023;
// -------------------------------------------------------------------------------------
void PowerOfTwo::compress(const DOUBLE* src,
                          const ValueStats& stats,
                          const Pattern&,
                          ByteWriter& dest) const {
  vector<s64> exponents;
  vector<DOUBLE> literals;
  exponents.reserve(stats.tuple_count);
  for (u32 row_i = 0; row_i < stats.tuple_count; row_i++) {
    const s32 exponent = Utils::powerOfTwoExponent(src[row_i]);
    if (exponent >= 0) {
      exponents.push_back(exponent);
    } else {
      exponents.push_back(LITERAL);
      literals.push_back(src[row_i]);
    }
  }
  Varint::encodeList(exponents, dest);
  for (auto literal : literals) {
    dest.write<DOUBLE>(literal);
  }
}
// -------------------------------------------------------------------------------------
void PowerOfTwo::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  auto exponents = Varint::decodeList(src, tuple_count);
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    const s64 exponent = exponents[row_i];
    if (exponent == LITERAL) {
      continue;
    }
    if (exponent < 0 || exponent > max_exponent) {
      throw CorruptPayload("power of two exponent " + std::to_string(exponent));
    }
    dest[row_i] = std::ldexp(1.0, CI(exponent));
  }
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    if (exponents[row_i] == LITERAL) {
      dest[row_i] = src.read<DOUBLE>();
    }
  }
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
