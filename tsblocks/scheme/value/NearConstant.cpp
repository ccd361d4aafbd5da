// -------------------------------------------------------------------------------------
#include "NearConstant.hpp"
#include "Patches.hpp"
// -------------------------------------------------------------------------------------
#include "common/Log.hpp"
#include "common/Utils.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
#include <algorithm>
#include <cmath>
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
// quantized deviations beyond this are not attempted
static constexpr DOUBLE max_quantized = 4611686018427387904.0;  // 2^62
// -------------------------------------------------------------------------------------
static inline DOUBLE reconstruct(DOUBLE base, s64 quantized, DOUBLE precision) {
  return base + CD(quantized) * precision;
}
// -------------------------------------------------------------------------------------
void NearConstant::compress(const DOUBLE* src,
                            const ValueStats& stats,
                            const Pattern&,
                            ByteWriter& dest) const {
  const auto& cfg = SchemeConfig::get().values;
  const DOUBLE base = std::isfinite(stats.min) ? stats.min : 0.0;
  DOUBLE max_deviation = 0;
  for (u32 row_i = 0; row_i < stats.tuple_count; row_i++) {
    if (std::isfinite(src[row_i])) {
      max_deviation = std::max(max_deviation, std::abs(src[row_i] - base));
    }
  }
  const DOUBLE precision =
      std::max(cfg.near_constant_min_precision, max_deviation / cfg.near_constant_precision_divisor);
  // -------------------------------------------------------------------------------------
  vector<s64> quantized(stats.tuple_count, 0);
  Patches patches;
  for (u32 row_i = 0; row_i < stats.tuple_count; row_i++) {
    const DOUBLE scaled = (src[row_i] - base) / precision;
    if (std::abs(scaled) < max_quantized) {
      quantized[row_i] = std::llround(scaled);
    }
    if (!Utils::bitEqual(reconstruct(base, quantized[row_i], precision), src[row_i])) {
      quantized[row_i] = 0;
      patches.add(row_i, src[row_i]);
    }
  }
  Log::debug("NEAR_CONSTANT: precision {}, {} patches", precision, patches.size());
  // -------------------------------------------------------------------------------------
  dest.write<DOUBLE>(base);
  dest.write<DOUBLE>(precision);
  Varint::encodeList(quantized, dest);
  patches.write(dest);
}
// -------------------------------------------------------------------------------------
void NearConstant::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  const auto base = src.read<DOUBLE>();
  const auto precision = src.read<DOUBLE>();
  auto quantized = Varint::decodeList(src, tuple_count);
  auto patches = Patches::read(src, tuple_count);
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    dest[row_i] = reconstruct(base, quantized[row_i], precision);
  }
  patches.apply(dest);
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
