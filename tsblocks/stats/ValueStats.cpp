// -------------------------------------------------------------------------------------
#include "ValueStats.hpp"
#include "common/Utils.hpp"
// -------------------------------------------------------------------------------------
#include <cmath>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
ValueStats ValueStats::generateStats(const DOUBLE* src, u32 tuple_count) {
  ValueStats stats(src, tuple_count);
  // -------------------------------------------------------------------------------------
  bool is_min_max_initialized = false;
  const u64 positive_zero = Utils::doubleToBits(0.0);
  u64 last_bits = 0;
  // -------------------------------------------------------------------------------------
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    const DOUBLE current_value = src[row_i];
    const u64 current_bits = Utils::doubleToBits(current_value);
    // -------------------------------------------------------------------------------------
    if (row_i > 0 && current_bits != last_bits) {
      stats.all_equal = false;
    }
    last_bits = current_bits;
    stats.distinct_values[current_bits]++;
    // -------------------------------------------------------------------------------------
    if (!std::isnan(current_value)) {
      if (!is_min_max_initialized) {
        stats.min = stats.max = current_value;
        is_min_max_initialized = true;
      } else if (current_value > stats.max) {
        stats.max = current_value;
      } else if (current_value < stats.min) {
        stats.min = current_value;
      }
    }
    // -------------------------------------------------------------------------------------
    if (current_value == 0.0) {
      stats.zero_count++;
    }
    if (current_bits == positive_zero) {
      stats.positive_zero_count++;
    }
    if (Utils::powerOfTwoExponent(current_value) >= 0) {
      stats.power_of_two_count++;
    }
    if (std::isfinite(current_value) && current_value == std::trunc(current_value)) {
      stats.integer_count++;
    }
  }
  if (!is_min_max_initialized && tuple_count > 0) {
    stats.min = stats.max = std::nan("");
  }
  // -------------------------------------------------------------------------------------
  stats.unique_count = CU(stats.distinct_values.size());
  // -------------------------------------------------------------------------------------
  return stats;
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
