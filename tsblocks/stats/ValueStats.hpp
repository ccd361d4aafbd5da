#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
// -------------------------------------------------------------------------------------
#include <map>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
// One pass statistics over a value column. Values are keyed by their bit
// pattern so that NaN payloads and signed zeros stay distinct.
// -------------------------------------------------------------------------------------
struct ValueStats {
 public:
  ValueStats(const DOUBLE* src, u32 tuple_count) : src(src), tuple_count(tuple_count) {}
  ValueStats() = delete;
  // -------------------------------------------------------------------------------------
  const DOUBLE* src;
  std::map<u64, u32> distinct_values;  // bit pattern -> occurrences
  DOUBLE min{0};                        // NaN ignored
  DOUBLE max{0};
  // -------------------------------------------------------------------------------------
  u32 tuple_count;
  u32 unique_count{0};
  u32 zero_count{0};           // == 0.0, either sign
  u32 positive_zero_count{0};  // bit pattern of +0.0
  u32 power_of_two_count{0};   // 2^e with e >= 0
  u32 integer_count{0};        // finite and equal to its truncation
  bool all_equal{true};
  // -------------------------------------------------------------------------------------
  [[nodiscard]] u32 nonZeroCount() const { return tuple_count - positive_zero_count; }
  [[nodiscard]] DOUBLE range() const { return max - min; }
  [[nodiscard]] DOUBLE fraction(u32 count) const {
    return tuple_count == 0 ? 0.0 : CD(count) / CD(tuple_count);
  }
  // -------------------------------------------------------------------------------------
  static ValueStats generateStats(const DOUBLE* src, u32 tuple_count);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
