#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
#include "scheme/SchemeConfig.hpp"
#include "stats/ValueStats.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
enum class PatternType : u8 {
  CONSTANT,
  NEAR_CONSTANT,
  SPARSE,
  POWER_OF_2,
  MOSTLY_INTEGER,
  PERIODIC,
  LINEAR,
  QUANTIZED,
  QUANTIZED_STEPPED,
  SMOOTH,
  RANDOM
};
string ConvertPatternTypeToString(PatternType type);
// -------------------------------------------------------------------------------------
struct Pattern {
  PatternType type;
  u32 period{0};  // only set for PERIODIC
  bool operator==(const Pattern& other) const {
    return type == other.type && period == other.period;
  }
  [[nodiscard]] string toString() const;
};
// -------------------------------------------------------------------------------------
// Heuristic shape classification of a value column. The result only steers
// scheme selection: a wrong guess costs compression ratio, never
// correctness.
// -------------------------------------------------------------------------------------
class PatternDetector {
 public:
  static Pattern classify(const ValueStats& stats, const SchemeConfig& config = SchemeConfig::get());
  static Pattern classify(const vector<DOUBLE>& values,
                          const SchemeConfig& config = SchemeConfig::get());
  // -------------------------------------------------------------------------------------
  // First candidate period the series repeats exactly (within tolerance), 0 if none
  static u32 findRepeatingPeriod(const DOUBLE* src, u32 tuple_count, const SchemeConfig& config);
  // First candidate period with a small average lag difference, 0 if none
  static u32 findSimilarPeriod(const ValueStats& stats, const SchemeConfig& config);

 private:
  static bool hasConstantDeltas(const DOUBLE* src, u32 tuple_count, const SchemeConfig& config);
  static bool isStepped(const ValueStats& stats, const SchemeConfig& config);
  static DOUBLE variance(const DOUBLE* src, u32 tuple_count);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
