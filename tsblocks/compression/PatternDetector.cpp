// -------------------------------------------------------------------------------------
#include "PatternDetector.hpp"
// -------------------------------------------------------------------------------------
#include "common/Log.hpp"
#include "common/Utils.hpp"
// -------------------------------------------------------------------------------------
#include <algorithm>
#include <cmath>
#include <set>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
string ConvertPatternTypeToString(PatternType type) {
  switch (type) {
    case PatternType::CONSTANT:
      return "CONSTANT";
    case PatternType::NEAR_CONSTANT:
      return "NEAR_CONSTANT";
    case PatternType::SPARSE:
      return "SPARSE";
    case PatternType::POWER_OF_2:
      return "POWER_OF_2";
    case PatternType::MOSTLY_INTEGER:
      return "MOSTLY_INTEGER";
    case PatternType::PERIODIC:
      return "PERIODIC";
    case PatternType::LINEAR:
      return "LINEAR";
    case PatternType::QUANTIZED:
      return "QUANTIZED";
    case PatternType::QUANTIZED_STEPPED:
      return "QUANTIZED_STEPPED";
    case PatternType::SMOOTH:
      return "SMOOTH";
    case PatternType::RANDOM:
      return "RANDOM";
  }
  throw Generic_Exception("Unknown PatternType");
}
// -------------------------------------------------------------------------------------
string Pattern::toString() const {
  if (type == PatternType::PERIODIC) {
    return ConvertPatternTypeToString(type) + "(" + std::to_string(period) + ")";
  }
  return ConvertPatternTypeToString(type);
}
// -------------------------------------------------------------------------------------
Pattern PatternDetector::classify(const vector<DOUBLE>& values, const SchemeConfig& config) {
  auto stats = ValueStats::generateStats(values.data(), CU(values.size()));
  return classify(stats, config);
}
// -------------------------------------------------------------------------------------
Pattern PatternDetector::classify(const ValueStats& stats, const SchemeConfig& config) {
  const auto& cfg = config.detection;
  const u32 tuple_count = stats.tuple_count;
  // Too short to say anything, the sparse/general path handles it
  if (tuple_count < cfg.min_length) {
    return {PatternType::SPARSE};
  }
  if (stats.all_equal) {
    return {PatternType::CONSTANT};
  }
  if (stats.range() < cfg.near_constant_range) {
    return {PatternType::NEAR_CONSTANT};
  }
  if (stats.fraction(stats.zero_count) > cfg.sparse_zero_fraction) {
    return {PatternType::SPARSE};
  }
  // Exact repetition is checked before the value-shape tests: a series like
  // 1,2,3,1,2,3,... is integer valued but far better served by its period
  if (u32 period = findRepeatingPeriod(stats.src, tuple_count, config); period != 0) {
    return {PatternType::PERIODIC, period};
  }
  if (stats.fraction(stats.power_of_two_count) > cfg.power_of_two_fraction) {
    return {PatternType::POWER_OF_2};
  }
  if (stats.fraction(stats.integer_count) > cfg.integer_fraction) {
    return {PatternType::MOSTLY_INTEGER};
  }
  if (cfg.periodic_lag_similarity) {
    if (u32 period = findSimilarPeriod(stats, config); period != 0) {
      return {PatternType::PERIODIC, period};
    }
  }
  if (hasConstantDeltas(stats.src, tuple_count, config)) {
    return {PatternType::LINEAR};
  }
  const u32 unique_limit =
      std::min(cfg.quantized_max_unique, tuple_count / std::max(cfg.quantized_unique_divisor, 1u));
  if (stats.unique_count <= unique_limit) {
    return {isStepped(stats, config) ? PatternType::QUANTIZED_STEPPED : PatternType::QUANTIZED};
  }
  if (variance(stats.src, tuple_count) < cfg.smooth_variance) {
    return {PatternType::SMOOTH};
  }
  return {PatternType::RANDOM};
}
// -------------------------------------------------------------------------------------
u32 PatternDetector::findRepeatingPeriod(const DOUBLE* src,
                                         u32 tuple_count,
                                         const SchemeConfig& config) {
  const auto& cfg = config.detection;
  for (u32 period : cfg.periodic_candidates) {
    if (period == 0 || CS(period) * 3 > tuple_count) {
      continue;
    }
    bool is_repeating = true;
    for (u32 row_i = period; row_i < tuple_count; row_i++) {
      // NaN never compares within tolerance, such series are not periodic
      if (!(std::abs(src[row_i] - src[row_i % period]) <= cfg.periodic_tolerance)) {
        is_repeating = false;
        break;
      }
    }
    if (is_repeating) {
      return period;
    }
  }
  return 0;
}
// -------------------------------------------------------------------------------------
u32 PatternDetector::findSimilarPeriod(const ValueStats& stats, const SchemeConfig& config) {
  const auto& cfg = config.detection;
  const DOUBLE value_range = stats.range();
  if (!(value_range > 0) || !std::isfinite(value_range)) {
    return 0;
  }
  for (u32 period : cfg.periodic_candidates) {
    if (period == 0 || CS(period) * 3 > stats.tuple_count) {
      continue;
    }
    DOUBLE diff_sum = 0;
    for (u32 row_i = period; row_i < stats.tuple_count; row_i++) {
      diff_sum += std::abs(stats.src[row_i] - stats.src[row_i - period]);
    }
    const DOUBLE average_diff = diff_sum / CD(stats.tuple_count - period);
    if (average_diff / value_range < cfg.periodic_lag_range_fraction) {
      return period;
    }
  }
  return 0;
}
// -------------------------------------------------------------------------------------
bool PatternDetector::hasConstantDeltas(const DOUBLE* src,
                                        u32 tuple_count,
                                        const SchemeConfig& config) {
  vector<DOUBLE> deltas;
  deltas.reserve(tuple_count - 1);
  for (u32 row_i = 1; row_i < tuple_count; row_i++) {
    deltas.push_back(src[row_i] - src[row_i - 1]);
  }
  const DOUBLE delta_variance = variance(deltas.data(), CU(deltas.size()));
  return delta_variance < config.detection.linear_delta_variance;
}
// -------------------------------------------------------------------------------------
bool PatternDetector::isStepped(const ValueStats& stats, const SchemeConfig& config) {
  // distinct_values is ordered by bit pattern, not by value
  vector<DOUBLE> sorted_unique;
  sorted_unique.reserve(stats.unique_count);
  for (const auto& entry : stats.distinct_values) {
    const DOUBLE value = Utils::bitsToDouble(entry.first);
    if (!std::isnan(value)) {
      sorted_unique.push_back(value);
    }
  }
  std::sort(sorted_unique.begin(), sorted_unique.end());
  if (sorted_unique.size() < 3) {
    return false;
  }
  std::set<DOUBLE> gaps;
  for (SIZE i = 1; i < sorted_unique.size(); i++) {
    gaps.insert(sorted_unique[i] - sorted_unique[i - 1]);
    if (gaps.size() > config.detection.quantized_stepped_max_gaps) {
      return false;
    }
  }
  return true;
}
// -------------------------------------------------------------------------------------
DOUBLE PatternDetector::variance(const DOUBLE* src, u32 tuple_count) {
  if (tuple_count == 0) {
    return 0;
  }
  DOUBLE mean = 0;
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    mean += src[row_i];
  }
  mean /= CD(tuple_count);
  DOUBLE sum = 0;
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    const DOUBLE diff = src[row_i] - mean;
    sum += diff * diff;
  }
  // NaN propagates and fails every "< threshold" test
  return sum / CD(tuple_count);
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
