#ifndef TSBLOCKS_SCHEMECONFIG_H_
#define TSBLOCKS_SCHEMECONFIG_H_
// ------------------------------------------------------------------------------
// Pattern detection and scheme-specific configuration options. You probably
// don't want to change these unless you really know what you are doing.
// ------------------------------------------------------------------------------
#include <cstdint>
#include <vector>
// ------------------------------------------------------------------------------
namespace tsblocks {
// ------------------------------------------------------------------------------
struct SchemeConfig {
  // ------------------------------------------------------------------------------
  struct {
    // series shorter than this are never analysed further
    uint32_t min_length{3};
    // max - min below this is considered near constant
    double near_constant_range{1e-6};
    // fraction of exact zeros above which a series counts as sparse
    double sparse_zero_fraction{0.5};
    // fraction of exact powers of two for POWER_OF_2
    double power_of_two_fraction{0.7};
    // fraction of integer valued samples for MOSTLY_INTEGER
    double integer_fraction{0.8};
    // candidate periods, tried in order. A period is only considered when
    // the series repeats it at least three times
    std::vector<uint32_t> periodic_candidates{2, 3, 4, 5, 6, 8, 12, 24, 60, 300};
    // maximum absolute difference of a value to its counterpart in the first window
    double periodic_tolerance{1e-10};
    // also accept periods whose average lag difference is small relative
    // to the value range (looser, catches noisy seasonality)
    bool periodic_lag_similarity{false};
    double periodic_lag_range_fraction{0.1};
    // variance of the first differences below this is LINEAR
    double linear_delta_variance{1e-10};
    // unique values <= min(max_unique, length / unique_divisor) is QUANTIZED
    uint32_t quantized_max_unique{50};
    uint32_t quantized_unique_divisor{5};
    // QUANTIZED_STEPPED when the sorted dictionary has at most this many distinct gaps
    uint32_t quantized_stepped_max_gaps{3};
    // variance about the mean below this is SMOOTH, everything else RANDOM
    double smooth_variance{100};
  } detection;
  // ------------------------------------------------------------------------------
  struct {
    // NEAR_CONSTANT quantization step: max(min_precision, max |deviation| / divisor)
    double near_constant_min_precision{1e-6};
    double near_constant_precision_divisor{1000};
    // SPARSE is only used when fewer than this fraction of samples are non zero
    double sparse_nonzero_fraction{0.3};
    // DELTA switches to its zero-run variant above this fraction of zero deltas
    double delta_zero_run_fraction{0.7};
  } values;
  // ------------------------------------------------------------------------------
  // The two detector variants. Standard is the default.
  static SchemeConfig standard() { return SchemeConfig{}; }
  static SchemeConfig enhanced() {
    SchemeConfig config;
    config.detection.sparse_zero_fraction = 0.3;
    config.detection.periodic_lag_similarity = true;
    return config;
  }
  // ------------------------------------------------------------------------------
  static SchemeConfig& get() {
    static SchemeConfig instance;
    return instance;
  }
  // ------------------------------------------------------------------------------
};
// ------------------------------------------------------------------------------
}  // namespace tsblocks
// ------------------------------------------------------------------------------
#endif
