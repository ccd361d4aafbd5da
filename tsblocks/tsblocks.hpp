// ------------------------------------------------------------------------------
// tsblocks - Generic C++ interface
// ------------------------------------------------------------------------------
#ifndef TSBLOCKS_H_
#define TSBLOCKS_H_
// ------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <functional>
// ------------------------------------------------------------------------------
#include "scheme/SchemeConfig.hpp"
#include "scheme/SchemeType.hpp"
// ------------------------------------------------------------------------------
namespace tsblocks {
// ------------------------------------------------------------------------------
// Global configuation used by the compression interface
// ------------------------------------------------------------------------------
struct TsBlocksConfig {
  // clang-format off
  struct {
    ValueSchemeSet schemes{defaultValueSchemes()};     // enabled value schemes
    ValueSchemeType override_scheme{static_cast<ValueSchemeType>(autoScheme())};  // use whenever usable
  } values;

  struct {
    uint32_t max_point_count{1u << 24};                // samples per block, checked on encode and decode
  } blocks;

  struct {
    size_t grain_size{16};                             // series per tbb task in the batch compressor
  } batch;
  // clang-format on

  /// Get the global configuration instance.
  /// This is a singleton, so you can modify it to change the compression behaviour.
  /// Decoding only depends on it through blocks.max_point_count: every scheme stays
  /// registered for decompression, whether it is enabled for compression or not.
  ///
  /// Updating this while compression is still running on another thread is not safe.
  static TsBlocksConfig& get() {
    static TsBlocksConfig config;
    return config;
  }

  /// Call this during program startup to configure the compression interface.
  /// The passed function can modify both the global config and the scheme
  /// thresholds (SchemeConfig).
  static void configure(
      const std::function<void(TsBlocksConfig&, SchemeConfig&)>& f = [](TsBlocksConfig&,
                                                                      SchemeConfig&) {});
};
// ------------------------------------------------------------------------------
}  // namespace tsblocks

#endif  // TSBLOCKS_H_
