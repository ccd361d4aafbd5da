#pragma once
// -------------------------------------------------------------------------------------
#include "tsblocks.hpp"
#include "common/Units.hpp"
// -------------------------------------------------------------------------------------
#include "compression/PatternDetector.hpp"
#include "scheme/CompressionScheme.hpp"
#include "stats/ValueStats.hpp"
// -------------------------------------------------------------------------------------
#include <optional>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
// Chooses the scheme for a column and encodes it. Encoding never fails: a
// scheme that is disabled or not usable for the data falls back to the
// general path, which runs both XOR and DELTA and keeps the smaller result.
// -------------------------------------------------------------------------------------
class SchemePicker {
 public:
  static TimestampSchemeType chooseTimestampScheme(u32 tuple_count);
  static TimestampPayload compressTimestamps(const TIMESTAMP* src, u32 tuple_count);
  // -------------------------------------------------------------------------------------
  static ValuePayload compressValues(const DOUBLE* src, u32 tuple_count);
  static ValuePayload compressValues(const ValueStats& stats, const Pattern& pattern);
  // XOR versus DELTA, the smaller wins, XOR on a tie
  static ValuePayload compressGeneral(const ValueStats& stats, const Pattern& pattern);
  // Encodes with exactly this scheme, the caller checked isUsable
  static ValuePayload compressWith(const ValueScheme& scheme,
                                   const ValueStats& stats,
                                   const Pattern& pattern);
  // -------------------------------------------------------------------------------------
  // The dedicated scheme of a pattern, nothing for SMOOTH and RANDOM
  static std::optional<ValueSchemeType> preferredScheme(const Pattern& pattern);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
