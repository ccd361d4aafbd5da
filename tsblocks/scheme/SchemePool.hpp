#pragma once
#include "scheme/CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
#include <unordered_map>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
struct SchemesCollection {
  std::unordered_map<TimestampSchemeType, unique_ptr<TimestampScheme>> timestamp_schemes;
  std::unordered_map<ValueSchemeType, unique_ptr<ValueScheme>> value_schemes;
  SchemesCollection();
};
// -------------------------------------------------------------------------------------
// Tag -> scheme registry. Built once on first use and never mutated
// afterwards, so concurrent lookups need no locking. Every scheme is
// registered, whether it is enabled for compression or not.
// -------------------------------------------------------------------------------------
class SchemePool {
 public:
  static const SchemesCollection& get();
  // -------------------------------------------------------------------------------------
  // throw UnknownMethodTag when nothing is registered under the tag
  static const TimestampScheme& getTimestampScheme(TimestampSchemeType type);
  static const ValueScheme& getValueScheme(ValueSchemeType type);
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
