// -------------------------------------------------------------------------------------
#include "SchemePicker.hpp"
// -------------------------------------------------------------------------------------
#include "common/Log.hpp"
#include "scheme/SchemePool.hpp"
// -------------------------------------------------------------------------------------
#include <utility>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
TimestampSchemeType SchemePicker::chooseTimestampScheme(u32 tuple_count) {
  switch (tuple_count) {
    case 0:
      return TimestampSchemeType::EMPTY;
    case 1:
      return TimestampSchemeType::SINGLE;
    case 2:
      return TimestampSchemeType::PAIR;
    default:
      return TimestampSchemeType::DOUBLE_DELTA;
  }
}
// -------------------------------------------------------------------------------------
TimestampPayload SchemePicker::compressTimestamps(const TIMESTAMP* src, u32 tuple_count) {
  const auto scheme_code = chooseTimestampScheme(tuple_count);
  const auto& scheme = SchemePool::getTimestampScheme(scheme_code);
  die_if(scheme.isUsable(tuple_count));
  ByteWriter writer;
  scheme.compress(src, tuple_count, writer);
  return {scheme_code, writer.release()};
}
// -------------------------------------------------------------------------------------
std::optional<ValueSchemeType> SchemePicker::preferredScheme(const Pattern& pattern) {
  switch (pattern.type) {
    case PatternType::CONSTANT:
      return ValueSchemeType::CONSTANT;
    case PatternType::NEAR_CONSTANT:
      return ValueSchemeType::NEAR_CONSTANT;
    case PatternType::SPARSE:
      return ValueSchemeType::SPARSE;
    case PatternType::POWER_OF_2:
      return ValueSchemeType::POWER_OF_2;
    case PatternType::MOSTLY_INTEGER:
      return ValueSchemeType::MOSTLY_INTEGER;
    case PatternType::PERIODIC:
      return ValueSchemeType::PERIODIC;
    case PatternType::LINEAR:
      return ValueSchemeType::LINEAR;
    case PatternType::QUANTIZED:
    case PatternType::QUANTIZED_STEPPED:
      return ValueSchemeType::QUANTIZED;
    case PatternType::SMOOTH:
    case PatternType::RANDOM:
      return std::nullopt;
  }
  UNREACHABLE();
}
// -------------------------------------------------------------------------------------
ValuePayload SchemePicker::compressWith(const ValueScheme& scheme,
                                        const ValueStats& stats,
                                        const Pattern& pattern) {
  ByteWriter writer;
  scheme.compress(stats.src, stats, pattern, writer);
  return {scheme.schemeType(), writer.release()};
}
// -------------------------------------------------------------------------------------
ValuePayload SchemePicker::compressGeneral(const ValueStats& stats, const Pattern& pattern) {
  auto xor_payload =
      compressWith(SchemePool::getValueScheme(ValueSchemeType::XOR), stats, pattern);
  auto delta_payload =
      compressWith(SchemePool::getValueScheme(ValueSchemeType::DELTA), stats, pattern);
  Log::debug("general path: XOR {} bytes, DELTA {} bytes", xor_payload.size(),
             delta_payload.size());
  return selectSmaller(std::move(xor_payload), std::move(delta_payload));
}
// -------------------------------------------------------------------------------------
ValuePayload SchemePicker::compressValues(const DOUBLE* src, u32 tuple_count) {
  auto stats = ValueStats::generateStats(src, tuple_count);
  auto pattern = PatternDetector::classify(stats);
  return compressValues(stats, pattern);
}
// -------------------------------------------------------------------------------------
ValuePayload SchemePicker::compressValues(const ValueStats& stats, const Pattern& pattern) {
  const auto& cfg = TsBlocksConfig::get().values;
  // -------------------------------------------------------------------------------------
  if (CB(cfg.override_scheme) != autoScheme()) {
    const auto& scheme = SchemePool::getValueScheme(cfg.override_scheme);
    if (scheme.isUsable(stats, pattern)) {
      Log::debug("{}: forced {}", pattern.toString(), scheme.selfDescription());
      return compressWith(scheme, stats, pattern);
    }
    Log::debug("{}: forced {} not usable, selecting automatically", pattern.toString(),
               scheme.selfDescription());
  }
  // -------------------------------------------------------------------------------------
  if (auto preferred = preferredScheme(pattern); preferred && cfg.schemes.isEnabled(*preferred)) {
    const auto& scheme = SchemePool::getValueScheme(*preferred);
    if (scheme.isUsable(stats, pattern)) {
      auto payload = compressWith(scheme, stats, pattern);
      if (scheme.usesPatches()) {
        payload = selectSmaller(std::move(payload), compressGeneral(stats, pattern));
      }
      Log::debug("{}: {} ({} B)", pattern.toString(), ConvertSchemeTypeToString(payload.scheme),
                 payload.size());
      return payload;
    }
  }
  auto payload = compressGeneral(stats, pattern);
  Log::debug("{}: {}", pattern.toString(), ConvertSchemeTypeToString(payload.scheme));
  return payload;
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
