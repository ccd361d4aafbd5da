#ifndef TSBLOCKS_SCHEMETYPE_H_
#define TSBLOCKS_SCHEMETYPE_H_
// ------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include "SchemeSet.hpp"
// ------------------------------------------------------------------------------
namespace tsblocks {
// ------------------------------------------------------------------------------
// Method tags. The numeric values are part of the wire format: a tag may
// never be renumbered or removed once blocks carrying it exist.
// ------------------------------------------------------------------------------
enum class TimestampSchemeType : uint8_t {
  EMPTY = 0,
  SINGLE = 1,
  PAIR = 2,
  DOUBLE_DELTA = 3,
  SCHEME_MAX = 4
};
// ------------------------------------------------------------------------------
enum class ValueSchemeType : uint8_t {
  CONSTANT = 0,
  NEAR_CONSTANT = 1,
  POWER_OF_2 = 2,
  MOSTLY_INTEGER = 3,
  LINEAR = 4,
  PERIODIC = 5,
  QUANTIZED = 6,
  SPARSE = 7,
  XOR = 8,
  DELTA = 9,
  SCHEME_MAX = 10
};
using ValueSchemeSet = SchemeSet<ValueSchemeType>;
// XOR and DELTA form the general path and cannot be disabled
inline ValueSchemeSet defaultValueSchemes() {
  return {ValueSchemeType::CONSTANT,       ValueSchemeType::NEAR_CONSTANT,
          ValueSchemeType::POWER_OF_2,     ValueSchemeType::MOSTLY_INTEGER,
          ValueSchemeType::LINEAR,         ValueSchemeType::PERIODIC,
          ValueSchemeType::QUANTIZED,      ValueSchemeType::SPARSE,
          ValueSchemeType::XOR,            ValueSchemeType::DELTA};
}
// ------------------------------------------------------------------------------
// When overriding schemes, pass this value to use automatic scheme selection.
constexpr auto autoScheme() {
  return 255;
}
// ------------------------------------------------------------------------------
std::string ConvertSchemeTypeToString(TimestampSchemeType type);
std::string ConvertSchemeTypeToString(ValueSchemeType type);
// Validate a tag byte read from the wire, throws UnknownMethodTag
TimestampSchemeType ParseTimestampSchemeType(uint8_t code);
ValueSchemeType ParseValueSchemeType(uint8_t code);
// ------------------------------------------------------------------------------
}  // namespace tsblocks
// ------------------------------------------------------------------------------
#endif  // TSBLOCKS_SCHEMETYPE_H_
