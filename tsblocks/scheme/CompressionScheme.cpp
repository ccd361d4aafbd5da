// -------------------------------------------------------------------------------------
#include "CompressionScheme.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
string ConvertSchemeTypeToString(TimestampSchemeType type) {
  switch (type) {
    case TimestampSchemeType::EMPTY:
      return "EMPTY";
    case TimestampSchemeType::SINGLE:
      return "SINGLE";
    case TimestampSchemeType::PAIR:
      return "PAIR";
    case TimestampSchemeType::DOUBLE_DELTA:
      return "DOUBLE_DELTA";
    default:
      throw Generic_Exception("Unknown TimestampSchemeType");
  }
}
// -------------------------------------------------------------------------------------
string ConvertSchemeTypeToString(ValueSchemeType type) {
  switch (type) {
    case ValueSchemeType::CONSTANT:
      return "CONSTANT";
    case ValueSchemeType::NEAR_CONSTANT:
      return "NEAR_CONSTANT";
    case ValueSchemeType::POWER_OF_2:
      return "POWER_OF_2";
    case ValueSchemeType::MOSTLY_INTEGER:
      return "MOSTLY_INTEGER";
    case ValueSchemeType::LINEAR:
      return "LINEAR";
    case ValueSchemeType::PERIODIC:
      return "PERIODIC";
    case ValueSchemeType::QUANTIZED:
      return "QUANTIZED";
    case ValueSchemeType::SPARSE:
      return "SPARSE";
    case ValueSchemeType::XOR:
      return "XOR";
    case ValueSchemeType::DELTA:
      return "DELTA";
    default:
      throw Generic_Exception("Unknown ValueSchemeType");
  }
}
// -------------------------------------------------------------------------------------
TimestampSchemeType ParseTimestampSchemeType(uint8_t code) {
  if (code >= CB(TimestampSchemeType::SCHEME_MAX)) {
    throw UnknownMethodTag("timestamp tag " + std::to_string(code));
  }
  return static_cast<TimestampSchemeType>(code);
}
// -------------------------------------------------------------------------------------
ValueSchemeType ParseValueSchemeType(uint8_t code) {
  if (code >= CB(ValueSchemeType::SCHEME_MAX)) {
    throw UnknownMethodTag("value tag " + std::to_string(code));
  }
  return static_cast<ValueSchemeType>(code);
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
