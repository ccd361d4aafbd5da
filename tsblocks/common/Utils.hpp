#pragma once
// -------------------------------------------------------------------------------------
#include <cmath>
#include <cstring>
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
class Utils {
 public:
  static u64 doubleToBits(DOUBLE value) {
    u64 bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
  }

  static DOUBLE bitsToDouble(u64 bits) {
    DOUBLE value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }

  // IEEE-754 identity: distinguishes -0.0 from 0.0 and compares NaN payloads
  static bool bitEqual(DOUBLE a, DOUBLE b) { return doubleToBits(a) == doubleToBits(b); }

  static u32 countLeadingZeros(u64 value) {
    if (value == 0) {
      return 64;
    }
    return CU(__builtin_clzll(value));
  }

  static u32 countTrailingZeros(u64 value) {
    if (value == 0) {
      return 64;
    }
    return CU(__builtin_ctzll(value));
  }

  // Exponent e >= 0 with value == 2^e, or -1
  static s32 powerOfTwoExponent(DOUBLE value) {
    if (!(value >= 1.0) || std::isinf(value)) {
      return -1;
    }
    int exponent;
    DOUBLE mantissa = std::frexp(value, &exponent);
    if (mantissa != 0.5) {
      return -1;
    }
    return exponent - 1;
  }

  // Wrapping arithmetic keeps delta chains of arbitrary int64 input defined
  static s64 wrappingSub(s64 a, s64 b) { return static_cast<s64>(static_cast<u64>(a) - static_cast<u64>(b)); }
  static s64 wrappingAdd(s64 a, s64 b) { return static_cast<s64>(static_cast<u64>(a) + static_cast<u64>(b)); }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
