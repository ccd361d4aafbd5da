#pragma once
// -------------------------------------------------------------------------------------
#include "tsblocks.hpp"
#include "common/Units.hpp"
// -------------------------------------------------------------------------------------
#include "compression/PatternDetector.hpp"
#include "encoding/ByteBuffer.hpp"
#include "stats/ValueStats.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
// An encoded column together with the tag of the scheme that produced it
// -------------------------------------------------------------------------------------
template <typename SchemeCode>
struct EncodedPayload {
  SchemeCode scheme;
  Bytes data;
  // -------------------------------------------------------------------------------------
  [[nodiscard]] SIZE size() const { return data.size(); }
  bool operator==(const EncodedPayload& other) const {
    return scheme == other.scheme && data == other.data;
  }
};
using TimestampPayload = EncodedPayload<TimestampSchemeType>;
using ValuePayload = EncodedPayload<ValueSchemeType>;
// -------------------------------------------------------------------------------------
// Keeps the smaller of two candidate encodings, the first one on a tie
template <typename Payload>
Payload selectSmaller(Payload first, Payload second) {
  if (second.size() < first.size()) {
    return second;
  }
  return first;
}
// -------------------------------------------------------------------------------------
// Timestamps
// -------------------------------------------------------------------------------------
class TimestampScheme {
 public:
  virtual ~TimestampScheme() = default;
  // -------------------------------------------------------------------------------------
  virtual void compress(const TIMESTAMP* src, u32 tuple_count, ByteWriter& dest) const = 0;
  // -------------------------------------------------------------------------------------
  // Reads exactly what compress wrote for tuple_count timestamps
  virtual void decompress(TIMESTAMP* dest, u32 tuple_count, ByteReader& src) const = 0;
  // -------------------------------------------------------------------------------------
  virtual TimestampSchemeType schemeType() const = 0;
  // Every timestamp scheme is tied to a point count range
  virtual bool isUsable(u32 tuple_count) const = 0;
  // -------------------------------------------------------------------------------------
  inline string selfDescription() const { return ConvertSchemeTypeToString(this->schemeType()); }
};
// -------------------------------------------------------------------------------------
// Values
// -------------------------------------------------------------------------------------
class ValueScheme {
 public:
  virtual ~ValueScheme() = default;
  // -------------------------------------------------------------------------------------
  virtual void compress(const DOUBLE* src,
                        const ValueStats& stats,
                        const Pattern& pattern,
                        ByteWriter& dest) const = 0;
  // -------------------------------------------------------------------------------------
  virtual void decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const = 0;
  // -------------------------------------------------------------------------------------
  virtual ValueSchemeType schemeType() const = 0;
  // -------------------------------------------------------------------------------------
  inline string selfDescription() const { return ConvertSchemeTypeToString(this->schemeType()); }
  virtual string fullDescription(const Bytes&) const {
    // Default implementation for schemes without a variant or parameter
    return this->selfDescription();
  }
  virtual bool isUsable(const ValueStats&, const Pattern&) const { return true; }
  // Samples the model misses are stored verbatim, so the payload can outgrow
  // the general path
  virtual bool usesPatches() const { return false; }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
