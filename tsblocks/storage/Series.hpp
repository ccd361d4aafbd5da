#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
struct Sample {
  TIMESTAMP timestamp;
  DOUBLE value;
};
// -------------------------------------------------------------------------------------
// Ordered samples stored as two parallel columns. Callers hand in series
// sorted by timestamp, the codec neither checks nor requires it.
// -------------------------------------------------------------------------------------
class Series {
 public:
  vector<TIMESTAMP> timestamps;
  vector<DOUBLE> values;
  // -------------------------------------------------------------------------------------
  Series() = default;
  Series(vector<TIMESTAMP> timestamps, vector<DOUBLE> values);
  explicit Series(const vector<Sample>& samples);
  // -------------------------------------------------------------------------------------
  void append(TIMESTAMP timestamp, DOUBLE value) {
    timestamps.push_back(timestamp);
    values.push_back(value);
  }
  [[nodiscard]] SIZE size() const { return timestamps.size(); }
  [[nodiscard]] bool empty() const { return timestamps.empty(); }
  // -------------------------------------------------------------------------------------
  // Exact equality: timestamps as integers, values by IEEE-754 bit pattern
  bool operator==(const Series& other) const;
  bool operator!=(const Series& other) const { return !(*this == other); }
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
