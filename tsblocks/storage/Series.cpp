// -------------------------------------------------------------------------------------
#include "Series.hpp"
#include "common/Utils.hpp"
// -------------------------------------------------------------------------------------
#include <utility>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
Series::Series(vector<TIMESTAMP> timestamps, vector<DOUBLE> values)
    : timestamps(std::move(timestamps)), values(std::move(values)) {
  if (this->timestamps.size() != this->values.size()) {
    throw Generic_Exception("series columns differ in length: " +
                            std::to_string(this->timestamps.size()) + " timestamps, " +
                            std::to_string(this->values.size()) + " values");
  }
}
// -------------------------------------------------------------------------------------
Series::Series(const vector<Sample>& samples) {
  timestamps.reserve(samples.size());
  values.reserve(samples.size());
  for (const auto& sample : samples) {
    append(sample.timestamp, sample.value);
  }
}
// -------------------------------------------------------------------------------------
bool Series::operator==(const Series& other) const {
  if (timestamps != other.timestamps || values.size() != other.values.size()) {
    return false;
  }
  for (SIZE row_i = 0; row_i < values.size(); row_i++) {
    if (!Utils::bitEqual(values[row_i], other.values[row_i])) {
      return false;
    }
  }
  return true;
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
