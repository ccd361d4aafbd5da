// -------------------------------------------------------------------------------------
#include "RunLength.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
#include <string>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
vector<RunLengthPair> RunLength::encode(const s64* src, SIZE count) {
  vector<RunLengthPair> runs;
  if (count == 0) {
    return runs;
  }
  s64 last_item = src[0];
  u64 run_count = 1;
  for (SIZE row_i = 1; row_i < count; row_i++) {
    if (src[row_i] == last_item) {
      run_count++;
    } else {
      runs.push_back({last_item, run_count});
      last_item = src[row_i];
      run_count = 1;
    }
  }
  runs.push_back({last_item, run_count});
  return runs;
}
// -------------------------------------------------------------------------------------
vector<s64> RunLength::decode(const vector<RunLengthPair>& runs) {
  vector<s64> result;
  result.reserve(expandedCount(runs));
  for (const auto& run : runs) {
    result.insert(result.end(), run.count, run.value);
  }
  return result;
}
// -------------------------------------------------------------------------------------
void RunLength::write(const vector<RunLengthPair>& runs, ByteWriter& dest) {
  for (const auto& run : runs) {
    Varint::encode(run.value, dest);
    Varint::encode(static_cast<s64>(run.count), dest);
  }
}
// -------------------------------------------------------------------------------------
vector<RunLengthPair> RunLength::read(ByteReader& src, u64 total_count) {
  vector<RunLengthPair> runs;
  u64 covered = 0;
  while (covered < total_count) {
    const s64 value = Varint::decode(src);
    const u64 count = Varint::decodeCount(src, total_count - covered);
    if (count == 0) {
      throw CorruptPayload("empty run at position " + std::to_string(covered));
    }
    runs.push_back({value, count});
    covered += count;
  }
  return runs;
}
// -------------------------------------------------------------------------------------
u64 RunLength::expandedCount(const vector<RunLengthPair>& runs) {
  u64 total = 0;
  for (const auto& run : runs) {
    total += run.count;
  }
  return total;
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
