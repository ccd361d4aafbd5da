// -------------------------------------------------------------------------------------
#include "DoubleDelta.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "encoding/RunLength.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::timestamps {
// -------------------------------------------------------------------------------------
void DoubleDelta::compress(const TIMESTAMP* src, u32 tuple_count, ByteWriter& dest) const {
  die_if(tuple_count >= 3);
  // All arithmetic wraps, any int64 sequence round-trips
  vector<s64> double_deltas;
  double_deltas.reserve(tuple_count - 2);
  s64 previous_delta = Utils::wrappingSub(src[1], src[0]);
  for (u32 row_i = 2; row_i < tuple_count; row_i++) {
    const s64 delta = Utils::wrappingSub(src[row_i], src[row_i - 1]);
    double_deltas.push_back(Utils::wrappingSub(delta, previous_delta));
    previous_delta = delta;
  }
  // -------------------------------------------------------------------------------------
  dest.write<TIMESTAMP>(src[0]);
  Varint::encode(Utils::wrappingSub(src[1], src[0]), dest);
  RunLength::write(RunLength::encode(double_deltas), dest);
}
// -------------------------------------------------------------------------------------
void DoubleDelta::decompress(TIMESTAMP* dest, u32 tuple_count, ByteReader& src) const {
  die_if(tuple_count >= 3);
  dest[0] = src.read<TIMESTAMP>();
  s64 delta = Varint::decode(src);
  dest[1] = Utils::wrappingAdd(dest[0], delta);
  // -------------------------------------------------------------------------------------
  auto runs = RunLength::read(src, tuple_count - 2);
  u32 row_i = 2;
  for (const auto& run : runs) {
    for (u64 repeat_i = 0; repeat_i < run.count; repeat_i++) {
      delta = Utils::wrappingAdd(delta, run.value);
      dest[row_i] = Utils::wrappingAdd(dest[row_i - 1], delta);
      row_i++;
    }
  }
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::timestamps
// -------------------------------------------------------------------------------------
