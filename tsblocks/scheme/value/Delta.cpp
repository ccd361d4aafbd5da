// -------------------------------------------------------------------------------------
#include "Delta.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "encoding/RunLength.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
void Delta::compress(const DOUBLE* src,
                     const ValueStats& stats,
                     const Pattern&,
                     ByteWriter& dest) const {
  const u32 tuple_count = stats.tuple_count;
  if (tuple_count == 0) {
    return;
  }
  vector<u64> deltas;
  deltas.reserve(tuple_count - 1);
  u32 zero_count = 0;
  for (u32 row_i = 1; row_i < tuple_count; row_i++) {
    const u64 delta = Utils::doubleToBits(src[row_i]) - Utils::doubleToBits(src[row_i - 1]);
    zero_count += delta == 0;
    deltas.push_back(delta);
  }
  const bool zero_runs =
      !deltas.empty() &&
      CD(zero_count) / CD(deltas.size()) > SchemeConfig::get().values.delta_zero_run_fraction;
  // -------------------------------------------------------------------------------------
  dest.write<DOUBLE>(src[0]);
  if (!zero_runs) {
    dest.writeByte(CB(Variant::PLAIN));
    for (auto delta : deltas) {
      dest.write<u64>(delta);
    }
    return;
  }
  dest.writeByte(CB(Variant::ZERO_RUN));
  vector<s64> markers;
  markers.reserve(deltas.size());
  for (auto delta : deltas) {
    markers.push_back(delta != 0);
  }
  RunLength::write(RunLength::encode(markers), dest);
  for (auto delta : deltas) {
    if (delta != 0) {
      dest.write<u64>(delta);
    }
  }
}
// -------------------------------------------------------------------------------------
void Delta::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  if (tuple_count == 0) {
    return;
  }
  dest[0] = src.read<DOUBLE>();
  u64 current = Utils::doubleToBits(dest[0]);
  const u8 variant = src.readByte();
  if (variant == CB(Variant::PLAIN)) {
    src.require(CS(tuple_count - 1) * sizeof(u64));
    for (u32 row_i = 1; row_i < tuple_count; row_i++) {
      current += src.read<u64>();
      dest[row_i] = Utils::bitsToDouble(current);
    }
  } else if (variant == CB(Variant::ZERO_RUN)) {
    auto runs = RunLength::read(src, tuple_count - 1);
    u32 row_i = 1;
    for (const auto& run : runs) {
      if (run.value != 0 && run.value != 1) {
        throw CorruptPayload("zero run marker " + std::to_string(run.value));
      }
      for (u64 repeat_i = 0; repeat_i < run.count; repeat_i++) {
        if (run.value == 1) {
          current += src.read<u64>();
        }
        dest[row_i++] = Utils::bitsToDouble(current);
      }
    }
  } else {
    throw CorruptPayload("unknown delta variant " + std::to_string(variant));
  }
}
// -------------------------------------------------------------------------------------
std::string Delta::fullDescription(const Bytes& payload) const {
  if (payload.size() <= sizeof(DOUBLE)) {
    return selfDescription();
  }
  const bool zero_runs = payload[sizeof(DOUBLE)] == CB(Variant::ZERO_RUN);
  return selfDescription() + (zero_runs ? "(zero-run)" : "(plain)");
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
