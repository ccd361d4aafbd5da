// -------------------------------------------------------------------------------------
#include "Periodic.hpp"
#include "Xor.hpp"
// -------------------------------------------------------------------------------------
#include "common/Log.hpp"
#include "common/Utils.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
bool Periodic::isUsable(const ValueStats& stats, const Pattern& pattern) const {
  if (stats.tuple_count == 0) {
    return false;
  }
  if (pattern.type == PatternType::PERIODIC) {
    return pattern.period >= 1 && pattern.period <= stats.tuple_count;
  }
  return true;
}
// -------------------------------------------------------------------------------------
u32 Periodic::choosePeriod(const ValueStats& stats, const Pattern& pattern) {
  if (pattern.type == PatternType::PERIODIC) {
    return pattern.period;
  }
  // Not classified as periodic, pick the best exact period there is
  const u32 period = PatternDetector::findRepeatingPeriod(stats.src, stats.tuple_count,
                                                          SchemeConfig::get());
  return period != 0 ? period : 1;
}
// -------------------------------------------------------------------------------------
void Periodic::compress(const DOUBLE* src,
                        const ValueStats& stats,
                        const Pattern& pattern,
                        ByteWriter& dest) const {
  const u32 period = choosePeriod(stats, pattern);
  die_if(period >= 1 && period <= stats.tuple_count);
  Log::debug("PERIODIC: period {} over {} values", period, stats.tuple_count);
  // -------------------------------------------------------------------------------------
  Varint::encode(period, dest);
  for (u32 row_i = 0; row_i < period; row_i++) {
    dest.write<DOUBLE>(src[row_i]);
  }
  BitWriter writer;
  for (u32 row_i = period; row_i < stats.tuple_count; row_i++) {
    Xor::writeResidual(writer,
                       Utils::doubleToBits(src[row_i]) ^ Utils::doubleToBits(src[row_i % period]));
  }
  dest.writeBytes(writer.flush());
}
// -------------------------------------------------------------------------------------
void Periodic::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  const u64 period = Varint::decodeCount(src, tuple_count);
  if (period == 0) {
    throw CorruptPayload("period of zero");
  }
  for (u64 row_i = 0; row_i < period; row_i++) {
    dest[row_i] = src.read<DOUBLE>();
  }
  BitReader reader(src.current(), src.remaining());
  for (u64 row_i = period; row_i < tuple_count; row_i++) {
    const u64 base = Utils::doubleToBits(dest[row_i % period]);
    dest[row_i] = Utils::bitsToDouble(base ^ Xor::readResidual(reader));
  }
  src.skip(reader.consumedBytes());
}
// -------------------------------------------------------------------------------------
std::string Periodic::fullDescription(const Bytes& payload) const {
  ByteReader reader(payload);
  return selfDescription() + "(" + std::to_string(Varint::decode(reader)) + ")";
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
