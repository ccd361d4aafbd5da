// -------------------------------------------------------------------------------------
#include "Xor.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
static constexpr u32 leading_zero_bits = 6;
static constexpr u32 significant_count_bits = 6;
// -------------------------------------------------------------------------------------
void Xor::writeResidual(BitWriter& writer, u64 residual) {
  if (residual == 0) {
    writer.writeBit(false);
    return;
  }
  const u32 leading = Utils::countLeadingZeros(residual);
  const u32 trailing = Utils::countTrailingZeros(residual);
  const u32 significant = 64 - leading - trailing;
  writer.writeBit(true);
  writer.writeBits(leading, leading_zero_bits);
  // 64 wraps to 0 in six bits, the reader maps it back
  writer.writeBits(significant & 0x3F, significant_count_bits);
  writer.writeBits(residual >> trailing, significant);
}
// -------------------------------------------------------------------------------------
u64 Xor::readResidual(BitReader& reader) {
  if (!reader.readBit()) {
    return 0;
  }
  const s32 leading = CI(reader.readBits(leading_zero_bits));
  s32 significant = CI(reader.readBits(significant_count_bits));
  if (significant == 0) {
    significant = 64;
  }
  const s32 trailing = 64 - leading - significant;
  if (trailing < 0) {
    throw CorruptXorStream("leading " + std::to_string(leading) + " + significant " +
                           std::to_string(significant) + " exceeds 64 bits");
  }
  const u64 bits = reader.readBits(CU(significant));
  return bits << trailing;
}
// -------------------------------------------------------------------------------------
void Xor::compress(const DOUBLE* src,
                   const ValueStats& stats,
                   const Pattern&,
                   ByteWriter& dest) const {
  if (stats.tuple_count == 0) {
    return;
  }
  dest.write<DOUBLE>(src[0]);
  BitWriter writer;
  u64 previous = Utils::doubleToBits(src[0]);
  for (u32 row_i = 1; row_i < stats.tuple_count; row_i++) {
    const u64 current = Utils::doubleToBits(src[row_i]);
    writeResidual(writer, current ^ previous);
    previous = current;
  }
  dest.writeBytes(writer.flush());
}
// -------------------------------------------------------------------------------------
void Xor::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  if (tuple_count == 0) {
    return;
  }
  dest[0] = src.read<DOUBLE>();
  BitReader reader(src.current(), src.remaining());
  u64 previous = Utils::doubleToBits(dest[0]);
  for (u32 row_i = 1; row_i < tuple_count; row_i++) {
    previous ^= readResidual(reader);
    dest[row_i] = Utils::bitsToDouble(previous);
  }
  src.skip(reader.consumedBytes());
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
