// -------------------------------------------------------------------------------------
#include "BitStream.hpp"
// -------------------------------------------------------------------------------------
#include <algorithm>
#include <string>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
void BitWriter::writeBits(u64 value, u32 num_bits) {
  die_if(num_bits <= 64);
  if (num_bits == 0) {
    return;
  }
  if (num_bits < 64) {
    value &= (u64{1} << num_bits) - 1;
  }
  // Feed the value into the pending byte from its most significant end
  u32 remaining = num_bits;
  while (remaining > 0) {
    u32 take = std::min(remaining, 8 - pending_bits);
    u64 chunk = (value >> (remaining - take)) & ((u64{1} << take) - 1);
    pending = (pending << take) | chunk;
    pending_bits += take;
    remaining -= take;
    if (pending_bits == 8) {
      bytes.push_back(static_cast<u8>(pending));
      pending = 0;
      pending_bits = 0;
    }
  }
}
// -------------------------------------------------------------------------------------
Bytes BitWriter::flush() {
  if (pending_bits > 0) {
    bytes.push_back(static_cast<u8>(pending << (8 - pending_bits)));
    pending = 0;
    pending_bits = 0;
  }
  Bytes result;
  result.swap(bytes);
  return result;
}
// -------------------------------------------------------------------------------------
u64 BitReader::readBits(u32 num_bits) {
  die_if(num_bits <= 64);
  if (!hasBits(num_bits)) {
    throw InsufficientBits("need " + std::to_string(num_bits) + " bits, have " +
                           std::to_string(remainingBits()));
  }
  u64 result = 0;
  u32 remaining = num_bits;
  while (remaining > 0) {
    const u8 current_byte = data[position / 8];
    const u32 bit_offset = CU(position % 8);
    const u32 available = 8 - bit_offset;
    const u32 take = std::min(remaining, available);
    const u32 shift = available - take;
    const u64 bits = (current_byte >> shift) & ((1u << take) - 1);
    result = (result << take) | bits;
    remaining -= take;
    position += take;
  }
  return result;
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
