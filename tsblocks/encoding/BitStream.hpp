#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
// MSB-first bit packing. These two classes are the only code touching
// individual bits, every bit-level codec is built on them.
// -------------------------------------------------------------------------------------
class BitWriter {
 public:
  // Appends the low num_bits bits of value, num_bits <= 64
  void writeBits(u64 value, u32 num_bits);
  void writeBit(bool bit) { writeBits(bit ? 1 : 0, 1); }
  // Zero pads the last byte and hands out the buffer, the writer is empty
  // afterwards
  Bytes flush();
  [[nodiscard]] u64 bitCount() const { return CS(bytes.size()) * 8 + pending_bits; }

 private:
  Bytes bytes;
  u64 pending{0};       // not yet complete byte, right aligned
  u32 pending_bits{0};  // < 8
};
// -------------------------------------------------------------------------------------
class BitReader {
 public:
  BitReader(const u8* data, SIZE size) : data(data), size(size) {}
  explicit BitReader(const Bytes& bytes) : BitReader(bytes.data(), bytes.size()) {}

  [[nodiscard]] bool hasBits(u64 num_bits) const { return remainingBits() >= num_bits; }
  [[nodiscard]] u64 remainingBits() const { return CS(size) * 8 - position; }
  // throws InsufficientBits instead of returning padding past the end
  u64 readBits(u32 num_bits);
  bool readBit() { return readBits(1) != 0; }
  // Bytes touched so far, including a partially read last byte
  [[nodiscard]] SIZE consumedBytes() const { return (position + 7) / 8; }

 private:
  const u8* data;
  SIZE size;
  u64 position{0};  // in bits
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
