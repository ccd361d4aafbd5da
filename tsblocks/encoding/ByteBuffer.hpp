#pragma once
// -------------------------------------------------------------------------------------
#include "common/Units.hpp"
// -------------------------------------------------------------------------------------
#include <string>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
// Growable output buffer for byte aligned payload fields
// -------------------------------------------------------------------------------------
class ByteWriter {
 public:
  template <typename T>
  void write(T value) {
    const SIZE offset = bytes.size();
    bytes.resize(offset + sizeof(T));
    writeRaw<T>(bytes.data(), CU(offset), value);
  }
  void writeByte(u8 value) { bytes.push_back(value); }
  void writeBytes(const u8* src, SIZE length) { bytes.insert(bytes.end(), src, src + length); }
  void writeBytes(const Bytes& src) { writeBytes(src.data(), src.size()); }

  [[nodiscard]] SIZE size() const { return bytes.size(); }
  Bytes release() {
    Bytes result;
    result.swap(bytes);
    return result;
  }

 private:
  Bytes bytes;
};
// -------------------------------------------------------------------------------------
// Bounds checked read cursor. Never reads past the end, every shortfall is
// reported as TruncatedPayload.
// -------------------------------------------------------------------------------------
class ByteReader {
 public:
  ByteReader(const u8* data, SIZE size) : data(data), size(size) {}
  explicit ByteReader(const Bytes& bytes) : ByteReader(bytes.data(), bytes.size()) {}

  template <typename T>
  T read() {
    require(sizeof(T));
    T value = readRaw<T>(data + position, 0);
    position += sizeof(T);
    return value;
  }
  u8 readByte() { return read<u8>(); }

  // Returns a pointer to the next length bytes and skips them
  const u8* take(SIZE length) {
    require(length);
    const u8* result = data + position;
    position += length;
    return result;
  }

  [[nodiscard]] const u8* current() const { return data + position; }
  [[nodiscard]] SIZE remaining() const { return size - position; }
  [[nodiscard]] bool exhausted() const { return position == size; }
  void skip(SIZE length) { take(length); }

  void require(SIZE length) const {
    if (length > remaining()) {
      throw TruncatedPayload("need " + std::to_string(length) + " bytes, have " +
                             std::to_string(remaining()));
    }
  }

 private:
  const u8* data;
  SIZE size;
  SIZE position{0};
};
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
