#pragma once
// -------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include "common/Exceptions.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
inline namespace units {
// -------------------------------------------------------------------------------------
using std::string;
using std::unique_ptr;
using std::vector;
// -------------------------------------------------------------------------------------
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
// -------------------------------------------------------------------------------------
using s8 = int8_t;
using s16 = int16_t;
using s32 = int32_t;
using s64 = int64_t;
// -------------------------------------------------------------------------------------
#define CB(enum) static_cast<u8>(enum)
#define CD(num) static_cast<double>(num)
#define CU(num) static_cast<u32>(num)
#define CI(num) static_cast<s32>(num)
#define CS(num) static_cast<size_t>(num)
// -------------------------------------------------------------------------------------
using SIZE = size_t;
// -------------------------------------------------------------------------------------
using TIMESTAMP = s64;
using DOUBLE = double;
// -------------------------------------------------------------------------------------
using Bytes = std::vector<u8>;
// -------------------------------------------------------------------------------------
// Raw (host byte order) access into byte buffers. Callers are responsible
// for bounds, use ByteReader/ByteWriter when the buffer is untrusted.
template <typename T>
inline void writeRaw(u8* base, u32 offset, T value) {
  std::memcpy(base + offset, &value, sizeof(T));
}
// -------------------------------------------------------------------------------------
template <typename T>
inline T readRaw(const u8* base, u32 offset) {
  T value;
  std::memcpy(&value, base + offset, sizeof(T));
  return value;
}
// -------------------------------------------------------------------------------------
}  // namespace units
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
