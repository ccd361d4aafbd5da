// -------------------------------------------------------------------------------------
#include "Quantized.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
#include <unordered_map>
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
static u8 indexWidth(SIZE dictionary_size) {
  if (dictionary_size <= (1u << 8)) {
    return 1;
  }
  if (dictionary_size <= (1u << 16)) {
    return 2;
  }
  return 4;
}
// -------------------------------------------------------------------------------------
void Quantized::compress(const DOUBLE* src,
                         const ValueStats& stats,
                         const Pattern&,
                         ByteWriter& dest) const {
  // Dictionary in order of first occurrence, keyed by bit pattern
  vector<DOUBLE> dictionary;
  std::unordered_map<u64, u32> codes;
  vector<u32> indices;
  indices.reserve(stats.tuple_count);
  for (u32 row_i = 0; row_i < stats.tuple_count; row_i++) {
    const u64 bits = Utils::doubleToBits(src[row_i]);
    auto it = codes.find(bits);
    if (it == codes.end()) {
      it = codes.emplace(bits, CU(dictionary.size())).first;
      dictionary.push_back(src[row_i]);
    }
    indices.push_back(it->second);
  }
  // -------------------------------------------------------------------------------------
  Varint::encode(static_cast<s64>(dictionary.size()), dest);
  for (auto value : dictionary) {
    dest.write<DOUBLE>(value);
  }
  const u8 width = indexWidth(dictionary.size());
  dest.writeByte(width);
  for (auto index : indices) {
    switch (width) {
      case 1:
        dest.write<u8>(static_cast<u8>(index));
        break;
      case 2:
        dest.write<u16>(static_cast<u16>(index));
        break;
      default:
        dest.write<u32>(index);
        break;
    }
  }
}
// -------------------------------------------------------------------------------------
void Quantized::decompress(DOUBLE* dest, u32 tuple_count, ByteReader& src) const {
  const u64 dictionary_size = Varint::decodeCount(src, tuple_count);
  src.require(dictionary_size * sizeof(DOUBLE));
  vector<DOUBLE> dictionary;
  dictionary.reserve(dictionary_size);
  for (u64 entry_i = 0; entry_i < dictionary_size; entry_i++) {
    dictionary.push_back(src.read<DOUBLE>());
  }
  const u8 width = src.readByte();
  if (width != 1 && width != 2 && width != 4) {
    throw CorruptPayload("index width " + std::to_string(width));
  }
  src.require(CS(tuple_count) * width);
  for (u32 row_i = 0; row_i < tuple_count; row_i++) {
    u64 index;
    switch (width) {
      case 1:
        index = src.read<u8>();
        break;
      case 2:
        index = src.read<u16>();
        break;
      default:
        index = src.read<u32>();
        break;
    }
    if (index >= dictionary_size) {
      throw CorruptPayload("dictionary index " + std::to_string(index) + " out of " +
                           std::to_string(dictionary_size));
    }
    dest[row_i] = dictionary[index];
  }
}
// -------------------------------------------------------------------------------------
std::string Quantized::fullDescription(const Bytes& payload) const {
  ByteReader reader(payload);
  return selfDescription() + "(" + std::to_string(Varint::decode(reader)) + " entries)";
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
