// -------------------------------------------------------------------------------------
#include "Trivial.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::timestamps {
// -------------------------------------------------------------------------------------
void Single::compress(const TIMESTAMP* src, u32 tuple_count, ByteWriter& dest) const {
  die_if(tuple_count == 1);
  dest.write<TIMESTAMP>(src[0]);
}
// -------------------------------------------------------------------------------------
void Single::decompress(TIMESTAMP* dest, u32, ByteReader& src) const {
  dest[0] = src.read<TIMESTAMP>();
}
// -------------------------------------------------------------------------------------
void Pair::compress(const TIMESTAMP* src, u32 tuple_count, ByteWriter& dest) const {
  die_if(tuple_count == 2);
  dest.write<TIMESTAMP>(src[0]);
  Varint::encode(Utils::wrappingSub(src[1], src[0]), dest);
}
// -------------------------------------------------------------------------------------
void Pair::decompress(TIMESTAMP* dest, u32, ByteReader& src) const {
  dest[0] = src.read<TIMESTAMP>();
  dest[1] = Utils::wrappingAdd(dest[0], Varint::decode(src));
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::timestamps
// -------------------------------------------------------------------------------------
