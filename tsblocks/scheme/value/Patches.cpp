// -------------------------------------------------------------------------------------
#include "Patches.hpp"
// -------------------------------------------------------------------------------------
#include "encoding/Varint.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks::values {
// -------------------------------------------------------------------------------------
void Patches::write(ByteWriter& dest) const {
  Varint::encode(static_cast<s64>(patches.size()), dest);
  u32 previous_index = 0;
  for (const auto& patch : patches) {
    Varint::encode(static_cast<s64>(patch.index - previous_index), dest);
    dest.write<DOUBLE>(patch.value);
    previous_index = patch.index;
  }
}
// -------------------------------------------------------------------------------------
Patches Patches::read(ByteReader& src, u32 tuple_count) {
  Patches result;
  const u64 patch_count = Varint::decodeCount(src, tuple_count);
  // gap byte plus literal per patch
  src.require(patch_count * (1 + sizeof(DOUBLE)));
  result.patches.reserve(patch_count);
  u64 index = 0;
  for (u64 patch_i = 0; patch_i < patch_count; patch_i++) {
    const u64 gap = Varint::decodeCount(src, tuple_count);
    if (patch_i > 0 && gap == 0) {
      throw CorruptPayload("patch indices not increasing");
    }
    index += gap;
    if (index >= tuple_count) {
      throw CorruptPayload("patch index " + std::to_string(index) + " beyond " +
                           std::to_string(tuple_count) + " values");
    }
    result.patches.push_back({CU(index), src.read<DOUBLE>()});
  }
  return result;
}
// -------------------------------------------------------------------------------------
void Patches::apply(DOUBLE* dest) const {
  for (const auto& patch : patches) {
    dest[patch.index] = patch.value;
  }
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks::values
// -------------------------------------------------------------------------------------
