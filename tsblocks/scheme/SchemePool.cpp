#include "SchemePool.hpp"
// -------------------------------------------------------------------------------------
#include "scheme/timestamp/DoubleDelta.hpp"
#include "scheme/timestamp/Trivial.hpp"
// -------------------------------------------------------------------------------------
#include "scheme/value/Constant.hpp"
#include "scheme/value/Delta.hpp"
#include "scheme/value/Linear.hpp"
#include "scheme/value/MostlyInteger.hpp"
#include "scheme/value/NearConstant.hpp"
#include "scheme/value/Periodic.hpp"
#include "scheme/value/PowerOfTwo.hpp"
#include "scheme/value/Quantized.hpp"
#include "scheme/value/Sparse.hpp"
#include "scheme/value/Xor.hpp"
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
template <typename... T, typename SchemeMap>
int addSchemes(SchemeMap& schemeMap) {
  return (... + [&]() {
    schemeMap.emplace(T::staticSchemeType(), std::make_unique<T>());
    return 1;
  }());
}
// -------------------------------------------------------------------------------------
SchemesCollection::SchemesCollection() {
  // Timestamp schemes
  {
    using namespace timestamps;
    addSchemes<Empty, Single, Pair, DoubleDelta>(timestamp_schemes);
    die_if(timestamp_schemes.size() == CS(TimestampSchemeType::SCHEME_MAX));
  }
  // Value schemes
  {
    using namespace values;
    // clang-format off
    addSchemes<Constant,
               NearConstant,
               PowerOfTwo,
               MostlyInteger,
               Linear,
               Periodic,
               Quantized,
               Sparse,
               Xor,
               Delta>(value_schemes);
    // clang-format on
    die_if(value_schemes.size() == CS(ValueSchemeType::SCHEME_MAX));
  }
}
// -------------------------------------------------------------------------------------
const SchemesCollection& SchemePool::get() {
  static const SchemesCollection collection;
  return collection;
}
// -------------------------------------------------------------------------------------
const TimestampScheme& SchemePool::getTimestampScheme(TimestampSchemeType type) {
  const auto& schemes = get().timestamp_schemes;
  auto it = schemes.find(type);
  if (it == schemes.end()) {
    throw UnknownMethodTag("no timestamp scheme registered for tag " + std::to_string(CB(type)));
  }
  return *it->second;
}
// -------------------------------------------------------------------------------------
const ValueScheme& SchemePool::getValueScheme(ValueSchemeType type) {
  const auto& schemes = get().value_schemes;
  auto it = schemes.find(type);
  if (it == schemes.end()) {
    throw UnknownMethodTag("no value scheme registered for tag " + std::to_string(CB(type)));
  }
  return *it->second;
}
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
