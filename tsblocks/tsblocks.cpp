// ------------------------------------------------------------------------------
#include "tsblocks.hpp"
#include "common/Log.hpp"
#include "scheme/SchemePool.hpp"
// ------------------------------------------------------------------------------
namespace tsblocks {

void TsBlocksConfig::configure(const std::function<void(TsBlocksConfig&, SchemeConfig&)>& f) {
  auto& instance = TsBlocksConfig::get();
  f(instance, SchemeConfig::get());
  // the general path is the fallback of every other scheme
  instance.values.schemes.enable({ValueSchemeType::XOR, ValueSchemeType::DELTA});
  // build the registry eagerly so the first compression call does not pay for it
  const auto& pool = SchemePool::get();
  Log::debug("tsblocks configured, {} value schemes and {} timestamp schemes registered",
             pool.value_schemes.size(), pool.timestamp_schemes.size());
}

}  // namespace tsblocks
// ------------------------------------------------------------------------------
