// ---------------------------------------------------------------------------
// tsblocks
// ---------------------------------------------------------------------------
#include "gtest/gtest.h"
#include "tsblocks.hpp"
#include "common/Log.hpp"
// ---------------------------------------------------------------------------
using namespace tsblocks;
// ---------------------------------------------------------------------------
int main(int argc, char *argv[])
{
   testing::InitGoogleTest(&argc, argv);
   // -------------------------------------------------------------------------------------
   Log::set_level(Log::level::warn);
   TsBlocksConfig::configure();
   return RUN_ALL_TESTS();
}
// ---------------------------------------------------------------------------
