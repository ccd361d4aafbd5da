// ---------------------------------------------------------------------------
// tsblocks
// ---------------------------------------------------------------------------
#include "benchmark/benchmark.h"
#include "common/Log.hpp"
#include "bench-cases/series_benchmark.cpp"
// ---------------------------------------------------------------------------
using namespace tsblocks;
// ---------------------------------------------------------------------------
int main(int argc, char** argv) {
  Log::set_level(Log::level::warn);
  TsBlocksConfig::configure();

  tsbench::RegisterSeriesBenchmarks();
  benchmark::Initialize(&argc, argv);
  if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  benchmark::RunSpecifiedBenchmarks();
}
// ---------------------------------------------------------------------------
