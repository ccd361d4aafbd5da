#pragma once
// -------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
// All library logging goes through spdlog's default logger.
// Log::set_level(Log::level::debug) traces every scheme decision.
namespace Log = ::spdlog;
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
