#pragma once
#include "tsblocks.hpp"
#include "compression/Block.hpp"
#include "storage/Series.hpp"
// -------------------------------------------------------------------------------------
#include "gtest/gtest.h"
// -------------------------------------------------------------------------------------
using namespace tsblocks;
// -------------------------------------------------------------------------------------
class TestHelper {
public:
   // Encodes, decodes and compares bit by bit, also through serialize/deserialize
   static Block CheckRoundTrip(const Series &series);
   // Encodes the values with exactly this scheme and checks that they come back
   static ValuePayload CheckForcedScheme(ValueSchemeType scheme, const vector<DOUBLE> &values);
   // -------------------------------------------------------------------------------------
   static vector<TIMESTAMP> RegularTimestamps(u32 count, TIMESTAMP start = 1000, TIMESTAMP interval = 15);
   static vector<TIMESTAMP> JitteredTimestamps(u32 count, u32 seed = 42);
   static Series WithRegularTimestamps(const vector<DOUBLE> &values);
   // -------------------------------------------------------------------------------------
   // One generator per detector category
   static vector<DOUBLE> Constant(u32 count, DOUBLE value = 50.0);
   static vector<DOUBLE> NearConstant(u32 count, u32 seed = 42);
   static vector<DOUBLE> Sparse(u32 count, u32 seed = 42);
   static vector<DOUBLE> PowersOfTwo(u32 count, u32 seed = 42);
   static vector<DOUBLE> MostlyIntegers(u32 count, u32 seed = 42);
   static vector<DOUBLE> Repeating(const vector<DOUBLE> &pattern, u32 repeats);
   static vector<DOUBLE> NoisySeasonal(u32 count, u32 period, u32 seed = 42);
   static vector<DOUBLE> Linear(u32 count, DOUBLE start = 10.25, DOUBLE step = 0.5);
   static vector<DOUBLE> Quantized(u32 count, const vector<DOUBLE> &levels, u32 seed = 42);
   static vector<DOUBLE> Smooth(u32 count, u32 seed = 42);
   static vector<DOUBLE> Random(u32 count, u32 seed = 42);
   // NaN payloads, signed zeros, infinities, subnormals and friends
   static vector<DOUBLE> Adversarial();
};
// -------------------------------------------------------------------------------------
struct EnforceScheme {
   explicit EnforceScheme(ValueSchemeType scheme_type) { TsBlocksConfig::get().values.override_scheme = scheme_type; }
   ~EnforceScheme() { TsBlocksConfig::get().values.override_scheme = static_cast<ValueSchemeType>(autoScheme()); }
};
// -------------------------------------------------------------------------------------
// Swaps in a SchemeConfig for the lifetime of the object
struct EnforceSchemeConfig {
   explicit EnforceSchemeConfig(const SchemeConfig &config) : saved(SchemeConfig::get()) { SchemeConfig::get() = config; }
   ~EnforceSchemeConfig() { SchemeConfig::get() = saved; }
   SchemeConfig saved;
};
// -------------------------------------------------------------------------------------
::testing::AssertionResult BitEqual(const vector<DOUBLE> &expected, const vector<DOUBLE> &actual);
// -------------------------------------------------------------------------------------
