// -------------------------------------------------------------------------------------
#include "TestHelper.hpp"
// -------------------------------------------------------------------------------------
#include "common/Utils.hpp"
#include "compression/SchemePicker.hpp"
#include "encoding/ByteBuffer.hpp"
#include "encoding/Varint.hpp"
#include "scheme/SchemePool.hpp"
// -------------------------------------------------------------------------------------
#include <algorithm>
#include <limits>
// -------------------------------------------------------------------------------------
namespace {
// -------------------------------------------------------------------------------------
// Schemes that can represent any input
const vector<ValueSchemeType> universal_schemes{
    ValueSchemeType::NEAR_CONSTANT, ValueSchemeType::POWER_OF_2, ValueSchemeType::MOSTLY_INTEGER,
    ValueSchemeType::LINEAR,        ValueSchemeType::PERIODIC,   ValueSchemeType::QUANTIZED,
    ValueSchemeType::XOR,           ValueSchemeType::DELTA};
// -------------------------------------------------------------------------------------
vector<vector<DOUBLE>> Datasets()
{
   return {TestHelper::Adversarial(),
           TestHelper::Random(300),
           TestHelper::Smooth(300),
           TestHelper::Linear(300),
           TestHelper::MostlyIntegers(300),
           TestHelper::PowersOfTwo(300),
           TestHelper::NearConstant(300),
           TestHelper::Repeating({1.0, 2.0, 3.0}, 20),
           {1.0},
           {-0.0, 0.0}};
}
// -------------------------------------------------------------------------------------
vector<DOUBLE> SparseAdversarial()
{
   vector<DOUBLE> values(100, 0.0);
   values[0] = -0.0;
   values[17] = std::numeric_limits<DOUBLE>::quiet_NaN();
   values[18] = std::numeric_limits<DOUBLE>::infinity();
   values[99] = std::numeric_limits<DOUBLE>::denorm_min();
   return values;
}
// -------------------------------------------------------------------------------------
}  // namespace
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, RegistryIsComplete)
{
   const auto &pool = SchemePool::get();
   EXPECT_EQ(pool.value_schemes.size(), CS(ValueSchemeType::SCHEME_MAX));
   EXPECT_EQ(pool.timestamp_schemes.size(), CS(TimestampSchemeType::SCHEME_MAX));
   for ( u8 tag = 0; tag < CB(ValueSchemeType::SCHEME_MAX); tag++ ) {
      EXPECT_EQ(CB(SchemePool::getValueScheme(ParseValueSchemeType(tag)).schemeType()), tag);
   }
   EXPECT_THROW(ParseValueSchemeType(CB(ValueSchemeType::SCHEME_MAX)), UnknownMethodTag);
   EXPECT_THROW(ParseTimestampSchemeType(200), UnknownMethodTag);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, ForcedOnAnyData)
{
   for ( auto scheme : universal_schemes ) {
      SCOPED_TRACE(ConvertSchemeTypeToString(scheme));
      for ( const auto &values : Datasets()) {
         TestHelper::CheckForcedScheme(scheme, values);
      }
   }
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, Constant)
{
   SIZE expected_size = 0;
   for ( u32 count : {3u, 100u, 100000u} ) {
      auto payload = encodeValues(TestHelper::Constant(count, 50.0));
      EXPECT_EQ(payload.scheme, ValueSchemeType::CONSTANT);
      if ( expected_size == 0 ) {
         expected_size = payload.size();
      }
      EXPECT_EQ(payload.size(), expected_size);
   }
   EXPECT_EQ(expected_size, 16u);
   // bit equality, not numeric equality
   TestHelper::CheckForcedScheme(ValueSchemeType::CONSTANT, vector<DOUBLE>(7, -0.0));
   TestHelper::CheckForcedScheme(ValueSchemeType::CONSTANT, vector<DOUBLE>(7, std::numeric_limits<DOUBLE>::quiet_NaN()));
   // -------------------------------------------------------------------------------------
   auto adversarial = TestHelper::Adversarial();
   auto stats = ValueStats::generateStats(adversarial.data(), CU(adversarial.size()));
   EXPECT_FALSE(SchemePool::getValueScheme(ValueSchemeType::CONSTANT).isUsable(stats, {PatternType::RANDOM}));
   auto payload = encodeValues(TestHelper::Constant(10));
   EXPECT_THROW(decodeValues(payload, 11), CorruptPayload);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, MixedZerosAreNotConstant)
{
   vector<DOUBLE> values{0.0, -0.0, 0.0, 0.0};
   auto payload = encodeValues(values);
   EXPECT_NE(payload.scheme, ValueSchemeType::CONSTANT);
   EXPECT_TRUE(BitEqual(values, decodeValues(payload, 4)));
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, Sparse)
{
   auto values = TestHelper::Sparse(2000);
   auto payload = encodeValues(values);
   EXPECT_EQ(payload.scheme, ValueSchemeType::SPARSE);
   EXPECT_TRUE(BitEqual(values, decodeValues(payload, CU(values.size()))));
   EXPECT_LT(payload.size(), values.size() * sizeof(DOUBLE) / 4);
   TestHelper::CheckForcedScheme(ValueSchemeType::SPARSE, SparseAdversarial());
   // -------------------------------------------------------------------------------------
   // sparse by zero count but too dense for the index list, -0.0 counts as non zero
   vector<DOUBLE> signed_zeros(100, 0.0);
   for ( u32 row_i = 0; row_i < 60; row_i++ ) {
      signed_zeros[row_i] = -0.0;
   }
   for ( u32 row_i = 90; row_i < 100; row_i++ ) {
      signed_zeros[row_i] = 1000.0 + row_i;
   }
   auto stats = ValueStats::generateStats(signed_zeros.data(), CU(signed_zeros.size()));
   auto pattern = PatternDetector::classify(stats);
   EXPECT_EQ(pattern.type, PatternType::SPARSE);
   EXPECT_FALSE(SchemePool::getValueScheme(ValueSchemeType::SPARSE).isUsable(stats, pattern));
   auto fallback = SchemePicker::compressValues(stats, pattern);
   EXPECT_TRUE(fallback.scheme == ValueSchemeType::XOR || fallback.scheme == ValueSchemeType::DELTA);
   EXPECT_TRUE(BitEqual(signed_zeros, decodeValues(fallback, 100)));
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, DetectedSchemes)
{
   struct Case {
      vector<DOUBLE> values;
      ValueSchemeType expected;
   };
   vector<Case> cases{
       {TestHelper::PowersOfTwo(1000), ValueSchemeType::POWER_OF_2},
       {TestHelper::MostlyIntegers(1000), ValueSchemeType::MOSTLY_INTEGER},
       {TestHelper::Linear(1000), ValueSchemeType::LINEAR},
       {TestHelper::Repeating({1.0, 2.0, 3.0}, 20), ValueSchemeType::PERIODIC},
       {TestHelper::Quantized(1000, {1.5, 2.5, 3.75, 7.25}), ValueSchemeType::QUANTIZED},
   };
   for ( const auto &test_case : cases ) {
      auto payload = encodeValues(test_case.values);
      EXPECT_EQ(payload.scheme, test_case.expected);
      EXPECT_TRUE(BitEqual(test_case.values, decodeValues(payload, CU(test_case.values.size()))));
      EXPECT_LT(payload.size(), test_case.values.size() * sizeof(DOUBLE));
   }
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, PatchedSchemesNeverLoseToGeneralPath)
{
   // noise far below the quantization step: every sample would become a patch
   auto near_constant = TestHelper::NearConstant(1000);
   // a line with every third sample off the line
   auto broken_line = TestHelper::Linear(999);
   for ( u32 row_i = 0; row_i < broken_line.size(); row_i += 3 ) {
      broken_line[row_i] += 0.001;
   }
   for ( const auto &values : {near_constant, broken_line, TestHelper::MostlyIntegers(1000), TestHelper::PowersOfTwo(1000)} ) {
      auto stats = ValueStats::generateStats(values.data(), CU(values.size()));
      auto pattern = PatternDetector::classify(stats);
      auto general = SchemePicker::compressGeneral(stats, pattern);
      auto payload = SchemePicker::compressValues(stats, pattern);
      EXPECT_LE(payload.size(), general.size()) << pattern.toString();
      EXPECT_TRUE(BitEqual(values, decodeValues(payload, CU(values.size()))));
   }
   // -------------------------------------------------------------------------------------
   auto stats = ValueStats::generateStats(near_constant.data(), CU(near_constant.size()));
   auto pattern = PatternDetector::classify(stats);
   ASSERT_EQ(pattern.type, PatternType::NEAR_CONSTANT);
   auto patched = SchemePicker::compressWith(SchemePool::getValueScheme(ValueSchemeType::NEAR_CONSTANT), stats, pattern);
   EXPECT_GT(patched.size(), near_constant.size() * sizeof(DOUBLE));
   auto payload = encodeValues(near_constant);
   EXPECT_NE(payload.scheme, ValueSchemeType::NEAR_CONSTANT);
   EXPECT_LT(payload.size(), near_constant.size() * sizeof(DOUBLE));
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, LinearIsCompact)
{
   auto values = TestHelper::Linear(10000);
   auto payload = encodeValues(values);
   ASSERT_EQ(payload.scheme, ValueSchemeType::LINEAR);
   // start, delta, count, empty patch list
   EXPECT_LE(payload.size(), 8u + 8u + 3u + 1u);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, PeriodicDeviations)
{
   auto values = TestHelper::Repeating({10.5, 20.25, 30.125, 40.0}, 50);
   values[101] = 20.26;
   values[150] = -0.0;
   auto stats = ValueStats::generateStats(values.data(), CU(values.size()));
   Pattern pattern{PatternType::PERIODIC, 4};
   auto payload = SchemePicker::compressWith(SchemePool::getValueScheme(ValueSchemeType::PERIODIC), stats, pattern);
   EXPECT_TRUE(BitEqual(values, decodeValues(payload, CU(values.size()))));
   EXPECT_EQ(SchemePool::getValueScheme(ValueSchemeType::PERIODIC).fullDescription(payload.data), "PERIODIC(4)");
   // a period longer than the series cannot be used
   EXPECT_FALSE(SchemePool::getValueScheme(ValueSchemeType::PERIODIC).isUsable(stats, {PatternType::PERIODIC, 1000}));
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, XorVersusDelta)
{
   vector<DOUBLE> values{1.0, 1.0, 2.0};
   auto stats = ValueStats::generateStats(values.data(), 3);
   auto pattern = PatternDetector::classify(stats);
   auto xor_payload = SchemePicker::compressWith(SchemePool::getValueScheme(ValueSchemeType::XOR), stats, pattern);
   auto delta_payload = SchemePicker::compressWith(SchemePool::getValueScheme(ValueSchemeType::DELTA), stats, pattern);
   auto chosen = SchemePicker::compressGeneral(stats, pattern);
   // -------------------------------------------------------------------------------------
   EXPECT_EQ(chosen.size(), std::min(xor_payload.size(), delta_payload.size()));
   EXPECT_EQ(chosen.scheme, xor_payload.size() <= delta_payload.size() ? ValueSchemeType::XOR : ValueSchemeType::DELTA);
   EXPECT_TRUE(BitEqual(values, decodeValues(chosen, 3)));
   EXPECT_TRUE(BitEqual(values, decodeValues(xor_payload, 3)));
   EXPECT_TRUE(BitEqual(values, decodeValues(delta_payload, 3)));
   // 8 byte literal, a zero residual, then 1 + 6 + 6 + 11 bits
   EXPECT_EQ(xor_payload.size(), 12u);
   EXPECT_EQ(delta_payload.size(), 8u + 1u + 16u);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, SelectSmaller)
{
   ValuePayload first{ValueSchemeType::XOR, Bytes(4)};
   ValuePayload second{ValueSchemeType::DELTA, Bytes(3)};
   EXPECT_EQ(selectSmaller(first, second).scheme, ValueSchemeType::DELTA);
   second.data.resize(4);
   EXPECT_EQ(selectSmaller(first, second).scheme, ValueSchemeType::XOR);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, XorFullWidthResidual)
{
   // 0.0 followed by the pattern 0x8000000000000001 needs all 64 significant bits
   vector<DOUBLE> values{0.0, Utils::bitsToDouble(0x8000000000000001ull), 0.0};
   auto payload = TestHelper::CheckForcedScheme(ValueSchemeType::XOR, values);
   EXPECT_EQ(payload.size(), 8u + 20u);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, CorruptXorStream)
{
   ByteWriter writer;
   writer.write<DOUBLE>(1.0);
   // control 1, leading zeros 63, significant bits 2: 63 + 2 > 64
   writer.writeByte(0xFE);
   writer.writeByte(0x10);
   ValuePayload payload{ValueSchemeType::XOR, writer.release()};
   EXPECT_THROW(decodeValues(payload, 2), CorruptXorStream);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, DeltaZeroRuns)
{
   vector<DOUBLE> values(1000, 3.25);
   for ( u32 row_i = 0; row_i < values.size(); row_i += 50 ) {
      values[row_i] = 3.25 + row_i;
   }
   auto payload = TestHelper::CheckForcedScheme(ValueSchemeType::DELTA, values);
   EXPECT_EQ(SchemePool::getValueScheme(ValueSchemeType::DELTA).fullDescription(payload.data), "DELTA(zero-run)");
   EXPECT_LT(payload.size(), values.size() * sizeof(DOUBLE) / 4);
   // -------------------------------------------------------------------------------------
   auto plain = TestHelper::CheckForcedScheme(ValueSchemeType::DELTA, TestHelper::Random(100));
   EXPECT_EQ(SchemePool::getValueScheme(ValueSchemeType::DELTA).fullDescription(plain.data), "DELTA(plain)");
   EXPECT_EQ(plain.size(), 8u + 1u + 99u * 8u);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, DisabledSchemeFallsBack)
{
   auto saved = TsBlocksConfig::get().values.schemes;
   TsBlocksConfig::get().values.schemes.disable(ValueSchemeType::POWER_OF_2);
   auto values = TestHelper::PowersOfTwo(500);
   auto payload = encodeValues(values);
   TsBlocksConfig::get().values.schemes = saved;
   EXPECT_TRUE(payload.scheme == ValueSchemeType::XOR || payload.scheme == ValueSchemeType::DELTA);
   EXPECT_TRUE(BitEqual(values, decodeValues(payload, 500)));
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, OverrideScheme)
{
   {
      EnforceScheme enforcer(ValueSchemeType::QUANTIZED);
      auto values = TestHelper::Random(100);
      auto payload = encodeValues(values);
      EXPECT_EQ(payload.scheme, ValueSchemeType::QUANTIZED);
      EXPECT_TRUE(BitEqual(values, decodeValues(payload, 100)));
   }
   {
      // not usable, automatic selection takes over
      EnforceScheme enforcer(ValueSchemeType::CONSTANT);
      auto payload = encodeValues(TestHelper::Linear(100));
      EXPECT_EQ(payload.scheme, ValueSchemeType::LINEAR);
   }
   EXPECT_NE(encodeValues(TestHelper::Random(100)).scheme, ValueSchemeType::QUANTIZED);
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, Truncation)
{
   vector<std::pair<ValueSchemeType, vector<DOUBLE>>> cases;
   for ( auto scheme : universal_schemes ) {
      cases.emplace_back(scheme, TestHelper::Adversarial());
      cases.emplace_back(scheme, TestHelper::Smooth(40));
   }
   cases.emplace_back(ValueSchemeType::CONSTANT, TestHelper::Constant(40));
   cases.emplace_back(ValueSchemeType::SPARSE, SparseAdversarial());
   cases.emplace_back(ValueSchemeType::DELTA, vector<DOUBLE>(40, 1.0));
   // -------------------------------------------------------------------------------------
   for ( const auto &[scheme, values] : cases ) {
      SCOPED_TRACE(ConvertSchemeTypeToString(scheme));
      auto payload = TestHelper::CheckForcedScheme(scheme, values);
      for ( SIZE length = 0; length < payload.size(); length++ ) {
         ValuePayload truncated{payload.scheme, Bytes(payload.data.begin(), payload.data.begin() + length)};
         EXPECT_THROW(decodeValues(truncated, CU(values.size())), DecodeException) << "cut at " << length;
      }
   }
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, TrailingBytes)
{
   for ( auto scheme : universal_schemes ) {
      auto values = TestHelper::Smooth(20);
      auto payload = TestHelper::CheckForcedScheme(scheme, values);
      payload.data.push_back(0x00);
      EXPECT_THROW(decodeValues(payload, 20), CorruptPayload) << ConvertSchemeTypeToString(scheme);
   }
}
// -------------------------------------------------------------------------------------
TEST(ValueSchemes, CorruptContent)
{
   // dictionary index beyond the dictionary
   ByteWriter writer;
   Varint::encode(1, writer);
   writer.write<DOUBLE>(4.0);
   writer.writeByte(1);
   writer.writeByte(0);
   writer.writeByte(1);
   EXPECT_THROW(decodeValues({ValueSchemeType::QUANTIZED, writer.release()}, 2), CorruptPayload);
   // index width that does not exist
   Varint::encode(1, writer);
   writer.write<DOUBLE>(4.0);
   writer.writeByte(3);
   writer.writeByte(0);
   EXPECT_THROW(decodeValues({ValueSchemeType::QUANTIZED, writer.release()}, 1), CorruptPayload);
   // unknown delta variant
   writer.write<DOUBLE>(4.0);
   writer.writeByte(7);
   EXPECT_THROW(decodeValues({ValueSchemeType::DELTA, writer.release()}, 1), CorruptPayload);
   // exponent beyond the double range
   Varint::encode(5000, writer);
   EXPECT_THROW(decodeValues({ValueSchemeType::POWER_OF_2, writer.release()}, 1), CorruptPayload);
}
// -------------------------------------------------------------------------------------
