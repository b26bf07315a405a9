#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "services/api/JsonCodec.hpp"

using namespace docguard;
using namespace docguard::test;
using nlohmann::json;

TEST(JsonCodecTest, RecordWithLock) {
  FileRecord r;
  r.fileHash = make_hash(1);
  r.uploader = make_principal(2);
  r.storagePointer = "ipfs://QmX";
  r.signature = Bytes{0xab, 0xcd};
  r.timestamp = 1700000000;
  r.lock = la_lock(250);

  auto j = api::recordToJson(r);
  EXPECT_EQ(j["fileHash"], toHex(r.fileHash));
  EXPECT_EQ(j["uploader"], toHex(r.uploader));
  EXPECT_EQ(j["storagePointer"], "ipfs://QmX");
  EXPECT_EQ(j["signature"], "0xabcd");
  EXPECT_EQ(j["timestamp"], 1700000000);
  EXPECT_EQ(j["hasLocationLock"], true);
  EXPECT_EQ(j["latitude"], "34.052235");
  EXPECT_EQ(j["longitude"], "-118.243683");
  EXPECT_EQ(j["radius"], 250);
}

TEST(JsonCodecTest, RecordWithoutLockOmitsCoordinates) {
  FileRecord r;
  r.storagePointer = "p";
  auto j = api::recordToJson(r);
  EXPECT_EQ(j["hasLocationLock"], false);
  EXPECT_FALSE(j.contains("latitude"));
}

TEST(JsonCodecTest, AccessEventNamesGrantee) {
  auto e = makeAccessEvent(EventKind::AccessRevoked, make_hash(1), make_principal(3), 42);
  e.sequence = 7;
  auto j = api::eventToJson(e);
  EXPECT_EQ(j["event"], "AccessRevoked");
  EXPECT_EQ(j["grantee"], toHex(make_principal(3)));
  EXPECT_EQ(j["sequence"], 7);
  EXPECT_FALSE(j.contains("uploader"));

  auto arr = api::eventsToJson({e, e});
  ASSERT_TRUE(arr.is_array());
  EXPECT_EQ(arr.size(), 2u);
}

TEST(JsonCodecTest, MicroDegreesFromJsonValues) {
  EXPECT_EQ(api::microDegreesFrom(json("34.052235")), 34052235);
  EXPECT_EQ(api::microDegreesFrom(json(-118.5)), -118500000);
  EXPECT_EQ(api::microDegreesFrom(json(12)), 12000000);
  EXPECT_FALSE(api::microDegreesFrom(json(1e12)).has_value());
  EXPECT_FALSE(api::microDegreesFrom(json(nullptr)).has_value());
  EXPECT_FALSE(api::microDegreesFrom(json::array()).has_value());
}

TEST(JsonCodecTest, MicroDegreesRejectsHugeUnsigned) {
  EXPECT_FALSE(api::microDegreesFrom(json(uint64_t{18446744073709551615ULL})).has_value());
  EXPECT_FALSE(api::microDegreesFrom(json(uint64_t{9223372036854775808ULL})).has_value());
  EXPECT_EQ(api::microDegreesFrom(json(uint64_t{90})), 90000000);
}

TEST(JsonCodecTest, ParseIntegerRequiresWholeString) {
  EXPECT_EQ(api::parseInteger("42"), 42);
  EXPECT_EQ(api::parseInteger("+7"), 7);
  EXPECT_EQ(api::parseInteger("-3"), -3);
  EXPECT_FALSE(api::parseInteger("").has_value());
  EXPECT_FALSE(api::parseInteger("12abc").has_value());
  EXPECT_FALSE(api::parseInteger("1.5").has_value());
  EXPECT_FALSE(api::parseInteger(" 1").has_value());
  EXPECT_FALSE(api::parseInteger("99999999999999999999").has_value());
}

TEST(JsonCodecTest, RadiusFromQueryStringRejectsOutOfRange) {
  EXPECT_EQ(api::parseRadius("0"), 0u);
  EXPECT_EQ(api::parseRadius("100"), 100u);
  EXPECT_EQ(api::parseRadius("4294967295"), 4294967295u);
  EXPECT_FALSE(api::parseRadius("-1").has_value());
  EXPECT_FALSE(api::parseRadius("4294967296").has_value());
  EXPECT_FALSE(api::parseRadius("4294967396").has_value());
  EXPECT_FALSE(api::parseRadius("100.5").has_value());
  EXPECT_FALSE(api::parseRadius("abc").has_value());
}

TEST(JsonCodecTest, RadiusFromJsonRejectsNegativeDecimalAndOverflow) {
  EXPECT_EQ(api::radiusFrom(json(250)), 250u);
  EXPECT_EQ(api::radiusFrom(json("250")), 250u);
  EXPECT_EQ(api::radiusFrom(json(uint64_t{4294967295ULL})), 4294967295u);
  EXPECT_FALSE(api::radiusFrom(json(-1)).has_value());
  EXPECT_FALSE(api::radiusFrom(json(uint64_t{4294967296ULL})).has_value());
  EXPECT_FALSE(api::radiusFrom(json(100.5)).has_value());
  EXPECT_FALSE(api::radiusFrom(json("-1")).has_value());
  EXPECT_FALSE(api::radiusFrom(json(nullptr)).has_value());
  EXPECT_FALSE(api::radiusFrom(json(true)).has_value());
}

TEST(JsonCodecTest, LimitMustBeNonNegative) {
  EXPECT_EQ(api::parseLimit("0"), size_t{0});
  EXPECT_EQ(api::parseLimit("50"), size_t{50});
  EXPECT_FALSE(api::parseLimit("-1").has_value());
  EXPECT_FALSE(api::parseLimit("ten").has_value());
}
