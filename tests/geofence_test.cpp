#include <gtest/gtest.h>

#include <limits>
#include <utility>
#include <vector>

#include "TestSupport.hpp"
#include "core/events/EventLog.hpp"
#include "core/geofence/GeofenceEngine.hpp"
#include "core/registry/Registry.hpp"
#include "core/store/InMemoryStore.hpp"

using namespace docguard;
using namespace docguard::test;

namespace {

class GeofenceTest : public ::testing::Test {
protected:
  InMemoryStore  store;
  EventLog       log{store};
  Registry       registry{store, log};
  GeofenceEngine engine{registry};

  FileHash put(uint8_t seed, const LocationLock& lock) {
    auto h = make_hash(seed);
    auto r = registry.put(h, make_principal(1), "ipfs://Qm" + std::to_string(seed),
                          make_signature(seed), lock, 1000);
    EXPECT_TRUE(r.ok());
    return h;
  }
};

} // namespace

TEST_F(GeofenceTest, UnknownFileIsNotFound) {
  auto r = engine.verify(make_hash(99), 0, 0);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.kind(), GeofenceError::NotFound);
  EXPECT_EQ(engine.distanceMeters(make_hash(99), 0, 0).kind(), GeofenceError::NotFound);
}

TEST_F(GeofenceTest, NoLockAlwaysVerifies) {
  auto h = put(1, LocationLock{});
  constexpr int32_t hi = std::numeric_limits<int32_t>::max();
  constexpr int32_t lo = std::numeric_limits<int32_t>::min();
  const std::vector<std::pair<int32_t, int32_t>> points = {
    {0, 0}, {hi, lo}, {lo, hi}, {-90000000, 180000000}};
  for (const auto& [lat, lon] : points) {
    auto r = engine.verify(h, lat, lon);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value());
  }
  EXPECT_EQ(engine.distanceMeters(h, hi, hi).value(), 0);
}

TEST_F(GeofenceTest, ExactLockCoordinateVerifiesForAnyRadius) {
  uint8_t seed = 10;
  for (uint32_t radius : {0u, 1u, 100u, std::numeric_limits<uint32_t>::max()}) {
    auto h = put(seed++, la_lock(radius));
    EXPECT_EQ(engine.distanceMeters(h, 34052235, -118243683).value(), 0);
    auto r = engine.verify(h, 34052235, -118243683);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value()) << "radius=" << radius;
  }
}

TEST_F(GeofenceTest, NearbyPointInsideHundredMetreLock) {
  auto h = put(2, la_lock(100));
  // 0.0009 deg north computes to 6 m with this approximation
  EXPECT_EQ(engine.distanceMeters(h, 34053135, -118243683).value(), 6);
  EXPECT_TRUE(engine.verify(h, 34053135, -118243683).value());
}

TEST_F(GeofenceTest, BoundaryIncludesExactRadius) {
  // 34060651 computes to exactly 95 m from the lock
  auto onEdge = put(3, la_lock(95));
  EXPECT_EQ(engine.distanceMeters(onEdge, 34060651, -118243683).value(), 95);
  EXPECT_TRUE(engine.verify(onEdge, 34060651, -118243683).value());

  auto inside = put(4, la_lock(94));
  EXPECT_FALSE(engine.verify(inside, 34060651, -118243683).value());
}

TEST_F(GeofenceTest, HundredMetreBoundaryFallsBetweenAngleSteps) {
  auto h = put(5, la_lock(100));
  EXPECT_TRUE(engine.verify(h, 34060651, -118243683).value());   // 95 m
  EXPECT_FALSE(engine.verify(h, 34061224, -118243683).value());  // 101 m
  EXPECT_FALSE(engine.verify(h, 35052235, -118243683).value());
}

TEST_F(GeofenceTest, ContainsIgnoresCoordinatesWhenDisabled) {
  LocationLock off = la_lock(0);
  off.enabled = false;
  EXPECT_TRUE(GeofenceEngine::contains(off, 0, 0));
  EXPECT_FALSE(GeofenceEngine::contains(la_lock(0), 34061224, -118243683));
}
