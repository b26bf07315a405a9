#include "FixedPoint.hpp"

namespace docguard::fixedpoint {

int64_t toRadians(int64_t microDegrees) {
  return (microDegrees * kPiNumerator) / kPiDenominator;
}

int64_t cosApprox(int64_t x) {
  const int64_t x2 = (x * x) / kScale;
  const int64_t x4 = (x2 * x2) / kScale;
  return kScale - x2 / 2 + x4 / 24;
}

int64_t isqrt(int64_t n) {
  if (n <= 0) return 0;
  int64_t z = n / 2 + n % 2;    // (n + 1) / 2 without overflow at INT64_MAX
  int64_t y = n;
  while (z < y) {
    y = z;
    z = (n / z + z) / 2;
  }
  return y;
}

int64_t planarDistanceMeters(int32_t lat1, int32_t lon1, int32_t lat2, int32_t lon2) {
  const int64_t lat1Rad = toRadians(lat1);
  const int64_t lat2Rad = toRadians(lat2);
  const int64_t lon1Rad = toRadians(lon1);
  const int64_t lon2Rad = toRadians(lon2);

  const int64_t dLat = lat2Rad - lat1Rad;
  const int64_t dLon = lon2Rad - lon1Rad;

  const int64_t c = cosApprox(lat1Rad);
  const int64_t x = (dLon * c) / kScale;
  const int64_t y = dLat;

  const int64_t root = isqrt(x * x + y * y);
  return (root * kEarthRadiusMeters) / kScale;
}

} // namespace docguard::fixedpoint
