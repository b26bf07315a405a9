#pragma once
#include <cstdint>

namespace docguard::fixedpoint {

// Integer-only approximations shared by every runtime that verifies a
// geofence. The operation order (and therefore every truncation) is part of
// the contract: a reordered expression produces different boundary results.

constexpr int64_t kScale              = 1'000'000;    // 6 fractional decimal digits
constexpr int64_t kPiNumerator        = 314'159;
constexpr int64_t kPiDenominator      = 180'000'000;
constexpr int64_t kEarthRadiusMeters  = 6'371'000;

// micro-degrees -> angle units of `microDegrees * 314159 / 180000000`.
// Truncates toward zero. Note the multiplier is pi/180 divided by 10, so one
// unit is 1e-5 rad rather than 1e-6 rad; distances derived from it are about
// one tenth of the true surface distance.
int64_t toRadians(int64_t microDegrees);

// 1e6 - x^2/2 + x^4/24 with x in the scale above (x^2 and x^4 each rescaled
// by 1e6). Valid near zero only; diverges for |x| beyond ~2e6.
int64_t cosApprox(int64_t x);

// Babylonian integer square root: z0 = (n+1)/2, z = (n/z + z)/2 while it
// keeps decreasing. n <= 0 yields 0; exact for perfect squares.
int64_t isqrt(int64_t n);

// Planar small-angle distance between two micro-degree coordinates:
// x = dLon * cos(lat1) / 1e6, y = dLat, isqrt(x^2 + y^2) * R / 1e6.
// For every signed 32-bit input the intermediates stay below 2^53.
int64_t planarDistanceMeters(int32_t lat1, int32_t lon1, int32_t lat2, int32_t lon2);

} // namespace docguard::fixedpoint
