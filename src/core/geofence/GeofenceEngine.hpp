#pragma once
#include <cstdint>

#include "core/provenance/Errors.hpp"
#include "core/provenance/FileRecord.hpp"
#include "core/provenance/Result.hpp"

namespace docguard {

class Registry;

// Decides whether a live coordinate lies inside a record's circular lock.
//
// Distances come from fixedpoint::planarDistanceMeters, a small-angle planar
// projection in integer arithmetic. It is only meaningful for short
// separations; far-apart points (different hemispheres, across the
// antimeridian) produce numbers with no geodesic meaning. Because the degree
// conversion scalar is pi/1800, the computed figure is roughly one tenth of
// the true distance and moves in steps of about 6.37 m. These figures are
// reproduced bit for bit so that every runtime agrees on the boundary.
class GeofenceEngine {
public:
  explicit GeofenceEngine(const Registry& registry) : registry_(registry) {}

  // true when the record has no lock, otherwise distance <= radius.
  Result<bool, GeofenceError> verify(const FileHash& fileHash,
                                     int32_t currentLat, int32_t currentLon) const;

  // Computed distance to the lock centre; 0 when the record has no lock.
  Result<int64_t, GeofenceError> distanceMeters(const FileHash& fileHash,
                                                int32_t currentLat, int32_t currentLon) const;

  static bool contains(const LocationLock& lock, int32_t lat, int32_t lon);

private:
  Result<FileRecord, GeofenceError> load(const FileHash& fileHash) const;

  const Registry& registry_;
};

} // namespace docguard
