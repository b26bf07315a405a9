#include "GeofenceEngine.hpp"

#include <spdlog/spdlog.h>

#include "core/math/FixedPoint.hpp"
#include "core/registry/Registry.hpp"

namespace docguard {

bool GeofenceEngine::contains(const LocationLock& lock, int32_t lat, int32_t lon) {
  if (!lock.enabled) return true;
  const int64_t d = fixedpoint::planarDistanceMeters(lock.latitude, lock.longitude, lat, lon);
  return d <= static_cast<int64_t>(lock.radiusMeters);
}

Result<FileRecord, GeofenceError> GeofenceEngine::load(const FileHash& fileHash) const {
  using R = Result<FileRecord, GeofenceError>;
  try {
    auto rec = registry_.find(fileHash);
    if (!rec) return R::failure(GeofenceError::NotFound, "file " + toHex(fileHash) + " not found");
    return R::success(std::move(*rec));
  } catch (const std::exception& e) {
    spdlog::error("geofence lookup {} failed: {}", toHex(fileHash), e.what());
    return R::failure(GeofenceError::StorageFailure, e.what());
  }
}

Result<bool, GeofenceError> GeofenceEngine::verify(const FileHash& fileHash,
                                                   int32_t currentLat, int32_t currentLon) const {
  using R = Result<bool, GeofenceError>;
  auto rec = load(fileHash);
  if (!rec) return R::failure(rec.kind(), rec.error().message);
  return R::success(contains(rec.value().lock, currentLat, currentLon));
}

Result<int64_t, GeofenceError> GeofenceEngine::distanceMeters(const FileHash& fileHash,
                                                              int32_t currentLat, int32_t currentLon) const {
  using R = Result<int64_t, GeofenceError>;
  auto rec = load(fileHash);
  if (!rec) return R::failure(rec.kind(), rec.error().message);
  const auto& lock = rec.value().lock;
  if (!lock.enabled) return R::success(0);
  return R::success(fixedpoint::planarDistanceMeters(lock.latitude, lock.longitude,
                                                     currentLat, currentLon));
}

} // namespace docguard
