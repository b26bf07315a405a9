#include "ProvenanceVault.hpp"

#include <mutex>
#include <spdlog/spdlog.h>

#include "core/store/VaultStore.hpp"

namespace docguard {

ProvenanceVault::ProvenanceVault(VaultStore& store, const Clock& clock)
  : clock_(clock),
    log_(store),
    registry_(store, log_),
    access_(store, registry_, log_),
    geofence_(registry_) {}

Result<FileRecord, RegistryError> ProvenanceVault::upload(const UploadRequest& req) {
  LocationLock lock;
  if (req.hasLocationLock) {
    lock.enabled      = true;
    lock.latitude     = req.latitude;
    lock.longitude    = req.longitude;
    lock.radiusMeters = req.radiusMeters;
  }

  std::unique_lock<std::shared_mutex> guard(mu_);
  auto res = registry_.put(req.fileHash, req.uploader, req.storagePointer,
                           req.signature, lock, clock_.now());
  if (res) {
    spdlog::info("uploaded {} by {} -> {}", toHex(req.fileHash), toHex(req.uploader),
                 req.storagePointer);
  } else if (res.kind() != RegistryError::StorageFailure) {
    spdlog::warn("upload {} rejected: {} ({})", toHex(req.fileHash),
                 to_string(res.kind()), res.error().message);
  }
  return res;
}

AccessResult ProvenanceVault::grantAccess(const FileHash& h, const Principal& caller,
                                          const Principal& grantee) {
  std::unique_lock<std::shared_mutex> guard(mu_);
  auto res = access_.grant(h, caller, grantee, clock_.now());
  if (res) spdlog::info("granted {} on {}", toHex(grantee), toHex(h));
  else     spdlog::warn("grant on {} rejected: {}", toHex(h), to_string(res.kind()));
  return res;
}

AccessResult ProvenanceVault::revokeAccess(const FileHash& h, const Principal& caller,
                                           const Principal& grantee) {
  std::unique_lock<std::shared_mutex> guard(mu_);
  auto res = access_.revoke(h, caller, grantee, clock_.now());
  if (res) spdlog::info("revoked {} on {}", toHex(grantee), toHex(h));
  else     spdlog::warn("revoke on {} rejected: {}", toHex(h), to_string(res.kind()));
  return res;
}

std::optional<FileRecord> ProvenanceVault::getRecord(const FileHash& h) const {
  std::shared_lock<std::shared_mutex> guard(mu_);
  return registry_.get(h);
}

bool ProvenanceVault::exists(const FileHash& h) const {
  std::shared_lock<std::shared_mutex> guard(mu_);
  return registry_.exists(h);
}

bool ProvenanceVault::canAccess(const FileHash& h, const Principal& p) const {
  std::shared_lock<std::shared_mutex> guard(mu_);
  return access_.canAccess(h, p);
}

Result<bool, GeofenceError> ProvenanceVault::verifyLocation(const FileHash& h,
                                                            int32_t lat, int32_t lon) const {
  std::shared_lock<std::shared_mutex> guard(mu_);
  return geofence_.verify(h, lat, lon);
}

Result<int64_t, GeofenceError> ProvenanceVault::distanceMeters(const FileHash& h,
                                                               int32_t lat, int32_t lon) const {
  std::shared_lock<std::shared_mutex> guard(mu_);
  return geofence_.distanceMeters(h, lat, lon);
}

std::vector<Event> ProvenanceVault::queryEvents(const EventQuery& q) const {
  std::shared_lock<std::shared_mutex> guard(mu_);
  return log_.query(q);
}

} // namespace docguard
