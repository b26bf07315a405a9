#pragma once
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "core/access/AccessControl.hpp"
#include "core/events/EventLog.hpp"
#include "core/geofence/GeofenceEngine.hpp"
#include "core/registry/Registry.hpp"
#include "core/vault/Clock.hpp"

namespace docguard {

class VaultStore;

constexpr uint32_t kDefaultLockRadiusMeters = 100;

struct UploadRequest {
  FileHash    fileHash{};
  Principal   uploader{};
  std::string storagePointer;
  Bytes       signature;
  bool        hasLocationLock = false;
  int32_t     latitude = 0;
  int32_t     longitude = 0;
  uint32_t    radiusMeters = kDefaultLockRadiusMeters;
};

// Host-facing entry point. Transitions (upload, grant, revoke) run one at a
// time under an exclusive lock; reads share the lock and so observe either
// all or none of a transition.
class ProvenanceVault {
public:
  ProvenanceVault(VaultStore& store, const Clock& clock);
  ProvenanceVault(const ProvenanceVault&) = delete;
  ProvenanceVault& operator=(const ProvenanceVault&) = delete;

  Result<FileRecord, RegistryError> upload(const UploadRequest& req);
  AccessResult grantAccess(const FileHash& h, const Principal& caller, const Principal& grantee);
  AccessResult revokeAccess(const FileHash& h, const Principal& caller, const Principal& grantee);

  std::optional<FileRecord> getRecord(const FileHash& h) const;
  bool exists(const FileHash& h) const;
  bool canAccess(const FileHash& h, const Principal& p) const;
  Result<bool, GeofenceError> verifyLocation(const FileHash& h, int32_t lat, int32_t lon) const;
  Result<int64_t, GeofenceError> distanceMeters(const FileHash& h, int32_t lat, int32_t lon) const;
  std::vector<Event> queryEvents(const EventQuery& q = {}) const;

private:
  const Clock&   clock_;
  EventLog       log_;
  Registry       registry_;
  AccessControl  access_;
  GeofenceEngine geofence_;

  mutable std::shared_mutex mu_;
};

} // namespace docguard
