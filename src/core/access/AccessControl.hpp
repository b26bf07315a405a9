#pragma once
#include <cstdint>

#include "core/provenance/Errors.hpp"
#include "core/provenance/FileRecord.hpp"
#include "core/provenance/Result.hpp"

namespace docguard {

class EventLog;
class Registry;
class VaultStore;

using AccessResult = Result<Unit, AccessError>;

// Per-file allow-list keyed by (fileHash, principal). Only the recorded
// uploader may change it, and never to remove their own entry.
class AccessControl {
public:
  // Subscribes to `registry` so every new record grants its uploader access.
  AccessControl(VaultStore& store, Registry& registry, EventLog& log);
  AccessControl(const AccessControl&) = delete;
  AccessControl& operator=(const AccessControl&) = delete;

  // Appends AccessGranted even when the grantee already had access.
  AccessResult grant(const FileHash& fileHash, const Principal& caller,
                     const Principal& grantee, int64_t at);

  // Appends AccessRevoked even when the grantee had no access.
  AccessResult revoke(const FileHash& fileHash, const Principal& caller,
                      const Principal& grantee, int64_t at);

  // Absent relation reads as false.
  bool canAccess(const FileHash& fileHash, const Principal& principal) const;

private:
  void init(const FileHash& fileHash, const Principal& uploader);

  AccessResult authorize(const FileHash& fileHash, const Principal& caller) const;

  AccessResult apply(const FileHash& fileHash, const Principal& caller,
                     const Principal& grantee, int64_t at, bool allowed);

  VaultStore&     store_;
  const Registry& registry_;
  EventLog&       log_;
};

} // namespace docguard
