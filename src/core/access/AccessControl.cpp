#include "AccessControl.hpp"

#include <spdlog/spdlog.h>

#include "core/events/EventLog.hpp"
#include "core/registry/Registry.hpp"
#include "core/store/VaultStore.hpp"

namespace docguard {

AccessControl::AccessControl(VaultStore& store, Registry& registry, EventLog& log)
  : store_(store), registry_(registry), log_(log) {
  registry.onRecordCreated([this](const FileRecord& r) { init(r.fileHash, r.uploader); });
}

void AccessControl::init(const FileHash& fileHash, const Principal& uploader) {
  store_.setAccess(fileHash, uploader, true);
}

AccessResult AccessControl::authorize(const FileHash& fileHash, const Principal& caller) const {
  auto rec = registry_.find(fileHash);
  if (!rec)
    return AccessResult::failure(AccessError::NotFound, "file " + toHex(fileHash) + " not found");
  if (rec->uploader != caller)
    return AccessResult::failure(AccessError::Unauthorized, "only the uploader can change access");
  return AccessResult::success(Unit{});
}

AccessResult AccessControl::apply(const FileHash& fileHash, const Principal& caller,
                                  const Principal& grantee, int64_t at, bool allowed) {
  try {
    StoreTransaction tx(store_);

    auto auth = authorize(fileHash, caller);
    if (!auth) return auth;

    if (allowed && isNull(grantee))
      return AccessResult::failure(AccessError::InvalidGrantee, "grantee must not be the null identity");
    if (!allowed && grantee == caller)
      return AccessResult::failure(AccessError::SelfRevocation, "uploader cannot revoke own access");

    store_.setAccess(fileHash, grantee, allowed);
    log_.append(makeAccessEvent(allowed ? EventKind::AccessGranted : EventKind::AccessRevoked,
                                fileHash, grantee, at));
    tx.commit();
    return AccessResult::success(Unit{});
  } catch (const std::exception& e) {
    spdlog::error("access update on {} failed: {}", toHex(fileHash), e.what());
    return AccessResult::failure(AccessError::StorageFailure, e.what());
  }
}

AccessResult AccessControl::grant(const FileHash& fileHash, const Principal& caller,
                                  const Principal& grantee, int64_t at) {
  return apply(fileHash, caller, grantee, at, true);
}

AccessResult AccessControl::revoke(const FileHash& fileHash, const Principal& caller,
                                   const Principal& grantee, int64_t at) {
  return apply(fileHash, caller, grantee, at, false);
}

bool AccessControl::canAccess(const FileHash& fileHash, const Principal& principal) const {
  try {
    return store_.findAccess(fileHash, principal).value_or(false);
  } catch (const std::exception& e) {
    spdlog::error("access check on {} failed: {}", toHex(fileHash), e.what());
    return false;
  }
}

} // namespace docguard
