#include "Registry.hpp"

#include <spdlog/spdlog.h>

#include "core/events/EventLog.hpp"
#include "core/store/VaultStore.hpp"

namespace docguard {

Result<FileRecord, RegistryError> Registry::put(const FileHash& fileHash,
                                                const Principal& uploader,
                                                const std::string& storagePointer,
                                                const Bytes& signature,
                                                const LocationLock& lock,
                                                int64_t timestamp) {
  using R = Result<FileRecord, RegistryError>;
  try {
    StoreTransaction tx(store_);

    if (store_.findRecord(fileHash))
      return R::failure(RegistryError::AlreadyExists, "file " + toHex(fileHash) + " already registered");
    if (storagePointer.empty())
      return R::failure(RegistryError::InvalidPointer, "storage pointer must not be empty");

    FileRecord rec;
    rec.fileHash       = fileHash;
    rec.uploader       = uploader;
    rec.storagePointer = storagePointer;
    rec.signature      = signature;
    rec.timestamp      = timestamp;
    rec.lock           = lock;

    store_.insertRecord(rec);
    for (const auto& l : listeners_) l(rec);
    log_.append(makeUploadedEvent(rec));

    tx.commit();
    return R::success(std::move(rec));
  } catch (const std::exception& e) {
    spdlog::error("registry put {} failed: {}", toHex(fileHash), e.what());
    return R::failure(RegistryError::StorageFailure, e.what());
  }
}

std::optional<FileRecord> Registry::get(const FileHash& fileHash) const {
  try {
    return store_.findRecord(fileHash);
  } catch (const std::exception& e) {
    spdlog::error("registry get {} failed: {}", toHex(fileHash), e.what());
    return std::nullopt;
  }
}

bool Registry::exists(const FileHash& fileHash) const {
  return get(fileHash).has_value();
}

std::optional<FileRecord> Registry::find(const FileHash& fileHash) const {
  return store_.findRecord(fileHash);
}

void Registry::onRecordCreated(CreatedListener listener) {
  listeners_.push_back(std::move(listener));
}

} // namespace docguard
