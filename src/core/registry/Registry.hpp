#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/provenance/Errors.hpp"
#include "core/provenance/FileRecord.hpp"
#include "core/provenance/Result.hpp"

namespace docguard {

class EventLog;
class VaultStore;

// Write-once store of FileRecords keyed by content hash.
class Registry {
public:
  using CreatedListener = std::function<void(const FileRecord&)>;

  Registry(VaultStore& store, EventLog& log) : store_(store), log_(log) {}

  // Creates the record with the caller-supplied clock value. Re-uploading a
  // known hash is an error, not a no-op. On success the created-listeners
  // run and an Uploaded event is appended, all in one store transaction.
  Result<FileRecord, RegistryError> put(const FileHash& fileHash,
                                        const Principal& uploader,
                                        const std::string& storagePointer,
                                        const Bytes& signature,
                                        const LocationLock& lock,
                                        int64_t timestamp);

  // Absence is a valid answer; store failures are logged and read as absent.
  std::optional<FileRecord> get(const FileHash& fileHash) const;
  bool exists(const FileHash& fileHash) const;

  // Like get() but lets store failures escape as std::runtime_error.
  std::optional<FileRecord> find(const FileHash& fileHash) const;

  // Invoked inside put()'s transaction; a throwing listener aborts the put.
  void onRecordCreated(CreatedListener listener);

private:
  VaultStore& store_;
  EventLog&   log_;
  std::vector<CreatedListener> listeners_;
};

} // namespace docguard
