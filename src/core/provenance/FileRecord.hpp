#pragma once
#include <cstdint>
#include <string>

#include "Identifiers.hpp"

namespace docguard {

// Circular lock in micro-degrees (scale 1e6). radiusMeters is meaningful
// only when enabled.
struct LocationLock {
  bool     enabled       = false;
  int32_t  latitude      = 0;
  int32_t  longitude     = 0;
  uint32_t radiusMeters  = 0;
};

// Immutable once stored. Field order is the persisted order.
struct FileRecord {
  FileHash     fileHash{};
  Principal    uploader{};
  std::string  storagePointer;
  Bytes        signature;
  int64_t      timestamp = 0;
  LocationLock lock;
};

inline bool operator==(const LocationLock& a, const LocationLock& b) {
  return a.enabled == b.enabled && a.latitude == b.latitude &&
         a.longitude == b.longitude && a.radiusMeters == b.radiusMeters;
}

inline bool operator==(const FileRecord& a, const FileRecord& b) {
  return a.fileHash == b.fileHash && a.uploader == b.uploader &&
         a.storagePointer == b.storagePointer && a.signature == b.signature &&
         a.timestamp == b.timestamp && a.lock == b.lock;
}

} // namespace docguard
