#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "core/provenance/FileRecord.hpp"

namespace docguard {

enum class EventKind : int {
  Uploaded      = 1,
  AccessGranted = 2,
  AccessRevoked = 3
};

const char* to_string(EventKind k);
std::optional<EventKind> parseEventKind(const std::string& name);

// One state transition. `principal` is the uploader for Uploaded and the
// grantee otherwise; storagePointer/signature/lock are set only for Uploaded.
struct Event {
  uint64_t     sequence = 0;   // assigned by the store on append
  EventKind    kind = EventKind::Uploaded;
  FileHash     fileHash{};
  Principal    principal{};
  int64_t      timestamp = 0;
  std::string  storagePointer;
  Bytes        signature;
  LocationLock lock;
};

Event makeUploadedEvent(const FileRecord& r);
Event makeAccessEvent(EventKind kind, const FileHash& h, const Principal& grantee, int64_t at);

} // namespace docguard
