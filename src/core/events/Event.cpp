#include "Event.hpp"

namespace docguard {

const char* to_string(EventKind k) {
  switch (k) {
    case EventKind::Uploaded:      return "FileUploaded";
    case EventKind::AccessGranted: return "AccessGranted";
    case EventKind::AccessRevoked: return "AccessRevoked";
  }
  return "Unknown";
}

std::optional<EventKind> parseEventKind(const std::string& name) {
  if (name == "FileUploaded")  return EventKind::Uploaded;
  if (name == "AccessGranted") return EventKind::AccessGranted;
  if (name == "AccessRevoked") return EventKind::AccessRevoked;
  return std::nullopt;
}

Event makeUploadedEvent(const FileRecord& r) {
  Event e;
  e.kind           = EventKind::Uploaded;
  e.fileHash       = r.fileHash;
  e.principal      = r.uploader;
  e.timestamp      = r.timestamp;
  e.storagePointer = r.storagePointer;
  e.signature      = r.signature;
  e.lock           = r.lock;
  return e;
}

Event makeAccessEvent(EventKind kind, const FileHash& h, const Principal& grantee, int64_t at) {
  Event e;
  e.kind      = kind;
  e.fileHash  = h;
  e.principal = grantee;
  e.timestamp = at;
  return e;
}

} // namespace docguard
