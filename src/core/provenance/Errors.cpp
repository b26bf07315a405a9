#include "Errors.hpp"

namespace docguard {

const char* to_string(RegistryError e) {
  switch (e) {
    case RegistryError::AlreadyExists:  return "AlreadyExists";
    case RegistryError::InvalidPointer: return "InvalidPointer";
    case RegistryError::StorageFailure: return "StorageFailure";
  }
  return "Unknown";
}

const char* to_string(AccessError e) {
  switch (e) {
    case AccessError::NotFound:       return "NotFound";
    case AccessError::Unauthorized:   return "Unauthorized";
    case AccessError::InvalidGrantee: return "InvalidGrantee";
    case AccessError::SelfRevocation: return "SelfRevocation";
    case AccessError::StorageFailure: return "StorageFailure";
  }
  return "Unknown";
}

const char* to_string(GeofenceError e) {
  switch (e) {
    case GeofenceError::NotFound:       return "NotFound";
    case GeofenceError::StorageFailure: return "StorageFailure";
  }
  return "Unknown";
}

} // namespace docguard
