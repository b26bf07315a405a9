#pragma once

namespace docguard {

enum class RegistryError {
  AlreadyExists,
  InvalidPointer,
  StorageFailure
};

enum class AccessError {
  NotFound,
  Unauthorized,
  InvalidGrantee,
  SelfRevocation,
  StorageFailure
};

// The geofence math is total; only the record lookup can fail.
enum class GeofenceError {
  NotFound,
  StorageFailure
};

const char* to_string(RegistryError e);
const char* to_string(AccessError e);
const char* to_string(GeofenceError e);

} // namespace docguard
