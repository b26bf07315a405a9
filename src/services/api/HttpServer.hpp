#pragma once
#include <string>

namespace docguard {
class ProvenanceVault;
class LocalFSBackend;
}

namespace docguard::api {
  // Start a blocking HTTP server exposing upload, lookup, audit, access and
  // location verification. apiKey: if empty, auth is disabled.
  void run_http_server(ProvenanceVault& vault,
                       LocalFSBackend& fs,
                       int port,
                       const std::string& apiKey);
}
