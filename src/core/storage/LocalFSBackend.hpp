#pragma once
#include <string>
#include <string_view>
#include <utility>

#include "core/provenance/Identifiers.hpp"

namespace docguard {

// Content storage used when the uploader supplies no external pointer.
// Files are laid out by digest: <root>/<first two hex>/<hex>.
class LocalFSBackend {
public:
  explicit LocalFSBackend(std::string root) : root_(std::move(root)) {}

  // Writes bytes (idempotent for identical content); returns a file:// pointer.
  std::string put(const FileHash& hash, std::string_view bytes);

private:
  std::string root_;
};

} // namespace docguard
