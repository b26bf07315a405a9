#pragma once
#include <string_view>

#include "core/provenance/Identifiers.hpp"

namespace docguard {

// SHA-256 of the uploaded bytes; the registry key for the file.
FileHash sha256Digest(std::string_view bytes);

} // namespace docguard
