#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docguard {

using Bytes = std::vector<uint8_t>;

// 256-bit content digest, primary key of a FileRecord.
using FileHash = std::array<uint8_t, 32>;

// Fixed-width opaque principal (address width). All zero = no identity.
using Principal = std::array<uint8_t, 20>;

inline bool isNull(const Principal& p) {
  for (auto b : p) if (b != 0) return false;
  return true;
}

std::string toHex(const uint8_t* data, size_t len);

template <size_t N>
std::string toHex(const std::array<uint8_t, N>& v) {
  return "0x" + toHex(v.data(), v.size());
}

inline std::string toHex(const Bytes& v) {
  return "0x" + toHex(v.data(), v.size());
}

// Accepts upper/lower case hex with optional 0x prefix; exact width only.
std::optional<FileHash>  parseFileHash(std::string_view text);
std::optional<Principal> parsePrincipal(std::string_view text);

// Any even-length hex string (0x optional); empty input gives empty bytes.
std::optional<Bytes> parseHexBytes(std::string_view text);

} // namespace docguard
