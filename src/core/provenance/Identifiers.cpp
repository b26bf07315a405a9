#include "Identifiers.hpp"

namespace docguard {

namespace {

int nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string_view stripPrefix(std::string_view text) {
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    text.remove_prefix(2);
  return text;
}

bool decodeInto(std::string_view hex, uint8_t* out, size_t len) {
  if (hex.size() != len * 2) return false;
  for (size_t i = 0; i < len; ++i) {
    int hi = nibble(hex[2*i]);
    int lo = nibble(hex[2*i+1]);
    if (hi < 0 || lo < 0) return false;
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return true;
}

template <size_t N>
std::optional<std::array<uint8_t, N>> parseFixed(std::string_view text) {
  std::array<uint8_t, N> out{};
  if (!decodeInto(stripPrefix(text), out.data(), N)) return std::nullopt;
  return out;
}

} // namespace

std::string toHex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::optional<FileHash> parseFileHash(std::string_view text) {
  return parseFixed<32>(text);
}

std::optional<Principal> parsePrincipal(std::string_view text) {
  return parseFixed<20>(text);
}

std::optional<Bytes> parseHexBytes(std::string_view text) {
  auto hex = stripPrefix(text);
  if (hex.size() % 2 != 0) return std::nullopt;
  Bytes out(hex.size() / 2);
  if (!decodeInto(hex, out.data(), out.size())) return std::nullopt;
  return out;
}

} // namespace docguard
