#include "Coordinates.hpp"

#include <limits>

namespace docguard {

std::optional<int32_t> parseMicroDegrees(std::string_view text) {
  if (text.empty()) return std::nullopt;

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  int64_t whole = 0;
  int64_t frac = 0;
  int fracDigits = 0;
  bool seenDot = false;
  bool seenDigit = false;

  for (char c : text) {
    if (c == '.') {
      if (seenDot) return std::nullopt;
      seenDot = true;
      continue;
    }
    if (c < '0' || c > '9') return std::nullopt;
    seenDigit = true;
    if (!seenDot) {
      whole = whole * 10 + (c - '0');
      if (whole > 10'000) return std::nullopt;  // far past int32 micro-degrees
    } else if (fracDigits < 6) {
      frac = frac * 10 + (c - '0');
      ++fracDigits;
    }
  }
  if (!seenDigit) return std::nullopt;

  for (; fracDigits < 6; ++fracDigits) frac *= 10;

  int64_t v = whole * 1'000'000 + frac;
  if (negative) v = -v;
  if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max())
    return std::nullopt;
  return static_cast<int32_t>(v);
}

std::string formatDegrees(int32_t microDegrees) {
  int64_t v = microDegrees;
  std::string out;
  if (v < 0) { out.push_back('-'); v = -v; }
  std::string frac = std::to_string(v % 1'000'000);
  out += std::to_string(v / 1'000'000);
  out.push_back('.');
  out.append(6 - frac.size(), '0');
  out += frac;
  return out;
}

} // namespace docguard
