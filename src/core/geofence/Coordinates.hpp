#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docguard {

// "34.0522359" -> 34052235. Digits past the sixth decimal are truncated
// toward zero. Rejects anything outside int32 or not a plain decimal.
std::optional<int32_t> parseMicroDegrees(std::string_view text);

// 34052235 -> "34.052235", -500 -> "-0.000500"
std::string formatDegrees(int32_t microDegrees);

} // namespace docguard
