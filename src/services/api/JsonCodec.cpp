#include "JsonCodec.hpp"

#include <charconv>
#include <cmath>
#include <limits>

#include "core/geofence/Coordinates.hpp"

using nlohmann::json;

namespace docguard::api {

static void putLock(json& j, const LocationLock& l) {
  j["hasLocationLock"] = l.enabled;
  if (l.enabled) {
    j["latitude"]  = formatDegrees(l.latitude);
    j["longitude"] = formatDegrees(l.longitude);
    j["radius"]    = l.radiusMeters;
  }
}

json recordToJson(const FileRecord& r) {
  json j = {
    {"fileHash",       toHex(r.fileHash)},
    {"uploader",       toHex(r.uploader)},
    {"storagePointer", r.storagePointer},
    {"signature",      toHex(r.signature)},
    {"timestamp",      r.timestamp}
  };
  putLock(j, r.lock);
  return j;
}

json eventToJson(const Event& e) {
  json j = {
    {"sequence",  e.sequence},
    {"event",     to_string(e.kind)},
    {"fileHash",  toHex(e.fileHash)},
    {"timestamp", e.timestamp}
  };
  if (e.kind == EventKind::Uploaded) {
    j["uploader"]       = toHex(e.principal);
    j["storagePointer"] = e.storagePointer;
    j["signature"]      = toHex(e.signature);
    putLock(j, e.lock);
  } else {
    j["grantee"] = toHex(e.principal);
  }
  return j;
}

json eventsToJson(const std::vector<Event>& events) {
  json arr = json::array();
  for (const auto& e : events) arr.push_back(eventToJson(e));
  return arr;
}

std::optional<int32_t> microDegreesFrom(const json& v) {
  if (v.is_string()) return parseMicroDegrees(v.get<std::string>());
  if (v.is_number_unsigned()) {
    const auto d = v.get<uint64_t>();
    if (d > 2147) return std::nullopt;
    return static_cast<int32_t>(d * 1'000'000);
  }
  if (v.is_number_integer()) {
    // integral degrees
    const auto d = v.get<int64_t>();
    if (d < -2147 || d > 2147) return std::nullopt;
    return static_cast<int32_t>(d * 1'000'000);
  }
  if (v.is_number_float()) {
    const double micro = std::trunc(v.get<double>() * 1e6);
    if (!std::isfinite(micro) ||
        micro < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
        micro > static_cast<double>(std::numeric_limits<int32_t>::max()))
      return std::nullopt;
    return static_cast<int32_t>(micro);
  }
  return std::nullopt;
}

std::optional<int64_t> parseInteger(std::string_view text) {
  if (!text.empty() && text.front() == '+') text.remove_prefix(1);
  if (text.empty()) return std::nullopt;
  int64_t v = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, v);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  return v;
}

static std::optional<uint32_t> toRadius(int64_t v) {
  if (v < 0 || v > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) return std::nullopt;
  return static_cast<uint32_t>(v);
}

std::optional<uint32_t> parseRadius(std::string_view text) {
  auto v = parseInteger(text);
  if (!v) return std::nullopt;
  return toRadius(*v);
}

std::optional<uint32_t> radiusFrom(const json& v) {
  if (v.is_number_unsigned()) {
    const auto r = v.get<uint64_t>();
    if (r > std::numeric_limits<uint32_t>::max()) return std::nullopt;
    return static_cast<uint32_t>(r);
  }
  if (v.is_number_integer()) return toRadius(v.get<int64_t>());
  if (v.is_string()) return parseRadius(v.get<std::string>());
  return std::nullopt;
}

std::optional<size_t> parseLimit(std::string_view text) {
  auto v = parseInteger(text);
  if (!v || *v < 0) return std::nullopt;
  return static_cast<size_t>(*v);
}

} // namespace docguard::api
