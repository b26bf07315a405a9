#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/events/Event.hpp"
#include "core/provenance/FileRecord.hpp"

namespace docguard::api {

nlohmann::json recordToJson(const FileRecord& r);
nlohmann::json eventToJson(const Event& e);
nlohmann::json eventsToJson(const std::vector<Event>& events);

// Degrees from a JSON value: strings are parsed exactly, numbers are
// truncated at the sixth decimal. nullopt for anything else.
std::optional<int32_t> microDegreesFrom(const nlohmann::json& v);

// Whole decimal integer, optional sign, no trailing characters.
std::optional<int64_t> parseInteger(std::string_view text);

// Lock radius in metres: an integer in [0, UINT32_MAX], given as a JSON
// integer or a decimal string. Decimals, negatives and overflow are rejected.
std::optional<uint32_t> radiusFrom(const nlohmann::json& v);
std::optional<uint32_t> parseRadius(std::string_view text);

// Query limit: a non-negative integer.
std::optional<size_t> parseLimit(std::string_view text);

} // namespace docguard::api
