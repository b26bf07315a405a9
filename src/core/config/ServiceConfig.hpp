#pragma once
#include <functional>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace docguard {

enum class StoreKind { Sqlite, Memory };

struct ServiceConfig {
  std::string dbPath      = "data/docguard.db";
  int         port        = 8080;
  std::string apiKey;                       // empty = auth disabled
  std::string contentRoot = "data/content";
  StoreKind   store       = StoreKind::Sqlite;
  spdlog::level::level_enum logLevel = spdlog::level::info;
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Reads DOCGUARD_* variables through `lookup`; bad values keep the default
// and log a warning.
ServiceConfig loadConfig(const EnvLookup& lookup);

ServiceConfig loadConfigFromEnv();

} // namespace docguard
