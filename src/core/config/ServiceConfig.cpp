#include "ServiceConfig.hpp"

#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace docguard {

static std::optional<std::string> get_env(const char* key) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return std::nullopt;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return std::nullopt;
#endif
}

ServiceConfig loadConfig(const EnvLookup& lookup) {
  ServiceConfig cfg;

  if (auto v = lookup("DOCGUARD_DB_PATH"); v && !v->empty()) cfg.dbPath = *v;
  if (auto v = lookup("DOCGUARD_API_KEY")) cfg.apiKey = *v;
  if (auto v = lookup("DOCGUARD_CONTENT_ROOT"); v && !v->empty()) cfg.contentRoot = *v;

  if (auto v = lookup("DOCGUARD_PORT")) {
    try {
      size_t used = 0;
      int port = std::stoi(*v, &used);
      if (used != v->size() || port <= 0 || port > 65535) throw std::out_of_range(*v);
      cfg.port = port;
    } catch (const std::exception&) {
      spdlog::warn("DOCGUARD_PORT={} invalid, using {}", *v, cfg.port);
    }
  }

  if (auto v = lookup("DOCGUARD_STORE")) {
    if (*v == "sqlite")      cfg.store = StoreKind::Sqlite;
    else if (*v == "memory") cfg.store = StoreKind::Memory;
    else spdlog::warn("DOCGUARD_STORE={} unknown, using sqlite", *v);
  }

  if (auto v = lookup("DOCGUARD_LOG_LEVEL")) {
    auto lvl = spdlog::level::from_str(*v);
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && *v != "off")
      spdlog::warn("DOCGUARD_LOG_LEVEL={} unknown, using info", *v);
    else
      cfg.logLevel = lvl;
  }

  return cfg;
}

ServiceConfig loadConfigFromEnv() {
  return loadConfig(get_env);
}

} // namespace docguard
