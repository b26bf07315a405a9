// src/main.cpp
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/config/ServiceConfig.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/store/InMemoryStore.hpp"
#include "core/store/InitDb.hpp"
#include "core/store/SqliteStore.hpp"
#include "core/vault/Clock.hpp"
#include "core/vault/ProvenanceVault.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/store/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/store)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve       # start HTTP server (DOCGUARD_PORT or 8080)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const docguard::ServiceConfig cfg = docguard::loadConfigFromEnv();
    spdlog::set_level(cfg.logLevel);

    if (argc > 1 && std::string(argv[1]) == "--init") {
      docguard::initDatabase(cfg.dbPath, findSchemaPath());
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      std::unique_ptr<docguard::VaultStore> store;
      if (cfg.store == docguard::StoreKind::Memory) {
        spdlog::warn("in-memory store: records are lost when the server stops");
        store = std::make_unique<docguard::InMemoryStore>();
      } else {
        // Self-heal DB on startup (idempotent)
        docguard::initDatabase(cfg.dbPath, findSchemaPath());
        store = std::make_unique<docguard::SqliteStore>(cfg.dbPath);
      }

      std::filesystem::create_directories(cfg.contentRoot);
      docguard::LocalFSBackend fs(cfg.contentRoot);

      docguard::SystemClock clock;
      docguard::ProvenanceVault vault(*store, clock);

      docguard::api::run_http_server(vault, fs, cfg.port, cfg.apiKey);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
