#pragma once
#include <string>

struct sqlite3;

namespace docguard {

// Creates the database if needed and applies schema.sql (idempotent).
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

// Per-connection settings (synchronous=FULL, foreign keys, busy timeout).
// Every connection that writes the vault must call this after opening.
void applyConnectionPragmas(sqlite3* db);

} // namespace docguard
