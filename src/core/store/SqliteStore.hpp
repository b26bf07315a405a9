#pragma once
#include <string>

#include "VaultStore.hpp"

namespace docguard {

// SQLite-backed store. Expects a database prepared by initDatabase().
// Transactions map to BEGIN IMMEDIATE / COMMIT / ROLLBACK.
class SqliteStore : public VaultStore {
public:
  explicit SqliteStore(const std::string& dbPath);
  ~SqliteStore() override;
  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  std::optional<FileRecord> findRecord(const FileHash& h) const override;
  void insertRecord(const FileRecord& r) override;

  std::optional<bool> findAccess(const FileHash& h, const Principal& p) const override;
  void setAccess(const FileHash& h, const Principal& p, bool allowed) override;

  uint64_t appendEvent(const Event& e) override;
  std::vector<Event> scanEvents(std::optional<int64_t> fromTime,
                                std::optional<int64_t> toTime) const override;

  void begin() override;
  void commit() override;
  void rollback() override;

private:
  void exec(const char* sql);

  void* db_; // sqlite3*
};

} // namespace docguard
