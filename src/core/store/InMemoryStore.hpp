#pragma once
#include <map>
#include <utility>
#include <vector>

#include "VaultStore.hpp"

namespace docguard {

// Map-backed store for local mode and tests. Rollback replays an undo
// journal kept since begin().
class InMemoryStore : public VaultStore {
public:
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
  using AccessKey = std::pair<FileHash, Principal>;

  struct AccessUndo {
    AccessKey           key;
    std::optional<bool> previous;
  };

  std::map<FileHash, FileRecord> records_;
  std::map<AccessKey, bool>      access_;
  std::vector<Event>             events_;

  bool                    inTx_ = false;
  std::vector<FileHash>   undoRecords_;
  std::vector<AccessUndo> undoAccess_;
  size_t                  eventMark_ = 0;
};

} // namespace docguard
