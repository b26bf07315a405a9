#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <vector>

#include "core/events/Event.hpp"
#include "core/provenance/FileRecord.hpp"

namespace docguard {

// Durable backing for the registry map, the access relation and the event
// sequence. Implementations may throw std::runtime_error on I/O failure;
// components translate that into StorageFailure after rolling back.
class VaultStore {
public:
  virtual ~VaultStore() = default;

  virtual std::optional<FileRecord> findRecord(const FileHash& h) const = 0;
  virtual void insertRecord(const FileRecord& r) = 0;

  // Absent relation is reported as nullopt; callers treat it as false.
  virtual std::optional<bool> findAccess(const FileHash& h, const Principal& p) const = 0;
  virtual void setAccess(const FileHash& h, const Principal& p, bool allowed) = 0;

  // Returns the assigned sequence number (1, 2, ...).
  virtual uint64_t appendEvent(const Event& e) = 0;
  // Events with from <= timestamp <= to, in sequence order.
  virtual std::vector<Event> scanEvents(std::optional<int64_t> fromTime,
                                        std::optional<int64_t> toTime) const = 0;

  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;
};

// Rolls back on scope exit unless commit() was reached.
class StoreTransaction {
public:
  explicit StoreTransaction(VaultStore& store) : store_(store) { store_.begin(); }
  ~StoreTransaction() {
    if (!done_) {
      try { store_.rollback(); } catch (const std::exception&) {}
    }
  }
  StoreTransaction(const StoreTransaction&) = delete;
  StoreTransaction& operator=(const StoreTransaction&) = delete;

  void commit() { store_.commit(); done_ = true; }

private:
  VaultStore& store_;
  bool done_ = false;
};

} // namespace docguard
