#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "Event.hpp"

namespace docguard {

class VaultStore;

constexpr size_t kDefaultQueryLimit = 50;

struct EventQuery {
  std::optional<int64_t>   fromTime;   // inclusive
  std::optional<int64_t>   toTime;     // inclusive
  std::optional<size_t>    limit;      // kDefaultQueryLimit when unset
  std::optional<EventKind> kind;
  std::optional<FileHash>  fileHash;
};

// Append-only record of upload/grant/revoke transitions. Written only from
// inside a Registry or AccessControl transition; never consulted by them.
class EventLog {
public:
  explicit EventLog(VaultStore& store) : store_(store) {}

  // Runs inside the caller's transaction; a store exception propagates so
  // the whole transition rolls back.
  uint64_t append(const Event& e);

  // Most-recent-first by timestamp; equal timestamps keep emission order.
  // Re-running the same query over an unchanged log gives the same result.
  std::vector<Event> query(const EventQuery& q = {}) const;

private:
  VaultStore& store_;
};

} // namespace docguard
