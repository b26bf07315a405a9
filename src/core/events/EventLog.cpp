#include "EventLog.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "core/store/VaultStore.hpp"

namespace docguard {

uint64_t EventLog::append(const Event& e) {
  return store_.appendEvent(e);
}

std::vector<Event> EventLog::query(const EventQuery& q) const {
  std::vector<Event> events;
  try {
    events = store_.scanEvents(q.fromTime, q.toTime);
  } catch (const std::exception& ex) {
    spdlog::error("event query failed: {}", ex.what());
    return {};
  }

  events.erase(std::remove_if(events.begin(), events.end(), [&](const Event& e) {
    if (q.kind && e.kind != *q.kind) return true;
    if (q.fileHash && e.fileHash != *q.fileHash) return true;
    return false;
  }), events.end());

  // scanEvents yields sequence order, so a stable sort keeps emission order on ties
  std::stable_sort(events.begin(), events.end(), [](const Event& a, const Event& b) {
    return a.timestamp > b.timestamp;
  });

  const size_t limit = q.limit.value_or(kDefaultQueryLimit);
  if (events.size() > limit) events.resize(limit);
  return events;
}

} // namespace docguard
