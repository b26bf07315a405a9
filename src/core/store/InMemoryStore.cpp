#include "InMemoryStore.hpp"

#include <stdexcept>

namespace docguard {

std::optional<FileRecord> InMemoryStore::findRecord(const FileHash& h) const {
  auto it = records_.find(h);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

void InMemoryStore::insertRecord(const FileRecord& r) {
  if (!records_.emplace(r.fileHash, r).second)
    throw std::runtime_error("insertRecord: duplicate key");
  if (inTx_) undoRecords_.push_back(r.fileHash);
}

std::optional<bool> InMemoryStore::findAccess(const FileHash& h, const Principal& p) const {
  auto it = access_.find({h, p});
  if (it == access_.end()) return std::nullopt;
  return it->second;
}

void InMemoryStore::setAccess(const FileHash& h, const Principal& p, bool allowed) {
  AccessKey key{h, p};
  if (inTx_) undoAccess_.push_back({key, findAccess(h, p)});
  access_[key] = allowed;
}

uint64_t InMemoryStore::appendEvent(const Event& e) {
  Event stored = e;
  stored.sequence = events_.size() + 1;
  events_.push_back(std::move(stored));
  return events_.back().sequence;
}

std::vector<Event> InMemoryStore::scanEvents(std::optional<int64_t> fromTime,
                                             std::optional<int64_t> toTime) const {
  std::vector<Event> out;
  for (const auto& e : events_) {
    if (fromTime && e.timestamp < *fromTime) continue;
    if (toTime && e.timestamp > *toTime) continue;
    out.push_back(e);
  }
  return out;
}

void InMemoryStore::begin() {
  if (inTx_) throw std::logic_error("InMemoryStore: nested transaction");
  inTx_ = true;
  undoRecords_.clear();
  undoAccess_.clear();
  eventMark_ = events_.size();
}

void InMemoryStore::commit() {
  inTx_ = false;
  undoRecords_.clear();
  undoAccess_.clear();
}

void InMemoryStore::rollback() {
  if (!inTx_) return;
  for (auto it = undoAccess_.rbegin(); it != undoAccess_.rend(); ++it) {
    if (it->previous) access_[it->key] = *it->previous;
    else              access_.erase(it->key);
  }
  for (const auto& h : undoRecords_) records_.erase(h);
  events_.resize(eventMark_);
  inTx_ = false;
  undoRecords_.clear();
  undoAccess_.clear();
}

} // namespace docguard
