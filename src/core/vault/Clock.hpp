#pragma once
#include <atomic>
#include <cstdint>

namespace docguard {

// Source of creation timestamps (seconds). The core never reads wall time
// itself; the host injects one of these.
class Clock {
public:
  virtual ~Clock() = default;
  virtual int64_t now() const = 0;
};

class SystemClock : public Clock {
public:
  int64_t now() const override;
};

// Manually driven clock for tests and replays.
class ManualClock : public Clock {
public:
  explicit ManualClock(int64_t start = 0) : t_(start) {}
  int64_t now() const override { return t_.load(); }
  void set(int64_t t) { t_.store(t); }
  void advance(int64_t dt = 1) { t_.fetch_add(dt); }

private:
  std::atomic<int64_t> t_;
};

} // namespace docguard
