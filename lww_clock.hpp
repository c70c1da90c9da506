// lww_clock.hpp
#ifndef LWW_CLOCK_HPP
#define LWW_CLOCK_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>

/// Process-local monotonic clock used to stamp LWW records.
///
/// Timestamps follow wall-clock milliseconds when the wall clock moves forward
/// and fall back to `last + 1` otherwise, so local writes never collide and a
/// clock regression is ignored. Remote timestamps are folded in with observe()
/// so the next local write always beats anything this replica has seen.
///
/// One instance is shared by all maps of a document and handed to them
/// explicitly; tests inject a deterministic time source.
class MonotonicClock {
public:
  using TimeSource = std::function<uint64_t()>;

  /// Milliseconds since the Unix epoch.
  static uint64_t system_time_ms() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
  }

  explicit MonotonicClock(TimeSource now = system_time_ms) : now_(std::move(now)), last_(0) {}

  /// Returns a timestamp strictly greater than any issued or observed so far.
  /// @throws std::overflow_error once the last timestamp is the maximum value.
  uint64_t next() {
    if (last_ == std::numeric_limits<uint64_t>::max()) {
      throw std::overflow_error("MonotonicClock: clock overflow");
    }
    last_ = std::max(now_(), last_ + 1);
    return last_;
  }

  /// Checks that `count` more timestamps can be issued without overflowing.
  bool can_issue(uint64_t count) const { return std::numeric_limits<uint64_t>::max() - last_ >= count; }

  /// Folds in a timestamp seen on a remote record.
  void observe(uint64_t remote_timestamp) { last_ = std::max(last_, remote_timestamp); }

  /// Retrieves the last issued or observed timestamp.
  uint64_t last() const { return last_; }

private:
  TimeSource now_;
  uint64_t last_;
};

#endif // LWW_CLOCK_HPP
