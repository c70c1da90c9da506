// lww_timer.hpp
#ifndef LWW_TIMER_HPP
#define LWW_TIMER_HPP

#include "lww_types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <thread>
#include <utility>

/// Single-threaded queue of deferred tasks.
///
/// This is the cooperative "timer" used for debounced work (log compaction,
/// materializer rebuilds). Nothing runs on its own: the owner of the event
/// loop calls run_due() (or run_until_idle()) and due tasks run on that
/// thread, in deadline order, ties broken by scheduling order.
///
/// Tests pass a manual time source and advance it explicitly.
class DeferredTaskQueue {
public:
  using TimeSource = std::function<uint64_t()>;
  using TaskId = uint64_t;
  using Task = std::function<void()>;

  /// Milliseconds from a steady clock.
  static uint64_t steady_time_ms() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
            .count());
  }

  explicit DeferredTaskQueue(TimeSource now = steady_time_ms) : now_(std::move(now)), next_id_(0) {}

  DeferredTaskQueue(const DeferredTaskQueue &) = delete;
  DeferredTaskQueue &operator=(const DeferredTaskQueue &) = delete;

  /// Schedules `task` to run once `delay_ms` has elapsed.
  TaskId schedule(uint64_t delay_ms, Task task) {
    TaskId id = ++next_id_;
    uint64_t deadline = now_() + delay_ms;
    tasks_.emplace(Key{deadline, id}, std::move(task));
    deadlines_.emplace(id, deadline);
    return id;
  }

  /// Cancels a pending task. Returns false if it already ran or was cancelled.
  bool cancel(TaskId id) {
    auto it = deadlines_.find(id);
    if (it == deadlines_.end())
      return false;
    tasks_.erase(Key{it->second, id});
    deadlines_.erase(it);
    return true;
  }

  /// Runs every task whose deadline has passed, including tasks that a
  /// running task schedules with a deadline that has also passed.
  ///
  /// Returns the number of tasks run.
  size_t run_due() {
    size_t ran = 0;
    while (!tasks_.empty()) {
      auto it = tasks_.begin();
      if (it->first.deadline > now_())
        break;
      Task task = std::move(it->second);
      deadlines_.erase(it->first.id);
      tasks_.erase(it);
      task();
      ++ran;
    }
    return ran;
  }

  /// Sleeps until each pending deadline and runs tasks until none are left.
  void run_until_idle() {
    while (auto deadline = next_deadline()) {
      uint64_t now = now_();
      if (*deadline > now) {
        std::this_thread::sleep_for(std::chrono::milliseconds(*deadline - now));
      }
      run_due();
    }
  }

  std::optional<uint64_t> next_deadline() const {
    if (tasks_.empty())
      return std::nullopt;
    return tasks_.begin()->first.deadline;
  }

  size_t pending() const { return tasks_.size(); }

  bool is_pending(TaskId id) const { return deadlines_.find(id) != deadlines_.end(); }

private:
  struct Key {
    uint64_t deadline;
    TaskId id;

    auto operator<=>(const Key &) const = default;
  };

  TimeSource now_;
  TaskId next_id_;
  LwwSortedMap<Key, Task> tasks_;
  LwwHashMap<TaskId, uint64_t> deadlines_;
};

#endif // LWW_TIMER_HPP
