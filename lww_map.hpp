// lww_map.hpp
#ifndef LWW_MAP_HPP
#define LWW_MAP_HPP

#include "lww_clock.hpp"
#include "lww_signal.hpp"
#include "lww_timer.hpp"
#include "lww_types.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

/// Represents a single write in the replicated log of one key-value namespace.
///
/// Records are immutable once appended. A missing value is a tombstone: it
/// marks the key deleted and takes part in the same ordering as writes.
template <typename V> struct LwwRecord {
  LwwKey key;
  std::optional<V> value; // std::nullopt represents a tombstone
  uint64_t timestamp;
  LwwWriterId writer_id;

  LwwRecord() : timestamp(0), writer_id(0) {}

  LwwRecord(LwwKey k, std::optional<V> val, uint64_t ts, LwwWriterId writer)
      : key(std::move(k)), value(std::move(val)), timestamp(ts), writer_id(writer) {}

  bool is_tombstone() const { return !value.has_value(); }

  /// True when both records are the same write (same key, timestamp and writer).
  bool same_write(const LwwRecord &other) const {
    return timestamp == other.timestamp && writer_id == other.writer_id && key == other.key;
  }
};

/// Total order on writes: higher timestamp wins, equal timestamps fall back to
/// the higher writer id. Every replica applies the same comparison, which is
/// what makes delivery order irrelevant.
constexpr bool lww_is_newer(uint64_t ts, LwwWriterId writer, uint64_t other_ts, LwwWriterId other_writer) {
  if (ts != other_ts) {
    return ts > other_ts;
  }
  return writer > other_writer;
}

template <typename V> constexpr bool lww_is_newer(const LwwRecord<V> &a, const LwwRecord<V> &b) {
  return lww_is_newer(a.timestamp, a.writer_id, b.timestamp, b.writer_id);
}

enum class LwwAction { ADD, UPDATE, DELETE };

inline const char *to_string(LwwAction action) {
  switch (action) {
  case LwwAction::ADD:
    return "add";
  case LwwAction::UPDATE:
    return "update";
  case LwwAction::DELETE:
    return "delete";
  }
  return "";
}

/// Observable effect of one record that changed a winner.
template <typename V> struct LwwChange {
  LwwAction action;
  std::optional<V> old_value;
  std::optional<V> new_value;
};

struct LwwMapOptions {
  /// Delay between the last change and the background compaction pass.
  uint64_t compaction_debounce_ms = 100;
};

/// Replicated last-write-wins map over one key namespace.
///
/// The log holds every record this replica has seen (local or remote) until
/// compaction drops the dominated ones. The winner map is derived from it
/// incrementally and answers reads in O(1). Given the same eventual set of
/// records, every replica ends up with the same winner map.
///
/// Not thread-safe. All calls, including compaction run from the task queue,
/// must come from the thread that owns the document.
template <typename V> class LwwMap {
public:
  using Record = LwwRecord<V>;
  using Change = LwwChange<V>;
  using ChangeHandler = std::function<void(const LwwKey &, const Change &)>;

  /// Creates an empty map.
  ///
  /// @param clock Clock shared by every map of the replica
  /// @param writer_id Identity of this replica, used as the tie-breaker
  /// @param tasks Optional queue for debounced compaction; without it
  ///        compaction only runs when compact() is called. Not owned; it
  ///        must outlive the map
  LwwMap(MonotonicClock &clock, LwwWriterId writer_id, DeferredTaskQueue *tasks = nullptr, LwwMapOptions options = {})
      : clock_(clock), writer_id_(writer_id), tasks_(tasks), options_(options), live_count_(0), compacting_(false) {}

  ~LwwMap() { cancel_compaction(); }

  LwwMap(const LwwMap &) = delete;
  LwwMap &operator=(const LwwMap &) = delete;

  /// Writes `value` under `key` with a fresh timestamp.
  ///
  /// @return The appended record
  /// @throws std::invalid_argument if key is empty
  Record set(const LwwKey &key, V value) {
    if (key.empty()) {
      throw std::invalid_argument("LwwMap::set: key must not be empty");
    }
    Record record(key, std::move(value), clock_.next(), writer_id_);
    integrate(record);
    return record;
  }

  /// Appends a tombstone for `key`. Deleting an absent key still appends, so
  /// the delete wins over concurrent older writes that arrive later.
  ///
  /// @return The appended tombstone
  /// @throws std::invalid_argument if key is empty
  Record remove(const LwwKey &key) {
    if (key.empty()) {
      throw std::invalid_argument("LwwMap::remove: key must not be empty");
    }
    Record record(key, std::nullopt, clock_.next(), writer_id_);
    integrate(record);
    return record;
  }

  /// Merges a record from another replica. Never rejects: losing records are
  /// kept in the log until compaction. Re-delivery of a record already in the
  /// log is a no-op.
  ///
  /// @return true if the record became the winner for its key
  bool merge(Record record) { return integrate(std::move(record)); }

  /// Merges a batch of remote records in order.
  ///
  /// @return Number of records that became winners
  size_t merge(const LwwVector<Record> &records) {
    size_t accepted = 0;
    for (const auto &record : records) {
      if (integrate(record)) {
        ++accepted;
      }
    }
    return accepted;
  }

  std::optional<V> get(const LwwKey &key) const {
    const V *value = find(key);
    if (!value)
      return std::nullopt;
    return *value;
  }

  /// Pointer to the live value, or nullptr if absent or tombstoned.
  const V *find(const LwwKey &key) const {
    auto it = winners_.find(key);
    if (it == winners_.end() || !it->second.value.has_value())
      return nullptr;
    return &*it->second.value;
  }

  bool has(const LwwKey &key) const { return find(key) != nullptr; }

  /// The winning record for `key`, tombstones included.
  const Record *winner(const LwwKey &key) const {
    auto it = winners_.find(key);
    return it == winners_.end() ? nullptr : &it->second;
  }

  /// Calls `fn(key, value)` for every live entry.
  template <typename Fn> void for_each(Fn &&fn) const {
    for (const auto &[key, record] : winners_) {
      if (record.value.has_value()) {
        fn(key, *record.value);
      }
    }
  }

  LwwVector<std::pair<LwwKey, V>> entries() const {
    LwwVector<std::pair<LwwKey, V>> result;
    result.reserve(live_count_);
    for_each([&](const LwwKey &key, const V &value) { result.emplace_back(key, value); });
    return result;
  }

  /// Number of live entries.
  size_t size() const { return live_count_; }

  bool empty() const { return live_count_ == 0; }

  /// The replicated log, in arrival order.
  const LwwVector<Record> &records() const { return log_; }

  size_t log_size() const { return log_.size(); }

  LwwWriterId writer_id() const { return writer_id_; }

  /// Subscribes to winner changes. Fires once per record that changes the
  /// observable state of a key.
  Subscription on_change(ChangeHandler handler) { return change_signal_.connect(std::move(handler)); }

  /// Drops every log entry dominated by the winner of its key.
  ///
  /// Only the log shrinks; reads are unaffected. The new log is built aside
  /// and swapped in at once.
  ///
  /// @return Number of records removed
  size_t compact() {
    if (compacting_) {
      return 0;
    }
    ScopeGuard guard(compacting_);
    cancel_compaction();

    LwwVector<Record> kept;
    kept.reserve(winners_.size());
    LwwHashSet<LwwKey> seen;
    for (const auto &record : log_) {
      auto it = winners_.find(record.key);
      if (it != winners_.end() && it->second.same_write(record) && seen.insert(record.key).second) {
        kept.push_back(record);
      }
    }

    size_t removed = log_.size() - kept.size();
    log_.swap(kept);
    logged_.clear();
    for (const auto &record : log_) {
      logged_[record.key].emplace_back(record.timestamp, record.writer_id);
    }
    return removed;
  }

  bool compaction_pending() const { return compaction_task_.has_value(); }

private:
  bool integrate(Record record) {
    clock_.observe(record.timestamp);

    auto it = winners_.find(record.key);
    if (it != winners_.end()) {
      if (it->second.same_write(record)) {
        return false;
      }
      if (!lww_is_newer(record, it->second)) {
        if (!is_logged(record)) {
          append(std::move(record));
          schedule_compaction();
        }
        return false;
      }
    }

    std::optional<V> old_value;
    if (it != winners_.end()) {
      old_value = it->second.value;
    }
    const bool had_value = old_value.has_value();
    const bool has_value = record.value.has_value();

    std::optional<Change> change;
    if (!had_value && has_value) {
      change = Change{LwwAction::ADD, std::nullopt, record.value};
      ++live_count_;
    } else if (had_value && has_value) {
      change = Change{LwwAction::UPDATE, std::move(old_value), record.value};
    } else if (had_value && !has_value) {
      change = Change{LwwAction::DELETE, std::move(old_value), std::nullopt};
      --live_count_;
    }
    // tombstone over tombstone (or over nothing) still moves the winner,
    // otherwise an older write could win later

    LwwKey key = record.key;
    if (it != winners_.end()) {
      it->second = record;
    } else {
      winners_.emplace(key, record);
    }
    append(std::move(record));
    schedule_compaction();

    if (change) {
      change_signal_.emit(key, *change);
    }
    return true;
  }

  bool is_logged(const Record &record) const {
    auto it = logged_.find(record.key);
    if (it == logged_.end())
      return false;
    for (const auto &[timestamp, writer_id] : it->second) {
      if (timestamp == record.timestamp && writer_id == record.writer_id)
        return true;
    }
    return false;
  }

  void append(Record record) {
    logged_[record.key].emplace_back(record.timestamp, record.writer_id);
    log_.push_back(std::move(record));
  }

  void schedule_compaction() {
    if (!tasks_ || compacting_) {
      return;
    }
    cancel_compaction();
    compaction_task_ = tasks_->schedule(options_.compaction_debounce_ms, [this]() {
      compaction_task_.reset();
      compact();
    });
  }

  void cancel_compaction() {
    if (compaction_task_ && tasks_) {
      tasks_->cancel(*compaction_task_);
    }
    compaction_task_.reset();
  }

  MonotonicClock &clock_;
  LwwWriterId writer_id_;
  DeferredTaskQueue *tasks_;
  LwwMapOptions options_;

  LwwVector<Record> log_;
  LwwHashMap<LwwKey, Record> winners_;
  // (timestamp, writer) of every logged write, per key
  LwwHashMap<LwwKey, LwwVector<std::pair<uint64_t, LwwWriterId>>> logged_;
  size_t live_count_;

  Signal<const LwwKey &, const Change &> change_signal_;
  std::optional<DeferredTaskQueue::TaskId> compaction_task_;
  bool compacting_;
};

#endif // LWW_MAP_HPP
