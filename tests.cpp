// tests.cpp
#include "lww_clock.hpp"
#include "lww_map.hpp"
#include "lww_signal.hpp"
#include "lww_timer.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>

using StringMap = LwwMap<std::string>;
using StringRecord = LwwRecord<std::string>;

/// Simple assertion helper
void assert_true(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << "Assertion failed: " << message << std::endl;
    exit(1);
  }
}

/// Clock whose wall time is frozen at 0, so timestamps are pure counters.
MonotonicClock logical_clock() {
  return MonotonicClock([]() -> uint64_t { return 0; });
}

/// Sorted (key, value, timestamp, writer) view of the winners, tombstones included.
std::vector<std::string> winner_view(const StringMap &map, const std::vector<std::string> &keys) {
  std::vector<std::string> view;
  for (const auto &key : keys) {
    const StringRecord *winner = map.winner(key);
    if (!winner) {
      view.push_back(key + "=<none>");
      continue;
    }
    view.push_back(key + "=" + (winner->value ? *winner->value : "<tombstone>") + "@" +
                   std::to_string(winner->timestamp) + "/" + std::to_string(winner->writer_id));
  }
  return view;
}

int main() {
  // Test Case: Monotonic Clock
  {
    uint64_t wall = 1000;
    MonotonicClock clock([&]() { return wall; });

    assert_true(clock.next() == 1000, "Monotonic Clock: first tick should follow wall time");
    assert_true(clock.next() == 1001, "Monotonic Clock: same millisecond should still increase");

    wall = 500; // clock regression
    assert_true(clock.next() == 1002, "Monotonic Clock: regression should be ignored");

    clock.observe(5000);
    assert_true(clock.last() == 5000, "Monotonic Clock: observe should fold in remote time");
    assert_true(clock.next() == 5001, "Monotonic Clock: next should exceed observed time");

    clock.observe(10);
    assert_true(clock.next() == 5002, "Monotonic Clock: observing an older time is a no-op");

    wall = 9000;
    assert_true(clock.next() == 9000, "Monotonic Clock: should jump forward with wall time");
    std::cout << "Test 'Monotonic Clock' passed." << std::endl;
  }

  // Test Case: Signal and Subscription
  {
    Signal<int> signal;
    int total = 0;
    Subscription first = signal.connect([&](int v) { total += v; });
    {
      Subscription second = signal.connect([&](int v) { total += 10 * v; });
      signal.emit(1);
      assert_true(total == 11, "Signal: both handlers should fire");
    }
    signal.emit(1);
    assert_true(total == 12, "Signal: destroyed subscription should disconnect");

    first.unsubscribe();
    signal.emit(1);
    assert_true(total == 12, "Signal: unsubscribe should disconnect");
    assert_true(signal.empty(), "Signal: no handlers should remain");

    // a handler may disconnect another one during emission
    Subscription victim;
    int victim_calls = 0;
    Subscription killer = signal.connect([&](int) { victim.unsubscribe(); });
    victim = signal.connect([&](int) { ++victim_calls; });
    signal.emit(0);
    assert_true(victim_calls == 0, "Signal: handler disconnected mid-emission should be skipped");

    // subscriptions may outlive their signal
    Subscription orphan;
    {
      Signal<> short_lived;
      orphan = short_lived.connect([]() {});
    }
    orphan.unsubscribe();
    std::cout << "Test 'Signal and Subscription' passed." << std::endl;
  }

  // Test Case: Deferred Task Queue
  {
    uint64_t now = 0;
    DeferredTaskQueue tasks([&]() { return now; });
    std::vector<int> order;

    tasks.schedule(100, [&]() { order.push_back(1); });
    auto cancelled = tasks.schedule(50, [&]() { order.push_back(2); });
    tasks.schedule(100, [&]() { order.push_back(3); });

    assert_true(tasks.cancel(cancelled), "Deferred Task Queue: cancel should succeed once");
    assert_true(!tasks.cancel(cancelled), "Deferred Task Queue: second cancel should fail");

    now = 99;
    assert_true(tasks.run_due() == 0, "Deferred Task Queue: nothing should be due yet");

    now = 100;
    assert_true(tasks.run_due() == 2, "Deferred Task Queue: two tasks should run");
    assert_true(order == std::vector<int>({1, 3}), "Deferred Task Queue: ties should run in scheduling order");
    assert_true(tasks.pending() == 0, "Deferred Task Queue: queue should be empty");

    // a task scheduling an immediately due task runs it in the same pass
    tasks.schedule(0, [&]() { tasks.schedule(0, [&]() { order.push_back(4); }); });
    tasks.run_due();
    assert_true(order.back() == 4, "Deferred Task Queue: chained due task should run");
    assert_true(!tasks.next_deadline().has_value(), "Deferred Task Queue: no deadline should remain");
    std::cout << "Test 'Deferred Task Queue' passed." << std::endl;
  }

  // Test Case: Set, Get, Has and Iteration
  {
    MonotonicClock clock = logical_clock();
    StringMap map(clock, 1);

    map.set("a", "1");
    map.set("b", "2");
    map.remove("b");
    map.set("c", "3");

    assert_true(map.get("a") == "1", "Set/Get: a should be 1");
    assert_true(!map.get("b").has_value(), "Set/Get: b should be tombstoned");
    assert_true(!map.has("b"), "Set/Get: has(b) should be false");
    assert_true(!map.has("missing"), "Set/Get: has(missing) should be false");
    assert_true(map.size() == 2, "Set/Get: only live entries should count");

    auto entries = map.entries();
    std::sort(entries.begin(), entries.end());
    assert_true(entries.size() == 2 && entries[0].first == "a" && entries[1].first == "c",
                "Set/Get: iteration should skip tombstones");
    assert_true(map.log_size() == 4, "Set/Get: every write should be logged");
    std::cout << "Test 'Set, Get, Has and Iteration' passed." << std::endl;
  }

  // Test Case: Empty Key Fails Fast
  {
    MonotonicClock clock = logical_clock();
    StringMap map(clock, 1);
    bool threw = false;
    try {
      map.set("", "value");
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    assert_true(threw, "Empty Key: set should throw");

    threw = false;
    try {
      map.remove("");
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    assert_true(threw, "Empty Key: remove should throw");
    assert_true(map.log_size() == 0, "Empty Key: nothing should be appended");
    std::cout << "Test 'Empty Key Fails Fast' passed." << std::endl;
  }

  // Test Case: Change Events
  {
    MonotonicClock clock = logical_clock();
    StringMap map(clock, 1);
    std::vector<std::string> events;
    auto subscription = map.on_change([&](const LwwKey &key, const LwwChange<std::string> &change) {
      std::string event = key + ":" + to_string(change.action);
      if (change.old_value)
        event += ":" + *change.old_value;
      if (change.new_value)
        event += ">" + *change.new_value;
      events.push_back(event);
    });

    map.set("k", "v1");
    map.set("k", "v2");
    map.remove("k");
    map.remove("k"); // tombstone over tombstone: no observable change

    assert_true(events == std::vector<std::string>({"k:add>v1", "k:update:v1>v2", "k:delete:v2"}),
                "Change Events: add/update/delete should be reported once each");

    // a remote record older than the current winner emits nothing
    map.merge(StringRecord("k", "stale", 1, 99));
    assert_true(events.size() == 3, "Change Events: losing record should emit nothing");
    assert_true(!map.has("k"), "Change Events: losing record should not resurrect the key");
    std::cout << "Test 'Change Events' passed." << std::endl;
  }

  // Test Case: Tombstone Resurrection
  {
    MonotonicClock clock = logical_clock();
    StringMap map(clock, 1);

    map.set("k", "v1");
    map.remove("k");
    assert_true(!map.has("k"), "Tombstone Resurrection: delete without rewrite should hide the key");

    map.set("k", "v2");
    assert_true(map.get("k") == "v2", "Tombstone Resurrection: later write should win");
    assert_true(map.has("k"), "Tombstone Resurrection: has should be true again");
    std::cout << "Test 'Tombstone Resurrection' passed." << std::endl;
  }

  // Test Case: Tie-Break Determinism
  {
    StringRecord from_low("title", "low", 42, 1);
    StringRecord from_high("title", "high", 42, 2);

    MonotonicClock clock_a = logical_clock();
    MonotonicClock clock_b = logical_clock();
    StringMap replica_a(clock_a, 10);
    StringMap replica_b(clock_b, 20);

    replica_a.merge(from_low);
    replica_a.merge(from_high);
    replica_b.merge(from_high);
    replica_b.merge(from_low);

    assert_true(replica_a.get("title") == "high", "Tie-Break: higher writer id should win on replica A");
    assert_true(replica_b.get("title") == "high", "Tie-Break: higher writer id should win on replica B");
    std::cout << "Test 'Tie-Break Determinism' passed." << std::endl;
  }

  // Test Case: Concurrent Writes Converge
  {
    MonotonicClock clock1 = logical_clock();
    MonotonicClock clock2 = logical_clock();
    StringMap node1(clock1, 1);
    StringMap node2(clock2, 2);

    node1.set("x", "from-1");
    node2.set("x", "from-2");
    node2.set("y", "only-2");

    for (const auto &record : node2.records())
      node1.merge(record);
    for (const auto &record : node1.records())
      node2.merge(record);

    assert_true(node1.get("x") == node2.get("x"), "Concurrent Writes: x should converge");
    assert_true(node1.get("x") == "from-2", "Concurrent Writes: equal timestamps resolve by writer id");
    assert_true(node1.get("y") == "only-2", "Concurrent Writes: y should replicate");

    // the next local write beats everything seen so far
    node1.set("x", "after-sync");
    node2.merge(node1.records());
    assert_true(node2.get("x") == "after-sync", "Concurrent Writes: observed clock should make new writes win");
    std::cout << "Test 'Concurrent Writes Converge' passed." << std::endl;
  }

  // Test Case: Convergence Under Shuffled Delivery
  {
    std::mt19937 rng(12345);
    const std::vector<std::string> keys = {"a", "b", "c", "d", "e"};

    for (int round = 0; round < 50; ++round) {
      // three writers with coarse wall clocks so equal timestamps happen
      uint64_t wall = 0;
      MonotonicClock clock1([&]() { return wall; });
      MonotonicClock clock2([&]() { return wall; });
      MonotonicClock clock3([&]() { return wall; });
      StringMap writer1(clock1, 1);
      StringMap writer2(clock2, 2);
      StringMap writer3(clock3, 3);
      StringMap *writers[] = {&writer1, &writer2, &writer3};

      for (int op = 0; op < 60; ++op) {
        if (op % 7 == 0)
          wall += 3;
        StringMap &writer = *writers[rng() % 3];
        const std::string &key = keys[rng() % keys.size()];
        if (rng() % 4 == 0) {
          writer.remove(key);
        } else {
          writer.set(key, "v" + std::to_string(op));
        }
      }

      std::vector<StringRecord> all;
      for (StringMap *writer : writers) {
        all.insert(all.end(), writer->records().begin(), writer->records().end());
      }

      std::vector<StringRecord> order_a = all;
      std::vector<StringRecord> order_b = all;
      std::shuffle(order_a.begin(), order_a.end(), rng);
      std::shuffle(order_b.begin(), order_b.end(), rng);

      MonotonicClock clock_a = logical_clock();
      MonotonicClock clock_b = logical_clock();
      StringMap replica_a(clock_a, 100);
      StringMap replica_b(clock_b, 200);
      replica_a.merge(order_a);
      replica_b.merge(order_b);
      // re-delivery is harmless
      replica_b.merge(order_a);

      assert_true(winner_view(replica_a, keys) == winner_view(replica_b, keys),
                  "Convergence: replicas should agree after shuffled delivery (round " + std::to_string(round) + ")");
      assert_true(replica_a.size() == replica_b.size(), "Convergence: live sizes should agree");
    }
    std::cout << "Test 'Convergence Under Shuffled Delivery' passed." << std::endl;
  }

  // Test Case: Idempotent Compaction
  {
    MonotonicClock clock = logical_clock();
    StringMap map(clock, 1);
    for (int i = 0; i < 10; ++i) {
      map.set("counter", std::to_string(i));
    }
    map.set("other", "x");
    map.remove("other");
    map.merge(StringRecord("counter", "ancient", 0, 7));

    auto before = winner_view(map, {"counter", "other"});
    size_t live_before = map.size();
    assert_true(map.log_size() == 13, "Compaction: log should hold every record before compaction");

    size_t removed = map.compact();
    assert_true(removed == 11, "Compaction: dominated records should be removed");
    assert_true(map.log_size() == 2, "Compaction: one record per key should remain");
    assert_true(winner_view(map, {"counter", "other"}) == before, "Compaction: winners should not change");
    assert_true(map.size() == live_before, "Compaction: live size should not change");

    assert_true(map.compact() == 0, "Compaction: second pass should remove nothing");
    assert_true(winner_view(map, {"counter", "other"}) == before, "Compaction: repeated passes should be no-ops");
    assert_true(map.get("counter") == "9" && !map.has("other"), "Compaction: reads should be unaffected");

    // a compacted log still replicates the same state
    MonotonicClock clock_copy = logical_clock();
    StringMap copy(clock_copy, 2);
    copy.merge(map.records());
    assert_true(winner_view(copy, {"counter", "other"}) == before, "Compaction: compacted log should replicate");
    std::cout << "Test 'Idempotent Compaction' passed." << std::endl;
  }

  // Test Case: Debounced Background Compaction
  {
    uint64_t now = 0;
    DeferredTaskQueue tasks([&]() { return now; });
    MonotonicClock clock = logical_clock();
    {
      StringMap map(clock, 1, &tasks, LwwMapOptions{100});
      map.set("k", "1");
      now += 60;
      map.set("k", "2");
      now += 60;
      tasks.run_due();
      assert_true(map.log_size() == 2, "Background Compaction: change should push the deadline back");

      now += 40;
      tasks.run_due();
      assert_true(map.log_size() == 1, "Background Compaction: should compact after the quiet period");
      assert_true(map.get("k") == "2", "Background Compaction: value should be unchanged");
      assert_true(!map.compaction_pending(), "Background Compaction: nothing should be pending");

      map.set("k", "3");
      assert_true(tasks.pending() == 1, "Background Compaction: new change should schedule a pass");
    }
    assert_true(tasks.pending() == 0, "Background Compaction: destroying the map should cancel its timer");
    std::cout << "Test 'Debounced Background Compaction' passed." << std::endl;
  }

  // Test Case: Clock Overflow
  {
    const uint64_t max_stamp = std::numeric_limits<uint64_t>::max();
    MonotonicClock clock = logical_clock();
    clock.observe(max_stamp - 1);
    assert_true(clock.can_issue(1) && !clock.can_issue(2), "Clock Overflow: one stamp should be left");
    assert_true(clock.next() == max_stamp, "Clock Overflow: last stamp should be the maximum");

    bool thrown = false;
    try {
      clock.next();
    } catch (const std::overflow_error &) {
      thrown = true;
    }
    assert_true(thrown, "Clock Overflow: next should refuse to wrap around");
    assert_true(clock.last() == max_stamp, "Clock Overflow: clock should stay at the maximum");

    // a remote record at the maximum stamp is still merged, later local writes fail
    MonotonicClock map_clock = logical_clock();
    StringMap map(map_clock, 1);
    map.set("k", "local");
    assert_true(map.merge(StringRecord("k", std::string("remote"), max_stamp, 2)),
                "Clock Overflow: remote record should be merged");
    thrown = false;
    try {
      map.set("k", "lost");
    } catch (const std::overflow_error &) {
      thrown = true;
    }
    assert_true(thrown, "Clock Overflow: local set should fail instead of losing the write");
    assert_true(map.get("k") == "remote", "Clock Overflow: winner should be unchanged");
    assert_true(map.log_size() == 2, "Clock Overflow: nothing should be logged");
    std::cout << "Test 'Clock Overflow' passed." << std::endl;
  }

  std::cout << "All tests passed successfully!" << std::endl;
  return 0;
}
