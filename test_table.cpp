// test_table.cpp
#include "lww_id.hpp"
#include "lww_table.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>

// Test helper macros
#define TEST(name) void test_##name()
#define RUN_TEST(name) \
  do { \
    std::cout << "Running test: " << #name << "..."; \
    test_##name(); \
    std::cout << " PASSED" << std::endl; \
  } while (0)

#define ASSERT_EQ(a, b) \
  do { \
    if ((a) != (b)) { \
      std::cerr << "Assertion failed: " << #a << " == " << #b \
                << " (got " << (a) << " and " << (b) << ")" << std::endl; \
      std::exit(1); \
    } \
  } while (0)

#define ASSERT_TRUE(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "Assertion failed: " << #cond << std::endl; \
      std::exit(1); \
    } \
  } while (0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_THROWS(expr, exception) \
  do { \
    bool thrown = false; \
    try { \
      expr; \
    } catch (const exception &) { \
      thrown = true; \
    } \
    if (!thrown) { \
      std::cerr << "Expected " << #exception << " from " << #expr << std::endl; \
      std::exit(1); \
    } \
  } while (0)

TableSchema todo_schema() {
  return TableSchema("todos", {
                                  {"id", FieldType::ID},
                                  {"title", FieldType::TEXT},
                                  {"done", FieldType::BOOLEAN, false, CellValue(false)},
                                  {"priority", FieldType::INTEGER, true},
                              });
}

DocumentOptions options_for(LwwWriterId writer, MonotonicClock::TimeSource now) {
  DocumentOptions options;
  options.writer_id = writer;
  options.time_source = std::move(now);
  return options;
}

/// Rows sorted by id, so replicas can be compared regardless of iteration order.
LwwVector<Row> sorted_by_id(LwwVector<Row> rows) {
  std::sort(rows.begin(), rows.end(),
            [](const Row &a, const Row &b) { return a.at("id").text_val < b.at("id").text_val; });
  return rows;
}

/// Exchanges full state in both directions.
void sync_replicas(Document &a, Document &b) {
  b.apply_update(a.encode_state());
  a.apply_update(b.encode_state());
}

/// Records every observer callback of a table.
struct ChangeLog {
  LwwVector<Table::RowChanges> batches;
  LwwVector<Transaction> transactions;
  Subscription subscription;

  explicit ChangeLog(Table &table) {
    subscription = table.observe([this](const Table::RowChanges &changes, const Transaction &transaction) {
      batches.push_back(changes);
      transactions.push_back(transaction);
    });
  }
};

TEST(basic_crud) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());

  todos.upsert({{"id", "t1"}, {"title", "Buy milk"}});
  ASSERT_TRUE(todos.has("t1"));
  ASSERT_EQ(todos.count(), 1u);

  RowResult result = todos.get("t1");
  ASSERT_TRUE(result.is_valid());
  ASSERT_EQ(result.row.at("title").text_val, "Buy milk");
  // default applied to the validated view
  ASSERT_EQ(result.row.at("done"), CellValue(false));
  // nullable field without default stays absent
  ASSERT_TRUE(result.row.find("priority") == result.row.end());

  ASSERT_TRUE(todos.update({{"id", "t1"}, {"done", true}}) == UpdateStatus::APPLIED);
  result = todos.get("t1");
  ASSERT_EQ(result.row.at("done"), CellValue(true));
  ASSERT_EQ(result.row.at("title").text_val, "Buy milk");

  ASSERT_TRUE(todos.remove("t1") == DeleteStatus::DELETED);
  ASSERT_FALSE(todos.has("t1"));
  ASSERT_TRUE(todos.get("t1").status == RowStatus::NOT_FOUND);
  ASSERT_EQ(todos.get("t1").id, "t1");
  ASSERT_TRUE(todos.remove("t1") == DeleteStatus::NOT_FOUND);
  ASSERT_TRUE(todos.remove("never-existed") == DeleteStatus::NOT_FOUND);
  ASSERT_EQ(todos.count(), 0u);
  ASSERT_TRUE(todos.get_all().empty());
}

TEST(update_missing_row) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());

  ASSERT_TRUE(todos.update({{"id", "ghost"}, {"title", "x"}}) == UpdateStatus::NOT_FOUND_LOCALLY);
  ASSERT_FALSE(todos.has("ghost"));
  ASSERT_EQ(doc.log_size(), 0u);
}

TEST(row_id_required) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());

  ASSERT_THROWS(todos.upsert({{"title", "no id"}}), std::invalid_argument);
  ASSERT_THROWS(todos.upsert({{"id", ""}, {"title", "empty id"}}), std::invalid_argument);
  ASSERT_THROWS(todos.update({{"id", 42}}), std::invalid_argument);
  // the whole batch is rejected before anything is written
  ASSERT_THROWS(todos.upsert_many({{{"id", "ok"}, {"title", "fine"}}, {{"title", "bad"}}}), std::invalid_argument);
  ASSERT_FALSE(todos.has("ok"));
}

TEST(empty_column_name_writes_nothing) {
  uint64_t wall = 1000;
  Document doc(options_for(1, [&]() { return wall; }));
  Table &todos = doc.define_table(todo_schema());
  ChangeLog log(todos);

  ASSERT_THROWS(todos.upsert({{"id", "x"}, {"", 1}, {"title", "t"}}), std::invalid_argument);
  ASSERT_FALSE(todos.has("x"));
  ASSERT_TRUE(todos.get("x").status == RowStatus::NOT_FOUND);
  ASSERT_TRUE(todos.get_all().empty());
  ASSERT_TRUE(log.batches.empty());
  ASSERT_EQ(doc.log_size(), 0u);

  todos.upsert({{"id", "t1"}, {"title", "kept"}});
  size_t log_size = doc.log_size();
  ASSERT_THROWS(todos.update({{"id", "t1"}, {"title", "changed"}, {"", 2}}), std::invalid_argument);
  ASSERT_THROWS(todos.upsert_many({{{"id", "t2"}, {"title", "fine"}}, {{"id", "t3"}, {"", 3}}}),
                std::invalid_argument);
  ASSERT_THROWS(todos.update_many({{{"id", "t1"}, {"title", "fine"}}, {{"id", "t1"}, {"", 4}}}),
                std::invalid_argument);
  ASSERT_EQ(todos.get("t1").row.at("title").text_val, "kept");
  ASSERT_FALSE(todos.has("t2"));
  ASSERT_FALSE(todos.has("t3"));
  ASSERT_EQ(doc.log_size(), log_size);
  ASSERT_EQ(log.batches.size(), 1u);
}

TEST(clock_overflow_rejects_local_writes) {
  uint64_t wall = 1000;
  Document a(options_for(1, [&]() { return wall; }));
  Document b(options_for(2, [&]() { return wall; }));
  Table &todos_a = a.define_table(todo_schema());
  Table &todos_b = b.define_table(todo_schema());

  todos_a.upsert({{"id", "t1"}, {"title", "one"}});
  WorkspaceUpdate state = a.encode_state();
  for (auto &cell : state.cells) {
    if (cell.record.key == "title") {
      cell.record.timestamp = std::numeric_limits<uint64_t>::max();
    }
  }
  b.apply_update(state);
  ASSERT_EQ(todos_b.get("t1").row.at("title").text_val, "one");

  ChangeLog log_b(todos_b);
  size_t log_size = b.log_size();
  ASSERT_THROWS(todos_b.update({{"id", "t1"}, {"title", "two"}}), std::overflow_error);
  ASSERT_THROWS(todos_b.upsert({{"id", "t2"}, {"title", "new"}}), std::overflow_error);
  ASSERT_EQ(todos_b.get("t1").row.at("title").text_val, "one");
  ASSERT_FALSE(todos_b.has("t2"));
  ASSERT_EQ(b.log_size(), log_size);
  ASSERT_TRUE(log_b.batches.empty());
}

TEST(schema_definition_errors) {
  ASSERT_THROWS(TableSchema("bad name", {{"id", FieldType::ID}}), std::invalid_argument);
  ASSERT_THROWS(TableSchema("1table", {{"id", FieldType::ID}}), std::invalid_argument);
  ASSERT_THROWS(TableSchema("items", {{"title", FieldType::TEXT}}), std::invalid_argument);
  ASSERT_THROWS(TableSchema("items", {{"id", FieldType::TEXT}}), std::invalid_argument);
  ASSERT_THROWS(TableSchema("items", {{"id", FieldType::ID}, {"a", FieldType::TEXT}, {"a", FieldType::INTEGER}}),
                std::invalid_argument);

  Document doc(options_for(1, MonotonicClock::system_time_ms));
  doc.define_table(todo_schema());
  ASSERT_THROWS(doc.define_table(todo_schema()), std::invalid_argument);
  ASSERT_TRUE(doc.table("todos") != nullptr);
  ASSERT_TRUE(doc.table("missing") == nullptr);
  ASSERT_EQ(doc.tables().size(), 1u);
}

TEST(invalid_rows_stay_visible) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());

  todos.upsert({{"id", "good"}, {"title", "ok"}});
  todos.upsert({{"id", "bad"}, {"title", 5}, {"done", CellValue::null()}});
  todos.upsert({{"id", "partial"}});

  ASSERT_EQ(todos.count(), 3u);
  ASSERT_EQ(todos.get_all().size(), 3u);
  ASSERT_EQ(todos.get_all_valid().size(), 1u);
  ASSERT_EQ(todos.get_all_invalid().size(), 2u);

  RowResult bad = todos.get("bad");
  ASSERT_TRUE(bad.status == RowStatus::INVALID);
  // the raw row is returned, without defaults
  ASSERT_EQ(bad.row.at("title"), CellValue(5));
  ASSERT_EQ(bad.errors.size(), 2u);
  std::set<std::string> fields;
  for (const auto &error : bad.errors) {
    fields.insert(error.field);
  }
  ASSERT_TRUE(fields.count("title") == 1 && fields.count("done") == 1);

  RowResult partial = todos.get("partial");
  ASSERT_TRUE(partial.status == RowStatus::INVALID);
  ASSERT_EQ(partial.errors.size(), 1u);
  ASSERT_EQ(partial.errors[0].field, "title");
  ASSERT_EQ(partial.errors[0].message, "missing required field");

  // repairing the row makes it valid again
  ASSERT_TRUE(todos.update({{"id", "partial"}, {"title", "now complete"}}) == UpdateStatus::APPLIED);
  ASSERT_TRUE(todos.get("partial").is_valid());
  ASSERT_EQ(todos.get_all_valid().size(), 2u);
}

TEST(unknown_columns_are_kept) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());

  todos.upsert({{"id", "t1"}, {"title", "x"}, {"color", "red"}});
  RowResult result = todos.get("t1");
  ASSERT_TRUE(result.is_valid());
  ASSERT_EQ(result.row.at("color").text_val, "red");
}

TEST(real_accepts_integer) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &points =
      doc.define_table(TableSchema("points", {{"id", FieldType::ID}, {"x", FieldType::REAL}, {"y", FieldType::REAL}}));

  points.upsert({{"id", "p"}, {"x", 1.5}, {"y", 2}});
  ASSERT_TRUE(points.get("p").is_valid());
  points.upsert({{"id", "q"}, {"x", "left"}, {"y", 0.0}});
  RowResult q = points.get("q");
  ASSERT_TRUE(q.status == RowStatus::INVALID);
  ASSERT_EQ(q.errors[0].message, "expected real, got text");
}

TEST(concurrent_field_independence) {
  uint64_t wall = 1000;
  Document a(options_for(1, [&]() { return wall; }));
  Document b(options_for(2, [&]() { return wall; }));
  Table &todos_a = a.define_table(todo_schema());
  Table &todos_b = b.define_table(todo_schema());

  todos_a.upsert({{"id", "t1"}, {"title", "Draft"}, {"done", false}});
  sync_replicas(a, b);
  ASSERT_TRUE(todos_b.get("t1").is_valid());

  // concurrent edits of different fields of the same row
  wall = 2000;
  ASSERT_TRUE(todos_a.update({{"id", "t1"}, {"title", "Final"}}) == UpdateStatus::APPLIED);
  ASSERT_TRUE(todos_b.update({{"id", "t1"}, {"done", true}}) == UpdateStatus::APPLIED);
  sync_replicas(a, b);

  for (Table *todos : {&todos_a, &todos_b}) {
    RowResult result = todos->get("t1");
    ASSERT_TRUE(result.is_valid());
    ASSERT_EQ(result.row.at("title").text_val, "Final");
    ASSERT_EQ(result.row.at("done"), CellValue(true));
  }
}

TEST(concurrent_same_field_tie_break) {
  // frozen wall clock: timestamps only advance through the logical part
  Document a(options_for(1, []() -> uint64_t { return 1000; }));
  Document b(options_for(2, []() -> uint64_t { return 1000; }));
  Table &todos_a = a.define_table(todo_schema());
  Table &todos_b = b.define_table(todo_schema());

  todos_a.upsert({{"id", "t1"}, {"title", "Draft"}});
  sync_replicas(a, b);
  ASSERT_EQ(a.clock().last(), b.clock().last());

  todos_a.update({{"id", "t1"}, {"title", "from a"}});
  todos_b.update({{"id", "t1"}, {"title", "from b"}});
  sync_replicas(a, b);

  // same timestamp, higher writer id wins on both replicas
  ASSERT_EQ(todos_a.get("t1").row.at("title").text_val, "from b");
  ASSERT_EQ(todos_b.get("t1").row.at("title").text_val, "from b");
}

TEST(delete_beats_older_concurrent_update) {
  uint64_t wall = 1000;
  Document a(options_for(1, [&]() { return wall; }));
  Document b(options_for(2, [&]() { return wall; }));
  Table &todos_a = a.define_table(todo_schema());
  Table &todos_b = b.define_table(todo_schema());

  todos_a.upsert({{"id", "t1"}, {"title", "Draft"}});
  sync_replicas(a, b);

  wall = 2000;
  ASSERT_TRUE(todos_b.remove("t1") == DeleteStatus::DELETED);
  wall = 3000;
  // edit of the old incarnation, made without seeing the delete
  ASSERT_TRUE(todos_a.update({{"id", "t1"}, {"title", "Edited"}}) == UpdateStatus::APPLIED);
  sync_replicas(a, b);

  ASSERT_FALSE(todos_a.has("t1"));
  ASSERT_FALSE(todos_b.has("t1"));
  ASSERT_TRUE(todos_a.get("t1").status == RowStatus::NOT_FOUND);
}

TEST(upsert_after_delete_starts_fresh) {
  uint64_t wall = 1000;
  Document a(options_for(1, [&]() { return wall; }));
  Document b(options_for(2, [&]() { return wall; }));
  Table &todos_a = a.define_table(todo_schema());
  Table &todos_b = b.define_table(todo_schema());

  todos_a.upsert({{"id", "t1"}, {"title", "Old"}, {"priority", 3}});
  todos_a.remove("t1");
  todos_a.upsert({{"id", "t1"}, {"title", "New"}});

  RowResult result = todos_a.get("t1");
  ASSERT_TRUE(result.is_valid());
  ASSERT_EQ(result.row.at("title").text_val, "New");
  // nothing from the deleted incarnation comes back
  ASSERT_TRUE(result.row.find("priority") == result.row.end());

  sync_replicas(a, b);
  ASSERT_TRUE(todos_b.get("t1").row == result.row);
}

TEST(cells_before_row) {
  uint64_t wall = 1000;
  Document a(options_for(1, [&]() { return wall; }));
  Document b(options_for(2, [&]() { return wall; }));
  Table &todos_a = a.define_table(todo_schema());
  Table &todos_b = b.define_table(todo_schema());
  ChangeLog log_b(todos_b);

  todos_a.upsert({{"id", "t1"}, {"title", "Out of order"}});
  WorkspaceUpdate state = a.encode_state();

  WorkspaceUpdate cells_only;
  cells_only.cells = state.cells;
  WorkspaceUpdate rows_only;
  rows_only.rows = state.rows;

  b.apply_update(cells_only);
  ASSERT_FALSE(todos_b.has("t1"));
  ASSERT_TRUE(log_b.batches.empty());

  b.apply_update(rows_only, "peer-a");
  ASSERT_TRUE(todos_b.has("t1"));
  ASSERT_EQ(todos_b.get("t1").row.at("title").text_val, "Out of order");

  ASSERT_EQ(log_b.batches.size(), 1u);
  ASSERT_TRUE(log_b.batches[0].at("t1") == RowAction::ADD);
  ASSERT_FALSE(log_b.transactions[0].local);
  ASSERT_EQ(log_b.transactions[0].origin, "peer-a");
}

TEST(apply_update_is_idempotent) {
  uint64_t wall = 1000;
  Document a(options_for(1, [&]() { return wall++; }));
  Document b(options_for(2, [&]() { return wall++; }));
  Table &todos_a = a.define_table(todo_schema());
  Table &todos_b = b.define_table(todo_schema());

  todos_a.upsert_many({{{"id", "t1"}, {"title", "one"}}, {{"id", "t2"}, {"title", "two"}}});
  todos_a.update({{"id", "t1"}, {"title", "one v2"}});
  todos_a.remove("t2");

  WorkspaceUpdate state = a.encode_state();
  b.apply_update(state);
  auto first = sorted_by_id(todos_b.get_all_valid());

  ChangeLog log_b(todos_b);
  b.apply_update(state);
  auto second = sorted_by_id(todos_b.get_all_valid());

  ASSERT_TRUE(first == second);
  ASSERT_TRUE(log_b.batches.empty());
  ASSERT_TRUE(first == sorted_by_id(todos_a.get_all_valid()));
}

TEST(table_defined_after_merge) {
  uint64_t wall = 1000;
  Document a(options_for(1, [&]() { return wall++; }));
  Document b(options_for(2, [&]() { return wall++; }));
  Table &todos_a = a.define_table(todo_schema());
  todos_a.upsert({{"id", "t1"}, {"title", "early"}});

  b.apply_update(a.encode_state());
  Table &todos_b = b.define_table(todo_schema());
  ASSERT_TRUE(todos_b.has("t1"));
  ASSERT_EQ(todos_b.get("t1").row.at("title").text_val, "early");
}

TEST(observer_batches_per_transaction) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());
  ChangeLog log(todos);

  todos.upsert_many({{{"id", "a"}, {"title", "A"}}, {{"id", "b"}, {"title", "B"}}, {{"id", "c"}, {"title", "C"}}});
  ASSERT_EQ(log.batches.size(), 1u);
  ASSERT_EQ(log.batches[0].size(), 3u);
  for (const auto &[id, action] : log.batches[0]) {
    ASSERT_TRUE(action == RowAction::ADD);
  }
  ASSERT_TRUE(log.transactions[0].local);

  // add then delete within one transaction leaves no trace
  doc.transact([&]() {
    todos.update({{"id", "a"}, {"title", "A2"}});
    todos.update({{"id", "a"}, {"done", true}});
    todos.remove("b");
    todos.upsert({{"id", "d"}, {"title", "D"}});
    todos.remove("d");
  }, "ui");
  ASSERT_EQ(log.batches.size(), 2u);
  ASSERT_EQ(log.batches[1].size(), 2u);
  ASSERT_TRUE(log.batches[1].at("a") == RowAction::UPDATE);
  ASSERT_TRUE(log.batches[1].at("b") == RowAction::DELETE);
  ASSERT_EQ(log.transactions[1].origin, "ui");
  ASSERT_TRUE(log.transactions[1].id > log.transactions[0].id);

  // delete then re-create folds into an update
  doc.transact([&]() {
    todos.remove("c");
    todos.upsert({{"id", "c"}, {"title", "C again"}});
  });
  ASSERT_EQ(log.batches.size(), 3u);
  ASSERT_TRUE(log.batches[2].at("c") == RowAction::UPDATE);

  // update then delete folds into a delete
  doc.transact([&]() {
    todos.update({{"id", "c"}, {"title", "C3"}});
    todos.remove("c");
  });
  ASSERT_TRUE(log.batches[3].at("c") == RowAction::DELETE);

  // a transaction that touches nothing is silent
  doc.transact([&]() { todos.update({{"id", "missing"}, {"title", "x"}}); });
  ASSERT_EQ(log.batches.size(), 4u);

  // nested transactions collapse into the outermost one
  doc.transact([&]() {
    doc.transact([&]() { todos.upsert({{"id", "e"}, {"title", "E"}}); });
    ASSERT_TRUE(doc.current_transaction() != nullptr);
    todos.upsert({{"id", "f"}, {"title", "F"}});
  });
  ASSERT_EQ(log.batches.size(), 5u);
  ASSERT_EQ(log.batches[4].size(), 2u);
  ASSERT_TRUE(doc.current_transaction() == nullptr);

  log.subscription.unsubscribe();
  todos.upsert({{"id", "g"}, {"title", "G"}});
  ASSERT_EQ(log.batches.size(), 5u);
}

TEST(transaction_ends_on_exception) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());
  ChangeLog log(todos);

  bool thrown = false;
  try {
    doc.transact([&]() {
      todos.upsert({{"id", "a"}, {"title", "A"}});
      throw std::runtime_error("boom");
    });
  } catch (const std::runtime_error &) {
    thrown = true;
  }
  ASSERT_TRUE(thrown);
  ASSERT_TRUE(doc.current_transaction() == nullptr);
  // writes made before the throw are kept and reported
  ASSERT_EQ(log.batches.size(), 1u);
  ASSERT_TRUE(todos.has("a"));
}

TEST(batch_results) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());
  todos.upsert_many({{{"id", "a"}, {"title", "A"}}, {{"id", "b"}, {"title", "B"}}});

  UpdateManyResult updated = todos.update_many({{{"id", "a"}, {"done", true}}, {{"id", "zz"}, {"done", true}}});
  ASSERT_TRUE(updated.status == BatchStatus::PARTIAL);
  ASSERT_TRUE(updated.applied == LwwVector<LwwKey>({"a"}));
  ASSERT_TRUE(updated.not_found_locally == LwwVector<LwwKey>({"zz"}));

  ASSERT_TRUE(todos.update_many({{{"id", "a"}, {"title", "A2"}}}).status == BatchStatus::ALL);
  ASSERT_TRUE(todos.update_many({{{"id", "x"}, {"title", "X"}}}).status == BatchStatus::NONE);

  DeleteManyResult none = todos.remove_many({"x", "y"});
  ASSERT_TRUE(none.status == BatchStatus::NONE);
  ASSERT_EQ(none.not_found.size(), 2u);

  DeleteManyResult partial = todos.remove_many({"a", "y"});
  ASSERT_TRUE(partial.status == BatchStatus::PARTIAL);
  ASSERT_TRUE(partial.deleted == LwwVector<LwwKey>({"a"}));

  DeleteManyResult all = todos.remove_many({"b"});
  ASSERT_TRUE(all.status == BatchStatus::ALL);
  ASSERT_EQ(todos.count(), 0u);
}

TEST(filter_find_clear) {
  Document doc(options_for(1, MonotonicClock::system_time_ms));
  Table &todos = doc.define_table(todo_schema());
  ChangeLog log(todos);

  for (int i = 0; i < 10; ++i) {
    todos.upsert({{"id", "t" + std::to_string(i)}, {"title", "task"}, {"priority", i}});
  }
  todos.upsert({{"id", "broken"}, {"priority", 100}});

  auto urgent = todos.filter([](const Row &row) { return row.at("priority").int_val >= 7; });
  ASSERT_EQ(urgent.size(), 3u);

  // invalid rows never match
  ASSERT_FALSE(todos.find([](const Row &row) { return row.at("priority").int_val == 100; }).has_value());
  auto five = todos.find([](const Row &row) { return row.at("priority").int_val == 5; });
  ASSERT_TRUE(five.has_value());
  ASSERT_EQ(five->at("id").text_val, "t5");

  size_t batches_before = log.batches.size();
  todos.clear();
  ASSERT_EQ(todos.count(), 0u);
  ASSERT_EQ(log.batches.size(), batches_before + 1);
  ASSERT_EQ(log.batches.back().size(), 11u);

  // clearing an empty table does nothing
  todos.clear();
  ASSERT_EQ(log.batches.size(), batches_before + 1);
}

TEST(compaction_preserves_state) {
  uint64_t wall = 1000;
  Document a(options_for(1, [&]() { return wall++; }));
  Table &todos = a.define_table(todo_schema());

  todos.upsert({{"id", "t1"}, {"title", "v0"}});
  for (int i = 1; i <= 20; ++i) {
    todos.update({{"id", "t1"}, {"title", "v" + std::to_string(i)}});
  }
  todos.upsert({{"id", "t2"}, {"title", "gone"}, {"priority", 1}});
  todos.remove("t2");

  auto before = sorted_by_id(todos.get_all_valid());
  size_t log_before = a.log_size();
  size_t removed = a.compact();
  ASSERT_TRUE(removed > 0);
  ASSERT_EQ(a.log_size(), log_before - removed);
  ASSERT_TRUE(sorted_by_id(todos.get_all_valid()) == before);
  ASSERT_EQ(a.compact(), 0u);

  // a compacted replica still bootstraps a new one
  Document c(options_for(3, [&]() { return wall++; }));
  Table &todos_c = c.define_table(todo_schema());
  c.apply_update(a.encode_state());
  ASSERT_TRUE(sorted_by_id(todos_c.get_all_valid()) == before);
  ASSERT_FALSE(todos_c.has("t2"));
}

TEST(background_compaction) {
  uint64_t now = 0;
  DeferredTaskQueue tasks([&]() { return now; });
  DocumentOptions options = options_for(1, [&]() { return now; });
  options.tasks = &tasks;
  options.map_options.compaction_debounce_ms = 50;
  Document doc(options);
  Table &todos = doc.define_table(todo_schema());

  todos.upsert({{"id", "t1"}, {"title", "a"}});
  todos.update({{"id", "t1"}, {"title", "b"}});
  todos.update({{"id", "t1"}, {"title", "c"}});
  size_t log_before = doc.log_size();

  now += 50;
  tasks.run_due();
  ASSERT_TRUE(doc.log_size() < log_before);
  ASSERT_EQ(todos.get("t1").row.at("title").text_val, "c");
}

TEST(document_releases_task_queue) {
  uint64_t now = 0;
  DeferredTaskQueue tasks([&]() { return now; });
  {
    DocumentOptions options = options_for(1, [&]() { return now; });
    options.tasks = &tasks;
    Document doc(options);
    Table &todos = doc.define_table(todo_schema());
    todos.upsert({{"id", "t1"}, {"title", "a"}});
    ASSERT_TRUE(tasks.pending() > 0);
  }
  // the queue outlives the document and holds nothing that points into it
  ASSERT_EQ(tasks.pending(), 0u);
  now += 10000;
  ASSERT_EQ(tasks.run_due(), 0u);
}

TEST(generated_ids) {
  LwwWriterId w1 = generate_writer_id();
  LwwWriterId w2 = generate_writer_id();
  ASSERT_TRUE(w1 != 0 && w2 != 0);
  ASSERT_TRUE(w1 != w2);

  std::string id = generate_row_id();
  ASSERT_EQ(id.size(), 36u);
  ASSERT_TRUE(id != generate_row_id());

  Document doc;
  ASSERT_TRUE(doc.writer_id() != 0);
}

TEST(random_convergence) {
  // three replicas editing and syncing pairwise in random order
  uint64_t wall = 1000;
  Document r1(options_for(1, [&]() { return wall; }));
  Document r2(options_for(2, [&]() { return wall; }));
  Document r3(options_for(3, [&]() { return wall; }));
  Document *replicas[] = {&r1, &r2, &r3};
  for (Document *doc : replicas) {
    doc->define_table(todo_schema());
  }

  unsigned seed = 7;
  auto next = [&]() {
    seed = seed * 1103515245u + 12345u;
    return (seed >> 16) & 0x7fff;
  };

  for (int step = 0; step < 300; ++step) {
    if (step % 5 == 0)
      ++wall;
    Document &doc = *replicas[next() % 3];
    Table &todos = *doc.table("todos");
    std::string id = "t" + std::to_string(next() % 6);
    switch (next() % 5) {
    case 0:
      todos.upsert({{"id", id}, {"title", "s" + std::to_string(step)}});
      break;
    case 1:
      todos.update({{"id", id}, {"priority", step}});
      break;
    case 2:
      todos.remove(id);
      break;
    case 3:
      todos.update({{"id", id}, {"done", step % 2 == 0}});
      break;
    default:
      sync_replicas(doc, *replicas[next() % 3]);
      break;
    }
  }

  sync_replicas(r1, r2);
  sync_replicas(r2, r3);
  sync_replicas(r1, r2);

  auto rows1 = sorted_by_id(r1.table("todos")->get_all_valid());
  ASSERT_TRUE(rows1 == sorted_by_id(r2.table("todos")->get_all_valid()));
  ASSERT_TRUE(rows1 == sorted_by_id(r3.table("todos")->get_all_valid()));
  ASSERT_EQ(r1.table("todos")->count(), r3.table("todos")->count());
}

int main() {
  std::cout << "Running LWW table tests..." << std::endl << std::endl;

  RUN_TEST(basic_crud);
  RUN_TEST(update_missing_row);
  RUN_TEST(row_id_required);
  RUN_TEST(empty_column_name_writes_nothing);
  RUN_TEST(clock_overflow_rejects_local_writes);
  RUN_TEST(schema_definition_errors);
  RUN_TEST(invalid_rows_stay_visible);
  RUN_TEST(unknown_columns_are_kept);
  RUN_TEST(real_accepts_integer);
  RUN_TEST(concurrent_field_independence);
  RUN_TEST(concurrent_same_field_tie_break);
  RUN_TEST(delete_beats_older_concurrent_update);
  RUN_TEST(upsert_after_delete_starts_fresh);
  RUN_TEST(cells_before_row);
  RUN_TEST(apply_update_is_idempotent);
  RUN_TEST(table_defined_after_merge);
  RUN_TEST(observer_batches_per_transaction);
  RUN_TEST(transaction_ends_on_exception);
  RUN_TEST(batch_results);
  RUN_TEST(filter_find_clear);
  RUN_TEST(compaction_preserves_state);
  RUN_TEST(background_compaction);
  RUN_TEST(document_releases_task_queue);
  RUN_TEST(generated_ids);
  RUN_TEST(random_convergence);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
