// benchmark.cpp
#include "lww_id.hpp"
#include "lww_sqlite.hpp"
#include "lww_table.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

class LwwBenchmark {
public:
  LwwBenchmark() : node1(options_for(1)), node2(options_for(2)), store(":memory:") {
    node1.define_table(item_schema());
    node2.define_table(item_schema());
  }

  void runBenchmark() {
    std::cout << "Starting LWW table benchmark..." << std::endl;

    insertRecords(1000);
    updateRecords(std::chrono::seconds(2));
    deleteRecords(500);
    synchronizeNodes();
    rebuildStore(10);
    compactLogs();

    std::cout << "LWW table benchmark completed." << std::endl;
  }

private:
  Document node1;
  Document node2;
  SQLiteStore store;
  std::vector<std::string> record_ids;

  static DocumentOptions options_for(LwwWriterId writer_id) {
    DocumentOptions options;
    options.writer_id = writer_id;
    return options;
  }

  static TableSchema item_schema() {
    return TableSchema("items", {
                                    {"id", FieldType::ID},
                                    {"name", FieldType::TEXT},
                                    {"count", FieldType::INTEGER},
                                    {"weight", FieldType::REAL, true},
                                });
  }

  void insertRecords(size_t count) {
    std::cout << "Inserting " << count << " records..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    Table &items = *node1.table("items");
    for (size_t i = 0; i < count; ++i) {
      std::string id = generate_row_id();
      record_ids.push_back(id);
      items.upsert({{"id", id}, {"name", "item_" + std::to_string(i)}, {"count", static_cast<int64_t>(i)}});
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Inserted " << count << " records in " << duration_ms << " ms." << std::endl;
  }

  void updateRecords(std::chrono::seconds duration) {
    std::cout << "Updating records for " << duration.count() << " seconds..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    size_t updates = 0;
    std::default_random_engine rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, record_ids.size() - 1);
    std::uniform_real_distribution<double> weight_dist(0.0, 100.0);

    Table &items = *node1.table("items");
    while (std::chrono::high_resolution_clock::now() - start < duration) {
      const std::string &id = record_ids[dist(rng)];
      if (updates % 2 == 0) {
        items.update({{"id", id}, {"count", static_cast<int64_t>(updates)}});
      } else {
        items.update({{"id", id}, {"weight", weight_dist(rng)}});
      }
      updates++;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Performed " << updates << " updates in " << elapsed_ms << " ms." << std::endl;
  }

  void deleteRecords(size_t count) {
    std::cout << "Deleting " << count << " records..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    size_t end_index = std::min(count, record_ids.size());
    LwwVector<LwwKey> ids(record_ids.begin(), record_ids.begin() + end_index);
    DeleteManyResult result = node1.table("items")->remove_many(ids);

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Deleted " << result.deleted.size() << " records in " << duration_ms << " ms." << std::endl;
  }

  void synchronizeNodes() {
    std::cout << "Synchronizing node1 to node2..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    WorkspaceUpdate update = node1.encode_state();
    node2.apply_update(update);
    node1.apply_update(node2.encode_state());

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Synchronized " << update.size() << " records in " << duration_ms << " ms." << std::endl;

    verifyConsistency();
  }

  void verifyConsistency() {
    std::cout << "Verifying consistency between nodes..." << std::endl;

    auto sorted_rows = [](Document &doc) {
      LwwVector<Row> rows = doc.table("items")->get_all_valid();
      std::sort(rows.begin(), rows.end(),
                [](const Row &a, const Row &b) { return a.at("id").text_val < b.at("id").text_val; });
      return rows;
    };

    if (sorted_rows(node1) == sorted_rows(node2)) {
      std::cout << "Consistency check passed: Both nodes have identical data." << std::endl;
    } else {
      std::cout << "Consistency check failed: Nodes have differing data." << std::endl;
    }
  }

  void rebuildStore(size_t rounds) {
    std::cout << "Rebuilding SQLite store " << rounds << " times..." << std::endl;
    DeferredTaskQueue tasks;
    Materializer materializer(node2, store, tasks);
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < rounds; ++i) {
      materializer.rebuild_now();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Rebuilt " << store.count_rows("items") << " rows " << rounds << " times in " << duration_ms
              << " ms (" << materializer.failed_rebuild_count() << " failures)." << std::endl;
  }

  void compactLogs() {
    std::cout << "Compacting logs..." << std::endl;
    size_t before = node1.log_size();
    auto start = std::chrono::high_resolution_clock::now();

    size_t removed = node1.compact();

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Removed " << removed << " of " << before << " records in " << duration_ms << " ms." << std::endl;
  }
};

int main() {
  LwwBenchmark benchmark;
  benchmark.runBenchmark();
  return 0;
}
