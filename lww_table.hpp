// lww_table.hpp
#ifndef LWW_TABLE_HPP
#define LWW_TABLE_HPP

#include "lww_clock.hpp"
#include "lww_map.hpp"
#include "lww_schema.hpp"
#include "lww_signal.hpp"
#include "lww_timer.hpp"
#include "lww_types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

class Document;

enum class RowAction { ADD, UPDATE, DELETE };

const char *to_string(RowAction action);

/// Handle of the transaction that produced a batch of changes.
///
/// `local` is false for transactions created by Document::apply_update, and
/// `origin` is whatever the caller passed in, which lets observers ignore
/// their own echoes.
struct Transaction {
  uint64_t id;
  std::string origin;
  bool local;
};

/// Row-container record of one table (row present / row deleted).
struct RowPresenceRecord {
  LwwKey table;
  LwwRecord<bool> record;
};

/// Cell record of one row generation.
struct CellRecord {
  LwwKey table;
  LwwKey row_id;
  RowGeneration generation;
  LwwRecord<CellValue> record;
};

/// Records exchanged between replicas. Transport and encoding belong to the
/// caller; applying the same update twice, or updates in any order, converges.
struct WorkspaceUpdate {
  LwwVector<RowPresenceRecord> rows;
  LwwVector<CellRecord> cells;

  bool empty() const { return rows.empty() && cells.empty(); }
  size_t size() const { return rows.size() + cells.size(); }
};

/// Cell-level storage of one table.
///
/// A container map (row id -> present) decides which rows exist. Each row
/// incarnation keeps its cells in its own LwwMap keyed by column name, so
/// concurrent writes to different columns of the same row both survive.
///
/// Cells are tagged with the generation of the row they were written to.
/// Cells of a generation the container has not seen yet are buffered; cells
/// of a generation the container has moved past are dropped for good.
class RowStore {
public:
  using CellMap = LwwMap<CellValue>;
  using RowEventHandler = std::function<void(const LwwKey &, RowAction)>;

  RowStore(std::string table_name, MonotonicClock &clock, LwwWriterId writer_id, DeferredTaskQueue *tasks,
           LwwMapOptions options);

  RowStore(const RowStore &) = delete;
  RowStore &operator=(const RowStore &) = delete;

  const std::string &table_name() const { return table_name_; }

  /// Starts a new generation for `row_id` and returns its (empty) cell map.
  CellMap &create_row(const LwwKey &row_id);

  /// Cell map of the live generation, or nullptr if the row is absent.
  CellMap *live_row(const LwwKey &row_id);
  const CellMap *live_row(const LwwKey &row_id) const;

  /// Removes the row from the container. Returns false if it was absent.
  bool remove_row(const LwwKey &row_id);

  bool contains(const LwwKey &row_id) const { return container_.has(row_id); }

  /// Number of present rows.
  size_t size() const { return container_.size(); }

  /// Calls `fn(row_id, cells)` for every present row.
  template <typename Fn> void for_each_row(Fn &&fn) const {
    container_.for_each([&](const LwwKey &row_id, const bool &) {
      if (const CellMap *cells = live_row(row_id)) {
        fn(row_id, *cells);
      }
    });
  }

  LwwVector<LwwKey> row_ids() const;

  void merge_row(const LwwRecord<bool> &record);
  void merge_cell(const LwwKey &row_id, const RowGeneration &generation, const LwwRecord<CellValue> &record);

  /// Appends every record of this table to `out`.
  void encode(WorkspaceUpdate &out) const;

  /// Compacts the container and every cell map. Returns records removed.
  size_t compact();

  /// Total log size across the container and all cell maps.
  size_t log_size() const;

  /// Row-level events for live generations only.
  Subscription on_row_event(RowEventHandler handler) { return row_signal_.connect(std::move(handler)); }

  /// Rebuilds a plain row from the live cells.
  static Row reconstruct(const CellMap &cells);

private:
  struct GenerationSlot {
    std::unique_ptr<CellMap> cells;
    Subscription subscription;
  };

  std::optional<RowGeneration> live_generation(const LwwKey &row_id) const;
  CellMap &cell_map(const LwwKey &row_id, const RowGeneration &generation);
  void prune(const LwwKey &row_id);

  std::string table_name_;
  MonotonicClock &clock_;
  LwwWriterId writer_id_;
  DeferredTaskQueue *tasks_;
  LwwMapOptions options_;

  LwwMap<bool> container_;
  LwwHashMap<LwwKey, LwwSortedMap<RowGeneration, GenerationSlot>> generations_;
  Signal<const LwwKey &, RowAction> row_signal_;
  Subscription container_subscription_;
};

enum class RowStatus { VALID, INVALID, NOT_FOUND };

const char *to_string(RowStatus status);

/// Outcome of reading one row.
///
/// VALID: `row` is the validated row (schema defaults applied).
/// INVALID: `row` is the raw reconstructed row, `errors` says why.
/// NOT_FOUND: only `id` is set.
struct RowResult {
  RowStatus status;
  LwwKey id;
  Row row;
  LwwVector<ValidationError> errors;

  bool is_valid() const { return status == RowStatus::VALID; }
};

enum class UpdateStatus { APPLIED, NOT_FOUND_LOCALLY };
enum class DeleteStatus { DELETED, NOT_FOUND };
enum class BatchStatus { ALL, PARTIAL, NONE };

struct UpdateManyResult {
  BatchStatus status;
  LwwVector<LwwKey> applied;
  LwwVector<LwwKey> not_found_locally;
};

struct DeleteManyResult {
  BatchStatus status;
  LwwVector<LwwKey> deleted;
  LwwVector<LwwKey> not_found;
};

/// Validated CRUD access to one table of a document.
///
/// Every mutating call runs in a document transaction, so observers see one
/// coalesced change per row per call (or per enclosing transaction).
class Table {
public:
  using RowChanges = LwwSortedMap<LwwKey, RowAction>;
  using ChangeCallback = std::function<void(const RowChanges &, const Transaction &)>;

  Table(Document &doc, std::shared_ptr<const TableSchema> schema, RowStore &store);

  Table(const Table &) = delete;
  Table &operator=(const Table &) = delete;

  const std::string &name() const { return schema_->name(); }
  const TableSchema &schema() const { return *schema_; }

  /// Writes every field of `row`, including `id`. Creates the row if absent.
  ///
  /// @throws std::invalid_argument if the row has no non-empty text `id` or
  ///         has an empty column name; nothing is written
  /// @throws std::overflow_error if the clock cannot stamp every field
  void upsert(const Row &row);

  /// upsert() for many rows in a single transaction. Every row is checked
  /// before the first one is written.
  void upsert_many(const LwwVector<Row> &rows);

  /// Writes only the fields present in `partial`; other cells are untouched.
  ///
  /// @return NOT_FOUND_LOCALLY if the row does not exist on this replica
  /// @throws std::invalid_argument if the row has no non-empty text `id` or
  ///         has an empty column name; nothing is written
  UpdateStatus update(const Row &partial);

  UpdateManyResult update_many(const LwwVector<Row> &partials);

  RowResult get(const LwwKey &id) const;

  /// Every present row, valid or not.
  LwwVector<RowResult> get_all() const;
  LwwVector<Row> get_all_valid() const;
  LwwVector<RowResult> get_all_invalid() const;

  bool has(const LwwKey &id) const { return store_.contains(id); }
  size_t count() const { return store_.size(); }

  /// Removes the row outright (cells go with it).
  DeleteStatus remove(const LwwKey &id);

  DeleteManyResult remove_many(const LwwVector<LwwKey> &ids);

  /// Removes every row.
  void clear();

  /// Valid rows matching `predicate`.
  LwwVector<Row> filter(const std::function<bool(const Row &)> &predicate) const;

  /// First valid row matching `predicate`.
  std::optional<Row> find(const std::function<bool(const Row &)> &predicate) const;

  /// Subscribes to row changes, delivered once per transaction.
  ///
  /// Only ids and actions are delivered; call get() for contents.
  Subscription observe(ChangeCallback callback) { return change_signal_.connect(std::move(callback)); }

private:
  RowResult validate_row(const LwwKey &id, Row raw) const;
  void write_fields(RowStore::CellMap &cells, const Row &row);
  void on_row_event(const LwwKey &row_id, RowAction action);
  void on_after_transaction(const Transaction &transaction);

  static LwwKey require_id(const Row &row, const char *operation);
  void reserve_timestamps(uint64_t count, const char *operation);

  Document &doc_;
  std::shared_ptr<const TableSchema> schema_;
  RowStore &store_;

  RowChanges pending_;
  Signal<const RowChanges &, const Transaction &> change_signal_;
  Subscription row_subscription_;
  Subscription transaction_subscription_;
};

struct DocumentOptions {
  /// 0 picks a random writer id.
  LwwWriterId writer_id = 0;
  /// Time source for the clock; defaults to wall-clock milliseconds.
  MonotonicClock::TimeSource time_source = MonotonicClock::system_time_ms;
  /// Queue used for debounced log compaction. Optional. Not owned; it must
  /// outlive the document.
  DeferredTaskQueue *tasks = nullptr;
  LwwMapOptions map_options;
};

/// A replica of a workspace: its tables, the shared clock and the transaction
/// boundary that observers batch on.
///
/// Not thread-safe.
class Document {
public:
  using TransactionHandler = std::function<void(const Transaction &)>;

  explicit Document(DocumentOptions options = {});
  ~Document();

  Document(const Document &) = delete;
  Document &operator=(const Document &) = delete;

  /// Binds a schema to a table name and returns its access layer.
  ///
  /// Rows merged before the table was defined are kept and become visible.
  ///
  /// @throws std::invalid_argument if the table is already defined
  Table &define_table(TableSchema schema);
  Table &define_table(std::shared_ptr<const TableSchema> schema);

  Table *table(const LwwKey &name);
  const Table *table(const LwwKey &name) const;
  LwwVector<Table *> tables();

  /// Runs `fn` inside a transaction. Nested calls join the outermost one;
  /// after_transaction observers run once when it ends, even if `fn` throws.
  template <typename Fn> void transact(Fn &&fn, std::string origin = "") {
    begin_transaction(std::move(origin), true);
    try {
      fn();
    } catch (...) {
      end_transaction();
      throw;
    }
    end_transaction();
  }

  /// Every record of every table.
  WorkspaceUpdate encode_state() const;

  /// Merges records from another replica in one non-local transaction.
  void apply_update(const WorkspaceUpdate &update, std::string origin = "remote");

  Subscription on_after_transaction(TransactionHandler handler) {
    return after_transaction_.connect(std::move(handler));
  }

  /// The transaction in progress, or nullptr.
  const Transaction *current_transaction() const { return current_ ? &*current_ : nullptr; }

  LwwWriterId writer_id() const { return writer_id_; }
  MonotonicClock &clock() { return clock_; }

  /// Compacts every row store. Returns records removed.
  size_t compact();

  /// Total records held across all logs.
  size_t log_size() const;

private:
  RowStore &row_store(const LwwKey &table);
  void begin_transaction(std::string origin, bool local);
  void end_transaction();

  LwwWriterId writer_id_;
  MonotonicClock clock_;
  DeferredTaskQueue *tasks_;
  LwwMapOptions map_options_;

  // stores must outlive the tables bound to them
  LwwSortedMap<LwwKey, std::unique_ptr<RowStore>> stores_;
  LwwSortedMap<LwwKey, std::unique_ptr<Table>> tables_;

  std::optional<Transaction> current_;
  uint32_t depth_;
  uint64_t next_transaction_id_;
  Signal<const Transaction &> after_transaction_;
};

#endif // LWW_TABLE_HPP
