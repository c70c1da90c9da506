// lww_sqlite.hpp
#ifndef LWW_SQLITE_HPP
#define LWW_SQLITE_HPP

#include "lww_schema.hpp"
#include "lww_signal.hpp"
#include "lww_table.hpp"
#include "lww_timer.hpp"
#include "lww_types.hpp"

#include <sqlite3.h>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

/// Exception thrown for SQLite adapter errors
class LwwSQLiteException : public std::runtime_error {
public:
  explicit LwwSQLiteException(const std::string &msg) : std::runtime_error(msg) {}
};

/// Derived queryable store that the materializer keeps in sync.
///
/// The materializer calls clear_all() and insert_many() between
/// begin_batch() and commit_batch(); an implementation must make that batch
/// atomic. Errors are reported by throwing.
class DerivedStore {
public:
  virtual ~DerivedStore() = default;

  /// (Re)creates storage for the given tables. Existing contents are dropped.
  virtual void prepare(const LwwVector<const TableSchema *> &schemas) = 0;

  virtual void begin_batch() = 0;
  virtual void commit_batch() = 0;
  virtual void rollback_batch() = 0;

  /// Empties every prepared table.
  virtual void clear_all() = 0;

  virtual void insert_many(const std::string &table, const LwwVector<Row> &rows) = 0;

  /// Reads back every row of a prepared table.
  virtual LwwVector<Row> select_all(const std::string &table) = 0;
};

/// SQLite-backed derived store.
///
/// One SQL table per schema, named after it, with one typed column per field
/// and `id` as primary key. Booleans are stored as INTEGER 0/1.
///
/// Thread Safety:
/// Not thread-safe, same as the sqlite3 connection it owns. Use from the
/// thread that runs the document and its task queue.
class SQLiteStore : public DerivedStore {
public:
  /// Opens (or creates) the database. File databases are switched to WAL.
  ///
  /// @param path Path to the database file, or ":memory:"
  /// @throws LwwSQLiteException if the database cannot be opened
  explicit SQLiteStore(const char *path);

  ~SQLiteStore() override;

  SQLiteStore(const SQLiteStore &) = delete;
  SQLiteStore &operator=(const SQLiteStore &) = delete;

  void prepare(const LwwVector<const TableSchema *> &schemas) override;

  void begin_batch() override;
  void commit_batch() override;
  void rollback_batch() override;

  void clear_all() override;
  void insert_many(const std::string &table, const LwwVector<Row> &rows) override;
  LwwVector<Row> select_all(const std::string &table) override;

  /// Number of rows in a table.
  int64_t count_rows(const std::string &table);

  /// Executes SQL statement(s)
  ///
  /// @throws LwwSQLiteException if execution fails
  void execute(const char *sql);

  /// Gets the underlying sqlite3* handle
  ///
  /// Writes made through it are overwritten by the next rebuild.
  sqlite3 *get_db() { return db_; }

private:
  /// RAII wrapper for sqlite3_stmt*
  class Statement {
  public:
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}
    ~Statement() {
      if (stmt_)
        sqlite3_finalize(stmt_);
    }
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    Statement(Statement &&other) noexcept : stmt_(other.stmt_) { other.stmt_ = nullptr; }
    Statement &operator=(Statement &&other) noexcept {
      if (this != &other) {
        if (stmt_)
          sqlite3_finalize(stmt_);
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
      }
      return *this;
    }
    sqlite3_stmt *get() const { return stmt_; }

  private:
    sqlite3_stmt *stmt_;
  };

  sqlite3_stmt *prepare_statement(const std::string &sql);
  const TableSchema &schema_for(const std::string &table) const;
  void bind_value(sqlite3_stmt *stmt, int index, const CellValue &value);
  static CellValue read_value(sqlite3_stmt *stmt, int index, FieldType type);
  static std::string quote_identifier(const std::string &name);
  void exec_or_throw(const char *sql);
  std::string get_error() const;

  sqlite3 *db_;
  // copies, so the store does not depend on the caller keeping schemas alive
  LwwSortedMap<std::string, TableSchema> schemas_;
};

struct MaterializerOptions {
  /// Quiet period after the last change before the store is rebuilt.
  uint64_t debounce_ms = 100;
  /// Optional file that receives a copy of every logged error.
  std::string log_path;
};

/// Keeps a DerivedStore in sync with every table of a document.
///
/// Any observed change (re)starts a debounce timer. When it fires, the store
/// is cleared and refilled with the currently valid rows in one batch. There
/// is no incremental path: a full rebuild cannot apply updates out of order
/// or before the matching insert.
///
/// A failed rebuild is rolled back and logged; the next change triggers a new
/// one. Errors never reach table observers.
class Materializer {
public:
  static constexpr uint64_t DEFAULT_DEBOUNCE_MS = 100;

  /// Origin of the transaction written by push_from_store().
  static constexpr const char *PUSH_ORIGIN = "lww-sqlite:push";

  /// Prepares the store for the document's tables, runs the initial rebuild
  /// and starts observing.
  ///
  /// `doc`, `store` and `tasks` are not owned and must outlive the
  /// materializer.
  ///
  /// @throws whatever the store throws from prepare()
  Materializer(Document &doc, DerivedStore &store, DeferredTaskQueue &tasks, MaterializerOptions options = {});

  ~Materializer();

  Materializer(const Materializer &) = delete;
  Materializer &operator=(const Materializer &) = delete;

  /// Rebuilds the store now and cancels any pending timer.
  ///
  /// @return false if the rebuild failed (the error is logged)
  bool rebuild_now();

  /// Replaces the tables' contents with the rows read back from the store.
  /// NULL columns whose field has no default are left out of the rows.
  ///
  /// The write is tagged PUSH_ORIGIN and triggers no rebuild only when it is
  /// the outermost transaction. Inside a caller's transact() the outer origin
  /// is kept and a rebuild is scheduled as for any other change.
  ///
  /// @return false if reading or writing failed (the error is logged)
  bool push_from_store();

  /// Cancels the pending rebuild and stops observing. Idempotent.
  void destroy();

  bool rebuild_pending() const { return rebuild_task_.has_value(); }
  uint64_t rebuild_count() const { return rebuilds_; }
  uint64_t failed_rebuild_count() const { return failed_rebuilds_; }

private:
  void schedule_rebuild();
  void cancel_rebuild();
  void rollback_quietly();
  void log_error(const std::string &message);

  Document &doc_;
  DerivedStore &store_;
  DeferredTaskQueue &tasks_;
  MaterializerOptions options_;
  LwwVector<Table *> tables_;

  LwwVector<Subscription> subscriptions_;
  std::optional<DeferredTaskQueue::TaskId> rebuild_task_;
  std::unique_ptr<std::FILE, int (*)(std::FILE *)> log_file_;
  bool rebuilding_;
  bool destroyed_;
  uint64_t rebuilds_;
  uint64_t failed_rebuilds_;
};

#endif // LWW_SQLITE_HPP
