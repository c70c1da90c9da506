// lww_sqlite.cpp
#include "lww_sqlite.hpp"

#include <cstdio>
#include <utility>

// SQLiteStore implementation

SQLiteStore::SQLiteStore(const char *path) : db_(nullptr) {
  int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "Failed to open database: " + std::string(db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw LwwSQLiteException(error);
  }

  // WAL keeps readers of the index unblocked while a rebuild is writing
  if (std::string(path) != ":memory:") {
    exec_or_throw("PRAGMA journal_mode=WAL");
  }
}

SQLiteStore::~SQLiteStore() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SQLiteStore::prepare(const LwwVector<const TableSchema *> &schemas) {
  schemas_.clear();

  for (const TableSchema *schema : schemas) {
    if (!schema) {
      continue;
    }
    const std::string table = quote_identifier(schema->name());

    // Drop and recreate so schema changes take effect
    exec_or_throw(("DROP TABLE IF EXISTS " + table).c_str());

    std::string create_sql = "CREATE TABLE " + table + " (";
    bool first = true;
    for (const auto &field : schema->fields()) {
      if (!first) {
        create_sql += ", ";
      }
      first = false;

      create_sql += quote_identifier(field.name) + " " + sql_type(field.type);
      if (field.type == FieldType::ID) {
        create_sql += " NOT NULL PRIMARY KEY";
      } else if (!field.nullable) {
        create_sql += " NOT NULL";
      }
    }
    create_sql += ")";
    exec_or_throw(create_sql.c_str());

    schemas_.insert_or_assign(schema->name(), *schema);
  }
}

void SQLiteStore::begin_batch() { exec_or_throw("BEGIN IMMEDIATE"); }

void SQLiteStore::commit_batch() { exec_or_throw("COMMIT"); }

void SQLiteStore::rollback_batch() {
  // autocommit is back on when SQLite already rolled the transaction back
  if (sqlite3_get_autocommit(db_) == 0) {
    exec_or_throw("ROLLBACK");
  }
}

void SQLiteStore::clear_all() {
  for (const auto &[name, schema] : schemas_) {
    exec_or_throw(("DELETE FROM " + quote_identifier(name)).c_str());
  }
}

void SQLiteStore::insert_many(const std::string &table, const LwwVector<Row> &rows) {
  const TableSchema &schema = schema_for(table);
  if (rows.empty()) {
    return;
  }

  std::string columns;
  std::string placeholders;
  for (const auto &field : schema.fields()) {
    if (!columns.empty()) {
      columns += ", ";
      placeholders += ", ";
    }
    columns += quote_identifier(field.name);
    placeholders += "?";
  }
  std::string insert_sql = "INSERT INTO " + quote_identifier(table) + " (" + columns + ") VALUES (" + placeholders + ")";
  Statement stmt(prepare_statement(insert_sql));

  const CellValue null_value;
  for (const auto &row : rows) {
    int index = 1;
    for (const auto &field : schema.fields()) {
      auto it = row.find(field.name);
      bind_value(stmt.get(), index++, it != row.end() ? it->second : null_value);
    }

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
      auto id_it = row.find("id");
      std::string id = id_it != row.end() ? id_it->second.to_string() : "?";
      throw LwwSQLiteException("Failed to insert row '" + id + "' into " + table + ": " + get_error());
    }
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
  }
}

LwwVector<Row> SQLiteStore::select_all(const std::string &table) {
  const TableSchema &schema = schema_for(table);

  std::string columns;
  for (const auto &field : schema.fields()) {
    if (!columns.empty()) {
      columns += ", ";
    }
    columns += quote_identifier(field.name);
  }
  std::string select_sql = "SELECT " + columns + " FROM " + quote_identifier(table);
  Statement stmt(prepare_statement(select_sql));

  LwwVector<Row> rows;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    Row row;
    int index = 0;
    for (const auto &field : schema.fields()) {
      row.emplace(field.name, read_value(stmt.get(), index++, field.type));
    }
    rows.push_back(std::move(row));
  }
  if (rc != SQLITE_DONE) {
    throw LwwSQLiteException("Failed to read " + table + ": " + get_error());
  }
  return rows;
}

int64_t SQLiteStore::count_rows(const std::string &table) {
  std::string count_sql = "SELECT COUNT(*) FROM " + quote_identifier(table);
  Statement stmt(prepare_statement(count_sql));
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    throw LwwSQLiteException("Failed to count rows of " + table + ": " + get_error());
  }
  return sqlite3_column_int64(stmt.get(), 0);
}

void SQLiteStore::execute(const char *sql) { exec_or_throw(sql); }

sqlite3_stmt *SQLiteStore::prepare_statement(const std::string &sql) {
  sqlite3_stmt *stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw LwwSQLiteException("Failed to prepare statement: " + get_error());
  }
  return stmt;
}

const TableSchema &SQLiteStore::schema_for(const std::string &table) const {
  auto it = schemas_.find(table);
  if (it == schemas_.end()) {
    throw LwwSQLiteException("Table was not prepared: " + table);
  }
  return it->second;
}

void SQLiteStore::bind_value(sqlite3_stmt *stmt, int index, const CellValue &value) {
  int rc = SQLITE_OK;
  switch (value.type) {
  case CellValue::NULL_TYPE:
    rc = sqlite3_bind_null(stmt, index);
    break;
  case CellValue::BOOLEAN:
    rc = sqlite3_bind_int64(stmt, index, value.bool_val ? 1 : 0);
    break;
  case CellValue::INTEGER:
    rc = sqlite3_bind_int64(stmt, index, value.int_val);
    break;
  case CellValue::REAL:
    rc = sqlite3_bind_double(stmt, index, value.real_val);
    break;
  case CellValue::TEXT:
    rc = sqlite3_bind_text(stmt, index, value.text_val.c_str(), -1, SQLITE_TRANSIENT);
    break;
  }
  if (rc != SQLITE_OK) {
    throw LwwSQLiteException("Failed to bind parameter " + std::to_string(index) + ": " + get_error());
  }
}

CellValue SQLiteStore::read_value(sqlite3_stmt *stmt, int index, FieldType type) {
  if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
    return CellValue::null();
  }

  switch (type) {
  case FieldType::ID:
  case FieldType::TEXT: {
    const unsigned char *text = sqlite3_column_text(stmt, index);
    return CellValue(std::string(text ? reinterpret_cast<const char *>(text) : ""));
  }
  case FieldType::INTEGER:
    return CellValue(static_cast<int64_t>(sqlite3_column_int64(stmt, index)));
  case FieldType::REAL:
    return CellValue(sqlite3_column_double(stmt, index));
  case FieldType::BOOLEAN:
    return CellValue(sqlite3_column_int64(stmt, index) != 0);
  }
  return CellValue::null();
}

std::string SQLiteStore::quote_identifier(const std::string &name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void SQLiteStore::exec_or_throw(const char *sql) {
  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = "SQL execution failed: ";
    if (err_msg) {
      error += err_msg;
      sqlite3_free(err_msg);
    }
    throw LwwSQLiteException(error);
  }
}

std::string SQLiteStore::get_error() const { return sqlite3_errmsg(db_); }

// Materializer implementation

Materializer::Materializer(Document &doc, DerivedStore &store, DeferredTaskQueue &tasks, MaterializerOptions options)
    : doc_(doc), store_(store), tasks_(tasks), options_(std::move(options)), tables_(doc.tables()),
      log_file_(nullptr, &std::fclose), rebuilding_(false), destroyed_(false), rebuilds_(0), failed_rebuilds_(0) {
  if (!options_.log_path.empty()) {
    log_file_.reset(std::fopen(options_.log_path.c_str(), "a"));
    if (!log_file_) {
      std::fprintf(stderr, "LWW-SQLite: Could not open log file %s, logging to stderr only\n",
                   options_.log_path.c_str());
    }
  }

  LwwVector<const TableSchema *> schemas;
  schemas.reserve(tables_.size());
  for (Table *table : tables_) {
    schemas.push_back(&table->schema());
  }
  store_.prepare(schemas);

  // Initial sync so queries work before the first change
  rebuild_now();

  for (Table *table : tables_) {
    subscriptions_.push_back(table->observe([this](const Table::RowChanges &, const Transaction &transaction) {
      if (transaction.origin == PUSH_ORIGIN) {
        return;
      }
      schedule_rebuild();
    }));
  }
}

Materializer::~Materializer() { destroy(); }

bool Materializer::rebuild_now() {
  if (rebuilding_) {
    return false;
  }
  ScopeGuard guard(rebuilding_);
  cancel_rebuild();

  try {
    store_.begin_batch();
    try {
      store_.clear_all();
      for (Table *table : tables_) {
        LwwVector<Row> valid;
        size_t invalid = 0;
        for (auto &result : table->get_all()) {
          if (result.is_valid()) {
            valid.push_back(std::move(result.row));
          } else {
            ++invalid;
          }
        }
        if (invalid > 0) {
          log_error("Skipped " + std::to_string(invalid) + " invalid rows of " + table->name());
        }
        store_.insert_many(table->name(), valid);
      }
      store_.commit_batch();
    } catch (const std::exception &) {
      rollback_quietly();
      throw;
    }
  } catch (const std::exception &e) {
    ++failed_rebuilds_;
    log_error(std::string("Rebuild failed: ") + e.what());
    return false;
  }

  ++rebuilds_;
  return true;
}

bool Materializer::push_from_store() {
  // read everything first so a failed read leaves the tables untouched
  LwwVector<std::pair<Table *, LwwVector<Row>>> snapshot;
  try {
    for (Table *table : tables_) {
      LwwVector<Row> rows = store_.select_all(table->name());
      // a NULL column without a default was an absent field, not a written NULL
      for (auto &row : rows) {
        for (auto it = row.begin(); it != row.end();) {
          const FieldSchema *field = table->schema().field(it->first);
          if (it->second.is_null() && field && !field->default_value) {
            it = row.erase(it);
          } else {
            ++it;
          }
        }
      }
      snapshot.emplace_back(table, std::move(rows));
    }
  } catch (const std::exception &e) {
    log_error(std::string("Push from store failed: ") + e.what());
    return false;
  }

  try {
    doc_.transact(
        [&]() {
          for (auto &[table, rows] : snapshot) {
            table->clear();
            table->upsert_many(rows);
          }
        },
        PUSH_ORIGIN);
  } catch (const std::exception &e) {
    log_error(std::string("Push from store failed: ") + e.what());
    return false;
  }
  return true;
}

void Materializer::destroy() {
  if (destroyed_) {
    return;
  }
  destroyed_ = true;
  cancel_rebuild();
  subscriptions_.clear();
}

void Materializer::schedule_rebuild() {
  if (destroyed_) {
    return;
  }
  cancel_rebuild();
  rebuild_task_ = tasks_.schedule(options_.debounce_ms, [this]() {
    rebuild_task_.reset();
    rebuild_now();
  });
}

void Materializer::cancel_rebuild() {
  if (rebuild_task_) {
    tasks_.cancel(*rebuild_task_);
    rebuild_task_.reset();
  }
}

void Materializer::rollback_quietly() {
  try {
    store_.rollback_batch();
  } catch (const std::exception &e) {
    log_error(std::string("Rollback failed: ") + e.what());
  }
}

void Materializer::log_error(const std::string &message) {
  std::fprintf(stderr, "LWW-SQLite: %s\n", message.c_str());
  if (log_file_) {
    std::fprintf(log_file_.get(), "LWW-SQLite: %s\n", message.c_str());
    std::fflush(log_file_.get());
  }
}
