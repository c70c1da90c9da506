// lww_table.cpp
#include "lww_table.hpp"
#include "lww_id.hpp"

#include <stdexcept>

const char *to_string(RowAction action) {
  switch (action) {
  case RowAction::ADD:
    return "add";
  case RowAction::UPDATE:
    return "update";
  case RowAction::DELETE:
    return "delete";
  }
  return "";
}

const char *to_string(RowStatus status) {
  switch (status) {
  case RowStatus::VALID:
    return "valid";
  case RowStatus::INVALID:
    return "invalid";
  case RowStatus::NOT_FOUND:
    return "not_found";
  }
  return "";
}

// RowStore implementation

RowStore::RowStore(std::string table_name, MonotonicClock &clock, LwwWriterId writer_id, DeferredTaskQueue *tasks,
                   LwwMapOptions options)
    : table_name_(std::move(table_name)), clock_(clock), writer_id_(writer_id), tasks_(tasks), options_(options),
      container_(clock, writer_id, tasks, options) {
  container_subscription_ = container_.on_change([this](const LwwKey &row_id, const LwwChange<bool> &change) {
    switch (change.action) {
    case LwwAction::ADD:
      row_signal_.emit(row_id, RowAction::ADD);
      break;
    case LwwAction::UPDATE:
      // a newer generation replaced the live one
      row_signal_.emit(row_id, RowAction::UPDATE);
      break;
    case LwwAction::DELETE:
      row_signal_.emit(row_id, RowAction::DELETE);
      break;
    }
  });
}

RowStore::CellMap &RowStore::create_row(const LwwKey &row_id) {
  auto record = container_.set(row_id, true);
  RowGeneration generation{record.timestamp, record.writer_id};
  CellMap &cells = cell_map(row_id, generation);
  prune(row_id);
  return cells;
}

RowStore::CellMap *RowStore::live_row(const LwwKey &row_id) {
  return const_cast<CellMap *>(static_cast<const RowStore *>(this)->live_row(row_id));
}

const RowStore::CellMap *RowStore::live_row(const LwwKey &row_id) const {
  auto generation = live_generation(row_id);
  if (!generation)
    return nullptr;

  auto rows_it = generations_.find(row_id);
  if (rows_it == generations_.end())
    return nullptr;
  auto slot_it = rows_it->second.find(*generation);
  if (slot_it == rows_it->second.end())
    return nullptr;
  return slot_it->second.cells.get();
}

bool RowStore::remove_row(const LwwKey &row_id) {
  if (!container_.has(row_id)) {
    return false;
  }
  container_.remove(row_id);
  prune(row_id);
  return true;
}

LwwVector<LwwKey> RowStore::row_ids() const {
  LwwVector<LwwKey> ids;
  ids.reserve(container_.size());
  container_.for_each([&](const LwwKey &row_id, const bool &) { ids.push_back(row_id); });
  return ids;
}

void RowStore::merge_row(const LwwRecord<bool> &record) {
  if (container_.merge(record)) {
    // a present row always has a cell map, even before its cells arrive
    if (auto generation = live_generation(record.key)) {
      cell_map(record.key, *generation);
    }
    prune(record.key);
  }
}

void RowStore::merge_cell(const LwwKey &row_id, const RowGeneration &generation, const LwwRecord<CellValue> &record) {
  if (const auto *winner = container_.winner(row_id)) {
    if (lww_is_newer(winner->timestamp, winner->writer_id, generation.timestamp, generation.writer_id)) {
      // the row was deleted or recreated after this generation; it can never be live again
      clock_.observe(record.timestamp);
      return;
    }
  }
  cell_map(row_id, generation).merge(record);
}

void RowStore::encode(WorkspaceUpdate &out) const {
  for (const auto &record : container_.records()) {
    out.rows.push_back(RowPresenceRecord{table_name_, record});
  }
  for (const auto &[row_id, slots] : generations_) {
    for (const auto &[generation, slot] : slots) {
      for (const auto &record : slot.cells->records()) {
        out.cells.push_back(CellRecord{table_name_, row_id, generation, record});
      }
    }
  }
}

size_t RowStore::compact() {
  size_t removed = container_.compact();
  for (auto &[row_id, slots] : generations_) {
    for (auto &[generation, slot] : slots) {
      removed += slot.cells->compact();
    }
  }
  return removed;
}

size_t RowStore::log_size() const {
  size_t total = container_.log_size();
  for (const auto &[row_id, slots] : generations_) {
    for (const auto &[generation, slot] : slots) {
      total += slot.cells->log_size();
    }
  }
  return total;
}

Row RowStore::reconstruct(const CellMap &cells) {
  Row row;
  cells.for_each([&](const LwwKey &column, const CellValue &value) { row.emplace(column, value); });
  return row;
}

std::optional<RowGeneration> RowStore::live_generation(const LwwKey &row_id) const {
  const auto *winner = container_.winner(row_id);
  if (!winner || winner->is_tombstone())
    return std::nullopt;
  return RowGeneration{winner->timestamp, winner->writer_id};
}

RowStore::CellMap &RowStore::cell_map(const LwwKey &row_id, const RowGeneration &generation) {
  auto &slots = generations_[row_id];
  auto it = slots.find(generation);
  if (it != slots.end()) {
    return *it->second.cells;
  }

  GenerationSlot slot;
  slot.cells = std::make_unique<CellMap>(clock_, writer_id_, tasks_, options_);
  slot.subscription = slot.cells->on_change([this, row_id, generation](const LwwKey &, const LwwChange<CellValue> &) {
    auto live = live_generation(row_id);
    if (live && *live == generation) {
      row_signal_.emit(row_id, RowAction::UPDATE);
    }
  });
  auto inserted = slots.emplace(generation, std::move(slot));
  return *inserted.first->second.cells;
}

void RowStore::prune(const LwwKey &row_id) {
  auto rows_it = generations_.find(row_id);
  if (rows_it == generations_.end())
    return;
  const auto *winner = container_.winner(row_id);
  if (!winner)
    return;

  auto &slots = rows_it->second;
  for (auto it = slots.begin(); it != slots.end();) {
    if (lww_is_newer(winner->timestamp, winner->writer_id, it->first.timestamp, it->first.writer_id)) {
      it = slots.erase(it);
    } else {
      ++it;
    }
  }
  if (slots.empty()) {
    generations_.erase(rows_it);
  }
}

// Table implementation

Table::Table(Document &doc, std::shared_ptr<const TableSchema> schema, RowStore &store)
    : doc_(doc), schema_(std::move(schema)), store_(store) {
  row_subscription_ =
      store_.on_row_event([this](const LwwKey &row_id, RowAction action) { on_row_event(row_id, action); });
  transaction_subscription_ =
      doc_.on_after_transaction([this](const Transaction &transaction) { on_after_transaction(transaction); });
}

void Table::upsert(const Row &row) {
  LwwKey id = require_id(row, "upsert");
  reserve_timestamps(row.size() + 1, "upsert");
  doc_.transact([&]() {
    RowStore::CellMap *cells = store_.live_row(id);
    if (!cells) {
      cells = &store_.create_row(id);
    }
    write_fields(*cells, row);
  });
}

void Table::upsert_many(const LwwVector<Row> &rows) {
  uint64_t writes = 0;
  for (const auto &row : rows) {
    require_id(row, "upsert_many");
    writes += row.size() + 1;
  }
  reserve_timestamps(writes, "upsert_many");
  doc_.transact([&]() {
    for (const auto &row : rows) {
      upsert(row);
    }
  });
}

UpdateStatus Table::update(const Row &partial) {
  LwwKey id = require_id(partial, "update");
  RowStore::CellMap *cells = store_.live_row(id);
  if (!cells) {
    return UpdateStatus::NOT_FOUND_LOCALLY;
  }
  reserve_timestamps(partial.size(), "update");
  doc_.transact([&]() { write_fields(*cells, partial); });
  return UpdateStatus::APPLIED;
}

UpdateManyResult Table::update_many(const LwwVector<Row> &partials) {
  uint64_t writes = 0;
  for (const auto &partial : partials) {
    require_id(partial, "update_many");
    writes += partial.size();
  }
  reserve_timestamps(writes, "update_many");

  UpdateManyResult result{BatchStatus::ALL, {}, {}};
  doc_.transact([&]() {
    for (const auto &partial : partials) {
      if (update(partial) == UpdateStatus::APPLIED) {
        result.applied.push_back(partial.at("id").text_val);
      } else {
        result.not_found_locally.push_back(partial.at("id").text_val);
      }
    }
  });

  if (result.not_found_locally.empty()) {
    result.status = BatchStatus::ALL;
  } else if (result.applied.empty()) {
    result.status = BatchStatus::NONE;
  } else {
    result.status = BatchStatus::PARTIAL;
  }
  return result;
}

RowResult Table::get(const LwwKey &id) const {
  const RowStore::CellMap *cells = store_.live_row(id);
  if (!cells) {
    return RowResult{RowStatus::NOT_FOUND, id, {}, {}};
  }
  return validate_row(id, RowStore::reconstruct(*cells));
}

LwwVector<RowResult> Table::get_all() const {
  LwwVector<RowResult> results;
  results.reserve(store_.size());
  store_.for_each_row([&](const LwwKey &id, const RowStore::CellMap &cells) {
    results.push_back(validate_row(id, RowStore::reconstruct(cells)));
  });
  return results;
}

LwwVector<Row> Table::get_all_valid() const {
  LwwVector<Row> rows;
  rows.reserve(store_.size());
  store_.for_each_row([&](const LwwKey &id, const RowStore::CellMap &cells) {
    RowResult result = validate_row(id, RowStore::reconstruct(cells));
    if (result.is_valid()) {
      rows.push_back(std::move(result.row));
    }
  });
  return rows;
}

LwwVector<RowResult> Table::get_all_invalid() const {
  LwwVector<RowResult> results;
  store_.for_each_row([&](const LwwKey &id, const RowStore::CellMap &cells) {
    RowResult result = validate_row(id, RowStore::reconstruct(cells));
    if (!result.is_valid()) {
      results.push_back(std::move(result));
    }
  });
  return results;
}

DeleteStatus Table::remove(const LwwKey &id) {
  if (!store_.contains(id)) {
    return DeleteStatus::NOT_FOUND;
  }
  doc_.transact([&]() { store_.remove_row(id); });
  return DeleteStatus::DELETED;
}

DeleteManyResult Table::remove_many(const LwwVector<LwwKey> &ids) {
  DeleteManyResult result{BatchStatus::ALL, {}, {}};
  doc_.transact([&]() {
    for (const auto &id : ids) {
      if (store_.remove_row(id)) {
        result.deleted.push_back(id);
      } else {
        result.not_found.push_back(id);
      }
    }
  });

  if (result.not_found.empty()) {
    result.status = BatchStatus::ALL;
  } else if (result.deleted.empty()) {
    result.status = BatchStatus::NONE;
  } else {
    result.status = BatchStatus::PARTIAL;
  }
  return result;
}

void Table::clear() {
  LwwVector<LwwKey> ids = store_.row_ids();
  if (ids.empty()) {
    return;
  }
  doc_.transact([&]() {
    for (const auto &id : ids) {
      store_.remove_row(id);
    }
  });
}

LwwVector<Row> Table::filter(const std::function<bool(const Row &)> &predicate) const {
  LwwVector<Row> rows;
  for (auto &row : get_all_valid()) {
    if (predicate(row)) {
      rows.push_back(std::move(row));
    }
  }
  return rows;
}

std::optional<Row> Table::find(const std::function<bool(const Row &)> &predicate) const {
  std::optional<Row> found;
  store_.for_each_row([&](const LwwKey &id, const RowStore::CellMap &cells) {
    if (found)
      return;
    RowResult result = validate_row(id, RowStore::reconstruct(cells));
    if (result.is_valid() && predicate(result.row)) {
      found = std::move(result.row);
    }
  });
  return found;
}

RowResult Table::validate_row(const LwwKey &id, Row raw) const {
  ValidationResult validation = schema_->validate(raw);
  if (validation.valid) {
    return RowResult{RowStatus::VALID, id, std::move(validation.row), {}};
  }
  return RowResult{RowStatus::INVALID, id, std::move(raw), std::move(validation.errors)};
}

void Table::write_fields(RowStore::CellMap &cells, const Row &row) {
  for (const auto &[column, value] : row) {
    cells.set(column, value);
  }
}

void Table::on_row_event(const LwwKey &row_id, RowAction action) {
  auto it = pending_.find(row_id);
  if (it == pending_.end()) {
    pending_.emplace(row_id, action);
    return;
  }

  // fold the new action into what this transaction already did to the row
  RowAction previous = it->second;
  if (previous == RowAction::ADD) {
    if (action == RowAction::DELETE) {
      pending_.erase(it);
    }
  } else if (previous == RowAction::DELETE) {
    if (action != RowAction::DELETE) {
      it->second = RowAction::UPDATE;
    }
  } else {
    it->second = action == RowAction::DELETE ? RowAction::DELETE : RowAction::UPDATE;
  }
}

void Table::on_after_transaction(const Transaction &transaction) {
  if (pending_.empty()) {
    return;
  }
  RowChanges changes;
  changes.swap(pending_);
  change_signal_.emit(changes, transaction);
}

LwwKey Table::require_id(const Row &row, const char *operation) {
  auto it = row.find("id");
  if (it == row.end() || it->second.type != CellValue::TEXT || it->second.text_val.empty()) {
    throw std::invalid_argument(std::string("Table::") + operation + ": row must have a non-empty text 'id'");
  }
  // checked before any cell is written so a bad row leaves no trace
  for (const auto &[column, value] : row) {
    if (column.empty()) {
      throw std::invalid_argument(std::string("Table::") + operation + ": column names must not be empty");
    }
  }
  return it->second.text_val;
}

void Table::reserve_timestamps(uint64_t count, const char *operation) {
  if (!doc_.clock().can_issue(count)) {
    throw std::overflow_error(std::string("Table::") + operation + ": clock overflow");
  }
}

// Document implementation

Document::Document(DocumentOptions options)
    : writer_id_(options.writer_id != 0 ? options.writer_id : generate_writer_id()),
      clock_(std::move(options.time_source)), tasks_(options.tasks), map_options_(options.map_options), depth_(0),
      next_transaction_id_(0) {}

Document::~Document() {
  tables_.clear();
  stores_.clear();
}

Table &Document::define_table(TableSchema schema) {
  return define_table(std::make_shared<const TableSchema>(std::move(schema)));
}

Table &Document::define_table(std::shared_ptr<const TableSchema> schema) {
  if (!schema) {
    throw std::invalid_argument("Document::define_table: schema must not be null");
  }
  const std::string &name = schema->name();
  if (tables_.find(name) != tables_.end()) {
    throw std::invalid_argument("Table already defined: " + name);
  }
  RowStore &store = row_store(name);
  auto table = std::make_unique<Table>(*this, std::move(schema), store);
  Table &ref = *table;
  tables_.emplace(ref.name(), std::move(table));
  return ref;
}

Table *Document::table(const LwwKey &name) {
  auto it = tables_.find(name);
  return it == tables_.end() ? nullptr : it->second.get();
}

const Table *Document::table(const LwwKey &name) const {
  auto it = tables_.find(name);
  return it == tables_.end() ? nullptr : it->second.get();
}

LwwVector<Table *> Document::tables() {
  LwwVector<Table *> result;
  result.reserve(tables_.size());
  for (auto &[name, table] : tables_) {
    result.push_back(table.get());
  }
  return result;
}

WorkspaceUpdate Document::encode_state() const {
  WorkspaceUpdate update;
  for (const auto &[name, store] : stores_) {
    store->encode(update);
  }
  return update;
}

void Document::apply_update(const WorkspaceUpdate &update, std::string origin) {
  if (update.empty()) {
    return;
  }
  begin_transaction(std::move(origin), false);
  try {
    // presence first so cells land directly in their live generation
    for (const auto &row : update.rows) {
      row_store(row.table).merge_row(row.record);
    }
    for (const auto &cell : update.cells) {
      row_store(cell.table).merge_cell(cell.row_id, cell.generation, cell.record);
    }
  } catch (...) {
    end_transaction();
    throw;
  }
  end_transaction();
}

size_t Document::compact() {
  size_t removed = 0;
  for (auto &[name, store] : stores_) {
    removed += store->compact();
  }
  return removed;
}

size_t Document::log_size() const {
  size_t total = 0;
  for (const auto &[name, store] : stores_) {
    total += store->log_size();
  }
  return total;
}

RowStore &Document::row_store(const LwwKey &table) {
  auto it = stores_.find(table);
  if (it != stores_.end()) {
    return *it->second;
  }
  auto store = std::make_unique<RowStore>(table, clock_, writer_id_, tasks_, map_options_);
  RowStore &ref = *store;
  stores_.emplace(table, std::move(store));
  return ref;
}

void Document::begin_transaction(std::string origin, bool local) {
  if (depth_++ == 0) {
    current_ = Transaction{++next_transaction_id_, std::move(origin), local};
  }
}

void Document::end_transaction() {
  if (depth_ == 0) {
    return;
  }
  if (--depth_ == 0) {
    Transaction transaction = std::move(*current_);
    current_.reset();
    after_transaction_.emit(transaction);
  }
}
