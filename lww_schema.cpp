// lww_schema.cpp
#include "lww_schema.hpp"

#include <stdexcept>

const char *to_string(FieldType type) {
  switch (type) {
  case FieldType::ID:
    return "id";
  case FieldType::TEXT:
    return "text";
  case FieldType::INTEGER:
    return "integer";
  case FieldType::REAL:
    return "real";
  case FieldType::BOOLEAN:
    return "boolean";
  }
  return "";
}

const char *sql_type(FieldType type) {
  switch (type) {
  case FieldType::ID:
  case FieldType::TEXT:
    return "TEXT";
  case FieldType::INTEGER:
  case FieldType::BOOLEAN:
    return "INTEGER";
  case FieldType::REAL:
    return "REAL";
  }
  return "TEXT";
}

std::ostream &operator<<(std::ostream &os, const ValidationError &error) {
  return os << error.field << ": " << error.message;
}

namespace {

bool matches_type(const CellValue &value, FieldType type) {
  switch (type) {
  case FieldType::ID:
  case FieldType::TEXT:
    return value.type == CellValue::TEXT;
  case FieldType::INTEGER:
    return value.type == CellValue::INTEGER;
  case FieldType::REAL:
    // integers are accepted for real columns
    return value.type == CellValue::REAL || value.type == CellValue::INTEGER;
  case FieldType::BOOLEAN:
    return value.type == CellValue::BOOLEAN;
  }
  return false;
}

const char *value_type_name(const CellValue &value) {
  switch (value.type) {
  case CellValue::NULL_TYPE:
    return "null";
  case CellValue::BOOLEAN:
    return "boolean";
  case CellValue::INTEGER:
    return "integer";
  case CellValue::REAL:
    return "real";
  case CellValue::TEXT:
    return "text";
  }
  return "unknown";
}

} // namespace

TableSchema::TableSchema(std::string name, LwwVector<FieldSchema> fields)
    : name_(std::move(name)), fields_(std::move(fields)) {
  if (!is_valid_identifier(name_)) {
    throw std::invalid_argument("Invalid table name: '" + name_ + "'");
  }

  for (size_t i = 0; i < fields_.size(); ++i) {
    const auto &field = fields_[i];
    if (field.name.empty()) {
      throw std::invalid_argument("Table '" + name_ + "' has a field with an empty name");
    }
    if (!index_.emplace(field.name, i).second) {
      throw std::invalid_argument("Table '" + name_ + "' declares field '" + field.name + "' twice");
    }
  }

  const FieldSchema *id_field = field("id");
  if (!id_field || id_field->type != FieldType::ID) {
    throw std::invalid_argument("Table '" + name_ + "' must declare an 'id' field of type id");
  }
}

const FieldSchema *TableSchema::field(const LwwKey &name) const {
  auto it = index_.find(name);
  if (it == index_.end())
    return nullptr;
  return &fields_[it->second];
}

ValidationResult TableSchema::validate(const Row &candidate) const {
  ValidationResult result{true, candidate, {}};

  for (const auto &field : fields_) {
    auto it = candidate.find(field.name);

    if (it == candidate.end()) {
      if (field.default_value.has_value()) {
        result.row[field.name] = *field.default_value;
      } else if (!field.nullable) {
        result.errors.push_back({field.name, "missing required field"});
      }
      continue;
    }

    const CellValue &value = it->second;
    if (value.is_null()) {
      if (!field.nullable) {
        result.errors.push_back({field.name, "null is not allowed"});
      }
      continue;
    }

    if (!matches_type(value, field.type)) {
      result.errors.push_back(
          {field.name, std::string("expected ") + to_string(field.type) + ", got " + value_type_name(value)});
      continue;
    }

    if (field.type == FieldType::ID && value.text_val.empty()) {
      result.errors.push_back({field.name, "id must not be empty"});
    }
  }

  result.valid = result.errors.empty();
  return result;
}

bool TableSchema::is_valid_identifier(const std::string &name) {
  if (name.empty() || name.length() > 128) {
    return false;
  }

  char first = name[0];
  if (!((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z') || first == '_')) {
    return false;
  }

  for (char c : name) {
    if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) {
      return false;
    }
  }

  return true;
}
