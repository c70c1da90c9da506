// lww_schema.hpp
#ifndef LWW_SCHEMA_HPP
#define LWW_SCHEMA_HPP

#include "lww_types.hpp"

#include <optional>
#include <string>

/// Column types understood by the validator and the SQLite adapter.
enum class FieldType { ID, TEXT, INTEGER, REAL, BOOLEAN };

const char *to_string(FieldType type);

/// SQLite column type used when materializing a field.
const char *sql_type(FieldType type);

struct FieldSchema {
  LwwKey name;
  FieldType type;
  bool nullable = false;
  // Applied to the validated view when the cell is missing; never written back.
  std::optional<CellValue> default_value;
};

struct ValidationError {
  LwwKey field;
  std::string message;
};

std::ostream &operator<<(std::ostream &os, const ValidationError &error);

/// Result of validating a reconstructed row.
///
/// `row` is the candidate with schema defaults filled in; the stored cells are
/// untouched.
struct ValidationResult {
  bool valid;
  Row row;
  LwwVector<ValidationError> errors;
};

/// Field-type map for one table plus the row validator.
///
/// The schema is owned by the caller and treated as immutable; tables keep a
/// shared pointer to it.
class TableSchema {
public:
  /// @throws std::invalid_argument if the name is not a valid identifier, a
  ///         field name is empty or duplicated, or there is no `id` field of
  ///         type ID
  TableSchema(std::string name, LwwVector<FieldSchema> fields);

  const std::string &name() const { return name_; }
  const LwwVector<FieldSchema> &fields() const { return fields_; }

  /// Field by name, or nullptr.
  const FieldSchema *field(const LwwKey &name) const;

  /// Checks a candidate row against the field map.
  ///
  /// Reports every missing required field, type mismatch and disallowed null.
  /// Columns the schema does not know are kept and not reported.
  ValidationResult validate(const Row &candidate) const;

  /// Identifier rule shared by tables and columns (letters, digits and
  /// underscores, not starting with a digit, at most 128 chars).
  static bool is_valid_identifier(const std::string &name);

private:
  std::string name_;
  LwwVector<FieldSchema> fields_;
  LwwHashMap<LwwKey, size_t> index_;
};

#endif // LWW_SCHEMA_HPP
