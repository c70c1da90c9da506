// lww_types.hpp
#ifndef LWW_TYPES_HPP
#define LWW_TYPES_HPP

#include <cstdint>

// Define this if you want to override the default collection types.
// The define must be visible before this header is included anywhere.
#ifndef LWW_COLLECTIONS_DEFINED
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <map>
#include <vector>

template <typename T> using LwwVector = std::vector<T>;

using LwwKey = std::string;

template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
using LwwHashMap = std::unordered_map<K, V, Hash, KeyEqual>;

template <typename K, typename V, typename Comparator = std::less<K>> using LwwSortedMap = std::map<K, V, Comparator>;

template <typename K, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
using LwwHashSet = std::unordered_set<K, Hash, KeyEqual>;

using LwwWriterId = uint64_t;
#endif

#include <compare>
#include <ostream>
#include <sstream>
#include <iomanip>

/// RAII guard to ensure boolean flag is reset on scope exit
class ScopeGuard {
public:
  explicit ScopeGuard(bool &flag) : flag_(flag) { flag_ = true; }
  ~ScopeGuard() { flag_ = false; }
  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard &operator=(const ScopeGuard &) = delete;

private:
  bool &flag_;
};

/// A single atomic cell value. The LWW layer never looks inside it; only the
/// schema collaborator and the SQLite adapter care about the type tag.
struct CellValue {
  enum Type { NULL_TYPE, BOOLEAN, INTEGER, REAL, TEXT };

  Type type;
  bool bool_val;
  int64_t int_val;
  double real_val;
  std::string text_val;

  CellValue() : type(NULL_TYPE), bool_val(false), int_val(0), real_val(0.0) {}

  CellValue(bool v) : type(BOOLEAN), bool_val(v), int_val(0), real_val(0.0) {}
  CellValue(int v) : type(INTEGER), bool_val(false), int_val(v), real_val(0.0) {}
  CellValue(int64_t v) : type(INTEGER), bool_val(false), int_val(v), real_val(0.0) {}
  CellValue(double v) : type(REAL), bool_val(false), int_val(0), real_val(v) {}
  CellValue(const char *v) : type(TEXT), bool_val(false), int_val(0), real_val(0.0), text_val(v) {}
  CellValue(std::string v) : type(TEXT), bool_val(false), int_val(0), real_val(0.0), text_val(std::move(v)) {}

  static CellValue null() { return CellValue(); }

  bool is_null() const { return type == NULL_TYPE; }

  std::string to_string() const {
    std::ostringstream oss;
    switch (type) {
    case NULL_TYPE:
      return "NULL";
    case BOOLEAN:
      return bool_val ? "true" : "false";
    case INTEGER:
      return std::to_string(int_val);
    case REAL:
      oss << std::setprecision(17) << real_val;
      return oss.str();
    case TEXT:
      return text_val;
    }
    return "";
  }

  // Only the payload selected by the tag takes part in equality.
  friend bool operator==(const CellValue &lhs, const CellValue &rhs) {
    if (lhs.type != rhs.type)
      return false;
    switch (lhs.type) {
    case NULL_TYPE:
      return true;
    case BOOLEAN:
      return lhs.bool_val == rhs.bool_val;
    case INTEGER:
      return lhs.int_val == rhs.int_val;
    case REAL:
      return lhs.real_val == rhs.real_val;
    case TEXT:
      return lhs.text_val == rhs.text_val;
    }
    return false;
  }

  friend std::ostream &operator<<(std::ostream &os, const CellValue &value) {
    if (value.type == TEXT)
      return os << '"' << value.text_val << '"';
    return os << value.to_string();
  }
};

/// A materialized row: column name to value, ordered by column name.
using Row = LwwSortedMap<LwwKey, CellValue>;

/// Identifies one incarnation of a row. It is the (timestamp, writer) pair of
/// the container record that created the row, so a row that is deleted and
/// upserted again gets a new generation and none of the old cells.
struct RowGeneration {
  uint64_t timestamp = 0;
  LwwWriterId writer_id = 0;

  auto operator<=>(const RowGeneration &) const = default;
};

#endif // LWW_TYPES_HPP
