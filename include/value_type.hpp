#ifndef VALUE_TYPE_HPP
#define VALUE_TYPE_HPP

#include <string>

namespace bookgraph {

/**
 * Enumeration of the value kinds a property bag can hold.
 *
 * The set is closed: every property of a node or an edge is exactly one of
 * these, and typed reads check the kind before handing the value out.
 */
enum class ValueType {
  INT64,   // 64-bit signed integer
  DOUBLE,  // 64-bit floating point
  STRING   // UTF-8 string
};

inline bool is_numeric_type(const ValueType type) {
  return type == ValueType::INT64 || type == ValueType::DOUBLE;
}

/**
 * Convert ValueType to human-readable string.
 */
inline std::string to_string(const ValueType type) {
  switch (type) {
    case ValueType::INT64:
      return "Int64";
    case ValueType::DOUBLE:
      return "Double";
    case ValueType::STRING:
      return "String";
    default:
      return "Unknown";
  }
}

}  // namespace bookgraph

#endif  // VALUE_TYPE_HPP
