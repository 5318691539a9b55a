#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <variant>

#include "value_type.hpp"

namespace bookgraph {

class Value {
 public:
  Value(int32_t i) : type_(ValueType::INT64), data_(int64_t{i}) {}  // Non-explicit
  Value(int64_t v) : type_(ValueType::INT64), data_(v) {}  // Non-explicit
  Value(double v) : type_(ValueType::DOUBLE), data_(v) {}  // Non-explicit
  Value(std::string v) : type_(ValueType::STRING), data_(std::move(v)) {}
  Value(const char* s) : type_(ValueType::STRING), data_(std::string(s)) {}

  ValueType type() const { return type_; }

  template <typename T>
  const T& get() const {
    return std::get<T>(data_);
  }

  [[nodiscard]] int64_t as_int64() const { return get<int64_t>(); }
  [[nodiscard]] double as_double() const { return get<double>(); }
  [[nodiscard]] const std::string& as_string() const {
    return get<std::string>();
  }

  // Widens INT64 to double; callers check is_numeric_type() first
  [[nodiscard]] double as_number() const {
    if (type_ == ValueType::INT64) {
      return static_cast<double>(as_int64());
    }
    return as_double();
  }

  // Convert the Value to its raw string representation (without quotes for
  // strings)
  [[nodiscard]] std::string to_string() const;

  bool operator==(const Value& other) const {
    if (type_ != other.type_) {
      return false;
    }
    return data_ == other.data_;
  }

  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  ValueType type_;
  std::variant<int64_t, double, std::string> data_;
};

// Stream operator for ValueType
inline std::ostream& operator<<(std::ostream& os, const ValueType type) {
  return os << to_string(type);
}

// Stream operator for Value
inline std::ostream& operator<<(std::ostream& os, const Value& value) {
  return os << value.to_string();
}

}  // namespace bookgraph

#endif  // TYPES_HPP
