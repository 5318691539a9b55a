#include "graph_element.hpp"

#include "errors.hpp"

namespace bookgraph {

void GraphElement::set_property(const std::string& key, Value value) {
  properties_.insert_or_assign(key, std::move(value));
}

const Value* GraphElement::find_property(const std::string& key) const {
  const auto it = properties_.find(key);
  if (it == properties_.end()) {
    return nullptr;
  }
  return &it->second;
}

arrow::Result<Value> GraphElement::get_property(const std::string& key) const {
  const Value* value = find_property(key);
  if (value == nullptr) {
    return property_missing(describe(), key);
  }
  return *value;
}

arrow::Result<const Value*> GraphElement::require(
    const std::string& key, const ValueType expected) const {
  const Value* value = find_property(key);
  if (value == nullptr) {
    return property_missing(describe(), key);
  }
  if (value->type() != expected) {
    return property_type_mismatch(key, expected, value->type());
  }
  return value;
}

arrow::Result<int64_t> GraphElement::get_int64(const std::string& key) const {
  ARROW_ASSIGN_OR_RAISE(const auto value, require(key, ValueType::INT64));
  return value->as_int64();
}

arrow::Result<double> GraphElement::get_double(const std::string& key) const {
  ARROW_ASSIGN_OR_RAISE(const auto value, require(key, ValueType::DOUBLE));
  return value->as_double();
}

arrow::Result<std::string> GraphElement::get_string(
    const std::string& key) const {
  ARROW_ASSIGN_OR_RAISE(const auto value, require(key, ValueType::STRING));
  return value->as_string();
}

arrow::Result<double> GraphElement::get_number(const std::string& key) const {
  const Value* value = find_property(key);
  if (value == nullptr) {
    return property_missing(describe(), key);
  }
  if (!is_numeric_type(value->type())) {
    return property_type_mismatch(key, ValueType::DOUBLE, value->type());
  }
  return value->as_number();
}

}  // namespace bookgraph
