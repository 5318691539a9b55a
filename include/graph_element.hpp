#ifndef GRAPH_ELEMENT_HPP
#define GRAPH_ELEMENT_HPP

#include <arrow/result.h>

#include <string>
#include <unordered_map>

#include "types.hpp"

namespace bookgraph {

/**
 * Common shape of nodes and edges: a label plus a property bag.
 *
 * Properties stay mutable after the element is created. Reads are strict: a
 * missing key yields GraphError::PROPERTY_MISSING and a typed read of a value
 * of another kind yields GraphError::PROPERTY_TYPE_MISMATCH. Callers that want
 * a fallback use find_property() and decide themselves.
 */
class GraphElement {
 public:
  explicit GraphElement(std::string label) : label_(std::move(label)) {}
  virtual ~GraphElement() = default;

  [[nodiscard]] const std::string& label() const { return label_; }

  void set_property(const std::string& key, Value value);

  [[nodiscard]] bool has_property(const std::string& key) const {
    return properties_.contains(key);
  }

  // nullptr when the key is absent
  [[nodiscard]] const Value* find_property(const std::string& key) const;

  arrow::Result<Value> get_property(const std::string& key) const;
  arrow::Result<int64_t> get_int64(const std::string& key) const;
  arrow::Result<double> get_double(const std::string& key) const;
  arrow::Result<std::string> get_string(const std::string& key) const;

  // Accepts INT64 or DOUBLE and widens to double
  arrow::Result<double> get_number(const std::string& key) const;

  [[nodiscard]] const std::unordered_map<std::string, Value>& properties()
      const {
    return properties_;
  }

  // Identifies the element in error messages
  [[nodiscard]] virtual std::string describe() const = 0;

 private:
  arrow::Result<const Value*> require(const std::string& key,
                                      ValueType expected) const;

  std::string label_;
  std::unordered_map<std::string, Value> properties_;
};

}  // namespace bookgraph

#endif  // GRAPH_ELEMENT_HPP
