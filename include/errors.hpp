#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <arrow/status.h>

#include <memory>
#include <optional>
#include <string>

#include "value_type.hpp"

namespace bookgraph {

/**
 * Kinds of failure the graph core reports.
 *
 * Every status produced by the core carries a GraphErrorDetail so callers can
 * tell a missing node from a missing property even though both use
 * arrow::StatusCode::KeyError.
 */
enum class GraphError {
  DUPLICATE_NODE,         // strict node creation hit an existing id
  NODE_NOT_FOUND,         // lookup or edge endpoint id is absent
  PROPERTY_MISSING,       // property key not present on the element
  PROPERTY_TYPE_MISMATCH  // property present but of another ValueType
};

std::string to_string(GraphError error);

class GraphErrorDetail : public arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "bookgraph::GraphErrorDetail";

  explicit GraphErrorDetail(const GraphError kind) : kind_(kind) {}

  const char* type_id() const override { return kTypeId; }
  std::string ToString() const override;

  [[nodiscard]] GraphError kind() const { return kind_; }

 private:
  GraphError kind_;
};

arrow::Status duplicate_node(const std::string& id);
arrow::Status node_not_found(const std::string& id);
arrow::Status property_missing(const std::string& element,
                               const std::string& key);
arrow::Status property_type_mismatch(const std::string& key,
                                     ValueType expected, ValueType actual);

// Returns the graph error kind attached to status, if any
std::optional<GraphError> graph_error_kind(const arrow::Status& status);

inline bool is_graph_error(const arrow::Status& status,
                           const GraphError kind) {
  const auto actual = graph_error_kind(status);
  return actual.has_value() && *actual == kind;
}

}  // namespace bookgraph

#endif  // ERRORS_HPP
