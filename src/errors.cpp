#include "errors.hpp"

#include <cstring>

namespace bookgraph {

std::string to_string(const GraphError error) {
  switch (error) {
    case GraphError::DUPLICATE_NODE:
      return "DuplicateNode";
    case GraphError::NODE_NOT_FOUND:
      return "NodeNotFound";
    case GraphError::PROPERTY_MISSING:
      return "PropertyMissing";
    case GraphError::PROPERTY_TYPE_MISMATCH:
      return "PropertyTypeMismatch";
    default:
      return "Unknown";
  }
}

std::string GraphErrorDetail::ToString() const { return to_string(kind_); }

namespace {
std::shared_ptr<GraphErrorDetail> detail_of(const GraphError kind) {
  return std::make_shared<GraphErrorDetail>(kind);
}
}  // namespace

arrow::Status duplicate_node(const std::string& id) {
  return arrow::Status::AlreadyExists("Duplicate node found: ", id)
      .WithDetail(detail_of(GraphError::DUPLICATE_NODE));
}

arrow::Status node_not_found(const std::string& id) {
  return arrow::Status::KeyError("Node not found: ", id)
      .WithDetail(detail_of(GraphError::NODE_NOT_FOUND));
}

arrow::Status property_missing(const std::string& element,
                               const std::string& key) {
  return arrow::Status::KeyError("Property '", key, "' not found on '", element,
                                 "'")
      .WithDetail(detail_of(GraphError::PROPERTY_MISSING));
}

arrow::Status property_type_mismatch(const std::string& key,
                                     const ValueType expected,
                                     const ValueType actual) {
  return arrow::Status::TypeError("Type mismatch for property '", key,
                                  "'. Expected ", to_string(expected),
                                  " but got ", to_string(actual))
      .WithDetail(detail_of(GraphError::PROPERTY_TYPE_MISMATCH));
}

std::optional<GraphError> graph_error_kind(const arrow::Status& status) {
  const auto& detail = status.detail();
  if (status.ok() || detail == nullptr ||
      std::strcmp(detail->type_id(), GraphErrorDetail::kTypeId) != 0) {
    return std::nullopt;
  }
  return static_cast<const GraphErrorDetail&>(*detail).kind();
}

}  // namespace bookgraph
