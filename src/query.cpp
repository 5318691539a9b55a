#include "query.hpp"

#include <sstream>
#include <type_traits>

#include "errors.hpp"
#include "graph.hpp"

namespace bookgraph {

std::string to_string(const CompareOp op) {
  switch (op) {
    case CompareOp::Eq:
      return "=";
    case CompareOp::NotEq:
      return "!=";
    case CompareOp::Gt:
      return ">";
    case CompareOp::Lt:
      return "<";
    case CompareOp::Gte:
      return ">=";
    case CompareOp::Lte:
      return "<=";
    case CompareOp::Contains:
      return "CONTAINS";
    case CompareOp::StartsWith:
      return "STARTS_WITH";
    case CompareOp::EndsWith:
      return "ENDS_WITH";
  }
  return "?";
}

namespace {

template <typename T>
bool apply_comparison(const T& field_val, const CompareOp op,
                      const T& where_val) {
  switch (op) {
    case CompareOp::Eq:
      return field_val == where_val;
    case CompareOp::NotEq:
      return field_val != where_val;
    case CompareOp::Gt:
      return field_val > where_val;
    case CompareOp::Lt:
      return field_val < where_val;
    case CompareOp::Gte:
      return field_val >= where_val;
    case CompareOp::Lte:
      return field_val <= where_val;
    case CompareOp::Contains:
      if constexpr (std::is_same_v<T, std::string>) {
        return field_val.find(where_val) != std::string::npos;
      } else {
        return false;
      }
    case CompareOp::StartsWith:
      if constexpr (std::is_same_v<T, std::string>) {
        return field_val.starts_with(where_val);
      } else {
        return false;
      }
    case CompareOp::EndsWith:
      if constexpr (std::is_same_v<T, std::string>) {
        return field_val.ends_with(where_val);
      } else {
        return false;
      }
  }
  return false;
}

bool is_string_op(const CompareOp op) {
  return op == CompareOp::Contains || op == CompareOp::StartsWith ||
         op == CompareOp::EndsWith;
}

}  // namespace

arrow::Result<bool> ComparisonExpr::compare_values(const Value& value,
                                                   const CompareOp op,
                                                   const Value& where_value) {
  if (is_string_op(op) && (value.type() != ValueType::STRING ||
                           where_value.type() != ValueType::STRING)) {
    return arrow::Status::Invalid(
        "String operations (CONTAINS, STARTS_WITH, ENDS_WITH) can only be "
        "applied to string values");
  }

  if (value.type() != where_value.type()) {
    return arrow::Status::Invalid("Type mismatch: field is ", value.type(),
                                  " but WHERE value is ", where_value.type());
  }

  switch (value.type()) {
    case ValueType::INT64:
      return apply_comparison(value.as_int64(), op, where_value.as_int64());
    case ValueType::DOUBLE:
      return apply_comparison(value.as_double(), op, where_value.as_double());
    case ValueType::STRING:
      return apply_comparison(value.as_string(), op, where_value.as_string());
  }
  return arrow::Status::NotImplemented(
      "Unsupported value type for comparison: ", value.type());
}

arrow::Result<bool> ComparisonExpr::matches(
    const GraphElement& element) const {
  const Value* field_value = element.find_property(field_);
  if (field_value == nullptr) {
    return property_missing(element.describe(), field_);
  }
  if (is_string_op(op_)) {
    // A non-string literal is rejected by compare_values as Invalid
    if (value_.type() == ValueType::STRING &&
        field_value->type() != ValueType::STRING) {
      return property_type_mismatch(field_, ValueType::STRING,
                                    field_value->type());
    }
  } else if (field_value->type() != value_.type()) {
    return property_type_mismatch(field_, value_.type(), field_value->type());
  }
  return compare_values(*field_value, op_, value_);
}

std::string ComparisonExpr::toString() const {
  std::stringstream ss;
  ss << "WHERE " << field_ << " " << to_string(op_) << " ";
  if (value_.type() == ValueType::STRING) {
    ss << "'" << value_.as_string() << "'";
  } else {
    ss << value_;
  }
  return ss.str();
}

arrow::Result<bool> LogicalExpr::matches(const GraphElement& element) const {
  if (!left_ || !right_) {
    return arrow::Status::Invalid("LogicalExpr missing left or right operand");
  }

  ARROW_ASSIGN_OR_RAISE(const bool left_val, left_->matches(element));
  switch (op_) {
    case LogicalOp::AND:
      if (!left_val) return false;
      break;
    case LogicalOp::OR:
      if (left_val) return true;
      break;
  }
  return right_->matches(element);
}

std::string LogicalExpr::toString() const {
  if (!left_ || !right_) {
    return "WHERE (incomplete logical expression)";
  }

  std::string left_str = left_->toString();
  std::string right_str = right_->toString();
  if (left_str.starts_with("WHERE ")) {
    left_str = left_str.substr(6);
  }
  if (right_str.starts_with("WHERE ")) {
    right_str = right_str.substr(6);
  }

  const std::string op_str = op_ == LogicalOp::AND ? " AND " : " OR ";
  return "WHERE (" + left_str + ")" + op_str + "(" + right_str + ")";
}

Relationships Nodes::out(std::string label) {
  return Relationships(stream_.flat_map<std::shared_ptr<Edge>>(
      [label = std::move(label)](const std::shared_ptr<Node>& node) {
        return Stream<std::shared_ptr<Edge>>::over(&node->outgoing_edges(),
                                                   node)
            .filter([label](const std::shared_ptr<Edge>& edge)
                        -> arrow::Result<bool> {
              return edge->label() == label;
            });
      }));
}

Relationships Nodes::in(std::string label) {
  return Relationships(stream_.flat_map<std::shared_ptr<Edge>>(
      [label = std::move(label)](const std::shared_ptr<Node>& node) {
        return Stream<std::shared_ptr<Edge>>::over(&node->incoming_edges(),
                                                   node)
            .filter([label](const std::shared_ptr<Edge>& edge)
                        -> arrow::Result<bool> {
              return edge->label() == label;
            });
      }));
}

Nodes Nodes::distinct() {
  auto seen = std::make_shared<llvm::StringSet<>>();
  return Nodes(stream_.filter(
      [seen](const std::shared_ptr<Node>& node) -> arrow::Result<bool> {
        return seen->insert(node->id()).second;
      }));
}

namespace {

Nodes project(Stream<std::shared_ptr<Edge>> edges, const bool targets) {
  return Nodes(edges.map<std::shared_ptr<Node>>(
      [targets](const std::shared_ptr<Edge>& edge)
          -> arrow::Result<std::shared_ptr<Node>> {
        return targets ? edge->target() : edge->source();
      }));
}

Nodes keep_label(Nodes nodes, std::string label) {
  return nodes.where([label = std::move(label)](const Node& node) {
    return node.label() == label;
  });
}

}  // namespace

Nodes Relationships::to_nodes() { return project(std::move(stream_), true); }

Nodes Relationships::to_nodes(std::string label) {
  return keep_label(to_nodes(), std::move(label));
}

Nodes Relationships::from_nodes() {
  return project(std::move(stream_), false);
}

Nodes Relationships::from_nodes(std::string label) {
  return keep_label(from_nodes(), std::move(label));
}

Nodes Query::match(const std::string& id) const {
  auto node = graph_.get_node(id);
  if (node == nullptr) {
    return Nodes(Stream<std::shared_ptr<Node>>::empty());
  }
  return Nodes(Stream<std::shared_ptr<Node>>::of({std::move(node)}));
}

arrow::Result<Nodes> Query::match_or_fail(const std::string& id) const {
  ARROW_ASSIGN_OR_RAISE(auto node, graph_.get_node_or_fail(id));
  return Nodes(Stream<std::shared_ptr<Node>>::of({std::move(node)}));
}

Nodes Query::with_label(const std::string& label) const {
  return from(graph_.get_nodes_by_label(label));
}

Nodes Query::from(const NodeSet& nodes) {
  return Nodes(Stream<std::shared_ptr<Node>>::over(&nodes));
}

Nodes Query::from_owned(NodeSet nodes) {
  return Nodes(Stream<std::shared_ptr<Node>>::of(std::move(nodes)));
}

}  // namespace bookgraph
