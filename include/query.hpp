#ifndef QUERY_HPP
#define QUERY_HPP

#include <arrow/result.h>
#include <arrow/status.h>
#include <llvm/ADT/StringSet.h>

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "edge.hpp"
#include "graph_element.hpp"
#include "node.hpp"
#include "stream.hpp"
#include "types.hpp"

namespace bookgraph {

class Graph;

enum class CompareOp {
  Eq,
  NotEq,
  Gt,
  Lt,
  Gte,
  Lte,
  Contains,
  StartsWith,
  EndsWith
};

std::string to_string(CompareOp op);

enum class LogicalOp { AND, OR };

/**
 * @brief Property predicate evaluated against a node or an edge
 *
 * matches() fails with the element's property error when the referenced
 * property is absent or has another type; traversals surface that failure
 * from their terminal operation.
 */
class WhereExpr {
 public:
  virtual ~WhereExpr() = default;
  virtual arrow::Result<bool> matches(const GraphElement& element) const = 0;
  [[nodiscard]] virtual std::string toString() const = 0;
};

class ComparisonExpr : public WhereExpr {
 public:
  ComparisonExpr(std::string field, CompareOp op, Value value)
      : field_(std::move(field)), op_(op), value_(std::move(value)) {}

  [[nodiscard]] const std::string& field() const { return field_; }
  [[nodiscard]] CompareOp op() const { return op_; }
  [[nodiscard]] const Value& value() const { return value_; }

  arrow::Result<bool> matches(const GraphElement& element) const override;
  [[nodiscard]] std::string toString() const override;

  friend std::ostream& operator<<(std::ostream& os,
                                  const ComparisonExpr& expr) {
    return os << expr.toString();
  }

 private:
  static arrow::Result<bool> compare_values(const Value& value, CompareOp op,
                                            const Value& where_value);

  std::string field_;
  CompareOp op_;
  Value value_;
};

// Short-circuits: the right operand is not evaluated once the left decides
class LogicalExpr : public WhereExpr {
 public:
  LogicalExpr(std::shared_ptr<WhereExpr> left, LogicalOp op,
              std::shared_ptr<WhereExpr> right)
      : left_(std::move(left)), op_(op), right_(std::move(right)) {}

  static std::shared_ptr<LogicalExpr> and_expr(
      std::shared_ptr<WhereExpr> left, std::shared_ptr<WhereExpr> right) {
    return std::make_shared<LogicalExpr>(std::move(left), LogicalOp::AND,
                                         std::move(right));
  }

  static std::shared_ptr<LogicalExpr> or_expr(
      std::shared_ptr<WhereExpr> left, std::shared_ptr<WhereExpr> right) {
    return std::make_shared<LogicalExpr>(std::move(left), LogicalOp::OR,
                                         std::move(right));
  }

  [[nodiscard]] const std::shared_ptr<WhereExpr>& left() const { return left_; }
  [[nodiscard]] const std::shared_ptr<WhereExpr>& right() const {
    return right_;
  }
  [[nodiscard]] LogicalOp op() const { return op_; }

  arrow::Result<bool> matches(const GraphElement& element) const override;
  [[nodiscard]] std::string toString() const override;

  friend std::ostream& operator<<(std::ostream& os, const LogicalExpr& expr) {
    return os << expr.toString();
  }

 private:
  std::shared_ptr<WhereExpr> left_;
  LogicalOp op_;
  std::shared_ptr<WhereExpr> right_;
};

inline std::shared_ptr<ComparisonExpr> compare(std::string field,
                                               CompareOp op, Value value) {
  return std::make_shared<ComparisonExpr>(std::move(field), op,
                                          std::move(value));
}

/**
 * @brief Operations shared by node and edge traversals
 *
 * Wraps a lazy Stream of elements. Filters return a new traversal of the same
 * kind; the value extractors (strings, ints, numbers) read one property per
 * element and fail on a missing or mistyped property.
 */
template <typename Derived, typename Element>
class ElementStream {
 public:
  using Ref = std::shared_ptr<Element>;

  explicit ElementStream(Stream<Ref> stream) : stream_(std::move(stream)) {}

  Derived where(std::function<bool(const Element&)> predicate) {
    return Derived(stream_.filter(
        [predicate = std::move(predicate)](
            const Ref& element) -> arrow::Result<bool> {
          return predicate(*element);
        }));
  }

  Derived where(std::shared_ptr<WhereExpr> expr) {
    return Derived(stream_.filter(
        [expr = std::move(expr)](const Ref& element) -> arrow::Result<bool> {
          if (!expr) {
            return arrow::Status::Invalid("where expression is null");
          }
          return expr->matches(*element);
        }));
  }

  Derived where(std::string field, const CompareOp op, Value value) {
    return where(compare(std::move(field), op, std::move(value)));
  }

  // Keeps elements that carry key, whatever its type
  Derived with_property(std::string key) {
    return Derived(stream_.filter(
        [key = std::move(key)](const Ref& element) -> arrow::Result<bool> {
          return element->has_property(key);
        }));
  }

  Stream<std::string> strings(std::string key) {
    return stream_.template map<std::string>(
        [key = std::move(key)](const Ref& element) {
          return element->get_string(key);
        });
  }

  Stream<int64_t> ints(std::string key) {
    return stream_.template map<int64_t>(
        [key = std::move(key)](const Ref& element) {
          return element->get_int64(key);
        });
  }

  // INT64 and DOUBLE properties, widened to double
  Stream<double> numbers(std::string key) {
    return stream_.template map<double>(
        [key = std::move(key)](const Ref& element) {
          return element->get_number(key);
        });
  }

  // Mean of a numeric property; 0.0 when there are no elements
  arrow::Result<double> average(std::string key) {
    return mean(numbers(std::move(key)));
  }

  arrow::Result<std::vector<Ref>> to_vector() { return stream_.to_vector(); }

  arrow::Result<size_t> count() { return stream_.count(); }

  arrow::Status for_each(const std::function<arrow::Status(const Ref&)>& fn) {
    return stream_.for_each(fn);
  }

  typename Stream<Ref>::iterator begin() { return stream_.begin(); }
  typename Stream<Ref>::iterator end() { return stream_.end(); }
  [[nodiscard]] const arrow::Status& status() const { return stream_.status(); }

  Stream<Ref>& stream() { return stream_; }

 protected:
  Stream<Ref> stream_;
};

class Relationships;

/**
 * @brief Lazy sequence of nodes produced by a query step
 *
 * The same node may appear more than once (two paths reaching it);
 * distinct() and to_set() drop repeats by id.
 */
class Nodes : public ElementStream<Nodes, Node> {
 public:
  using ElementStream::ElementStream;

  // Edges with label leaving each node, in adjacency order
  Relationships out(std::string label);

  // Edges with label arriving at each node, in adjacency order
  Relationships in(std::string label);

  Nodes distinct();

  // Distinct nodes in first-seen order
  arrow::Result<NodeSet> to_set() { return distinct().to_vector(); }
};

/**
 * @brief Lazy sequence of edges produced by an out() or in() step
 */
class Relationships : public ElementStream<Relationships, Edge> {
 public:
  using ElementStream::ElementStream;

  // Targets of the edges
  Nodes to_nodes();
  // Targets carrying label
  Nodes to_nodes(std::string label);

  // Sources of the edges
  Nodes from_nodes();
  // Sources carrying label
  Nodes from_nodes(std::string label);
};

/**
 * @brief Entry points for traversals over a graph
 *
 * The graph must outlive every traversal started here.
 */
class Query {
 public:
  explicit Query(const Graph& graph) : graph_(graph) {}

  // The node with id, or an empty traversal when it does not exist
  [[nodiscard]] Nodes match(const std::string& id) const;

  // Fails with GraphError::NODE_NOT_FOUND when id does not exist
  arrow::Result<Nodes> match_or_fail(const std::string& id) const;

  [[nodiscard]] Nodes with_label(const std::string& label) const;

  // nodes is read in place and must outlive the traversal
  static Nodes from(const NodeSet& nodes);
  static Nodes from(NodeSet&& nodes) = delete;

  static Nodes from_owned(NodeSet nodes);

 private:
  const Graph& graph_;
};

}  // namespace bookgraph

#endif  // QUERY_HPP
