#ifndef GRAPH_HPP
#define GRAPH_HPP

#include <arrow/result.h>
#include <llvm/ADT/StringMap.h>

#include <memory>
#include <string>
#include <vector>

#include "edge.hpp"
#include "node.hpp"
#include "node_index.hpp"

namespace bookgraph {

/**
 * @brief Append-only owner of all nodes and edges
 *
 * Nodes are kept by id and registered under their label as soon as they are
 * created. Edges live in the adjacency lists of their two endpoints. Nothing
 * is ever removed; the only mutations after creation are edge appends and
 * property updates.
 *
 * Not thread-safe: build the graph on one thread, then query it. Concurrent
 * readers are fine as long as no writer is active.
 */
class Graph {
 public:
  Graph() = default;
  ~Graph();

  Graph(const Graph &) = delete;
  Graph &operator=(const Graph &) = delete;
  Graph(Graph &&) = default;
  // Drops the adjacency of the nodes being replaced
  Graph &operator=(Graph &&other) noexcept;

  /**
   * Creates a node. Fails with GraphError::DUPLICATE_NODE if id is taken.
   */
  arrow::Result<std::shared_ptr<Node>> add_node(const std::string &id,
                                                const std::string &label);

  /**
   * Returns the node stored under id, creating it when absent. An existing
   * node is returned unchanged even if its label differs from label.
   */
  std::shared_ptr<Node> add_node_if_absent(const std::string &id,
                                           const std::string &label);

  /**
   * Connects from_id -> to_id. Fails with GraphError::NODE_NOT_FOUND if
   * either endpoint is missing. The returned edge can receive properties.
   */
  arrow::Result<std::shared_ptr<Edge>> add_edge(const std::string &label,
                                                const std::string &from_id,
                                                const std::string &to_id);

  // nullptr when absent
  [[nodiscard]] std::shared_ptr<Node> get_node(const std::string &id) const;

  arrow::Result<std::shared_ptr<Node>> get_node_or_fail(
      const std::string &id) const;

  [[nodiscard]] bool contains(const std::string &id) const {
    return nodes_.contains(id);
  }

  // Empty set for an unknown label
  [[nodiscard]] const NodeSet &get_nodes_by_label(
      const std::string &label) const {
    return nodes_by_label_.get(label);
  }

  [[nodiscard]] std::vector<std::string> labels() const {
    return nodes_by_label_.keys();
  }

  [[nodiscard]] size_t node_count() const { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const { return edge_count_; }

 private:
  void release();

  std::shared_ptr<Node> insert_node(const std::string &id,
                                    const std::string &label);

  llvm::StringMap<std::shared_ptr<Node>> nodes_;
  NodeIndex nodes_by_label_;
  size_t edge_count_ = 0;
};

}  // namespace bookgraph

#endif  // GRAPH_HPP
