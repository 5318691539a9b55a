#ifndef NODE_HPP
#define NODE_HPP

#include <memory>
#include <string>
#include <vector>

#include "graph_element.hpp"

namespace bookgraph {

class Edge;
class Graph;

/**
 * A labelled vertex identified by a string id.
 *
 * Equality is defined by id alone. Adjacency lists only ever grow: the Graph
 * appends each new edge to its source's outgoing list and its target's
 * incoming list, in creation order.
 */
class Node final : public GraphElement {
 public:
  Node(std::string id, std::string label)
      : GraphElement(std::move(label)), id_(std::move(id)) {}

  [[nodiscard]] const std::string& id() const { return id_; }

  [[nodiscard]] const std::vector<std::shared_ptr<Edge>>& outgoing_edges()
      const {
    return outgoing_;
  }

  [[nodiscard]] const std::vector<std::shared_ptr<Edge>>& incoming_edges()
      const {
    return incoming_;
  }

  bool operator==(const Node& other) const { return id_ == other.id_; }
  bool operator!=(const Node& other) const { return !(*this == other); }

  [[nodiscard]] std::string to_string() const;

 protected:
  [[nodiscard]] std::string describe() const override { return id_; }

 private:
  friend class Graph;

  void add_outgoing_edge(std::shared_ptr<Edge> edge) {
    outgoing_.push_back(std::move(edge));
  }

  void add_incoming_edge(std::shared_ptr<Edge> edge) {
    incoming_.push_back(std::move(edge));
  }

  // Edges hold their endpoints, so the owning Graph drops adjacency on
  // destruction to release the node <-> edge reference cycle
  void clear_edges() {
    outgoing_.clear();
    incoming_.clear();
  }

  std::string id_;
  std::vector<std::shared_ptr<Edge>> outgoing_;
  std::vector<std::shared_ptr<Edge>> incoming_;
};

// A collection of distinct nodes, in insertion order
using NodeSet = std::vector<std::shared_ptr<Node>>;

inline std::ostream& operator<<(std::ostream& os, const Node& node) {
  return os << node.to_string();
}

}  // namespace bookgraph

#endif  // NODE_HPP
