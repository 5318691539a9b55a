#include "graph.hpp"

#include <utility>

#include "errors.hpp"
#include "logger.hpp"

namespace bookgraph {

Graph::~Graph() { release(); }

Graph& Graph::operator=(Graph&& other) noexcept {
  if (this != &other) {
    release();
    nodes_ = std::move(other.nodes_);
    nodes_by_label_ = std::move(other.nodes_by_label_);
    edge_count_ = std::exchange(other.edge_count_, 0);
  }
  return *this;
}

// Edges hold their endpoints, so node/edge cycles are cut before the nodes go
void Graph::release() {
  for (auto& entry : nodes_) {
    entry.second->clear_edges();
  }
  nodes_.clear();
}

std::shared_ptr<Node> Graph::insert_node(const std::string& id,
                                         const std::string& label) {
  auto node = std::make_shared<Node>(id, label);
  nodes_[id] = node;
  nodes_by_label_.put(label, node);
  return node;
}

arrow::Result<std::shared_ptr<Node>> Graph::add_node(const std::string& id,
                                                     const std::string& label) {
  if (nodes_.contains(id)) {
    log_debug("Rejecting duplicate node id '{}' (label '{}')", id, label);
    return duplicate_node(id);
  }
  return insert_node(id, label);
}

std::shared_ptr<Node> Graph::add_node_if_absent(const std::string& id,
                                                const std::string& label) {
  if (const auto it = nodes_.find(id); it != nodes_.end()) {
    return it->second;
  }
  return insert_node(id, label);
}

arrow::Result<std::shared_ptr<Edge>> Graph::add_edge(
    const std::string& label, const std::string& from_id,
    const std::string& to_id) {
  ARROW_ASSIGN_OR_RAISE(auto from, get_node_or_fail(from_id));
  ARROW_ASSIGN_OR_RAISE(auto to, get_node_or_fail(to_id));

  auto edge = std::make_shared<Edge>(label, from, to);
  from->add_outgoing_edge(edge);
  to->add_incoming_edge(edge);
  ++edge_count_;
  return edge;
}

std::shared_ptr<Node> Graph::get_node(const std::string& id) const {
  const auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    return nullptr;
  }
  return it->second;
}

arrow::Result<std::shared_ptr<Node>> Graph::get_node_or_fail(
    const std::string& id) const {
  auto node = get_node(id);
  if (node == nullptr) {
    return node_not_found(id);
  }
  return node;
}

}  // namespace bookgraph
