#ifndef EDGE_HPP
#define EDGE_HPP

#include <memory>
#include <string>

#include "graph_element.hpp"
#include "node.hpp"

namespace bookgraph {

// Directed, labelled relationship between two nodes of the same Graph. Edges
// carry no id; several edges may share endpoints and label.
class Edge final : public GraphElement {
 private:
  const std::shared_ptr<Node> source_;
  const std::shared_ptr<Node> target_;

 public:
  Edge(std::string label, std::shared_ptr<Node> source,
       std::shared_ptr<Node> target)
      : GraphElement(std::move(label)),
        source_(std::move(source)),
        target_(std::move(target)) {}

  [[nodiscard]] const std::shared_ptr<Node>& source() const { return source_; }
  [[nodiscard]] const std::shared_ptr<Node>& target() const { return target_; }

 protected:
  [[nodiscard]] std::string describe() const override {
    return source_->id() + "-[" + label() + "]->" + target_->id();
  }
};

}  // namespace bookgraph

#endif  // EDGE_HPP
