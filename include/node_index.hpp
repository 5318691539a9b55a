#ifndef NODE_INDEX_HPP
#define NODE_INDEX_HPP

#include <llvm/ADT/DenseSet.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>

#include <memory>
#include <string>
#include <vector>

#include "node.hpp"

namespace bookgraph {

/**
 * @brief Exact-key index from a string to a set of nodes
 *
 * Used both for the label index maintained by Graph and for the keyed
 * secondary indices (place names, book titles) that the ingestion layer fills
 * next to node creation. A node is stored at most once per key; lookups are
 * average O(1). No ordering or range lookups are offered.
 */
class NodeIndex {
 public:
  // Returns false when node was already present under key
  bool put(llvm::StringRef key, const std::shared_ptr<Node>& node) {
    auto& bucket = buckets_[key];
    if (!bucket.members.insert(node.get()).second) {
      return false;
    }
    bucket.nodes.push_back(node);
    ++entries_;
    return true;
  }

  // Empty set for an unknown key
  [[nodiscard]] const NodeSet& get(llvm::StringRef key) const {
    static const NodeSet empty;
    const auto it = buckets_.find(key);
    if (it == buckets_.end()) {
      return empty;
    }
    return it->second.nodes;
  }

  [[nodiscard]] bool contains(llvm::StringRef key) const {
    return buckets_.contains(key);
  }

  // Number of distinct keys
  [[nodiscard]] size_t size() const { return buckets_.size(); }

  // Number of (key, node) pairs
  [[nodiscard]] size_t entries() const { return entries_; }

  [[nodiscard]] bool empty() const { return buckets_.empty(); }

  [[nodiscard]] std::vector<std::string> keys() const {
    std::vector<std::string> result;
    result.reserve(buckets_.size());
    for (const auto& entry : buckets_) {
      result.push_back(entry.getKey().str());
    }
    return result;
  }

 private:
  struct Bucket {
    NodeSet nodes;
    llvm::DenseSet<const Node*> members;
  };

  llvm::StringMap<Bucket> buckets_;
  size_t entries_ = 0;
};

}  // namespace bookgraph

#endif  // NODE_INDEX_HPP
