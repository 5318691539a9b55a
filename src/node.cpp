#include "node.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace bookgraph {

std::string Node::to_string() const {
  std::vector<std::string> keys;
  keys.reserve(properties().size());
  for (const auto& [key, value] : properties()) {
    keys.push_back(key);
  }
  std::ranges::sort(keys);

  std::stringstream ss;
  ss << "Node{label='" << label() << "', id='" << id_ << "', properties={";
  for (size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) ss << ", ";
    ss << keys[i] << "=" << properties().at(keys[i]);
  }
  ss << "}}";
  return ss.str();
}

}  // namespace bookgraph
