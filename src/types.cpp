#include "types.hpp"

#include <sstream>

namespace bookgraph {

std::string Value::to_string() const {
  switch (type_) {
    case ValueType::INT64:
      return std::to_string(as_int64());
    case ValueType::DOUBLE: {
      // std::to_string pads doubles to six decimals
      std::ostringstream ss;
      ss << as_double();
      return ss.str();
    }
    case ValueType::STRING:
      return as_string();
    default:
      return "";
  }
}

}  // namespace bookgraph
