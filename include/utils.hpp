#ifndef UTILS_HPP
#define UTILS_HPP

#include <arrow/result.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "logger.hpp"

namespace bookgraph {

static int64_t now_millis() {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             now.time_since_epoch())
      .count();
}

// Strips leading and trailing ASCII whitespace
std::string_view trim(std::string_view s);

// Splits on every occurrence of delimiter; "" yields one empty field
std::vector<std::string_view> split(std::string_view s, char delimiter);

std::string join(const std::vector<std::string>& tokens,
                 std::string_view separator);

// Every ISO-8859-1 byte maps to the code point of the same value
std::string latin1_to_utf8(std::string_view latin1);

// Number of code points, used as the display width of a cell
size_t utf8_length(std::string_view utf8);

// Parses a base-10 integer spanning the whole (trimmed) input
std::optional<int32_t> parse_int32(std::string_view s);

// Accepts debug, info, warn, error, off in any letter case
arrow::Result<LogLevel> parse_log_level(const std::string& name);

std::string to_string(LogLevel level);

}  // namespace bookgraph

#endif  // UTILS_HPP
