#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace bookgraph {

namespace {

bool is_space(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

std::vector<std::string_view> split(std::string_view s,
                                    const char delimiter) {
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    const size_t pos = s.find(delimiter, start);
    if (pos == std::string_view::npos) {
      fields.push_back(s.substr(start));
      break;
    }
    fields.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

std::string join(const std::vector<std::string>& tokens,
                 std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0) result.append(separator);
    result.append(tokens[i]);
  }
  return result;
}

std::string latin1_to_utf8(std::string_view latin1) {
  std::string utf8;
  utf8.reserve(latin1.size());
  for (const char ch : latin1) {
    const auto c = static_cast<unsigned char>(ch);
    if (c < 0x80) {
      utf8.push_back(static_cast<char>(c));
    } else {
      utf8.push_back(static_cast<char>(0xC0 | (c >> 6)));
      utf8.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }
  return utf8;
}

size_t utf8_length(std::string_view utf8) {
  size_t length = 0;
  for (const char ch : utf8) {
    // Continuation bytes are 10xxxxxx
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      ++length;
    }
  }
  return length;
}

std::optional<int32_t> parse_int32(std::string_view s) {
  s = trim(s);
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
  }
  if (s.empty()) {
    return std::nullopt;
  }
  int32_t value = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

arrow::Result<LogLevel> parse_log_level(const std::string& name) {
  std::string lower = name;
  std::ranges::transform(lower, lower.begin(), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "debug") return LogLevel::DEBUG;
  if (lower == "info") return LogLevel::INFO;
  if (lower == "warn" || lower == "warning") return LogLevel::WARN;
  if (lower == "error") return LogLevel::ERROR;
  if (lower == "off") return LogLevel::OFF;
  return arrow::Status::Invalid("Unknown log level: '", name, "'");
}

std::string to_string(const LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "debug";
    case LogLevel::INFO:
      return "info";
    case LogLevel::WARN:
      return "warn";
    case LogLevel::ERROR:
      return "error";
    case LogLevel::OFF:
      return "off";
  }
  return "info";
}

}  // namespace bookgraph
