#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "logger.hpp"

namespace bookgraph {

// Default configuration constants
namespace defaults {
constexpr size_t TOP_N = 10;
constexpr const char* BOOKS_CSV = "data/BX-Books.csv";
constexpr const char* RATINGS_CSV = "data/BX-Book-Ratings.csv";
constexpr const char* USERS_CSV = "data/BX-Users.csv";
constexpr const char* AUTHOR = "Dan Brown";
constexpr const char* STATE = "california";
constexpr const char* COUNTRY = "italy";
constexpr const char* TITLE = "Dracula";
// Bytes handed to the Arrow CSV reader per block
constexpr int32_t CSV_BLOCK_SIZE = 1 << 20;
}  // namespace defaults

// Controls how the book-review graph is built from parsed records
class GraphConfig {
 private:
  // Maintain the title -> book index used by the average-age query
  bool index_book_titles = true;

  // Ratings referencing an unknown user or isbn are dropped instead of
  // failing the whole load
  bool skip_dangling_ratings = true;

  // CSV rows with a wrong column count or a non-numeric field are dropped
  bool skip_malformed_rows = true;

  friend class GraphConfigBuilder;

 public:
  bool is_title_index_enabled() const { return index_book_titles; }
  bool is_skip_dangling_ratings() const { return skip_dangling_ratings; }
  bool is_skip_malformed_rows() const { return skip_malformed_rows; }
};

class GraphConfigBuilder {
 private:
  GraphConfig config;

 public:
  GraphConfigBuilder() = default;

  GraphConfigBuilder &with_title_index(bool enabled) {
    config.index_book_titles = enabled;
    return *this;
  }

  GraphConfigBuilder &with_skip_dangling_ratings(bool enabled) {
    config.skip_dangling_ratings = enabled;
    return *this;
  }

  GraphConfigBuilder &with_skip_malformed_rows(bool enabled) {
    config.skip_malformed_rows = enabled;
    return *this;
  }

  [[nodiscard]] GraphConfig build() const { return config; }
};

inline GraphConfigBuilder make_config() { return {}; }

enum class OutputFormat { TEXT, JSON };

// Settings of the reporting command-line driver
class ReportConfig {
 private:
  std::string books_csv = defaults::BOOKS_CSV;
  std::string ratings_csv = defaults::RATINGS_CSV;
  std::string users_csv = defaults::USERS_CSV;
  size_t top_n = defaults::TOP_N;
  std::string author = defaults::AUTHOR;
  std::string state = defaults::STATE;
  std::string country = defaults::COUNTRY;
  std::string title = defaults::TITLE;
  LogLevel log_level = LogLevel::INFO;
  std::string log_file;
  OutputFormat output_format = OutputFormat::TEXT;
  GraphConfig graph_config;

  friend class ReportConfigBuilder;

 public:
  const std::string &get_books_csv() const { return books_csv; }
  const std::string &get_ratings_csv() const { return ratings_csv; }
  const std::string &get_users_csv() const { return users_csv; }
  size_t get_top_n() const { return top_n; }
  const std::string &get_author() const { return author; }
  const std::string &get_state() const { return state; }
  const std::string &get_country() const { return country; }
  const std::string &get_title() const { return title; }
  LogLevel get_log_level() const { return log_level; }
  const std::string &get_log_file() const { return log_file; }
  OutputFormat get_output_format() const { return output_format; }
  const GraphConfig &get_graph_config() const { return graph_config; }
};

class ReportConfigBuilder {
 private:
  ReportConfig config;

 public:
  ReportConfigBuilder() = default;

  ReportConfigBuilder &with_books_csv(const std::string &path) {
    config.books_csv = path;
    return *this;
  }

  ReportConfigBuilder &with_ratings_csv(const std::string &path) {
    config.ratings_csv = path;
    return *this;
  }

  ReportConfigBuilder &with_users_csv(const std::string &path) {
    config.users_csv = path;
    return *this;
  }

  // Points all three CSV paths at the BX-* file names inside directory
  ReportConfigBuilder &with_data_dir(const std::string &directory) {
    config.books_csv = directory + "/BX-Books.csv";
    config.ratings_csv = directory + "/BX-Book-Ratings.csv";
    config.users_csv = directory + "/BX-Users.csv";
    return *this;
  }

  ReportConfigBuilder &with_top_n(size_t n) {
    config.top_n = n;
    return *this;
  }

  ReportConfigBuilder &with_author(const std::string &name) {
    config.author = name;
    return *this;
  }

  ReportConfigBuilder &with_state(const std::string &name) {
    config.state = name;
    return *this;
  }

  ReportConfigBuilder &with_country(const std::string &name) {
    config.country = name;
    return *this;
  }

  ReportConfigBuilder &with_title(const std::string &title) {
    config.title = title;
    return *this;
  }

  ReportConfigBuilder &with_log_level(LogLevel level) {
    config.log_level = level;
    return *this;
  }

  ReportConfigBuilder &with_log_file(const std::string &path) {
    config.log_file = path;
    return *this;
  }

  ReportConfigBuilder &with_output_format(OutputFormat format) {
    config.output_format = format;
    return *this;
  }

  ReportConfigBuilder &with_graph_config(const GraphConfig &graph_config) {
    config.graph_config = graph_config;
    return *this;
  }

  [[nodiscard]] ReportConfig build() const { return config; }
};

inline ReportConfigBuilder make_report_config() { return {}; }

}  // namespace bookgraph

#endif  // CONFIG_HPP
