#ifndef BOOK_REVIEWS_GRAPH_HPP
#define BOOK_REVIEWS_GRAPH_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "book_reviews_csv.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "node_index.hpp"

namespace bookgraph {

namespace labels {
constexpr const char* BOOK = "book";
constexpr const char* USER = "user";
constexpr const char* PUBLISHER = "publisher";
constexpr const char* AUTHOR = "author";
constexpr const char* CITY = "city";
constexpr const char* STATE = "state";
constexpr const char* COUNTRY = "country";
}  // namespace labels

namespace edges {
constexpr const char* PUBLISHED_BY = "publishedBy";
constexpr const char* WRITTEN_BY = "writtenBy";
constexpr const char* IN_CITY = "inCity";
constexpr const char* IN_STATE = "inState";
constexpr const char* IN_COUNTRY = "inCountry";
constexpr const char* REVIEWED = "reviewed";
}  // namespace edges

namespace props {
constexpr const char* ISBN = "isbn";
constexpr const char* TITLE = "title";
constexpr const char* NAME = "name";
constexpr const char* AGE = "age";
constexpr const char* YEAR = "year";
constexpr const char* RATING = "rating";
}  // namespace props

struct IngestStats {
  int64_t books = 0;
  int64_t duplicate_books = 0;
  int64_t users = 0;
  int64_t duplicate_users = 0;
  int64_t ratings = 0;
  int64_t dangling_ratings = 0;
  int64_t publishers = 0;
  int64_t authors = 0;
  int64_t cities = 0;
  int64_t states = 0;
  int64_t countries = 0;
  int64_t malformed_rows = 0;

  [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Parsed location of a user: "city, state, country"
 *
 * Tokens are split on ',' and trimmed. Only a three-token location names a
 * country and a state; a state of "n/a" is treated as unknown.
 */
struct Location {
  std::vector<std::string> tokens;

  static Location parse(const std::string& location);

  // All tokens joined with ':'; absent when there are no tokens
  [[nodiscard]] std::optional<std::string> city_id() const;
  // "<state>:<country>"
  [[nodiscard]] std::optional<std::string> state_id() const;
  [[nodiscard]] std::optional<std::string> country_id() const;

  [[nodiscard]] const std::string& city_name() const { return tokens[0]; }
  [[nodiscard]] const std::string& state_name() const { return tokens[1]; }
  [[nodiscard]] const std::string& country_name() const { return tokens[2]; }
};

/**
 * @brief The book-review property graph and its keyed indices
 *
 * Books bring in their publisher and author, users bring in the
 * city/state/country chain of their location, and ratings become "reviewed"
 * edges from user to book. Node ids:
 *   book       isbn
 *   publisher  publisher name
 *   author     author name
 *   user       "user:<user id>"
 *   city       location tokens joined with ':'
 *   state      "<state>:<country>"
 *   country    country name
 *
 * The place-name indices and the title index are filled next to node
 * creation; Graph itself knows nothing about them.
 */
class BookReviewsGraph {
 public:
  explicit BookReviewsGraph(GraphConfig config = make_config().build())
      : config_(config) {}

  // Loads books, then users, then ratings
  static arrow::Result<BookReviewsGraph> build(const ParseResult& source,
                                               GraphConfig config);

  arrow::Status add_book(const Book& book);
  arrow::Status add_user(const User& user);

  // A rating whose user or book is missing is skipped when
  // skip_dangling_ratings is set, else fails with NODE_NOT_FOUND
  arrow::Status add_rating(const BookRating& rating);

  static std::string user_id(const std::string& id) { return "user:" + id; }

  [[nodiscard]] const Graph& graph() const { return graph_; }
  Graph& graph() { return graph_; }

  [[nodiscard]] const NodeIndex& countries_by_name() const {
    return countries_by_name_;
  }
  [[nodiscard]] const NodeIndex& states_by_name() const {
    return states_by_name_;
  }
  [[nodiscard]] const NodeIndex& cities_by_name() const {
    return cities_by_name_;
  }
  // Empty unless the title index is enabled
  [[nodiscard]] const NodeIndex& books_by_title() const {
    return books_by_title_;
  }

  [[nodiscard]] const IngestStats& stats() const { return stats_; }
  [[nodiscard]] const GraphConfig& config() const { return config_; }

 private:
  arrow::Status add_location(const std::string& user_node_id,
                             const Location& location);
  arrow::Status add_country_if_absent(const Location& location);
  arrow::Status add_state_if_absent(const Location& location);
  arrow::Status add_city_if_absent(const Location& location);

  GraphConfig config_;
  Graph graph_;
  NodeIndex countries_by_name_;
  NodeIndex states_by_name_;
  NodeIndex cities_by_name_;
  NodeIndex books_by_title_;
  IngestStats stats_;
};

}  // namespace bookgraph

#endif  // BOOK_REVIEWS_GRAPH_HPP
