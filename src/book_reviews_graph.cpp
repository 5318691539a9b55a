#include "book_reviews_graph.hpp"

#include <sstream>

#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace bookgraph {

std::string IngestStats::to_string() const {
  std::stringstream ss;
  ss << "books=" << books << " (duplicates skipped " << duplicate_books
     << "), users=" << users << " (duplicates skipped " << duplicate_users
     << "), ratings=" << ratings << " (dangling skipped " << dangling_ratings
     << "), publishers=" << publishers << ", authors=" << authors
     << ", cities=" << cities << ", states=" << states
     << ", countries=" << countries << ", malformed rows=" << malformed_rows;
  return ss.str();
}

Location Location::parse(const std::string& location) {
  auto fields = split(location, ',');
  // Trailing empty fields do not count as tokens
  while (!fields.empty() && fields.back().empty()) {
    fields.pop_back();
  }

  Location result;
  result.tokens.reserve(fields.size());
  for (const auto field : fields) {
    result.tokens.emplace_back(trim(field));
  }
  return result;
}

std::optional<std::string> Location::city_id() const {
  if (tokens.empty()) {
    return std::nullopt;
  }
  return join(tokens, ":");
}

std::optional<std::string> Location::state_id() const {
  if (tokens.size() != 3 || tokens[1] == "n/a") {
    return std::nullopt;
  }
  return tokens[1] + ":" + tokens[2];
}

std::optional<std::string> Location::country_id() const {
  if (tokens.size() != 3) {
    return std::nullopt;
  }
  return tokens[2];
}

arrow::Status BookReviewsGraph::add_book(const Book& book) {
  auto created = graph_.add_node(book.isbn, labels::BOOK);
  if (!created.ok()) {
    if (config_.is_skip_malformed_rows() &&
        is_graph_error(created.status(), GraphError::DUPLICATE_NODE)) {
      ++stats_.duplicate_books;
      log_warn("Skipping duplicate book '{}'", book.isbn);
      return arrow::Status::OK();
    }
    return created.status();
  }
  auto node = created.MoveValueUnsafe();
  node->set_property(props::ISBN, book.isbn);
  node->set_property(props::TITLE, book.title);
  if (config_.is_title_index_enabled()) {
    books_by_title_.put(book.title, node);
  }
  ++stats_.books;

  if (!graph_.contains(book.publisher)) {
    ++stats_.publishers;
  }
  graph_.add_node_if_absent(book.publisher, labels::PUBLISHER);
  ARROW_ASSIGN_OR_RAISE(
      auto published_by,
      graph_.add_edge(edges::PUBLISHED_BY, book.isbn, book.publisher));
  published_by->set_property(props::YEAR, book.year);

  if (!graph_.contains(book.author)) {
    ++stats_.authors;
  }
  auto author = graph_.add_node_if_absent(book.author, labels::AUTHOR);
  author->set_property(props::NAME, book.author);
  ARROW_RETURN_NOT_OK(
      graph_.add_edge(edges::WRITTEN_BY, book.isbn, book.author).status());
  return arrow::Status::OK();
}

arrow::Status BookReviewsGraph::add_user(const User& user) {
  const std::string id = user_id(user.user_id);
  auto created = graph_.add_node(id, labels::USER);
  if (!created.ok()) {
    if (config_.is_skip_malformed_rows() &&
        is_graph_error(created.status(), GraphError::DUPLICATE_NODE)) {
      ++stats_.duplicate_users;
      log_warn("Skipping duplicate user '{}'", user.user_id);
      return arrow::Status::OK();
    }
    return created.status();
  }
  auto node = created.MoveValueUnsafe();
  if (user.age.has_value()) {
    node->set_property(props::AGE, *user.age);
  }
  ++stats_.users;

  return add_location(id, Location::parse(user.location));
}

arrow::Status BookReviewsGraph::add_location(const std::string& user_node_id,
                                             const Location& location) {
  ARROW_RETURN_NOT_OK(add_country_if_absent(location));
  ARROW_RETURN_NOT_OK(add_state_if_absent(location));
  ARROW_RETURN_NOT_OK(add_city_if_absent(location));

  if (const auto city_id = location.city_id()) {
    ARROW_RETURN_NOT_OK(
        graph_.add_edge(edges::IN_CITY, user_node_id, *city_id).status());
  }
  return arrow::Status::OK();
}

arrow::Status BookReviewsGraph::add_country_if_absent(
    const Location& location) {
  const auto country_id = location.country_id();
  if (!country_id || graph_.contains(*country_id)) {
    return arrow::Status::OK();
  }
  ARROW_ASSIGN_OR_RAISE(auto country,
                        graph_.add_node(*country_id, labels::COUNTRY));
  country->set_property(props::NAME, location.country_name());
  countries_by_name_.put(location.country_name(), country);
  ++stats_.countries;
  return arrow::Status::OK();
}

arrow::Status BookReviewsGraph::add_state_if_absent(const Location& location) {
  const auto state_id = location.state_id();
  if (!state_id || graph_.contains(*state_id)) {
    return arrow::Status::OK();
  }
  ARROW_ASSIGN_OR_RAISE(auto state, graph_.add_node(*state_id, labels::STATE));
  state->set_property(props::NAME, location.state_name());
  states_by_name_.put(location.state_name(), state);
  ++stats_.states;

  if (const auto country_id = location.country_id()) {
    ARROW_RETURN_NOT_OK(
        graph_.add_edge(edges::IN_COUNTRY, *state_id, *country_id).status());
  }
  return arrow::Status::OK();
}

arrow::Status BookReviewsGraph::add_city_if_absent(const Location& location) {
  const auto city_id = location.city_id();
  if (!city_id || graph_.contains(*city_id)) {
    return arrow::Status::OK();
  }
  ARROW_ASSIGN_OR_RAISE(auto city, graph_.add_node(*city_id, labels::CITY));
  city->set_property(props::NAME, location.city_name());
  cities_by_name_.put(location.city_name(), city);
  ++stats_.cities;

  if (const auto state_id = location.state_id()) {
    ARROW_RETURN_NOT_OK(
        graph_.add_edge(edges::IN_STATE, *city_id, *state_id).status());
  }
  return arrow::Status::OK();
}

arrow::Status BookReviewsGraph::add_rating(const BookRating& rating) {
  const std::string reviewer = user_id(rating.user_id);
  if (config_.is_skip_dangling_ratings() &&
      (!graph_.contains(reviewer) || !graph_.contains(rating.isbn))) {
    ++stats_.dangling_ratings;
    log_debug("Skipping rating of '{}' by '{}': unknown user or book",
              rating.isbn, rating.user_id);
    return arrow::Status::OK();
  }
  ARROW_ASSIGN_OR_RAISE(
      auto reviewed, graph_.add_edge(edges::REVIEWED, reviewer, rating.isbn));
  reviewed->set_property(props::RATING, rating.rating);
  ++stats_.ratings;
  return arrow::Status::OK();
}

arrow::Result<BookReviewsGraph> BookReviewsGraph::build(
    const ParseResult& source, GraphConfig config) {
  ContextLogger logger("graph");
  const int64_t start = now_millis();

  BookReviewsGraph result(config);
  result.stats_.malformed_rows = source.stats.total();
  for (const auto& book : source.books) {
    ARROW_RETURN_NOT_OK(result.add_book(book));
  }
  for (const auto& user : source.users) {
    ARROW_RETURN_NOT_OK(result.add_user(user));
  }
  for (const auto& rating : source.ratings) {
    ARROW_RETURN_NOT_OK(result.add_rating(rating));
  }

  logger.info("built {} nodes and {} edges in {} ms",
              result.graph_.node_count(), result.graph_.edge_count(),
              now_millis() - start);
  logger.info("{}", result.stats_.to_string());
  return result;
}

}  // namespace bookgraph
