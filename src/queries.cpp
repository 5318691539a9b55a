#include "queries.hpp"

#include <algorithm>

#include "logger.hpp"

namespace bookgraph {

namespace {

template <typename Row, typename Field>
void sort_descending(std::vector<Row>& rows, Field Row::*value) {
  std::ranges::sort(rows, [value](const Row& a, const Row& b) {
    if (a.*value != b.*value) {
      return a.*value > b.*value;
    }
    return a.author < b.author;
  });
}

}  // namespace

Relationships BookReviewQueries::reviews_of(Nodes authors) {
  return authors.in(edges::WRITTEN_BY)
      .from_nodes(labels::BOOK)
      .in(edges::REVIEWED);
}

arrow::Result<std::vector<AuthorReviewCount>>
BookReviewQueries::authors_by_review_count() const {
  const auto& authors = graph_.graph().get_nodes_by_label(labels::AUTHOR);
  std::vector<AuthorReviewCount> result;
  result.reserve(authors.size());
  for (const auto& author : authors) {
    ARROW_ASSIGN_OR_RAISE(auto name, author->get_string(props::NAME));
    ARROW_ASSIGN_OR_RAISE(const size_t reviews,
                          reviews_of(Query::from_owned({author})).count());
    result.push_back({std::move(name), static_cast<int64_t>(reviews)});
  }
  sort_descending(result, &AuthorReviewCount::reviews);
  return result;
}

arrow::Result<double> BookReviewQueries::average_rating_for_author(
    const std::string& author) const {
  return reviews_of(query_.match(author)).average(props::RATING);
}

arrow::Result<std::vector<AuthorAverageRating>>
BookReviewQueries::authors_by_average_rating() const {
  const auto& authors = graph_.graph().get_nodes_by_label(labels::AUTHOR);
  std::vector<AuthorAverageRating> result;
  result.reserve(authors.size());
  for (const auto& author : authors) {
    ARROW_ASSIGN_OR_RAISE(auto name, author->get_string(props::NAME));
    ARROW_ASSIGN_OR_RAISE(
        const double average,
        reviews_of(Query::from_owned({author})).average(props::RATING));
    result.push_back({std::move(name), average});
  }
  sort_descending(result, &AuthorAverageRating::average);
  return result;
}

arrow::Result<std::set<std::string>> BookReviewQueries::reviewed_titles(
    Nodes cities) {
  std::set<std::string> titles;
  ARROW_RETURN_NOT_OK(cities.in(edges::IN_CITY)
                          .from_nodes(labels::USER)
                          .out(edges::REVIEWED)
                          .to_nodes(labels::BOOK)
                          .strings(props::TITLE)
                          .for_each([&titles](const std::string& title) {
                            titles.insert(title);
                            return arrow::Status::OK();
                          }));
  return titles;
}

arrow::Result<std::set<std::string>> BookReviewQueries::books_reviewed_in_state(
    const std::string& state) const {
  const auto& states = graph_.states_by_name().get(state);
  if (states.empty()) {
    log_debug("No state named '{}'", state);
  }
  return reviewed_titles(
      Query::from(states).in(edges::IN_STATE).from_nodes(labels::CITY));
}

arrow::Result<std::set<std::string>>
BookReviewQueries::books_reviewed_in_country(const std::string& country) const {
  const auto& countries = graph_.countries_by_name().get(country);
  if (countries.empty()) {
    log_debug("No country named '{}'", country);
  }
  return reviewed_titles(Query::from(countries)
                             .in(edges::IN_COUNTRY)
                             .from_nodes(labels::STATE)
                             .in(edges::IN_STATE)
                             .from_nodes(labels::CITY));
}

arrow::Result<double> BookReviewQueries::average_age_by_title(
    const std::string& title) const {
  Nodes books = graph_.config().is_title_index_enabled()
                    ? Query::from(graph_.books_by_title().get(title))
                    : query_.with_label(labels::BOOK)
                          .where(props::TITLE, CompareOp::Eq, title);
  return books.in(edges::REVIEWED)
      .from_nodes(labels::USER)
      .with_property(props::AGE)
      .average(props::AGE);
}

}  // namespace bookgraph
