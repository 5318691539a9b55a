#ifndef QUERIES_HPP
#define QUERIES_HPP

#include <arrow/result.h>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "book_reviews_graph.hpp"
#include "query.hpp"

namespace bookgraph {

struct AuthorReviewCount {
  std::string author;
  int64_t reviews = 0;
};

struct AuthorAverageRating {
  std::string author;
  double average = 0.0;
};

/**
 * @brief Domain questions answered by multi-hop traversals
 *
 * Ranked lists are sorted by their value, highest first; ties are ordered by
 * author name so results are stable across runs. An unknown author, state,
 * country or title is not an error: it yields 0, 0.0 or an empty set.
 */
class BookReviewQueries {
 public:
  explicit BookReviewQueries(const BookReviewsGraph& graph)
      : graph_(graph), query_(graph.graph()) {}

  // author <- writtenBy <- book <- reviewed <- user, counted per author
  arrow::Result<std::vector<AuthorReviewCount>> authors_by_review_count()
      const;

  // Mean rating over all reviews of the author's books; 0.0 without reviews
  arrow::Result<double> average_rating_for_author(
      const std::string& author) const;

  arrow::Result<std::vector<AuthorAverageRating>> authors_by_average_rating()
      const;

  // Titles of books reviewed by users living in a state with this name
  arrow::Result<std::set<std::string>> books_reviewed_in_state(
      const std::string& state) const;

  // Titles of books reviewed by users living in a country with this name
  arrow::Result<std::set<std::string>> books_reviewed_in_country(
      const std::string& country) const;

  /**
   * Mean age of the users who reviewed a book with this title, one sample
   * per review. Uses the title index when it is enabled, otherwise scans
   * every book. Reviewers without an age are skipped; 0.0 when no reviewer
   * has one.
   */
  arrow::Result<double> average_age_by_title(const std::string& title) const;

 private:
  static Relationships reviews_of(Nodes authors);
  static arrow::Result<std::set<std::string>> reviewed_titles(Nodes cities);

  const BookReviewsGraph& graph_;
  Query query_;
};

}  // namespace bookgraph

#endif  // QUERIES_HPP
