#ifndef REPORT_HPP
#define REPORT_HPP

#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/table.h>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "book_reviews_graph.hpp"
#include "config.hpp"
#include "queries.hpp"

namespace bookgraph {

// Everything the command-line driver prints, computed in one pass
struct Report {
  size_t top_n = 0;
  std::string author;
  double author_average_rating = 0.0;
  std::vector<AuthorReviewCount> top_authors_by_reviews;
  // Average rating of each author in top_authors_by_reviews, same order
  std::vector<AuthorAverageRating> top_author_ratings;
  std::string state;
  std::vector<std::string> state_titles;
  std::vector<AuthorAverageRating> top_authors_by_rating;
  std::string country;
  // First top_n titles in lexicographic order
  std::vector<std::string> country_titles;
  std::string title;
  double average_reviewer_age = 0.0;
  IngestStats stats;
};

arrow::Result<Report> build_report(const BookReviewsGraph& graph,
                                   const ReportConfig& config);

arrow::Result<std::shared_ptr<arrow::Table>> review_counts_table(
    const std::vector<AuthorReviewCount>& rows);

arrow::Result<std::shared_ptr<arrow::Table>> average_ratings_table(
    const std::vector<AuthorAverageRating>& rows);

arrow::Result<std::shared_ptr<arrow::Table>> titles_table(
    const std::vector<std::string>& titles);

// Renders a table as an ASCII grid, one line per row
std::string format_table(const std::shared_ptr<arrow::Table>& table);

std::string stringify_cell(const std::shared_ptr<arrow::ChunkedArray>& column,
                           int64_t row);

arrow::Status write_text(const Report& report, std::ostream& out);

void write_json(const Report& report, std::ostream& out);

}  // namespace bookgraph

#endif  // REPORT_HPP
