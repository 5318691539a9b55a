#include "report.hpp"

#include <arrow/api.h>
#include <nlohmann/json.hpp>

#include <algorithm>

#include "logger.hpp"
#include "utils.hpp"

namespace bookgraph {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AuthorReviewCount, author, reviews)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AuthorAverageRating, author, average)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(IngestStats, books, duplicate_books, users,
                                   duplicate_users, ratings, dangling_ratings,
                                   publishers, authors, cities, states,
                                   countries, malformed_rows)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Report, top_n, author,
                                   author_average_rating,
                                   top_authors_by_reviews, top_author_ratings,
                                   state, state_titles, top_authors_by_rating,
                                   country, country_titles, title,
                                   average_reviewer_age, stats)

namespace {

template <typename T>
void truncate(std::vector<T>& rows, const size_t n) {
  if (rows.size() > n) {
    rows.resize(n);
  }
}

}  // namespace

arrow::Result<Report> build_report(const BookReviewsGraph& graph,
                                   const ReportConfig& config) {
  const BookReviewQueries queries(graph);
  Report report;
  report.top_n = config.get_top_n();
  report.author = config.get_author();
  report.state = config.get_state();
  report.country = config.get_country();
  report.title = config.get_title();
  report.stats = graph.stats();

  ARROW_ASSIGN_OR_RAISE(report.author_average_rating,
                        queries.average_rating_for_author(report.author));

  ARROW_ASSIGN_OR_RAISE(report.top_authors_by_reviews,
                        queries.authors_by_review_count());
  truncate(report.top_authors_by_reviews, report.top_n);
  for (const auto& row : report.top_authors_by_reviews) {
    ARROW_ASSIGN_OR_RAISE(const double average,
                          queries.average_rating_for_author(row.author));
    report.top_author_ratings.push_back({row.author, average});
  }

  ARROW_ASSIGN_OR_RAISE(const auto state_titles,
                        queries.books_reviewed_in_state(report.state));
  report.state_titles.assign(state_titles.begin(), state_titles.end());

  ARROW_ASSIGN_OR_RAISE(report.top_authors_by_rating,
                        queries.authors_by_average_rating());
  truncate(report.top_authors_by_rating, report.top_n);

  ARROW_ASSIGN_OR_RAISE(const auto country_titles,
                        queries.books_reviewed_in_country(report.country));
  report.country_titles.assign(country_titles.begin(), country_titles.end());
  truncate(report.country_titles, report.top_n);

  ARROW_ASSIGN_OR_RAISE(report.average_reviewer_age,
                        queries.average_age_by_title(report.title));

  log_debug("Report ready: {} titles in {}, {} in {}", state_titles.size(),
            report.state, country_titles.size(), report.country);
  return report;
}

arrow::Result<std::shared_ptr<arrow::Table>> review_counts_table(
    const std::vector<AuthorReviewCount>& rows) {
  arrow::StringBuilder author_builder;
  arrow::Int64Builder reviews_builder;
  for (const auto& row : rows) {
    ARROW_RETURN_NOT_OK(author_builder.Append(row.author));
    ARROW_RETURN_NOT_OK(reviews_builder.Append(row.reviews));
  }
  ARROW_ASSIGN_OR_RAISE(auto authors, author_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto reviews, reviews_builder.Finish());

  auto schema = arrow::schema({arrow::field("author", arrow::utf8()),
                               arrow::field("reviews", arrow::int64())});
  return arrow::Table::Make(schema, {authors, reviews});
}

arrow::Result<std::shared_ptr<arrow::Table>> average_ratings_table(
    const std::vector<AuthorAverageRating>& rows) {
  arrow::StringBuilder author_builder;
  arrow::DoubleBuilder average_builder;
  for (const auto& row : rows) {
    ARROW_RETURN_NOT_OK(author_builder.Append(row.author));
    ARROW_RETURN_NOT_OK(average_builder.Append(row.average));
  }
  ARROW_ASSIGN_OR_RAISE(auto authors, author_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto averages, average_builder.Finish());

  auto schema = arrow::schema({arrow::field("author", arrow::utf8()),
                               arrow::field("average_rating", arrow::float64())});
  return arrow::Table::Make(schema, {authors, averages});
}

arrow::Result<std::shared_ptr<arrow::Table>> titles_table(
    const std::vector<std::string>& titles) {
  arrow::StringBuilder title_builder;
  ARROW_RETURN_NOT_OK(title_builder.AppendValues(titles));
  ARROW_ASSIGN_OR_RAISE(auto array, title_builder.Finish());
  return arrow::Table::Make(arrow::schema({arrow::field("title", arrow::utf8())}),
                            {array});
}

std::string stringify_cell(const std::shared_ptr<arrow::ChunkedArray>& column,
                           const int64_t row) {
  int chunk_idx = 0;
  int64_t chunk_row = row;

  while (chunk_idx < column->num_chunks() &&
         chunk_row >= column->chunk(chunk_idx)->length()) {
    chunk_row -= column->chunk(chunk_idx)->length();
    chunk_idx++;
  }

  if (chunk_idx >= column->num_chunks()) {
    return "ERR";
  }

  const auto chunk = column->chunk(chunk_idx);
  if (chunk->IsNull(chunk_row)) {
    return "null";
  }

  switch (column->type()->id()) {
    case arrow::Type::STRING:
      return std::static_pointer_cast<arrow::StringArray>(chunk)->GetString(
          chunk_row);
    case arrow::Type::INT64:
      return std::to_string(
          std::static_pointer_cast<arrow::Int64Array>(chunk)->Value(chunk_row));
    case arrow::Type::DOUBLE:
      return std::to_string(
          std::static_pointer_cast<arrow::DoubleArray>(chunk)->Value(chunk_row));
    default:
      return "Unsupported";
  }
}

std::string format_table(const std::shared_ptr<arrow::Table>& table) {
  if (!table || table->num_columns() == 0) {
    return "(empty)\n";
  }

  std::vector<std::string> names;
  std::vector<size_t> widths;
  for (int i = 0; i < table->num_columns(); i++) {
    names.push_back(table->schema()->field(i)->name());
    widths.push_back(utf8_length(names.back()));
  }

  std::vector<std::vector<std::string>> cells(table->num_rows());
  for (int64_t row = 0; row < table->num_rows(); row++) {
    for (int col = 0; col < table->num_columns(); col++) {
      cells[row].push_back(stringify_cell(table->column(col), row));
      widths[col] = std::max(widths[col], utf8_length(cells[row].back()));
    }
  }

  std::string out;
  const auto separator = [&](const char fill) {
    out += "+";
    for (const size_t width : widths) {
      out += std::string(width + 2, fill) + "+";
    }
    out += "\n";
  };
  const auto line = [&](const std::vector<std::string>& values) {
    out += "|";
    for (size_t i = 0; i < values.size(); i++) {
      out += " " + values[i] +
             std::string(widths[i] - utf8_length(values[i]), ' ') + " |";
    }
    out += "\n";
  };

  separator('=');
  line(names);
  separator('=');
  for (const auto& row : cells) {
    line(row);
  }
  separator('-');
  return out;
}

arrow::Status write_text(const Report& report, std::ostream& out) {
  ARROW_ASSIGN_OR_RAISE(auto by_reviews,
                        review_counts_table(report.top_authors_by_reviews));
  ARROW_ASSIGN_OR_RAISE(auto top_ratings,
                        average_ratings_table(report.top_author_ratings));
  ARROW_ASSIGN_OR_RAISE(auto state_titles, titles_table(report.state_titles));
  ARROW_ASSIGN_OR_RAISE(auto by_rating,
                        average_ratings_table(report.top_authors_by_rating));
  ARROW_ASSIGN_OR_RAISE(auto country_titles,
                        titles_table(report.country_titles));

  out << "Top " << report.top_n << " authors by number of reviews:\n"
      << format_table(by_reviews) << "\n";
  out << "Average rating for " << report.author << ": "
      << std::to_string(report.author_average_rating) << "\n\n";
  out << "Average ratings for top " << report.top_n << " authors:\n"
      << format_table(top_ratings) << "\n";
  out << "Books reviewed by users in " << report.state << " ("
      << report.state_titles.size() << "):\n"
      << format_table(state_titles) << "\n";
  out << "Top " << report.top_n << " authors by average rating:\n"
      << format_table(by_rating) << "\n";
  out << "Books reviewed by users in " << report.country << " (top "
      << report.top_n << "):\n"
      << format_table(country_titles) << "\n";
  out << "Average age of reviewers of '" << report.title
      << "': " << std::to_string(report.average_reviewer_age) << "\n";
  return arrow::Status::OK();
}

void write_json(const Report& report, std::ostream& out) {
  const nlohmann::json j = report;
  out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
      << "\n";
}

}  // namespace bookgraph
