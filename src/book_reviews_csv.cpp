#include "book_reviews_csv.hpp"

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>

#include "config.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace bookgraph {

namespace {

constexpr int BOOK_COLUMNS = 5;
constexpr int RATING_COLUMNS = 3;
constexpr int USER_COLUMNS = 3;
constexpr const char* NULL_AGE = "NULL";

std::string column_name(const int index) { return "f" + std::to_string(index); }

// Column accessors over a table whose columns were combined into one chunk
class Columns {
 public:
  explicit Columns(const std::shared_ptr<arrow::Table>& table) {
    for (int i = 0; i < table->num_columns(); ++i) {
      arrays_.push_back(
          std::static_pointer_cast<arrow::BinaryArray>(table->column(i)->chunk(0)));
    }
  }

  [[nodiscard]] bool complete(const int64_t row) const {
    for (const auto& array : arrays_) {
      if (array->IsNull(row)) return false;
    }
    return true;
  }

  [[nodiscard]] std::string raw(const int column, const int64_t row) const {
    return arrays_[column]->GetString(row);
  }

  [[nodiscard]] std::string text(const int column, const int64_t row) const {
    return latin1_to_utf8(raw(column, row));
  }

 private:
  std::vector<std::shared_ptr<arrow::BinaryArray>> arrays_;
};

}  // namespace

arrow::Result<std::shared_ptr<arrow::Table>> BookReviewsCsvParser::read_table(
    const std::string& path, const int columns, int64_t* malformed) const {
  ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path));

  auto read_options = arrow::csv::ReadOptions::Defaults();
  read_options.use_threads = false;
  read_options.block_size = defaults::CSV_BLOCK_SIZE;
  // The header is read as data so that a header-only file still fixes the
  // column count; it is dropped after reading
  read_options.skip_rows = 0;
  read_options.autogenerate_column_names = true;

  auto parse_options = arrow::csv::ParseOptions::Defaults();
  parse_options.delimiter = ';';
  parse_options.double_quote = false;
  parse_options.escaping = true;
  parse_options.escape_char = '\\';
  parse_options.newlines_in_values = true;
  const bool skip = skip_malformed_rows_;
  parse_options.invalid_row_handler =
      [skip, malformed, path](const arrow::csv::InvalidRow& row) {
        if (!skip) {
          return arrow::csv::InvalidRowResult::kError;
        }
        ++*malformed;
        log_debug("{}: skipping row {} with {} columns (expected {})", path,
                  row.number, row.actual_columns, row.expected_columns);
        return arrow::csv::InvalidRowResult::kSkip;
      };

  auto convert_options = arrow::csv::ConvertOptions::Defaults();
  convert_options.include_missing_columns = true;
  for (int i = 0; i < columns; ++i) {
    convert_options.column_types[column_name(i)] = arrow::binary();
    convert_options.include_columns.push_back(column_name(i));
  }

  ARROW_ASSIGN_OR_RAISE(
      auto reader,
      arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                    read_options, parse_options,
                                    convert_options));
  ARROW_ASSIGN_OR_RAISE(auto table, reader->Read());
  ARROW_ASSIGN_OR_RAISE(table, table->CombineChunks());
  return table->Slice(1);
}

arrow::Status BookReviewsCsvParser::reject_row(const std::string& path,
                                               const int64_t row,
                                               const std::string& reason,
                                               int64_t* malformed) const {
  if (!skip_malformed_rows_) {
    return arrow::Status::Invalid(path, ": record ", row, ": ", reason);
  }
  ++*malformed;
  log_debug("{}: skipping record {}: {}", path, row, reason);
  return arrow::Status::OK();
}

arrow::Result<std::vector<Book>> BookReviewsCsvParser::parse_books(
    const std::string& path, int64_t* malformed) const {
  ARROW_ASSIGN_OR_RAISE(auto table,
                        read_table(path, BOOK_COLUMNS, malformed));
  std::vector<Book> books;
  if (table->num_rows() == 0) {
    return books;
  }
  books.reserve(table->num_rows());

  const Columns columns(table);
  for (int64_t row = 0; row < table->num_rows(); ++row) {
    if (!columns.complete(row)) {
      ARROW_RETURN_NOT_OK(
          reject_row(path, row, "missing columns", malformed));
      continue;
    }
    const auto year = parse_int32(columns.raw(3, row));
    if (!year) {
      ARROW_RETURN_NOT_OK(reject_row(
          path, row, "invalid year '" + columns.text(3, row) + "'",
          malformed));
      continue;
    }
    books.push_back(Book{columns.text(0, row), columns.text(1, row),
                         columns.text(2, row), *year, columns.text(4, row)});
  }
  return books;
}

arrow::Result<std::vector<BookRating>> BookReviewsCsvParser::parse_ratings(
    const std::string& path, int64_t* malformed) const {
  ARROW_ASSIGN_OR_RAISE(auto table,
                        read_table(path, RATING_COLUMNS, malformed));
  std::vector<BookRating> ratings;
  if (table->num_rows() == 0) {
    return ratings;
  }
  ratings.reserve(table->num_rows());

  const Columns columns(table);
  for (int64_t row = 0; row < table->num_rows(); ++row) {
    if (!columns.complete(row)) {
      ARROW_RETURN_NOT_OK(
          reject_row(path, row, "missing columns", malformed));
      continue;
    }
    const auto rating = parse_int32(columns.raw(2, row));
    if (!rating) {
      ARROW_RETURN_NOT_OK(reject_row(
          path, row, "invalid rating '" + columns.text(2, row) + "'",
          malformed));
      continue;
    }
    ratings.push_back(
        BookRating{columns.text(0, row), columns.text(1, row), *rating});
  }
  return ratings;
}

arrow::Result<std::vector<User>> BookReviewsCsvParser::parse_users(
    const std::string& path, int64_t* malformed) const {
  ARROW_ASSIGN_OR_RAISE(auto table,
                        read_table(path, USER_COLUMNS, malformed));
  std::vector<User> users;
  if (table->num_rows() == 0) {
    return users;
  }
  users.reserve(table->num_rows());

  const Columns columns(table);
  for (int64_t row = 0; row < table->num_rows(); ++row) {
    if (!columns.complete(row)) {
      ARROW_RETURN_NOT_OK(
          reject_row(path, row, "missing columns", malformed));
      continue;
    }
    std::optional<int32_t> age;
    const auto age_text = columns.raw(2, row);
    if (trim(age_text) != NULL_AGE) {
      age = parse_int32(age_text);
      if (!age) {
        ARROW_RETURN_NOT_OK(reject_row(
            path, row, "invalid age '" + columns.text(2, row) + "'",
            malformed));
        continue;
      }
    }
    users.push_back(User{columns.text(0, row), columns.text(1, row), age});
  }
  return users;
}

arrow::Result<ParseResult> BookReviewsCsvParser::parse(
    const std::string& books_path, const std::string& ratings_path,
    const std::string& users_path) const {
  ContextLogger logger("csv");
  const int64_t start = now_millis();

  ParseResult result;
  ARROW_ASSIGN_OR_RAISE(
      result.books, parse_books(books_path, &result.stats.malformed_books));
  ARROW_ASSIGN_OR_RAISE(
      result.ratings,
      parse_ratings(ratings_path, &result.stats.malformed_ratings));
  ARROW_ASSIGN_OR_RAISE(
      result.users, parse_users(users_path, &result.stats.malformed_users));

  logger.info(
      "parsed {} books, {} ratings, {} users in {} ms ({} malformed rows "
      "skipped)",
      result.books.size(), result.ratings.size(), result.users.size(),
      now_millis() - start, result.stats.total());
  return result;
}

}  // namespace bookgraph
