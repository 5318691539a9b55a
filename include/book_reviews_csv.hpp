#ifndef BOOK_REVIEWS_CSV_HPP
#define BOOK_REVIEWS_CSV_HPP

#include <arrow/result.h>
#include <arrow/table.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bookgraph {

// One row of BX-Books.csv
struct Book {
  std::string isbn;
  std::string title;
  std::string author;
  int32_t year = 0;
  std::string publisher;
};

// One row of BX-Book-Ratings.csv
struct BookRating {
  std::string user_id;
  std::string isbn;
  int32_t rating = 0;
};

// One row of BX-Users.csv; age is absent when the file says NULL
struct User {
  std::string user_id;
  std::string location;
  std::optional<int32_t> age;
};

// Rows dropped while reading, per file
struct ParseStats {
  int64_t malformed_books = 0;
  int64_t malformed_ratings = 0;
  int64_t malformed_users = 0;

  [[nodiscard]] int64_t total() const {
    return malformed_books + malformed_ratings + malformed_users;
  }
};

struct ParseResult {
  std::vector<Book> books;
  std::vector<BookRating> ratings;
  std::vector<User> users;
  ParseStats stats;
};

/**
 * @brief Reads the Book-Crossing CSV export into plain records
 *
 * The files are ';' separated, double-quoted with backslash-escaped quotes,
 * ISO-8859-1 encoded and start with a header row. Fields are read as raw
 * bytes through the Arrow CSV reader and transcoded to UTF-8.
 *
 * A row is malformed when its column count differs from the header row
 * or a numeric field (year, rating, age other than NULL) does not parse.
 * Malformed rows are skipped and counted when skip_malformed_rows is set;
 * otherwise the first one fails the parse with arrow::StatusCode::Invalid.
 * A file holding only the header row yields no records. A missing file
 * fails with arrow::StatusCode::IOError.
 */
class BookReviewsCsvParser {
 public:
  explicit BookReviewsCsvParser(bool skip_malformed_rows = true)
      : skip_malformed_rows_(skip_malformed_rows) {}

  arrow::Result<ParseResult> parse(const std::string& books_path,
                                   const std::string& ratings_path,
                                   const std::string& users_path) const;

  arrow::Result<std::vector<Book>> parse_books(const std::string& path,
                                               int64_t* malformed) const;

  arrow::Result<std::vector<BookRating>> parse_ratings(
      const std::string& path, int64_t* malformed) const;

  arrow::Result<std::vector<User>> parse_users(const std::string& path,
                                               int64_t* malformed) const;

 private:
  // Reads the first `columns` columns of path, each as binary
  arrow::Result<std::shared_ptr<arrow::Table>> read_table(
      const std::string& path, int columns, int64_t* malformed) const;

  // Records a row that failed conversion, or fails if skipping is disabled
  arrow::Status reject_row(const std::string& path, int64_t row,
                           const std::string& reason,
                           int64_t* malformed) const;

  bool skip_malformed_rows_;
};

}  // namespace bookgraph

#endif  // BOOK_REVIEWS_CSV_HPP
