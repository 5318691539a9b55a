#include <arrow/result.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "book_reviews_csv.hpp"
#include "book_reviews_graph.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "utils.hpp"

using namespace bookgraph;

namespace {

void print_usage() {
  std::cout
      << "Usage: bookgraph_report [OPTIONS]\n"
      << "Options:\n"
      << "      --data-dir DIR    Read BX-Books.csv, BX-Book-Ratings.csv and "
         "BX-Users.csv from DIR\n"
      << "      --books PATH      Books CSV (default: " << defaults::BOOKS_CSV
      << ")\n"
      << "      --ratings PATH    Ratings CSV (default: "
      << defaults::RATINGS_CSV << ")\n"
      << "      --users PATH      Users CSV (default: " << defaults::USERS_CSV
      << ")\n"
      << "  -n, --top N           Length of ranked lists (default: "
      << defaults::TOP_N << ")\n"
      << "      --author NAME     Author for the average rating (default: "
      << defaults::AUTHOR << ")\n"
      << "      --state NAME      State for reviewed books (default: "
      << defaults::STATE << ")\n"
      << "      --country NAME    Country for reviewed books (default: "
      << defaults::COUNTRY << ")\n"
      << "      --title TITLE     Title for the reviewer age (default: "
      << defaults::TITLE << ")\n"
      << "      --no-title-index  Scan all books for the reviewer age query\n"
      << "      --strict          Fail on malformed rows and dangling ratings\n"
      << "      --log-level LVL   debug, info, warn, error or off (default: "
         "info)\n"
      << "      --log-file PATH   Write log output to PATH\n"
      << "      --format FMT      text or json (default: text)\n"
      << "  -h, --help            Show this help message\n";
}

// Returns the value following argv[i], advancing i; nullptr when missing
const char* option_value(int argc, char* argv[], int& i) {
  if (i + 1 >= argc) {
    std::cerr << "Error: " << argv[i] << " requires a value\n";
    return nullptr;
  }
  return argv[++i];
}

}  // namespace

int main(int argc, char* argv[]) {
  auto builder = make_report_config();
  auto graph_builder = make_config();

  for (int i = 1; i < argc; i++) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--no-title-index") {
      graph_builder.with_title_index(false);
      continue;
    }
    if (arg == "--strict") {
      graph_builder.with_skip_malformed_rows(false)
          .with_skip_dangling_ratings(false);
      continue;
    }

    const bool takes_value =
        arg == "--data-dir" || arg == "--books" || arg == "--ratings" ||
        arg == "--users" || arg == "--top" || arg == "-n" ||
        arg == "--author" || arg == "--state" || arg == "--country" ||
        arg == "--title" || arg == "--log-level" || arg == "--log-file" ||
        arg == "--format";
    if (!takes_value) {
      std::cerr << "Error: Unknown argument: " << arg << "\n";
      std::cerr << "Use --help for usage information\n";
      return 1;
    }
    const char* value = option_value(argc, argv, i);
    if (value == nullptr) {
      return 1;
    }

    if (arg == "--data-dir") {
      builder.with_data_dir(value);
    } else if (arg == "--books") {
      builder.with_books_csv(value);
    } else if (arg == "--ratings") {
      builder.with_ratings_csv(value);
    } else if (arg == "--users") {
      builder.with_users_csv(value);
    } else if (arg == "--top" || arg == "-n") {
      const auto n = parse_int32(value);
      if (!n || *n < 0) {
        std::cerr << "Error: --top expects a non-negative integer, got '"
                  << value << "'\n";
        return 1;
      }
      builder.with_top_n(static_cast<size_t>(*n));
    } else if (arg == "--author") {
      builder.with_author(value);
    } else if (arg == "--state") {
      builder.with_state(value);
    } else if (arg == "--country") {
      builder.with_country(value);
    } else if (arg == "--title") {
      builder.with_title(value);
    } else if (arg == "--log-level") {
      auto level = parse_log_level(value);
      if (!level.ok()) {
        std::cerr << "Error: " << level.status().message() << "\n";
        return 1;
      }
      builder.with_log_level(*level);
    } else if (arg == "--log-file") {
      builder.with_log_file(value);
    } else if (arg == "--format") {
      const std::string format = value;
      if (format == "text") {
        builder.with_output_format(OutputFormat::TEXT);
      } else if (format == "json") {
        builder.with_output_format(OutputFormat::JSON);
      } else {
        std::cerr << "Error: --format expects text or json, got '" << format
                  << "'\n";
        return 1;
      }
    }
  }

  const auto config = builder.with_graph_config(graph_builder.build()).build();

  Logger::get_instance().set_level(config.get_log_level());
  if (!config.get_log_file().empty() &&
      !Logger::get_instance().set_log_to_file(config.get_log_file())) {
    std::cerr << "Warning: cannot open log file " << config.get_log_file()
              << ", logging to console\n";
  }

  const BookReviewsCsvParser parser(
      config.get_graph_config().is_skip_malformed_rows());
  auto parsed = parser.parse(config.get_books_csv(), config.get_ratings_csv(),
                             config.get_users_csv());
  if (!parsed.ok()) {
    log_error("Failed to read CSV input: {}", parsed.status().ToString());
    std::cerr << "Failed to read CSV input: " << parsed.status().ToString()
              << std::endl;
    return 1;
  }

  auto graph = BookReviewsGraph::build(*parsed, config.get_graph_config());
  if (!graph.ok()) {
    log_error("Failed to build graph: {}", graph.status().ToString());
    std::cerr << "Failed to build graph: " << graph.status().ToString()
              << std::endl;
    return 1;
  }

  auto report = build_report(*graph, config);
  if (!report.ok()) {
    log_error("Query failed: {}", report.status().ToString());
    std::cerr << "Query failed: " << report.status().ToString() << std::endl;
    return 1;
  }

  if (config.get_output_format() == OutputFormat::JSON) {
    write_json(*report, std::cout);
  } else if (const auto status = write_text(*report, std::cout); !status.ok()) {
    std::cerr << "Failed to render report: " << status.ToString()
              << std::endl;
    return 1;
  }
  return 0;
}
