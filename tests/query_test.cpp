#include "../include/query.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "../include/errors.hpp"
#include "../include/graph.hpp"
#include "../include/stream.hpp"

// Helper macro for Arrow operations
#define ASSERT_OK(expr) ASSERT_TRUE((expr).ok())

using namespace std::string_literals;
using namespace bookgraph;

namespace bookgraph {

namespace {

std::vector<std::string> ids(const NodeSet& nodes) {
  std::vector<std::string> result;
  for (const auto& node : nodes) {
    result.push_back(node->id());
  }
  return result;
}

}  // namespace

/**
 * Two authors, three books and three users:
 *   Bram Stoker <- Dracula        <- u1 (8), u2 (6)
 *   Dan Brown   <- Da Vinci Code  <- u1 (9), u3 (7)
 *   Dan Brown   <- Angels&Demons  <- u3 (5)
 * u3 has no age.
 */
class QueryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    add_author("Bram Stoker");
    add_author("Dan Brown");
    add_book("b1", "Dracula", "Bram Stoker");
    add_book("b2", "The Da Vinci Code", "Dan Brown");
    add_book("b3", "Angels & Demons", "Dan Brown");

    graph_.add_node("u1", "user").ValueOrDie()->set_property("age", 20);
    graph_.add_node("u2", "user").ValueOrDie()->set_property("age", 40);
    ASSERT_OK(graph_.add_node("u3", "user"));

    review("u1", "b1", 8);
    review("u2", "b1", 6);
    review("u1", "b2", 9);
    review("u3", "b2", 7);
    review("u3", "b3", 5);
  }

  void add_author(const std::string& name) {
    graph_.add_node(name, "author").ValueOrDie()->set_property("name", name);
  }

  void add_book(const std::string& isbn, const std::string& title,
                const std::string& author) {
    auto book = graph_.add_node(isbn, "book").ValueOrDie();
    book->set_property("title", title);
    graph_.add_edge("writtenBy", isbn, author).ValueOrDie();
  }

  void review(const std::string& user, const std::string& isbn,
              const int rating) {
    graph_.add_edge("reviewed", user, isbn)
        .ValueOrDie()
        ->set_property("rating", rating);
  }

  Graph graph_;
};

TEST_F(QueryTest, MatchYieldsTheNode) {
  Query query(graph_);
  auto nodes = query.match("b1").to_vector().ValueOrDie();
  ASSERT_EQ(nodes.size(), 1u);
  EXPECT_EQ(nodes[0]->get_string("title").ValueOrDie(), "Dracula");
}

TEST_F(QueryTest, MatchOfUnknownIdIsEmpty) {
  Query query(graph_);
  EXPECT_EQ(query.match("nobody").count().ValueOrDie(), 0u);
  EXPECT_EQ(query.match("nobody")
                .in("writtenBy")
                .from_nodes("book")
                .in("reviewed")
                .count()
                .ValueOrDie(),
            0u);
  EXPECT_DOUBLE_EQ(
      query.match("nobody").in("writtenBy").from_nodes().average("rating")
          .ValueOrDie(),
      0.0);
}

TEST_F(QueryTest, MatchOrFailReportsMissingNode) {
  Query query(graph_);
  auto res = query.match_or_fail("nobody");
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(is_graph_error(res.status(), GraphError::NODE_NOT_FOUND));

  auto found = query.match_or_fail("u1");
  ASSERT_OK(found);
  EXPECT_EQ(found.ValueOrDie().count().ValueOrDie(), 1u);
}

TEST_F(QueryTest, ReviewsOfAnAuthorsBooks) {
  Query query(graph_);
  auto reviews = query.match("Dan Brown")
                     .in("writtenBy")
                     .from_nodes("book")
                     .in("reviewed")
                     .to_vector()
                     .ValueOrDie();
  ASSERT_EQ(reviews.size(), 3u);
  EXPECT_EQ(reviews[0]->source()->id(), "u1");
  EXPECT_EQ(reviews[0]->target()->id(), "b2");
  EXPECT_EQ(reviews[1]->source()->id(), "u3");
  EXPECT_EQ(reviews[2]->target()->id(), "b3");

  EXPECT_DOUBLE_EQ(query.match("Dan Brown")
                       .in("writtenBy")
                       .from_nodes("book")
                       .in("reviewed")
                       .average("rating")
                       .ValueOrDie(),
                   7.0);
}

TEST_F(QueryTest, TraversalMatchesManualAdjacencyWalk) {
  std::vector<std::string> expected;
  for (const auto& written : graph_.get_node("Dan Brown")->incoming_edges()) {
    if (written->label() != "writtenBy") continue;
    for (const auto& reviewed : written->source()->incoming_edges()) {
      if (reviewed->label() != "reviewed") continue;
      expected.push_back(reviewed->source()->id());
    }
  }

  Query query(graph_);
  auto reviewers = query.match("Dan Brown")
                       .in("writtenBy")
                       .from_nodes()
                       .in("reviewed")
                       .from_nodes()
                       .to_vector()
                       .ValueOrDie();
  EXPECT_EQ(ids(reviewers), expected);
  EXPECT_EQ(ids(reviewers), (std::vector<std::string>{"u1", "u3", "u3"}));
}

TEST_F(QueryTest, ToSetDropsRepeatsInFirstSeenOrder) {
  Query query(graph_);
  auto reviewers = query.match("Dan Brown")
                       .in("writtenBy")
                       .from_nodes()
                       .in("reviewed")
                       .from_nodes()
                       .to_set()
                       .ValueOrDie();
  EXPECT_EQ(ids(reviewers), (std::vector<std::string>{"u1", "u3"}));
}

TEST_F(QueryTest, EdgeLabelFilterIgnoresOtherLabels) {
  Query query(graph_);
  EXPECT_EQ(query.match("b1").out("reviewed").count().ValueOrDie(), 0u);
  EXPECT_EQ(query.match("b1").out("writtenBy").count().ValueOrDie(), 1u);
  EXPECT_EQ(query.match("b1").in("reviewed").count().ValueOrDie(), 2u);
  EXPECT_EQ(query.match("b1").in("unknown").count().ValueOrDie(), 0u);
}

TEST_F(QueryTest, NodeLabelFilterOnProjection) {
  Query query(graph_);
  EXPECT_EQ(
      query.match("u1").out("reviewed").to_nodes("author").count().ValueOrDie(),
      0u);
  auto titles = query.match("u1")
                    .out("reviewed")
                    .to_nodes("book")
                    .strings("title")
                    .to_vector()
                    .ValueOrDie();
  EXPECT_EQ(titles,
            (std::vector<std::string>{"Dracula", "The Da Vinci Code"}));
}

TEST_F(QueryTest, WhereOnEdges) {
  Query query(graph_);
  auto ratings = query.match("u1")
                     .out("reviewed")
                     .where("rating", CompareOp::Gte, 9)
                     .ints("rating")
                     .to_vector()
                     .ValueOrDie();
  EXPECT_EQ(ratings, (std::vector<int64_t>{9}));
}

TEST_F(QueryTest, WithLabelAndPropertyPredicate) {
  Query query(graph_);
  auto books = query.with_label("book")
                   .where("title", CompareOp::Eq, "Dracula")
                   .to_vector()
                   .ValueOrDie();
  ASSERT_EQ(books.size(), 1u);
  EXPECT_EQ(books[0]->id(), "b1");

  EXPECT_EQ(query.with_label("publisher").count().ValueOrDie(), 0u);
}

TEST_F(QueryTest, WithPropertySkipsElementsWithoutIt) {
  Query query(graph_);
  auto aged = query.with_label("user").with_property("age").to_vector();
  ASSERT_OK(aged);
  EXPECT_EQ(ids(aged.ValueOrDie()), (std::vector<std::string>{"u1", "u2"}));

  EXPECT_DOUBLE_EQ(
      query.match("b1").in("reviewed").from_nodes("user").with_property("age")
          .average("age")
          .ValueOrDie(),
      30.0);
}

TEST_F(QueryTest, MissingPropertySurfacesFromTerminal) {
  Query query(graph_);
  auto res = query.with_label("user")
                 .where("age", CompareOp::Gt, 30)
                 .to_vector();
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(is_graph_error(res.status(), GraphError::PROPERTY_MISSING));

  auto ages = query.with_label("user").ints("age").to_vector();
  EXPECT_TRUE(is_graph_error(ages.status(), GraphError::PROPERTY_MISSING));
}

TEST_F(QueryTest, MistypedPropertySurfacesFromTerminal) {
  Query query(graph_);
  auto res = query.with_label("user")
                 .where("age", CompareOp::Eq, "20")
                 .count();
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(
      is_graph_error(res.status(), GraphError::PROPERTY_TYPE_MISMATCH));

  auto titles = query.with_label("book").ints("title").to_vector();
  EXPECT_TRUE(
      is_graph_error(titles.status(), GraphError::PROPERTY_TYPE_MISMATCH));
}

TEST_F(QueryTest, RangeForStopsAtFirstError) {
  Query query(graph_);
  auto users = query.with_label("user").where("age", CompareOp::Gt, 30);
  std::vector<std::string> seen;
  for (const auto& user : users) {
    seen.push_back(user->id());
  }
  EXPECT_EQ(seen, (std::vector<std::string>{"u2"}));
  EXPECT_TRUE(is_graph_error(users.status(), GraphError::PROPERTY_MISSING));
}

TEST_F(QueryTest, RangeForWithoutErrorLeavesStatusOk) {
  Query query(graph_);
  auto books = query.with_label("book");
  size_t n = 0;
  for (const auto& book : books) {
    EXPECT_EQ(book->label(), "book");
    ++n;
  }
  EXPECT_EQ(n, 3u);
  EXPECT_TRUE(books.status().ok());
}

TEST_F(QueryTest, NothingRunsBeforeTheTerminal) {
  Query query(graph_);
  int calls = 0;
  auto users = query.with_label("user").where([&calls](const Node& node) {
    ++calls;
    return node.id() != "u2";
  });
  auto reviews = users.out("reviewed");
  EXPECT_EQ(calls, 0);

  EXPECT_EQ(reviews.count().ValueOrDie(), 4u);
  EXPECT_EQ(calls, 3);
}

TEST_F(QueryTest, TraversalReadsTheGraphWhenDrained) {
  Query query(graph_);
  auto reviews = query.match("u2").out("reviewed");
  review("u2", "b3", 10);
  EXPECT_EQ(reviews.ints("rating").to_vector().ValueOrDie(),
            (std::vector<int64_t>{6, 10}));
}

TEST_F(QueryTest, FromBorrowedAndOwnedSets) {
  const NodeSet start{graph_.get_node("u1"), graph_.get_node("u2")};
  EXPECT_EQ(Query::from(start).out("reviewed").count().ValueOrDie(), 3u);

  auto owned = Query::from_owned({graph_.get_node("b2"), graph_.get_node("b3")})
                   .in("reviewed")
                   .from_nodes()
                   .to_set()
                   .ValueOrDie();
  EXPECT_EQ(ids(owned), (std::vector<std::string>{"u1", "u3"}));
}

TEST_F(QueryTest, WhereExpressionObject) {
  Query query(graph_);
  auto expr = LogicalExpr::or_expr(compare("title", CompareOp::StartsWith, "The"),
                                   compare("title", CompareOp::Contains, "&"));
  auto books = query.with_label("book").where(expr).to_vector().ValueOrDie();
  EXPECT_EQ(ids(books), (std::vector<std::string>{"b2", "b3"}));

  std::shared_ptr<WhereExpr> null_expr;
  auto res = query.with_label("book").where(null_expr).count();
  EXPECT_TRUE(res.status().IsInvalid());
}

TEST(StreamTest, CombinatorsAreLazyAndSinglePass) {
  int pulled = 0;
  auto source = Stream<int>::of({1, 2, 3, 4, 5, 6});
  auto evens = source
                   .filter([&pulled](const int& v) -> arrow::Result<bool> {
                     ++pulled;
                     return v % 2 == 0;
                   })
                   .map<std::string>(
                       [](const int& v) -> arrow::Result<std::string> {
                         return std::to_string(v * 10);
                       });
  EXPECT_EQ(pulled, 0);
  EXPECT_EQ(evens.to_vector().ValueOrDie(),
            (std::vector<std::string>{"20", "40", "60"}));
  EXPECT_EQ(pulled, 6);

  // Drained streams stay empty
  EXPECT_EQ(evens.count().ValueOrDie(), 0u);
  EXPECT_EQ(source.count().ValueOrDie(), 0u);
}

TEST(StreamTest, FlatMapConcatenatesInnerStreams) {
  auto nested = Stream<int>::of({0, 2, 1}).flat_map<int>([](const int& n) {
    std::vector<int> repeated(static_cast<size_t>(n), n);
    return Stream<int>::of(std::move(repeated));
  });
  EXPECT_EQ(nested.to_vector().ValueOrDie(), (std::vector<int>{2, 2, 1}));
}

TEST(StreamTest, ErrorsStopTheStream) {
  auto failing = Stream<int>::of({1, 2, 3}).map<int>(
      [](const int& v) -> arrow::Result<int> {
        if (v == 2) {
          return arrow::Status::Invalid("bad element ", v);
        }
        return v;
      });
  int seen = 0;
  auto status = failing.for_each([&seen](const int&) {
    ++seen;
    return arrow::Status::OK();
  });
  EXPECT_TRUE(status.IsInvalid());
  EXPECT_EQ(seen, 1);
}

TEST(StreamTest, MeanOfEmptyStreamIsZero) {
  EXPECT_DOUBLE_EQ(mean(Stream<double>::empty()).ValueOrDie(), 0.0);
  EXPECT_DOUBLE_EQ(mean(Stream<double>::of({7.0, 8.0, 9.0})).ValueOrDie(),
                   8.0);
}

}  // namespace bookgraph
