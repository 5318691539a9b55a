#include "../include/graph.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "../include/errors.hpp"
#include "../include/node_index.hpp"

// Helper macro for Arrow operations
#define ASSERT_OK(expr) ASSERT_TRUE((expr).ok())

using namespace std::string_literals;
using namespace bookgraph;

namespace bookgraph {

class GraphTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_OK(graph_.add_node("0451524934", "book"));
    ASSERT_OK(graph_.add_node("George Orwell", "author"));
    ASSERT_OK(graph_.add_node("user:8", "user"));
  }

  Graph graph_;
};

TEST_F(GraphTest, AddNodeRegistersIdAndLabel) {
  auto node = graph_.get_node("0451524934");
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->id(), "0451524934");
  EXPECT_EQ(node->label(), "book");
  EXPECT_TRUE(node->properties().empty());
  EXPECT_TRUE(node->outgoing_edges().empty());
  EXPECT_TRUE(node->incoming_edges().empty());

  EXPECT_EQ(graph_.node_count(), 3u);
  EXPECT_TRUE(graph_.contains("user:8"));
  EXPECT_FALSE(graph_.contains("user:9"));
}

TEST_F(GraphTest, DuplicateIdIsRejected) {
  auto res = graph_.add_node("0451524934", "author");
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(res.status().IsAlreadyExists());
  EXPECT_TRUE(is_graph_error(res.status(), GraphError::DUPLICATE_NODE));

  // The existing node is untouched and not re-indexed under the new label
  EXPECT_EQ(graph_.get_node("0451524934")->label(), "book");
  EXPECT_EQ(graph_.get_nodes_by_label("author").size(), 1u);
  EXPECT_EQ(graph_.node_count(), 3u);
}

TEST_F(GraphTest, AddNodeIfAbsentReturnsExisting) {
  auto existing = graph_.get_node("George Orwell");
  existing->set_property("name", "George Orwell");

  auto same = graph_.add_node_if_absent("George Orwell", "publisher");
  EXPECT_EQ(same.get(), existing.get());
  EXPECT_EQ(same->label(), "author");
  EXPECT_TRUE(same->has_property("name"));
  EXPECT_TRUE(graph_.get_nodes_by_label("publisher").empty());

  auto created = graph_.add_node_if_absent("Signet", "publisher");
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(created->label(), "publisher");
  EXPECT_EQ(graph_.get_nodes_by_label("publisher").size(), 1u);
  EXPECT_EQ(graph_.node_count(), 4u);
}

TEST_F(GraphTest, AddEdgeAppendsToBothEndpoints) {
  auto edge = graph_.add_edge("writtenBy", "0451524934", "George Orwell")
                  .ValueOrDie();
  edge->set_property("year", 1950);

  auto book = graph_.get_node("0451524934");
  auto author = graph_.get_node("George Orwell");
  ASSERT_EQ(book->outgoing_edges().size(), 1u);
  ASSERT_EQ(author->incoming_edges().size(), 1u);
  EXPECT_TRUE(book->incoming_edges().empty());
  EXPECT_TRUE(author->outgoing_edges().empty());

  const auto& stored = book->outgoing_edges()[0];
  EXPECT_EQ(stored.get(), edge.get());
  EXPECT_EQ(author->incoming_edges()[0].get(), edge.get());
  EXPECT_EQ(stored->label(), "writtenBy");
  EXPECT_EQ(stored->source().get(), book.get());
  EXPECT_EQ(stored->target().get(), author.get());
  EXPECT_EQ(stored->get_int64("year").ValueOrDie(), 1950);
  EXPECT_EQ(graph_.edge_count(), 1u);
}

TEST_F(GraphTest, ParallelEdgesAreKeptInCreationOrder) {
  for (int rating = 1; rating <= 3; ++rating) {
    auto edge =
        graph_.add_edge("reviewed", "user:8", "0451524934").ValueOrDie();
    edge->set_property("rating", rating);
  }

  const auto& out = graph_.get_node("user:8")->outgoing_edges();
  ASSERT_EQ(out.size(), 3u);
  for (size_t i = 0; i < out.size(); ++i) {
    EXPECT_EQ(out[i]->get_int64("rating").ValueOrDie(),
              static_cast<int64_t>(i + 1));
  }
  EXPECT_EQ(graph_.get_node("0451524934")->incoming_edges().size(), 3u);
}

TEST_F(GraphTest, AddEdgeWithMissingEndpointFails) {
  auto missing_target = graph_.add_edge("reviewed", "user:8", "nope");
  ASSERT_FALSE(missing_target.ok());
  EXPECT_TRUE(
      is_graph_error(missing_target.status(), GraphError::NODE_NOT_FOUND));
  EXPECT_NE(missing_target.status().message().find("nope"), std::string::npos);

  auto missing_source = graph_.add_edge("reviewed", "user:404", "0451524934");
  EXPECT_TRUE(
      is_graph_error(missing_source.status(), GraphError::NODE_NOT_FOUND));

  // Nothing was attached to the endpoint that does exist
  EXPECT_TRUE(graph_.get_node("user:8")->outgoing_edges().empty());
  EXPECT_TRUE(graph_.get_node("0451524934")->incoming_edges().empty());
  EXPECT_EQ(graph_.edge_count(), 0u);
}

TEST_F(GraphTest, SelfLoopAppearsInBothLists) {
  ASSERT_OK(graph_.add_edge("knows", "user:8", "user:8"));
  auto user = graph_.get_node("user:8");
  EXPECT_EQ(user->outgoing_edges().size(), 1u);
  EXPECT_EQ(user->incoming_edges().size(), 1u);
}

TEST_F(GraphTest, GetNodeOrFail) {
  EXPECT_EQ(graph_.get_node("missing"), nullptr);
  auto res = graph_.get_node_or_fail("missing");
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(res.status().IsKeyError());
  EXPECT_TRUE(is_graph_error(res.status(), GraphError::NODE_NOT_FOUND));

  auto found = graph_.get_node_or_fail("user:8");
  ASSERT_OK(found);
  EXPECT_EQ(found.ValueOrDie()->label(), "user");
}

TEST_F(GraphTest, NodesByLabelKeepInsertionOrder) {
  ASSERT_OK(graph_.add_node("user:2", "user"));
  ASSERT_OK(graph_.add_node("user:5", "user"));

  const auto& users = graph_.get_nodes_by_label("user");
  ASSERT_EQ(users.size(), 3u);
  EXPECT_EQ(users[0]->id(), "user:8");
  EXPECT_EQ(users[1]->id(), "user:2");
  EXPECT_EQ(users[2]->id(), "user:5");

  EXPECT_TRUE(graph_.get_nodes_by_label("city").empty());

  auto labels = graph_.labels();
  std::sort(labels.begin(), labels.end());
  EXPECT_EQ(labels, (std::vector<std::string>{"author", "book", "user"}));
}

TEST(NodeIndexTest, PutIsIdempotentPerKey) {
  auto rome = std::make_shared<Node>("rome:lazio:italy", "city");
  auto rome_ny = std::make_shared<Node>("rome:new york:usa", "city");

  NodeIndex index;
  EXPECT_TRUE(index.empty());
  EXPECT_TRUE(index.put("rome", rome));
  EXPECT_FALSE(index.put("rome", rome));
  EXPECT_TRUE(index.put("rome", rome_ny));
  EXPECT_TRUE(index.put("lazio", rome));

  EXPECT_EQ(index.size(), 2u);
  EXPECT_EQ(index.entries(), 3u);
  ASSERT_EQ(index.get("rome").size(), 2u);
  EXPECT_EQ(index.get("rome")[0]->id(), "rome:lazio:italy");
  EXPECT_EQ(index.get("rome")[1]->id(), "rome:new york:usa");
  EXPECT_TRUE(index.contains("lazio"));
}

TEST(NodeIndexTest, UnknownKeyIsEmptyAndCaseSensitive) {
  NodeIndex index;
  index.put("Dracula", std::make_shared<Node>("0001", "book"));
  EXPECT_TRUE(index.get("dracula").empty());
  EXPECT_FALSE(index.contains("dracula"));
  EXPECT_TRUE(index.get("").empty());
}

TEST(GraphLifetimeTest, NodesOutliveTheGraphWhenHeld) {
  std::shared_ptr<Node> user;
  {
    Graph graph;
    user = graph.add_node("user:1", "user").ValueOrDie();
    ASSERT_OK(graph.add_node("b", "book"));
    ASSERT_OK(graph.add_edge("reviewed", "user:1", "b"));
    EXPECT_EQ(user->outgoing_edges().size(), 1u);
  }
  // The graph drops adjacency on destruction
  EXPECT_EQ(user->id(), "user:1");
  EXPECT_TRUE(user->outgoing_edges().empty());
}

TEST(GraphLifetimeTest, MoveAssignmentReleasesReplacedNodes) {
  Graph graph;
  auto user = graph.add_node("user:1", "user").ValueOrDie();
  ASSERT_OK(graph.add_node("b", "book"));
  ASSERT_OK(graph.add_edge("reviewed", "user:1", "b"));
  std::weak_ptr<Node> book = graph.get_node("b");

  Graph other;
  ASSERT_OK(graph.add_node("c", "city"));
  ASSERT_OK(other.add_node("user:2", "user"));
  ASSERT_OK(other.add_node("b2", "book"));
  ASSERT_OK(other.add_edge("reviewed", "user:2", "b2"));

  graph = std::move(other);

  EXPECT_TRUE(user->outgoing_edges().empty());
  EXPECT_TRUE(book.expired());
  EXPECT_EQ(graph.get_node("user:1"), nullptr);
  EXPECT_EQ(graph.node_count(), 2u);
  EXPECT_EQ(graph.edge_count(), 1u);
  EXPECT_EQ(graph.get_nodes_by_label("user").size(), 1u);
  EXPECT_EQ(graph.get_node("user:2")->outgoing_edges().size(), 1u);
}

}  // namespace bookgraph
