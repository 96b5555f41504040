#include <gtest/gtest.h>
#include <process_model/errors.hpp>
#include <process_model/graph.hpp>
#include <process_model/graph_provider.hpp>
#include "test_helpers.hpp"
#include <limits>

using namespace process_model;
using test_helpers::make_graph;
using test_helpers::node;

// ─── Construction ──────────────────────────────────────────────

TEST(GraphTest, BuildIndexesNodesAndEdges) {
    const auto g = test_helpers::diamond_graph();
    EXPECT_EQ(g.node_count(), 5u);
    EXPECT_EQ(g.edge_count(), 5u);
    EXPECT_EQ(g.info().id, "diamond");
    EXPECT_TRUE(g.contains("C"));
    EXPECT_FALSE(g.contains("Z"));
    EXPECT_EQ(g.index_of("B"), 2u);
    EXPECT_EQ(g.node("C").kind, NodeKind::Gateway);
}

TEST(GraphTest, EmptyGraphIsValid) {
    const auto g = ProcessGraph::build({}, {}, {});
    EXPECT_EQ(g.node_count(), 0u);
    EXPECT_TRUE(g.dead_ends().empty());
}

TEST(GraphTest, DuplicateIdIsRejected) {
    EXPECT_THROW(make_graph({ node("A", NodeKind::Start), node("A", NodeKind::End) }, {}),
        ValidationError);
}

TEST(GraphTest, EmptyIdIsRejected) {
    EXPECT_THROW(make_graph({ node("", NodeKind::Task) }, {}), ValidationError);
}

TEST(GraphTest, EdgeToUnknownNodeIsRejected) {
    EXPECT_THROW(make_graph({ node("A", NodeKind::Start) }, { {"A", "B"} }), ValidationError);
    EXPECT_THROW(make_graph({ node("A", NodeKind::End) }, { {"X", "A"} }), ValidationError);
}

TEST(GraphTest, NonFiniteWeightIsRejected) {
    EXPECT_THROW(make_graph({ node("A", NodeKind::Task, std::numeric_limits<double>::quiet_NaN()) }, {}), ValidationError);
    EXPECT_THROW(make_graph({ node("A", NodeKind::Task, std::nullopt, std::numeric_limits<double>::infinity()) }, {}), ValidationError);
}

TEST(GraphTest, NegativeWeightIsAccepted) {
    const auto g = make_graph({ node("Start", NodeKind::Start, std::nullopt, -5.0), node("End", NodeKind::End, -1.0) },
        { {"Start", "End"} });
    EXPECT_DOUBLE_EQ(*g.node("Start").attributes.cost, -5.0);
    EXPECT_DOUBLE_EQ(*g.node("End").attributes.duration, -1.0);
}

TEST(GraphTest, ValidationErrorIsAProcessError) {
    try {
        make_graph({ node("A", NodeKind::Start) }, { {"A", "missing"} });
        FAIL() << "expected ValidationError";
    } catch (const ProcessError& e) {
        EXPECT_NE(std::string(e.what()).find("missing"), std::string::npos);
    }
}

// ─── Adjacency Queries ────────────────────────────────────────

TEST(GraphTest, SuccessorsFollowEdgeOrder) {
    const auto g = test_helpers::diamond_graph();
    EXPECT_EQ(g.successors("Start"), (std::vector<std::string>{ "A", "B" }));
    EXPECT_EQ(g.successors("C"), (std::vector<std::string>{ "End" }));
    EXPECT_TRUE(g.successors("End").empty());
}

TEST(GraphTest, PredecessorsFollowEdgeOrder) {
    const auto g = test_helpers::diamond_graph();
    EXPECT_EQ(g.predecessors("C"), (std::vector<std::string>{ "A", "B" }));
    EXPECT_TRUE(g.predecessors("Start").empty());
}

TEST(GraphTest, ParallelEdgesAreKept) {
    const auto g = make_graph({ node("S", NodeKind::Start), node("E", NodeKind::End) },
        { {"S", "E"}, {"S", "E"} });
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_EQ(g.successors("S").size(), 2u);
    EXPECT_EQ(g.predecessors("E").size(), 2u);
}

TEST(GraphTest, UnknownNodeLookupThrows) {
    const auto g = test_helpers::linear_graph();
    EXPECT_THROW(g.successors("nope"), UnknownNodeError);
    EXPECT_THROW(g.predecessors("nope"), UnknownNodeError);
    EXPECT_THROW(g.node("nope"), UnknownNodeError);
    try {
        g.index_of("nope");
        FAIL() << "expected UnknownNodeError";
    } catch (const UnknownNodeError& e) {
        EXPECT_EQ(e.node_id(), "nope");
    }
}

TEST(GraphTest, NodesOfKind) {
    const auto g = make_graph(
        { node("s1", NodeKind::Start), node("t", NodeKind::Task), node("s2", NodeKind::Start),
          node("e", NodeKind::End) },
        { {"s1", "t"}, {"s2", "t"}, {"t", "e"} });
    EXPECT_EQ(g.nodes_of_kind(NodeKind::Start), (std::vector<std::string>{ "s1", "s2" }));
    EXPECT_EQ(g.nodes_of_kind(NodeKind::End), (std::vector<std::string>{ "e" }));
    EXPECT_TRUE(g.nodes_of_kind(NodeKind::Event).empty());
}

TEST(GraphTest, DeadEndsAreReported) {
    const auto g = make_graph(
        { node("s", NodeKind::Start), node("t", NodeKind::Task), node("g", NodeKind::Gateway),
          node("e", NodeKind::End) },
        { {"s", "t"}, {"s", "g"}, {"t", "e"} });
    EXPECT_EQ(g.dead_ends(), (std::vector<std::string>{ "g" }));
}

// ─── Node kinds ───────────────────────────────────────────────

TEST(NodeKindTest, StringConversion) {
    for (const auto kind : { NodeKind::Start, NodeKind::End, NodeKind::Task, NodeKind::Gateway, NodeKind::Event })
        EXPECT_EQ(kind_from_string(to_string(kind)), kind);
    EXPECT_EQ(kind_from_string("Decision"), NodeKind::Gateway);
    EXPECT_FALSE(kind_from_string("task").has_value());
    EXPECT_FALSE(kind_from_string("").has_value());
}

// ─── Provider ─────────────────────────────────────────────────

TEST(GraphProviderTest, FetchReturnsStoredGraph) {
    InMemoryGraphProvider provider;
    provider.add(test_helpers::linear_graph());
    provider.add(test_helpers::diamond_graph());
    const auto g = provider.fetch_graph("diamond");
    EXPECT_EQ(g.node_count(), 5u);
    EXPECT_EQ(g.info().name, "diamond process");
}

TEST(GraphProviderTest, MissingProcessThrowsNotFound) {
    InMemoryGraphProvider provider;
    provider.add(test_helpers::linear_graph());
    try {
        provider.fetch_graph("other");
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.process_id(), "other");
    }
}

TEST(GraphProviderTest, ListIsOrderedById) {
    InMemoryGraphProvider provider;
    provider.add(test_helpers::linear_graph());
    provider.add(test_helpers::diamond_graph());
    provider.add(test_helpers::feedback_graph());
    const auto list = provider.list_processes();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].id, "diamond");
    EXPECT_EQ(list[1].id, "feedback");
    EXPECT_EQ(list[2].id, "linear");
    EXPECT_TRUE(provider.remove("linear"));
    EXPECT_FALSE(provider.remove("linear"));
    EXPECT_EQ(provider.size(), 2u);
}
