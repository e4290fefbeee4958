/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <gtest/gtest.h>

#include <graphdot/dot/EdgeListGraph.hpp>

TEST(EdgeListGraphTests, TestStructure)
{
  using namespace graphdot::dot;

  // Arrange
  EdgeListGraph graph("g", { { 3, 1 }, { 1, 5 }, { 5, 5 } });

  // Act
  auto nodes = graph.Nodes();
  auto edges = graph.Edges();

  // Assert
  EXPECT_EQ(nodes, (std::vector<size_t>{ 1, 3, 5 }));
  EXPECT_EQ(edges, (std::vector<size_t>{ 0, 1, 2 }));
  EXPECT_EQ(graph.NumEdges(), 3u);
  EXPECT_EQ(graph.Source(0), 3u);
  EXPECT_EQ(graph.Target(0), 1u);
  EXPECT_EQ(graph.Source(2), 5u);
  EXPECT_EQ(graph.Target(2), 5u);
}

TEST(EdgeListGraphTests, TestLabels)
{
  using namespace graphdot::dot;

  EdgeListGraph graph("my_graph", { { 0, 1 }, { 1, 2 } }, { "first", "" });

  EXPECT_EQ(graph.GraphId(), Id("my_graph"));
  EXPECT_EQ(graph.NodeId(7), Id("N7"));
  EXPECT_EQ(graph.NodeLabel(7), Text::Label("N7"));
  EXPECT_EQ(graph.EdgeLabel(0), Text::Label("first"));
  EXPECT_EQ(graph.EdgeLabel(1), Text::Label(""));
  EXPECT_EQ(graph.GetGraphKind(), GraphKind::Digraph);
  EXPECT_TRUE(graph.Subgraphs().empty());

  EdgeListGraph unlabelled("u", { { 0, 1 } });
  EXPECT_EQ(unlabelled.EdgeLabel(0), Text::Label(""));
}

TEST(EdgeListGraphTests, TestEmptyGraph)
{
  using namespace graphdot::dot;

  EdgeListGraph graph("empty_graph", {});

  EXPECT_TRUE(graph.Nodes().empty());
  EXPECT_TRUE(graph.Edges().empty());
}

TEST(EdgeListGraphTests, TestErrors)
{
  using namespace graphdot::dot;

  EXPECT_THROW(EdgeListGraph("", { { 0, 1 } }), IdError);
  EXPECT_THROW(EdgeListGraph("bad\\name", { { 0, 1 } }), IdError);
  EXPECT_THROW(
      EdgeListGraph("g", { { 0, 1 }, { 1, 2 } }, { "only one" }),
      graphdot::util::Error);
}
