/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_RENDERER_HPP
#define GRAPHDOT_DOT_RENDERER_HPP

#include <graphdot/dot/GraphWalk.hpp>
#include <graphdot/dot/Labeller.hpp>
#include <graphdot/util/common.hpp>
#include <graphdot/util/Statistics.hpp>
#include <graphdot/util/strfmt.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_set>

namespace graphdot::dot
{

/**
 * Thrown when the output stream fails while a graph is being rendered.
 * Statements that were already written remain in the stream.
 */
class WriteFailure final : public util::Error
{
public:
  ~WriteFailure() noexcept override;

  explicit WriteFailure(const std::string & msg)
      : util::Error("Failed to write DOT output: " + msg)
  {}
};

/**
 * Options that change how a graph is rendered.
 */
class RenderConfiguration final
{
public:
  enum class Option
  {
    NoNodeLabels,
    NoEdgeLabels,
    NoNodeStyles,
    NoEdgeStyles,
    NoNodeColors,
    NoEdgeColors,
    NoArrows,

    /**
     * White text and lines on a black background.
     */
    DarkTheme
  };

  RenderConfiguration() = default;

  explicit RenderConfiguration(std::unordered_set<Option> options)
      : Options_(std::move(options))
  {}

  [[nodiscard]] bool
  IsEnabled(Option option) const noexcept
  {
    return Options_.find(option) != Options_.end();
  }

  void
  Enable(Option option)
  {
    Options_.insert(option);
  }

  void
  Disable(Option option)
  {
    Options_.erase(option);
  }

  [[nodiscard]] const std::optional<std::string> &
  GetFontName() const noexcept
  {
    return FontName_;
  }

  /**
   * Sets the font used for the graph label, all nodes and all edges.
   */
  void
  SetFontName(std::string fontName)
  {
    FontName_ = std::move(fontName);
  }

  /**
   * @return true if the configuration requires graph, node and edge default attributes
   */
  [[nodiscard]] bool
  HasGlobalAttributes() const noexcept
  {
    return FontName_.has_value() || IsEnabled(Option::DarkTheme);
  }

  /**
   * @return the space separated attributes of the graph[...] statement
   */
  [[nodiscard]] std::string
  GetGraphAttributes() const;

  /**
   * @return the space separated attributes of the node[...] and edge[...] statements
   */
  [[nodiscard]] std::string
  GetContentAttributes() const;

private:
  std::unordered_set<Option> Options_;
  std::optional<std::string> FontName_;
};

/**
 * Statistics collected for every rendered graph.
 */
class RenderStatistics final : public util::Statistics
{
public:
  ~RenderStatistics() override;

  explicit RenderStatistics(std::string graphName)
      : util::Statistics(util::Statistics::Id::DotRendering, std::move(graphName))
  {}

  void
  Start();

  void
  Stop(size_t numSubgraphs, size_t numNodes, size_t numEdges, uint64_t numBytes);

  static std::unique_ptr<RenderStatistics>
  Create(std::string graphName)
  {
    return std::make_unique<RenderStatistics>(std::move(graphName));
  }
};

namespace detail
{

/**
 * Writes complete lines to the output stream, and turns stream failures into WriteFailure.
 * A line is assembled in memory before it is handed to the stream in a single write.
 */
class StatementWriter final
{
public:
  explicit StatementWriter(std::ostream & out)
      : Out_(out),
        NumBytesWritten_(0)
  {}

  StatementWriter(const StatementWriter &) = delete;

  StatementWriter &
  operator=(const StatementWriter &) = delete;

  /**
   * Writes \p statement indented by \p indent levels, followed by a newline.
   * @throws WriteFailure if the stream is, or ends up, in a failed state.
   */
  void
  WriteLine(size_t indent, std::string_view statement);

  [[nodiscard]] uint64_t
  NumBytesWritten() const noexcept
  {
    return NumBytesWritten_;
  }

private:
  std::ostream & Out_;
  uint64_t NumBytesWritten_;
};

/**
 * Appends the attribute [name=value] to \p statement.
 */
void
AppendAttribute(std::string & statement, std::string_view name, std::string_view value);

/**
 * Appends the attribute [name="value"] to \p statement, for Graphviz keywords such as styles.
 */
void
AppendQuotedAttribute(std::string & statement, std::string_view name, std::string_view value);

/**
 * Appends the arrowhead / arrowtail attributes of an edge to \p statement.
 * Nothing is appended if both arrows are default.
 */
void
AppendArrows(std::string & statement, const Arrow & startArrow, const Arrow & endArrow);

template<typename NodeType, typename EdgeType, typename SubgraphType>
void
RenderSubgraph(
    const GraphWalk<NodeType, EdgeType, SubgraphType> & walk,
    const Labeller<NodeType, EdgeType, SubgraphType> & labeller,
    const SubgraphType & subgraph,
    StatementWriter & writer)
{
  if (auto id = labeller.SubgraphId(subgraph))
    writer.WriteLine(1, util::strfmt("subgraph ", id->ToDotString(), " {"));
  else
    writer.WriteLine(1, "{");

  writer.WriteLine(2, util::strfmt("label=", labeller.SubgraphLabel(subgraph).ToDotString(), ";"));

  const auto style = labeller.SubgraphStyle(subgraph);
  if (style != Style::None)
    writer.WriteLine(2, util::strfmt("style=\"", ToString(style), "\";"));

  if (auto color = labeller.SubgraphColor(subgraph))
    writer.WriteLine(2, util::strfmt("color=", color->ToDotString(), ";"));

  if (auto shape = labeller.SubgraphShape(subgraph))
    writer.WriteLine(2, util::strfmt("node[shape=", shape->ToDotString(), "];"));

  if (auto rank = labeller.SubgraphRank(subgraph))
    writer.WriteLine(2, util::strfmt("rank=", ToString(*rank), ";"));

  writer.WriteLine(0, "");

  for (auto & node : walk.SubgraphNodes(subgraph))
    writer.WriteLine(2, labeller.NodeId(node).ToDotString() + ";");

  writer.WriteLine(1, "}");
  writer.WriteLine(0, "");
}

template<typename NodeType, typename EdgeType, typename SubgraphType>
std::string
CreateNodeStatement(
    const Labeller<NodeType, EdgeType, SubgraphType> & labeller,
    const NodeType & node,
    const RenderConfiguration & configuration)
{
  using Option = RenderConfiguration::Option;

  auto statement = labeller.NodeId(node).ToDotString();

  if (!configuration.IsEnabled(Option::NoNodeLabels))
    AppendAttribute(statement, "label", labeller.NodeLabel(node).ToDotString());

  const auto style = labeller.NodeStyle(node);
  if (!configuration.IsEnabled(Option::NoNodeStyles) && style != Style::None)
    AppendQuotedAttribute(statement, "style", ToString(style));

  if (!configuration.IsEnabled(Option::NoNodeColors))
  {
    if (auto color = labeller.NodeColor(node))
      AppendAttribute(statement, "color", color->ToDotString());
  }

  if (auto shape = labeller.NodeShape(node))
    AppendAttribute(statement, "shape", shape->ToDotString());

  statement += ';';
  return statement;
}

template<typename NodeType, typename EdgeType, typename SubgraphType>
std::string
CreateEdgeStatement(
    const GraphWalk<NodeType, EdgeType, SubgraphType> & walk,
    const Labeller<NodeType, EdgeType, SubgraphType> & labeller,
    const EdgeType & edge,
    GraphKind kind,
    const RenderConfiguration & configuration)
{
  using Option = RenderConfiguration::Option;

  const auto sourceId = labeller.NodeId(walk.Source(edge));
  const auto targetId = labeller.NodeId(walk.Target(edge));

  auto statement = util::strfmt(
      sourceId.ToDotString(),
      " ",
      GetEdgeOperator(kind),
      " ",
      targetId.ToDotString());

  if (!configuration.IsEnabled(Option::NoEdgeLabels))
    AppendAttribute(statement, "label", labeller.EdgeLabel(edge).ToDotString());

  const auto style = labeller.EdgeStyle(edge);
  if (!configuration.IsEnabled(Option::NoEdgeStyles) && style != Style::None)
    AppendQuotedAttribute(statement, "style", ToString(style));

  if (!configuration.IsEnabled(Option::NoEdgeColors))
  {
    if (auto color = labeller.EdgeColor(edge))
      AppendAttribute(statement, "color", color->ToDotString());
  }

  if (!configuration.IsEnabled(Option::NoArrows))
    AppendArrows(statement, labeller.EdgeStartArrow(edge), labeller.EdgeEndArrow(edge));

  statement += ';';
  return statement;
}

}

/**
 * Renders the graph described by \p walk and \p labeller to \p out in DOT syntax.
 *
 * Subgraphs are printed first, listing only the ids of their members. They are followed by
 * one statement per node, carrying the node attributes, and one statement per edge.
 * Everything is printed in the order the GraphWalk enumerates it.
 *
 * The graph id is requested before anything is written. Statistics about the rendering are
 * handed to \p statisticsCollector.
 *
 * @throws WriteFailure if \p out fails. Rendering stops at the first failed statement.
 */
template<typename NodeType, typename EdgeType, typename SubgraphType>
void
Render(
    const GraphWalk<NodeType, EdgeType, SubgraphType> & walk,
    const Labeller<NodeType, EdgeType, SubgraphType> & labeller,
    std::ostream & out,
    const RenderConfiguration & configuration,
    util::StatisticsCollector & statisticsCollector)
{
  const auto graphId = labeller.GraphId();
  const auto kind = labeller.GetGraphKind();

  auto statistics = RenderStatistics::Create(graphId.GetName());
  statistics->Start();

  detail::StatementWriter writer(out);
  writer.WriteLine(0, util::strfmt(GetKeyword(kind), " ", graphId.ToDotString(), " {"));

  if (configuration.HasGlobalAttributes())
  {
    const auto contentAttributes = configuration.GetContentAttributes();
    writer.WriteLine(1, "graph[" + configuration.GetGraphAttributes() + "];");
    writer.WriteLine(1, "node[" + contentAttributes + "];");
    writer.WriteLine(1, "edge[" + contentAttributes + "];");
  }

  const auto subgraphs = walk.Subgraphs();
  for (auto & subgraph : subgraphs)
    detail::RenderSubgraph(walk, labeller, subgraph, writer);

  const auto nodes = walk.Nodes();
  for (auto & node : nodes)
    writer.WriteLine(1, detail::CreateNodeStatement(labeller, node, configuration));

  const auto edges = walk.Edges();
  for (auto & edge : edges)
    writer.WriteLine(1, detail::CreateEdgeStatement(walk, labeller, edge, kind, configuration));

  writer.WriteLine(0, "}");

  statistics->Stop(subgraphs.size(), nodes.size(), edges.size(), writer.NumBytesWritten());
  statisticsCollector.CollectDemandedStatistics(std::move(statistics));
}

/**
 * Renders without collecting statistics.
 */
template<typename NodeType, typename EdgeType, typename SubgraphType>
void
Render(
    const GraphWalk<NodeType, EdgeType, SubgraphType> & walk,
    const Labeller<NodeType, EdgeType, SubgraphType> & labeller,
    std::ostream & out,
    const RenderConfiguration & configuration = RenderConfiguration())
{
  util::StatisticsCollector statisticsCollector;
  Render(walk, labeller, out, configuration, statisticsCollector);
}

/**
 * Renders \p graph, which must implement both GraphWalk and Labeller.
 */
template<typename GraphType>
void
Render(
    const GraphType & graph,
    std::ostream & out,
    const RenderConfiguration & configuration,
    util::StatisticsCollector & statisticsCollector)
{
  Render(graph, graph, out, configuration, statisticsCollector);
}

template<typename GraphType>
void
Render(
    const GraphType & graph,
    std::ostream & out,
    const RenderConfiguration & configuration = RenderConfiguration())
{
  util::StatisticsCollector statisticsCollector;
  Render(graph, graph, out, configuration, statisticsCollector);
}

}

#endif
