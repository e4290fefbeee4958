/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_LABELLER_HPP
#define GRAPHDOT_DOT_LABELLER_HPP

#include <graphdot/dot/Arrow.hpp>
#include <graphdot/dot/GraphKind.hpp>
#include <graphdot/dot/GraphWalk.hpp>
#include <graphdot/dot/Id.hpp>
#include <graphdot/dot/Style.hpp>
#include <graphdot/dot/Text.hpp>

#include <optional>

namespace graphdot::dot
{

/**
 * Names and decorates the elements of a graph whose structure is described by a GraphWalk
 * with the same type parameters.
 *
 * Only the graph id and the node ids are required. Every other query has a default that leaves
 * the corresponding attribute out of the output.
 */
template<typename NodeType, typename EdgeType, typename SubgraphType = NoSubgraph>
class Labeller
{
public:
  virtual ~Labeller() noexcept = default;

  /**
   * @return the identifier naming the graph
   */
  [[nodiscard]] virtual Id
  GraphId() const = 0;

  /**
   * Maps \p node to its identifier in the .dot output.
   * Distinct nodes must have distinct identifiers. This is not checked, and
   * nodes sharing an identifier are merged by Graphviz.
   */
  [[nodiscard]] virtual Id
  NodeId(const NodeType & node) const = 0;

  /**
   * @return the label of \p node. Need not be unique. Defaults to the node id.
   */
  [[nodiscard]] virtual Text
  NodeLabel(const NodeType & node) const
  {
    return Text::Label(NodeId(node).GetName());
  }

  [[nodiscard]] virtual Style
  NodeStyle([[maybe_unused]] const NodeType & node) const
  {
    return Style::None;
  }

  /**
   * Maps \p node to a Graphviz color name, see https://graphviz.org/doc/info/colors.html
   * If std::nullopt is returned, no color attribute is printed.
   */
  [[nodiscard]] virtual std::optional<Text>
  NodeColor([[maybe_unused]] const NodeType & node) const
  {
    return std::nullopt;
  }

  /**
   * Maps \p node to a Graphviz shape name, see https://graphviz.org/doc/info/shapes.html
   * If std::nullopt is returned, no shape attribute is printed.
   */
  [[nodiscard]] virtual std::optional<Text>
  NodeShape([[maybe_unused]] const NodeType & node) const
  {
    return std::nullopt;
  }

  /**
   * @return the label of \p edge. Defaults to the empty string.
   */
  [[nodiscard]] virtual Text
  EdgeLabel([[maybe_unused]] const EdgeType & edge) const
  {
    return Text::Label("");
  }

  [[nodiscard]] virtual Style
  EdgeStyle([[maybe_unused]] const EdgeType & edge) const
  {
    return Style::None;
  }

  [[nodiscard]] virtual std::optional<Text>
  EdgeColor([[maybe_unused]] const EdgeType & edge) const
  {
    return std::nullopt;
  }

  /**
   * @return the arrow drawn at the source end of \p edge
   */
  [[nodiscard]] virtual Arrow
  EdgeStartArrow([[maybe_unused]] const EdgeType & edge) const
  {
    return Arrow();
  }

  /**
   * @return the arrow drawn at the target end of \p edge
   */
  [[nodiscard]] virtual Arrow
  EdgeEndArrow([[maybe_unused]] const EdgeType & edge) const
  {
    return Arrow();
  }

  /**
   * Maps \p subgraph to its identifier. Prefix the identifier with `cluster_` to have Graphviz
   * draw the subgraph in its own rectangle. If std::nullopt is returned, the subgraph is
   * printed as an anonymous block.
   */
  [[nodiscard]] virtual std::optional<Id>
  SubgraphId([[maybe_unused]] const SubgraphType & subgraph) const
  {
    return std::nullopt;
  }

  [[nodiscard]] virtual Text
  SubgraphLabel([[maybe_unused]] const SubgraphType & subgraph) const
  {
    return Text::Label("");
  }

  [[nodiscard]] virtual Style
  SubgraphStyle([[maybe_unused]] const SubgraphType & subgraph) const
  {
    return Style::None;
  }

  [[nodiscard]] virtual std::optional<Text>
  SubgraphColor([[maybe_unused]] const SubgraphType & subgraph) const
  {
    return std::nullopt;
  }

  /**
   * Maps \p subgraph to the default shape of its member nodes.
   */
  [[nodiscard]] virtual std::optional<Text>
  SubgraphShape([[maybe_unused]] const SubgraphType & subgraph) const
  {
    return std::nullopt;
  }

  /**
   * @return a rank constraint for all members of \p subgraph, or std::nullopt for none
   */
  [[nodiscard]] virtual std::optional<Rank>
  SubgraphRank([[maybe_unused]] const SubgraphType & subgraph) const
  {
    return std::nullopt;
  }

  [[nodiscard]] virtual GraphKind
  GetGraphKind() const
  {
    return GraphKind::Digraph;
  }
};

}

#endif
