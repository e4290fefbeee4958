/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_GRAPHWALK_HPP
#define GRAPHDOT_DOT_GRAPHWALK_HPP

#include <vector>

namespace graphdot::dot
{

/**
 * Subgraph type for graphs that never have subgraphs.
 */
struct NoSubgraph
{};

/**
 * The structure of a graph made up of node handles \tparam NodeType and edge handles
 * \tparam EdgeType, where each edge can be mapped to its source and target node.
 * Nodes may also be grouped into subgraphs, identified by handles of \tparam SubgraphType.
 *
 * Handles are plain values, such as indices or pointers, owned by the implementer.
 * During a single rendering, repeated calls must return the same elements.
 */
template<typename NodeType, typename EdgeType, typename SubgraphType = NoSubgraph>
class GraphWalk
{
public:
  virtual ~GraphWalk() noexcept = default;

  /**
   * @return all the nodes of the graph
   */
  [[nodiscard]] virtual std::vector<NodeType>
  Nodes() const = 0;

  /**
   * @return all the edges of the graph
   */
  [[nodiscard]] virtual std::vector<EdgeType>
  Edges() const = 0;

  [[nodiscard]] virtual NodeType
  Source(const EdgeType & edge) const = 0;

  [[nodiscard]] virtual NodeType
  Target(const EdgeType & edge) const = 0;

  /**
   * @return all subgraphs of the graph. By default there are none.
   */
  [[nodiscard]] virtual std::vector<SubgraphType>
  Subgraphs() const
  {
    return {};
  }

  /**
   * @return the nodes that are members of \p subgraph. A node can be in several subgraphs.
   */
  [[nodiscard]] virtual std::vector<NodeType>
  SubgraphNodes([[maybe_unused]] const SubgraphType & subgraph) const
  {
    return {};
  }
};

}

#endif
