/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_EDGELISTGRAPH_HPP
#define GRAPHDOT_DOT_EDGELISTGRAPH_HPP

#include <graphdot/dot/GraphWalk.hpp>
#include <graphdot/dot/Labeller.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace graphdot::dot
{

/**
 * A graph given by a plain list of edges between node indices.
 * The nodes of the graph are exactly the endpoints of its edges, in ascending order.
 * Node i is named N<i>, and is labelled with its name.
 *
 * Edges are identified by their position in the edge list.
 */
class EdgeListGraph final : public GraphWalk<size_t, size_t>, public Labeller<size_t, size_t>
{
public:
  using EdgeEndpoints = std::pair<size_t, size_t>;

  ~EdgeListGraph() noexcept override;

  /**
   * Creates a graph named \p name with unlabelled edges.
   * @throws IdError if \p name is not a valid identifier.
   */
  EdgeListGraph(std::string name, std::vector<EdgeEndpoints> edges);

  /**
   * Creates a graph named \p name where edge i is labelled by \p edgeLabels[i].
   * The number of labels must match the number of edges.
   */
  EdgeListGraph(
      std::string name,
      std::vector<EdgeEndpoints> edges,
      std::vector<std::string> edgeLabels);

  [[nodiscard]] size_t
  NumEdges() const noexcept
  {
    return Edges_.size();
  }

  [[nodiscard]] std::vector<size_t>
  Nodes() const override;

  [[nodiscard]] std::vector<size_t>
  Edges() const override;

  [[nodiscard]] size_t
  Source(const size_t & edge) const override;

  [[nodiscard]] size_t
  Target(const size_t & edge) const override;

  [[nodiscard]] Id
  GraphId() const override;

  [[nodiscard]] Id
  NodeId(const size_t & node) const override;

  [[nodiscard]] Text
  EdgeLabel(const size_t & edge) const override;

private:
  Id Name_;
  std::vector<EdgeEndpoints> Edges_;
  std::vector<std::string> EdgeLabels_;
};

}

#endif
