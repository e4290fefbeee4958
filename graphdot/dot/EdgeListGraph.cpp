/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <graphdot/dot/EdgeListGraph.hpp>
#include <graphdot/util/strfmt.hpp>

#include <algorithm>

namespace graphdot::dot
{

EdgeListGraph::~EdgeListGraph() noexcept = default;

EdgeListGraph::EdgeListGraph(std::string name, std::vector<EdgeEndpoints> edges)
    : Name_(std::move(name)),
      Edges_(std::move(edges)),
      EdgeLabels_(Edges_.size())
{}

EdgeListGraph::EdgeListGraph(
    std::string name,
    std::vector<EdgeEndpoints> edges,
    std::vector<std::string> edgeLabels)
    : Name_(std::move(name)),
      Edges_(std::move(edges)),
      EdgeLabels_(std::move(edgeLabels))
{
  if (EdgeLabels_.size() != Edges_.size())
    throw util::Error(util::strfmt(
        "Expected ",
        Edges_.size(),
        " edge labels, got ",
        EdgeLabels_.size()));
}

std::vector<size_t>
EdgeListGraph::Nodes() const
{
  std::vector<size_t> nodes;
  nodes.reserve(Edges_.size() * 2);
  for (auto & [source, target] : Edges_)
  {
    nodes.push_back(source);
    nodes.push_back(target);
  }

  std::sort(nodes.begin(), nodes.end());
  nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
  return nodes;
}

std::vector<size_t>
EdgeListGraph::Edges() const
{
  std::vector<size_t> edges(Edges_.size());
  for (size_t i = 0; i < edges.size(); i++)
    edges[i] = i;
  return edges;
}

size_t
EdgeListGraph::Source(const size_t & edge) const
{
  GRAPHDOT_ASSERT(edge < Edges_.size());
  return Edges_[edge].first;
}

size_t
EdgeListGraph::Target(const size_t & edge) const
{
  GRAPHDOT_ASSERT(edge < Edges_.size());
  return Edges_[edge].second;
}

Id
EdgeListGraph::GraphId() const
{
  return Name_;
}

Id
EdgeListGraph::NodeId(const size_t & node) const
{
  return Id(util::strfmt("N", node));
}

Text
EdgeListGraph::EdgeLabel(const size_t & edge) const
{
  GRAPHDOT_ASSERT(edge < EdgeLabels_.size());
  return Text::Label(EdgeLabels_[edge]);
}

}
