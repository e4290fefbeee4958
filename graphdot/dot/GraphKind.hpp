/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_GRAPHKIND_HPP
#define GRAPHDOT_DOT_GRAPHKIND_HPP

#include <string_view>

namespace graphdot::dot
{

/**
 * Determines whether a graph is printed as a `digraph` or an undirected `graph`.
 */
enum class GraphKind
{
  Digraph,
  Graph
};

/**
 * @return the keyword that opens a graph of the given \p kind
 */
[[nodiscard]] std::string_view
GetKeyword(GraphKind kind);

/**
 * @return the edge operator used in a graph of the given \p kind, "->" or "--"
 */
[[nodiscard]] std::string_view
GetEdgeOperator(GraphKind kind);

}

#endif
