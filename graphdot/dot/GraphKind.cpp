/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <graphdot/dot/GraphKind.hpp>
#include <graphdot/util/common.hpp>

namespace graphdot::dot
{

std::string_view
GetKeyword(GraphKind kind)
{
  switch (kind)
  {
  case GraphKind::Digraph:
    return "digraph";
  case GraphKind::Graph:
    return "graph";
  default:
    GRAPHDOT_UNREACHABLE("Unknown GraphKind");
  }
}

std::string_view
GetEdgeOperator(GraphKind kind)
{
  switch (kind)
  {
  case GraphKind::Digraph:
    return "->";
  case GraphKind::Graph:
    return "--";
  default:
    GRAPHDOT_UNREACHABLE("Unknown GraphKind");
  }
}

}
