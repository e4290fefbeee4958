/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_STYLE_HPP
#define GRAPHDOT_DOT_STYLE_HPP

#include <string_view>

namespace graphdot::dot
{

/**
 * The style of a node, edge or subgraph.
 * See https://graphviz.org/docs/attr-types/style/ for descriptions.
 * Note that some of these are not valid for edges.
 */
enum class Style
{
  None, // no style attribute is printed
  Solid,
  Dashed,
  Dotted,
  Bold,
  Rounded,
  Diagonals,
  Filled,
  Striped,
  Wedged,
  Invisible
};

/**
 * @return the Graphviz keyword for \p style, or the empty string for Style::None
 */
[[nodiscard]] std::string_view
ToString(Style style);

/**
 * Rank constraint placed on all nodes of a subgraph.
 * See https://graphviz.org/docs/attr-types/rankType/
 */
enum class Rank
{
  Same,
  Min,
  Max,
  Source,
  Sink
};

[[nodiscard]] std::string_view
ToString(Rank rank);

}

#endif
