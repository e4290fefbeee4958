/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <graphdot/dot/Style.hpp>
#include <graphdot/util/common.hpp>

namespace graphdot::dot
{

std::string_view
ToString(Style style)
{
  switch (style)
  {
  case Style::None:
    return "";
  case Style::Solid:
    return "solid";
  case Style::Dashed:
    return "dashed";
  case Style::Dotted:
    return "dotted";
  case Style::Bold:
    return "bold";
  case Style::Rounded:
    return "rounded";
  case Style::Diagonals:
    return "diagonals";
  case Style::Filled:
    return "filled";
  case Style::Striped:
    return "striped";
  case Style::Wedged:
    return "wedged";
  case Style::Invisible:
    return "invis";
  default:
    GRAPHDOT_UNREACHABLE("Unknown Style");
  }
}

std::string_view
ToString(Rank rank)
{
  switch (rank)
  {
  case Rank::Same:
    return "same";
  case Rank::Min:
    return "min";
  case Rank::Max:
    return "max";
  case Rank::Source:
    return "source";
  case Rank::Sink:
    return "sink";
  default:
    GRAPHDOT_UNREACHABLE("Unknown Rank");
  }
}

}
