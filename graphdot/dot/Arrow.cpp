/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <graphdot/dot/Arrow.hpp>
#include <graphdot/util/common.hpp>

namespace graphdot::dot
{

static const char *
GetShapeName(ArrowShape::Type type)
{
  switch (type)
  {
  case ArrowShape::Type::None:
    return "none";
  case ArrowShape::Type::Normal:
    return "normal";
  case ArrowShape::Type::Box:
    return "box";
  case ArrowShape::Type::Crow:
    return "crow";
  case ArrowShape::Type::Curve:
    return "curve";
  case ArrowShape::Type::ICurve:
    return "icurve";
  case ArrowShape::Type::Diamond:
    return "diamond";
  case ArrowShape::Type::Dot:
    return "dot";
  case ArrowShape::Type::Inv:
    return "inv";
  case ArrowShape::Type::Tee:
    return "tee";
  case ArrowShape::Type::Vee:
    return "vee";
  default:
    GRAPHDOT_UNREACHABLE("Unknown ArrowShape::Type");
  }
}

static bool
SupportsFill(ArrowShape::Type type)
{
  switch (type)
  {
  case ArrowShape::Type::Normal:
  case ArrowShape::Type::Box:
  case ArrowShape::Type::ICurve:
  case ArrowShape::Type::Diamond:
  case ArrowShape::Type::Dot:
  case ArrowShape::Type::Inv:
    return true;
  default:
    return false;
  }
}

static bool
SupportsSide(ArrowShape::Type type)
{
  return type != ArrowShape::Type::None && type != ArrowShape::Type::Dot;
}

std::string
ArrowShape::ToDotString() const
{
  std::string result;

  if (SupportsFill(Type_) && Fill_ == Fill::Open)
    result += 'o';

  if (SupportsSide(Type_))
  {
    if (Side_ == Side::Left)
      result += 'l';
    else if (Side_ == Side::Right)
      result += 'r';
  }

  result += GetShapeName(Type_);
  return result;
}

std::string
Arrow::ToDotString() const
{
  std::string result;
  for (auto & shape : Shapes_)
    result += shape.ToDotString();
  return result;
}

}
