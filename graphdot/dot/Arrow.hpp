/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_ARROW_HPP
#define GRAPHDOT_DOT_ARROW_HPP

#include <initializer_list>
#include <string>
#include <vector>

namespace graphdot::dot
{

/**
 * Arrow modifier that determines if the shape is drawn as an outline or filled.
 */
enum class Fill
{
  Open,
  Filled
};

/**
 * Arrow modifier that clips the shape. Side::Left means only the left half is drawn.
 */
enum class Side
{
  Left,
  Right,
  Both
};

/**
 * One of the primitive arrow shapes of Graphviz, see https://graphviz.org/doc/info/arrows.html
 * Shapes that do not support a modifier ignore it.
 */
class ArrowShape final
{
public:
  enum class Type
  {
    None,
    Normal,
    Box,
    Crow,
    Curve,
    ICurve,
    Diamond,
    Dot,
    Inv,
    Tee,
    Vee
  };

  [[nodiscard]] static ArrowShape
  None()
  {
    return ArrowShape(Type::None, Fill::Filled, Side::Both);
  }

  [[nodiscard]] static ArrowShape
  Normal(Fill fill = Fill::Filled, Side side = Side::Both)
  {
    return ArrowShape(Type::Normal, fill, side);
  }

  [[nodiscard]] static ArrowShape
  Box(Fill fill = Fill::Filled, Side side = Side::Both)
  {
    return ArrowShape(Type::Box, fill, side);
  }

  [[nodiscard]] static ArrowShape
  Crow(Side side = Side::Both)
  {
    return ArrowShape(Type::Crow, Fill::Filled, side);
  }

  [[nodiscard]] static ArrowShape
  Curve(Side side = Side::Both)
  {
    return ArrowShape(Type::Curve, Fill::Filled, side);
  }

  [[nodiscard]] static ArrowShape
  ICurve(Fill fill = Fill::Filled, Side side = Side::Both)
  {
    return ArrowShape(Type::ICurve, fill, side);
  }

  [[nodiscard]] static ArrowShape
  Diamond(Fill fill = Fill::Filled, Side side = Side::Both)
  {
    return ArrowShape(Type::Diamond, fill, side);
  }

  [[nodiscard]] static ArrowShape
  Dot(Fill fill = Fill::Filled)
  {
    return ArrowShape(Type::Dot, fill, Side::Both);
  }

  [[nodiscard]] static ArrowShape
  Inv(Fill fill = Fill::Filled, Side side = Side::Both)
  {
    return ArrowShape(Type::Inv, fill, side);
  }

  [[nodiscard]] static ArrowShape
  Tee(Side side = Side::Both)
  {
    return ArrowShape(Type::Tee, Fill::Filled, side);
  }

  [[nodiscard]] static ArrowShape
  Vee(Side side = Side::Both)
  {
    return ArrowShape(Type::Vee, Fill::Filled, side);
  }

  [[nodiscard]] Type
  GetType() const noexcept
  {
    return Type_;
  }

  [[nodiscard]] Fill
  GetFill() const noexcept
  {
    return Fill_;
  }

  [[nodiscard]] Side
  GetSide() const noexcept
  {
    return Side_;
  }

  /**
   * @return the shape name with its modifiers, such as "onormal", "lcrow" or "dot"
   */
  [[nodiscard]] std::string
  ToDotString() const;

  bool
  operator==(const ArrowShape & other) const noexcept
  {
    return Type_ == other.Type_ && Fill_ == other.Fill_ && Side_ == other.Side_;
  }

  bool
  operator!=(const ArrowShape & other) const noexcept
  {
    return !(*this == other);
  }

private:
  ArrowShape(Type type, Fill fill, Side side)
      : Type_(type),
        Fill_(fill),
        Side_(side)
  {}

  Type Type_;
  Fill Fill_;
  Side Side_;
};

/**
 * The look of one end of an edge. Multiple shapes are drawn after each other,
 * with the first shape at the tip. An arrow without shapes leaves the Graphviz default in place.
 */
class Arrow final
{
public:
  /**
   * Creates the default arrow, for which no attribute is printed.
   */
  Arrow() = default;

  Arrow(std::initializer_list<ArrowShape> shapes)
      : Shapes_(shapes)
  {}

  explicit Arrow(std::vector<ArrowShape> shapes)
      : Shapes_(std::move(shapes))
  {}

  [[nodiscard]] static Arrow
  None()
  {
    return Arrow({ ArrowShape::None() });
  }

  [[nodiscard]] static Arrow
  Normal()
  {
    return Arrow({ ArrowShape::Normal() });
  }

  [[nodiscard]] static Arrow
  FromShape(const ArrowShape & shape)
  {
    return Arrow({ shape });
  }

  [[nodiscard]] bool
  IsDefault() const noexcept
  {
    return Shapes_.empty();
  }

  [[nodiscard]] const std::vector<ArrowShape> &
  GetShapes() const noexcept
  {
    return Shapes_;
  }

  /**
   * @return the concatenation of all shapes, as used by the arrowhead and arrowtail attributes
   */
  [[nodiscard]] std::string
  ToDotString() const;

  bool
  operator==(const Arrow & other) const noexcept
  {
    return Shapes_ == other.Shapes_;
  }

  bool
  operator!=(const Arrow & other) const noexcept
  {
    return !(*this == other);
  }

private:
  std::vector<ArrowShape> Shapes_;
};

}

#endif
