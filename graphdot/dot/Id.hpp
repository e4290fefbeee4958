/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_ID_HPP
#define GRAPHDOT_DOT_ID_HPP

#include <graphdot/util/common.hpp>

#include <string>
#include <string_view>

namespace graphdot::dot
{

/**
 * Thrown when a string can not be represented as a DOT identifier.
 */
class IdError final : public util::Error
{
public:
  ~IdError() noexcept override;

  explicit IdError(std::string_view candidate);
};

/**
 * A Graphviz ID, used to name graphs, subgraphs and nodes.
 *
 * Names matching the regular expression `[A-Za-z_][A-Za-z0-9_]*` that are not DOT keywords
 * are printed verbatim. All other names are printed as double-quoted strings, with embedded
 * quotes escaped. A name is rejected if it is empty, is not well-formed UTF-8, or contains a
 * backslash or an ASCII control character, since these can not be passed through a quoted ID
 * unchanged.
 */
class Id final
{
public:
  /**
   * Creates an Id named \p name.
   * @throws IdError if \p name can not be represented.
   */
  explicit Id(std::string name);

  /**
   * @return true if \p name can be used to construct an Id
   */
  [[nodiscard]] static bool
  IsValid(std::string_view name) noexcept;

  /**
   * @return true if \p name can be printed in DOT without quotes.
   */
  [[nodiscard]] static bool
  IsPlainIdentifier(std::string_view name) noexcept;

  [[nodiscard]] const std::string &
  GetName() const noexcept
  {
    return Name_;
  }

  /**
   * @return true if the Id needs quotes when printed
   */
  [[nodiscard]] bool
  IsQuoted() const noexcept
  {
    return !IsPlainIdentifier(Name_);
  }

  /**
   * @return the Id as it appears in a .dot file, including quotes if needed
   */
  [[nodiscard]] std::string
  ToDotString() const;

  bool
  operator==(const Id & other) const noexcept
  {
    return Name_ == other.Name_;
  }

  bool
  operator!=(const Id & other) const noexcept
  {
    return !(*this == other);
  }

private:
  std::string Name_;
};

}

#endif
