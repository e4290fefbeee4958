/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_DOT_TEXT_HPP
#define GRAPHDOT_DOT_TEXT_HPP

#include <string>
#include <string_view>

namespace graphdot::dot
{

/**
 * The text of a Graphviz label, color or shape attribute.
 * The content must be UTF-8. It is not validated.
 */
class Text final
{
public:
  enum class Type
  {
    /**
     * The text is shown as is. Backslashes, quotes and line breaks are escaped, and thus appear
     * literally in the rendered label.
     */
    Label,

    /**
     * The text is a Graphviz escString: https://graphviz.org/docs/attr-types/escString/
     * Backslashes are not escaped, and start escape sequences such as \\n (centered line break),
     * \\l (left-justified line break) and \\r (right-justified line break).
     * A backslash and the character following it are kept together, so \\" is a literal quote.
     * A backslash ending the text is doubled.
     */
    Escaped,

    /**
     * The text is a Graphviz HTML-like label: https://graphviz.org/doc/info/shapes.html#html
     * It is printed between < and > with no escaping at all.
     */
    Html
  };

  [[nodiscard]] static Text
  Label(std::string content)
  {
    return Text(Type::Label, std::move(content));
  }

  [[nodiscard]] static Text
  Escaped(std::string content)
  {
    return Text(Type::Escaped, std::move(content));
  }

  [[nodiscard]] static Text
  Html(std::string content)
  {
    return Text(Type::Html, std::move(content));
  }

  [[nodiscard]] Type
  GetType() const noexcept
  {
    return Type_;
  }

  [[nodiscard]] const std::string &
  GetContent() const noexcept
  {
    return Content_;
  }

  /**
   * Renders the text as it appears in a .dot file, including quotes or angle brackets.
   */
  [[nodiscard]] std::string
  ToDotString() const;

  /**
   * Puts \p suffix on a line below this text, with a blank line in between.
   * The result is an Escaped text that renders both parts the same way they render on their own.
   */
  [[nodiscard]] Text
  SuffixLine(const Text & suffix) const;

  bool
  operator==(const Text & other) const noexcept
  {
    return Type_ == other.Type_ && Content_ == other.Content_;
  }

  bool
  operator!=(const Text & other) const noexcept
  {
    return !(*this == other);
  }

private:
  Text(Type type, std::string content)
      : Type_(type),
        Content_(std::move(content))
  {}

  /**
   * Converts the content into a string that, used as Escaped content, renders identically.
   */
  [[nodiscard]] std::string
  PreEscapedContent() const;

  Type Type_;
  std::string Content_;
};

/**
 * Escapes \p string for inclusion in a Graphviz HTML-like label.
 */
[[nodiscard]] std::string
EscapeHtml(std::string_view string);

}

#endif
