/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <graphdot/dot/Text.hpp>
#include <graphdot/util/common.hpp>

namespace graphdot::dot
{

/**
 * Appends \p string to \p out between double quotes, escaping quotes and line breaks.
 * If \p escapeBackslash is false, backslashes start escape sequences, and a backslash followed
 * by a quote or another backslash is copied unchanged.
 */
static void
AppendQuoted(std::string & out, std::string_view string, bool escapeBackslash)
{
  out += '"';
  for (size_t i = 0; i < string.size(); i++)
  {
    char c = string[i];
    if (c == '\\')
    {
      // A lone backslash before the closing quote would escape it
      if (escapeBackslash || i + 1 == string.size())
      {
        out += "\\\\";
        continue;
      }

      out += c;
      char next = string[i + 1];
      if (next == '\\' || next == '"')
      {
        out += next;
        i++;
      }
    }
    else if (c == '"')
      out += "\\\"";
    else if (c == '\n')
      out += "\\n";
    else if (c == '\r')
      out += "\\r";
    else if (c == '\t')
      out += "\\t";
    else
      out += c;
  }
  out += '"';
}

std::string
Text::ToDotString() const
{
  std::string result;
  result.reserve(Content_.size() + 2);

  switch (Type_)
  {
  case Type::Label:
    AppendQuoted(result, Content_, true);
    break;
  case Type::Escaped:
    AppendQuoted(result, Content_, false);
    break;
  case Type::Html:
    result += '<';
    result += Content_;
    result += '>';
    break;
  default:
    GRAPHDOT_UNREACHABLE("Unknown Text::Type");
  }

  return result;
}

std::string
Text::PreEscapedContent() const
{
  if (Type_ != Type::Label)
    return Content_;

  std::string result;
  result.reserve(Content_.size());
  for (char c : Content_)
  {
    if (c == '\\')
      result += "\\\\";
    else
      result += c;
  }
  return result;
}

Text
Text::SuffixLine(const Text & suffix) const
{
  auto content = PreEscapedContent();
  content += "\\n\\n";
  content += suffix.PreEscapedContent();
  return Escaped(std::move(content));
}

std::string
EscapeHtml(std::string_view string)
{
  std::string result;
  result.reserve(string.size());
  for (char c : string)
  {
    if (c == '&')
      result += "&amp;";
    else if (c == '"')
      result += "&quot;";
    else if (c == '<')
      result += "&lt;";
    else if (c == '>')
      result += "&gt;";
    else
      result += c;
  }
  return result;
}

}
