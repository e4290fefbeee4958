/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <graphdot/dot/Id.hpp>
#include <graphdot/util/strfmt.hpp>

#include <array>
#include <cstdint>

namespace graphdot::dot
{

// We avoid C's isalpha, as it is locale dependent
static bool
IsAlpha(char c)
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool
IsDigit(char c)
{
  return c >= '0' && c <= '9';
}

static char
ToLower(char c)
{
  if (c >= 'A' && c <= 'Z')
    return static_cast<char>(c - 'A' + 'a');
  return c;
}

/**
 * DOT keywords are case-insensitive, and are only valid as IDs when quoted.
 */
static bool
IsKeyword(std::string_view name)
{
  static const std::array<std::string_view, 6> keywords = {
    "node", "edge", "graph", "digraph", "subgraph", "strict"
  };

  for (auto keyword : keywords)
  {
    if (keyword.size() != name.size())
      continue;

    bool equal = true;
    for (size_t i = 0; i < name.size() && equal; i++)
      equal = ToLower(name[i]) == keyword[i];

    if (equal)
      return true;
  }

  return false;
}

/**
 * Checks that \p string is well-formed UTF-8. Overlong encodings, surrogates and
 * code points above U+10FFFF are rejected.
 */
static bool
IsValidUtf8(std::string_view string)
{
  size_t i = 0;
  while (i < string.size())
  {
    auto byte = static_cast<unsigned char>(string[i]);
    if (byte < 0x80)
    {
      i++;
      continue;
    }

    size_t length;
    uint32_t codePoint;
    uint32_t minCodePoint;
    if ((byte & 0xE0) == 0xC0)
    {
      length = 2;
      codePoint = byte & 0x1F;
      minCodePoint = 0x80;
    }
    else if ((byte & 0xF0) == 0xE0)
    {
      length = 3;
      codePoint = byte & 0x0F;
      minCodePoint = 0x800;
    }
    else if ((byte & 0xF8) == 0xF0)
    {
      length = 4;
      codePoint = byte & 0x07;
      minCodePoint = 0x10000;
    }
    else
    {
      // Continuation byte without a lead byte, or an invalid lead byte
      return false;
    }

    if (i + length > string.size())
      return false;

    for (size_t n = 1; n < length; n++)
    {
      auto continuation = static_cast<unsigned char>(string[i + n]);
      if ((continuation & 0xC0) != 0x80)
        return false;
      codePoint = (codePoint << 6) | (continuation & 0x3F);
    }

    if (codePoint < minCodePoint || codePoint > 0x10FFFF)
      return false;
    if (codePoint >= 0xD800 && codePoint <= 0xDFFF)
      return false;

    i += length;
  }

  return true;
}

IdError::~IdError() noexcept = default;

IdError::IdError(std::string_view candidate)
    : util::Error(util::strfmt("Invalid DOT identifier: \"", candidate, "\""))
{}

Id::Id(std::string name)
    : Name_(std::move(name))
{
  if (!IsValid(Name_))
    throw IdError(Name_);
}

bool
Id::IsValid(std::string_view name) noexcept
{
  if (name.empty())
    return false;

  for (char c : name)
  {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7F || c == '\\')
      return false;
  }

  return IsValidUtf8(name);
}

bool
Id::IsPlainIdentifier(std::string_view name) noexcept
{
  if (name.empty())
    return false;

  char firstChar = name[0];
  if (!IsAlpha(firstChar) && firstChar != '_')
    return false;

  for (char c : name)
    if (!IsAlpha(c) && !IsDigit(c) && c != '_')
      return false;

  return !IsKeyword(name);
}

std::string
Id::ToDotString() const
{
  if (!IsQuoted())
    return Name_;

  std::string result;
  result.reserve(Name_.size() + 2);
  result += '"';
  for (char c : Name_)
  {
    if (c == '"')
      result += "\\\"";
    else
      result += c;
  }
  result += '"';
  return result;
}

}
