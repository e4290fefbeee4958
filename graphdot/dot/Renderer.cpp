/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <graphdot/dot/Renderer.hpp>

#include <ios>

namespace graphdot::dot
{

/**
 * Returns a C string with the given amount of indentation.
 * The string is valid until this function is called again from the same thread.
 * @param indent the number of indentation levels
 * @return a string of spaces corresponding to the indentation level.
 */
[[nodiscard]] static const char *
Indent(size_t indent)
{
  static constexpr size_t SPACE_PER_INDENT = 4;
  static constexpr size_t MAX_SPACES = 64;
  static thread_local char indentation[MAX_SPACES + 1];

  size_t spaces = indent * SPACE_PER_INDENT;
  if (spaces > MAX_SPACES)
    spaces = MAX_SPACES;

  for (size_t i = 0; i < spaces; i++)
    indentation[i] = ' ';
  indentation[spaces] = '\0';
  return indentation;
}

WriteFailure::~WriteFailure() noexcept = default;

std::string
RenderConfiguration::GetGraphAttributes() const
{
  std::string attributes;
  if (FontName_)
    attributes += "fontname=" + Text::Label(*FontName_).ToDotString();

  if (IsEnabled(Option::DarkTheme))
  {
    if (!attributes.empty())
      attributes += ' ';
    attributes += "bgcolor=\"black\" fontcolor=\"white\"";
  }

  return attributes;
}

std::string
RenderConfiguration::GetContentAttributes() const
{
  std::string attributes;
  if (FontName_)
    attributes += "fontname=" + Text::Label(*FontName_).ToDotString();

  if (IsEnabled(Option::DarkTheme))
  {
    if (!attributes.empty())
      attributes += ' ';
    attributes += "color=\"white\" fontcolor=\"white\"";
  }

  return attributes;
}

RenderStatistics::~RenderStatistics() = default;

void
RenderStatistics::Start()
{
  AddTimer(Label::Timer).start();
}

void
RenderStatistics::Stop(size_t numSubgraphs, size_t numNodes, size_t numEdges, uint64_t numBytes)
{
  GetTimer(Label::Timer).stop();
  AddMeasurement(Label::NumSubgraphs, static_cast<uint64_t>(numSubgraphs));
  AddMeasurement(Label::NumNodes, static_cast<uint64_t>(numNodes));
  AddMeasurement(Label::NumEdges, static_cast<uint64_t>(numEdges));
  AddMeasurement(Label::NumBytes, numBytes);
}

namespace detail
{

void
StatementWriter::WriteLine(size_t indent, std::string_view statement)
{
  if (!Out_)
    throw WriteFailure("output stream is in a failed state");

  std::string line = Indent(indent);
  line.append(statement);
  line += '\n';

  try
  {
    Out_.write(line.data(), static_cast<std::streamsize>(line.size()));
  }
  catch (const std::ios_base::failure & e)
  {
    throw WriteFailure(e.what());
  }

  if (!Out_)
    throw WriteFailure("output stream failed while writing");

  NumBytesWritten_ += line.size();
}

void
AppendAttribute(std::string & statement, std::string_view name, std::string_view value)
{
  statement += '[';
  statement.append(name);
  statement += '=';
  statement.append(value);
  statement += ']';
}

void
AppendQuotedAttribute(std::string & statement, std::string_view name, std::string_view value)
{
  statement += '[';
  statement.append(name);
  statement += "=\"";
  statement.append(value);
  statement += "\"]";
}

void
AppendArrows(std::string & statement, const Arrow & startArrow, const Arrow & endArrow)
{
  if (startArrow.IsDefault() && endArrow.IsDefault())
    return;

  statement += '[';
  if (!endArrow.IsDefault())
  {
    statement += "arrowhead=\"" + endArrow.ToDotString() + "\"";
    if (!startArrow.IsDefault())
      statement += ' ';
  }
  if (!startArrow.IsDefault())
    statement += "dir=\"both\" arrowtail=\"" + startArrow.ToDotString() + "\"";
  statement += ']';
}

}

}
