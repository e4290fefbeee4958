/*
 * Copyright 2024 The graphdot developers
 * See COPYING for terms of redistribution.
 */

#include <gtest/gtest.h>

#include <graphdot/dot/Text.hpp>

TEST(TextTests, TestLabelEscaping)
{
  using namespace graphdot::dot;

  EXPECT_EQ(Text::Label("").ToDotString(), "\"\"");
  EXPECT_EQ(Text::Label("plain").ToDotString(), "\"plain\"");
  EXPECT_EQ(Text::Label("a \"quote\"").ToDotString(), "\"a \\\"quote\\\"\"");
  EXPECT_EQ(Text::Label("back\\slash").ToDotString(), "\"back\\\\slash\"");
  EXPECT_EQ(Text::Label("two\nlines").ToDotString(), "\"two\\nlines\"");
  EXPECT_EQ(Text::Label("cr\rtab\t").ToDotString(), "\"cr\\rtab\\t\"");

  // Apostrophes and non-ASCII characters are passed through
  EXPECT_EQ(Text::Label("it's").ToDotString(), "\"it's\"");
  EXPECT_EQ(Text::Label("\xe2\x8a\x86").ToDotString(), "\"\xe2\x8a\x86\"");
}

TEST(TextTests, TestEscapedText)
{
  using namespace graphdot::dot;

  // Backslashes start Graphviz escape sequences and are kept
  EXPECT_EQ(Text::Escaped("left\\l").ToDotString(), "\"left\\l\"");
  EXPECT_EQ(Text::Escaped("\\G").ToDotString(), "\"\\G\"");

  // Quotes and raw line breaks are still escaped
  EXPECT_EQ(Text::Escaped("\"x\"\n").ToDotString(), "\"\\\"x\\\"\\n\"");
}

TEST(TextTests, TestEscapedTextKeepsEscapeSequences)
{
  using namespace graphdot::dot;

  // An escaped quote stays a single escape sequence
  EXPECT_EQ(Text::Escaped("say \\\"hi\\\"").ToDotString(), "\"say \\\"hi\\\"\"");

  // An escaped backslash is copied as is
  EXPECT_EQ(Text::Escaped("a\\\\b").ToDotString(), "\"a\\\\b\"");
  EXPECT_EQ(Text::Escaped("a\\\\\"").ToDotString(), "\"a\\\\\\\"\"");

  // A trailing backslash can not escape the closing quote
  EXPECT_EQ(Text::Escaped("trail\\").ToDotString(), "\"trail\\\\\"");
  EXPECT_EQ(Text::Escaped("\\").ToDotString(), "\"\\\\\"");
}

TEST(TextTests, TestHtmlText)
{
  using namespace graphdot::dot;

  EXPECT_EQ(Text::Html("&sube;").ToDotString(), "<&sube;>");
  EXPECT_EQ(Text::Html("<b>bold</b>").ToDotString(), "<<b>bold</b>>");
  EXPECT_EQ(Text::Html("").ToDotString(), "<>");
}

TEST(TextTests, TestGetters)
{
  using namespace graphdot::dot;

  auto text = Text::Escaped("a\\lb");
  EXPECT_EQ(text.GetType(), Text::Type::Escaped);
  EXPECT_EQ(text.GetContent(), "a\\lb");

  EXPECT_EQ(Text::Label("x"), Text::Label("x"));
  EXPECT_NE(Text::Label("x"), Text::Escaped("x"));
  EXPECT_NE(Text::Label("x"), Text::Label("y"));
}

TEST(TextTests, TestSuffixLine)
{
  using namespace graphdot::dot;

  // Arrange
  auto prefix = Text::Label("back\\slash");
  auto suffix = Text::Escaped("left\\l");

  // Act
  auto combined = prefix.SuffixLine(suffix);

  // Assert
  EXPECT_EQ(combined.GetType(), Text::Type::Escaped);
  EXPECT_EQ(combined.GetContent(), "back\\\\slash\\n\\nleft\\l");
  EXPECT_EQ(combined.ToDotString(), "\"back\\\\slash\\n\\nleft\\l\"");

  // Both parts render as they would on their own
  EXPECT_EQ(Text::Label("a").SuffixLine(Text::Label("b")).ToDotString(), "\"a\\n\\nb\"");
}

TEST(TextTests, TestEscapeHtml)
{
  using namespace graphdot::dot;

  EXPECT_EQ(EscapeHtml("a < b && \"c\" > d"), "a &lt; b &amp;&amp; &quot;c&quot; &gt; d");
  EXPECT_EQ(EscapeHtml("plain"), "plain");
}
