#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "driftscan/text/literal_parser.hpp"

using driftscan::text::extract_balanced;
using driftscan::text::find_matching_close;
using driftscan::text::LiteralEntry;
using driftscan::text::LiteralKind;
using driftscan::text::parse_entries;
using driftscan::text::split_top_level;
using driftscan::text::strip_delimiters;

namespace
{

/// Render entries back into object-literal body text.
std::string serialize(const std::vector<LiteralEntry> & entries)
{
  std::string out;
  for (const auto & e : entries) {
    out += e.key + ": " + e.raw + ",\n";
  }
  return out;
}

}  // namespace

TEST(TextLiteralParser, ClassifiesValuesByFirstCharacter)
{
  const auto entries = parse_entries(
    "a: 'x', b: \"y\", c: `z`, d: { e: 1 }, f: [1, 2], g: rem(12), h: 42");
  ASSERT_EQ(entries.size(), 7U);
  EXPECT_EQ(entries[0].kind, LiteralKind::String);
  EXPECT_EQ(entries[0].raw, "'x'");
  EXPECT_EQ(entries[1].kind, LiteralKind::String);
  EXPECT_EQ(entries[2].kind, LiteralKind::Template);
  EXPECT_EQ(entries[3].kind, LiteralKind::Object);
  EXPECT_EQ(entries[3].raw, "{ e: 1 }");
  EXPECT_EQ(entries[4].kind, LiteralKind::Array);
  EXPECT_EQ(entries[5].kind, LiteralKind::Other);
  EXPECT_EQ(entries[5].raw, "rem(12)");
  EXPECT_EQ(entries[6].raw, "42");
}

TEST(TextLiteralParser, UnterminatedStringIsNotAStringLiteral)
{
  const auto entries = parse_entries("'x':'y");
  ASSERT_EQ(entries.size(), 1U);
  EXPECT_EQ(entries[0].key, "x");
  EXPECT_EQ(entries[0].kind, LiteralKind::Other);
  EXPECT_EQ(entries[0].raw, "'y");

  const auto tail = parse_entries("a: '', b: `open");
  ASSERT_EQ(tail.size(), 2U);
  EXPECT_EQ(tail[0].kind, LiteralKind::String);
  EXPECT_EQ(tail[1].kind, LiteralKind::Other);
}

TEST(TextLiteralParser, QuotedAndNumericKeys)
{
  const auto entries = parse_entries("'primary-500': '#fff', \"gray\": '#888', 50: '#f9fafb'");
  ASSERT_EQ(entries.size(), 3U);
  EXPECT_EQ(entries[0].key, "primary-500");
  EXPECT_EQ(entries[1].key, "gray");
  EXPECT_EQ(entries[2].key, "50");
}

TEST(TextLiteralParser, SkipsCommentsSpreadsAndShorthand)
{
  const auto entries = parse_entries(
    "// leading comment\n"
    "...base,\n"
    "shorthand,\n"
    "/* block */ kept: '1px', // trailing\n"
    "[computed]: 'no',\n"
    "last: 2\n");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0].key, "kept");
  EXPECT_EQ(entries[0].raw, "'1px'");
  EXPECT_EQ(entries[1].key, "last");
  EXPECT_EQ(entries[1].raw, "2");
}

TEST(TextLiteralParser, KeepsDuplicateKeysInOrder)
{
  const auto entries = parse_entries("a: '1', a: '2'");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0].raw, "'1'");
  EXPECT_EQ(entries[1].raw, "'2'");
}

TEST(TextLiteralParser, CommasInsideNestedValuesDoNotSplit)
{
  const auto entries = parse_entries("shadow: rgba(0, 0, 0, 0.5), fonts: ['a, b', 'c']");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0].raw, "rgba(0, 0, 0, 0.5)");
  EXPECT_EQ(entries[1].raw, "['a, b', 'c']");
}

TEST(TextLiteralParser, DiscardsTrailingAsConst)
{
  const auto entries = parse_entries("a: { b: '1' } as const, c: '2'");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0].raw, "{ b: '1' }");
  EXPECT_EQ(entries[1].key, "c");
}

TEST(TextLiteralParser, SerializedEntriesParseBackToTheSamePairs)
{
  const std::string_view src =
    "colors: { gray: { 50: '#f9fafb', 900: '#111827' }, brand: `#00f` },\n"
    "space: [ '4px', '8px' ],\n"
    "radius: rem(4)";
  const auto first = parse_entries(src);
  const auto second = parse_entries(serialize(first));
  EXPECT_EQ(first, second);

  // Nested bodies are stable too.
  const auto nested = parse_entries(strip_delimiters(first[0].raw));
  EXPECT_EQ(nested, parse_entries(serialize(nested)));
}

TEST(TextLiteralParser, FindMatchingCloseSkipsStringsAndComments)
{
  const std::string_view text = "{ a: '}', /* } */ b: { c: 1 } } tail";
  const auto close = find_matching_close(text, 0);
  ASSERT_TRUE(close.has_value());
  EXPECT_EQ(text.substr(*close + 1), " tail");

  EXPECT_FALSE(find_matching_close("{ a: 1", 0).has_value());
  EXPECT_FALSE(find_matching_close("abc", 0).has_value());
}

TEST(TextLiteralParser, ExtractBalancedAndStripDelimiters)
{
  const std::string_view text = "f(a, (b, c)) + 1";
  const auto region = extract_balanced(text, 1);
  ASSERT_TRUE(region.has_value());
  EXPECT_EQ(*region, "(a, (b, c))");
  EXPECT_EQ(strip_delimiters(*region), "a, (b, c)");
  EXPECT_EQ(strip_delimiters("x"), "");
}

TEST(TextLiteralParser, SplitTopLevelDropsEmptyElements)
{
  const auto parts = split_top_level(" 'a', fn(1, 2), [3, 4], ");
  ASSERT_EQ(parts.size(), 3U);
  EXPECT_EQ(parts[0], "'a'");
  EXPECT_EQ(parts[1], "fn(1, 2)");
  EXPECT_EQ(parts[2], "[3, 4]");
}
