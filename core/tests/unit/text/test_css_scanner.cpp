#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "driftscan/text/css_scanner.hpp"

using driftscan::text::CssDialect;
using driftscan::text::extract_value;
using driftscan::text::scan_custom_properties;
using driftscan::text::strip_css_comments;

TEST(TextCssScanner, ExtractsCustomPropertiesWithLines)
{
  const std::string_view src =
    ":root {\n"
    "  --color-primary: #3B82F6;\n"
    "  --space-4: 16px;\n"
    "}\n";

  const auto decls = scan_custom_properties(src, CssDialect::Css);
  ASSERT_EQ(decls.size(), 2U);
  EXPECT_EQ(decls[0].name, "color-primary");
  EXPECT_EQ(decls[0].value, "#3B82F6");
  EXPECT_EQ(decls[0].line, 2U);
  EXPECT_EQ(decls[1].name, "space-4");
  EXPECT_EQ(decls[1].value, "16px");
  EXPECT_EQ(decls[1].line, 3U);
}

TEST(TextCssScanner, KeepsSemicolonsInsideUrl)
{
  const auto decls =
    scan_custom_properties("--x: url(data:image/png;base64,AAA==);", CssDialect::Css);
  ASSERT_EQ(decls.size(), 1U);
  EXPECT_EQ(decls[0].value, "url(data:image/png;base64,AAA==)");
}

TEST(TextCssScanner, KeepsNestedFunctionsWhole)
{
  const auto decls = scan_custom_properties(
    "--w: calc(100% - var(--gutter; 8px));\n--g: linear-gradient(red, blue);", CssDialect::Css);
  ASSERT_EQ(decls.size(), 2U);
  EXPECT_EQ(decls[0].value, "calc(100% - var(--gutter; 8px))");
  EXPECT_EQ(decls[1].value, "linear-gradient(red, blue)");
}

TEST(TextCssScanner, StopsAtClosingBrace)
{
  const auto decls = scan_custom_properties(".a{--x: 1px}.b{--y:2px}", CssDialect::Css);
  ASSERT_EQ(decls.size(), 2U);
  EXPECT_EQ(decls[0].value, "1px");
  EXPECT_EQ(decls[1].value, "2px");
}

TEST(TextCssScanner, QuotedSemicolonDoesNotEndValue)
{
  const auto decls = scan_custom_properties("--font: \"A;B\", sans-serif;", CssDialect::Css);
  ASSERT_EQ(decls.size(), 1U);
  EXPECT_EQ(decls[0].value, "\"A;B\", sans-serif");
}

TEST(TextCssScanner, DeclarationTextInsideQuotedValueIsAlsoMatched)
{
  const auto decls =
    scan_custom_properties("--font: \"x --inner: 1px; y\";", CssDialect::Css);
  ASSERT_EQ(decls.size(), 2U);
  EXPECT_EQ(decls[0].name, "font");
  EXPECT_EQ(decls[0].value, "\"x --inner: 1px; y\"");
  EXPECT_EQ(decls[1].name, "inner");
  EXPECT_EQ(decls[1].value, "1px");
  EXPECT_EQ(decls[1].line, 1U);
}

TEST(TextCssScanner, MultiValueDeclarationSpansLines)
{
  const std::string_view src =
    "--shadow:\n"
    "  0 1px 2px rgba(0, 0, 0, 0.1),\n"
    "  0 2px 4px rgba(0, 0, 0, 0.2);\n";
  const auto decls = scan_custom_properties(src, CssDialect::Css);
  ASSERT_EQ(decls.size(), 1U);
  EXPECT_EQ(decls[0].line, 1U);
  EXPECT_EQ(
    decls[0].value, "0 1px 2px rgba(0, 0, 0, 0.1),\n  0 2px 4px rgba(0, 0, 0, 0.2)");
}

TEST(TextCssScanner, LineNumbersSurviveMultiLineComments)
{
  const std::string_view src =
    "/* first\n"
    "   second\n"
    "   third */\n"
    "\n"
    "--c: red;\n";
  const auto decls = scan_custom_properties(src, CssDialect::Css);
  ASSERT_EQ(decls.size(), 1U);
  EXPECT_EQ(decls[0].name, "c");
  EXPECT_EQ(decls[0].line, 5U);
}

TEST(TextCssScanner, IgnoresDeclarationsInsideComments)
{
  const auto decls =
    scan_custom_properties("/* --old: blue; */ --new: green;", CssDialect::Css);
  ASSERT_EQ(decls.size(), 1U);
  EXPECT_EQ(decls[0].name, "new");
}

TEST(TextCssScanner, SkipsEmptyValuesAndVarReferences)
{
  const auto decls =
    scan_custom_properties("--empty: ;\n--a: var(--b);\n", CssDialect::Css);
  ASSERT_EQ(decls.size(), 1U);
  EXPECT_EQ(decls[0].name, "a");
  EXPECT_EQ(decls[0].value, "var(--b)");
}

TEST(TextCssScanner, ScssVariables)
{
  const std::string_view src =
    "$brand: #ff0000;\n"
    "$gap : 8px;\n"
    "--not-scss: 1px;\n";
  const auto decls = scan_custom_properties(src, CssDialect::Scss);
  ASSERT_EQ(decls.size(), 2U);
  EXPECT_EQ(decls[0].name, "brand");
  EXPECT_EQ(decls[0].value, "#ff0000");
  EXPECT_EQ(decls[1].name, "gap");
  EXPECT_EQ(decls[1].line, 2U);
}

TEST(TextCssScanner, StripCommentsPreservesLineStructure)
{
  const std::string_view src = "a/* x\ny */b\n/* unterminated\nz";
  const auto out = strip_css_comments(src);
  EXPECT_EQ(out.size(), src.size());
  EXPECT_EQ(out, std::string("a    \n    b\n") + std::string(15, ' ') + "\n ");
}

TEST(TextCssScanner, ExtractValueTrimsAndRejectsEmpty)
{
  EXPECT_EQ(extract_value("--a:   12px  ;", 4), "12px");
  EXPECT_FALSE(extract_value("--a:   ;", 4).has_value());
  EXPECT_EQ(extract_value("--a: 'it\\'s';", 4), "'it\\'s'");
}
