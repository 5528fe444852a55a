#include <gtest/gtest.h>

#include "driftscan/tokens/token_extractors.hpp"

using namespace driftscan;
using namespace driftscan::tokens;

namespace
{

const TokenFileContext kContext{"src/tokens.ts", "tokens", {}};

std::vector<std::string> names(const std::vector<DesignToken> & tokens)
{
  std::vector<std::string> out;
  for (const auto & t : tokens) out.push_back(t.name);
  return out;
}

}  // namespace

TEST(TokensTypeScript, StringUnionType)
{
  const auto tokens =
    extract_ts_tokens("export type ButtonVariant = 'primary' | 'secondary' | 'ghost';\n", kContext);
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(names(tokens), (std::vector<std::string>{"primary", "secondary", "ghost"}));

  const auto & t = tokens[0];
  EXPECT_EQ(t.id, "typescript:src/tokens.ts:ButtonVariant:primary");
  EXPECT_EQ(t.metadata.at("description"), "Value from ButtonVariant union type");
  const auto & source = std::get<TypeScriptSource>(t.source);
  EXPECT_EQ(source.type_name, "ButtonVariant");
  EXPECT_EQ(source.line, 1u);
}

TEST(TokensTypeScript, MultiLineUnion)
{
  const auto unions = find_union_types("// sizes\ntype Intent =\n  | 'info'\n  | 'danger';\n");
  ASSERT_EQ(unions.size(), 1u);
  EXPECT_EQ(unions[0].line, 2u);
  EXPECT_EQ(unions[0].members, (std::vector<std::string>{"info", "danger"}));
}

TEST(TokensTypeScript, UnionNamesMustLookLikeTokens)
{
  EXPECT_TRUE(extract_ts_tokens("type Props = 'a' | 'b';", kContext).empty());
  EXPECT_TRUE(extract_ts_tokens("type IconSize = number | string;", kContext).empty());

  const auto mixed = find_union_types("type Size = 'sm' | 'md' | number;");
  ASSERT_EQ(mixed.size(), 1u);
  EXPECT_EQ(mixed[0].members, (std::vector<std::string>{"sm", "md"}));
}

TEST(TokensTypeScript, ExportedTokenObject)
{
  constexpr std::string_view src =
    "import x from 'y';\n"
    "export const colors = {\n"
    "  primary: '#3B82F6',\n"
    "  gray: { 100: '#f3f4f6' },\n"
    "} as const;\n";

  const auto tokens = extract_ts_tokens(src, kContext);
  EXPECT_EQ(names(tokens), (std::vector<std::string>{"primary", "gray.100"}));
  for (const auto & t : tokens) {
    EXPECT_EQ(t.category, TokenCategory::Color);
    const auto & source = std::get<TypeScriptSource>(t.source);
    EXPECT_EQ(source.type_name, "colors");
    EXPECT_EQ(source.line, 2u);
  }
}

TEST(TokensTypeScript, TypedExportAndUnrelatedConst)
{
  constexpr std::string_view src =
    "export const spacing: Record<string, string> = { sm: '4px' };\n"
    "export const config = { debug: '1' };\n";

  const auto tokens = extract_ts_tokens(src, kContext);
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].name, "sm");
  EXPECT_EQ(tokens[0].category, TokenCategory::Spacing);
}

TEST(TokensTypeScript, DefineTokensCalls)
{
  constexpr std::string_view src =
    "const t = defineTokens.colors({ brand: { value: '#000' } });\n"
    "const s = defineSemanticTokens.colors({\n"
    "  bg: { value: { _light: '#fff', _dark: '#000' } },\n"
    "});\n";

  const auto objects = find_token_objects(src);
  ASSERT_EQ(objects.size(), 2u);
  EXPECT_EQ(objects[0].type_name, "defineTokens.colors");
  EXPECT_FALSE(objects[0].semantic);
  EXPECT_EQ(objects[1].type_name, "defineSemanticTokens.colors");
  EXPECT_TRUE(objects[1].semantic);
  EXPECT_EQ(objects[1].line, 2u);

  const auto tokens = extract_ts_tokens(src, kContext);
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].name, "brand");
  EXPECT_EQ(tokens[1].name, "bg");
  EXPECT_EQ(value_text(tokens[1].value), "#fff");
}

TEST(TokensTypeScript, CommentedCodeIgnored)
{
  constexpr std::string_view src =
    "// export const colors = { a: '#fff' };\n"
    "/* type ButtonVariant = 'x'; */\n"
    "export const spacing = { sm: '4px' };\n";

  const auto tokens = extract_ts_tokens(src, kContext);
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].name, "sm");
  EXPECT_EQ(std::get<TypeScriptSource>(tokens[0].source).line, 3u);
}

TEST(TokensTypeScript, NameHeuristics)
{
  EXPECT_TRUE(is_token_type_name("ButtonVariant"));
  EXPECT_TRUE(is_token_type_name("ColorScheme"));
  EXPECT_FALSE(is_token_type_name("Props"));

  EXPECT_TRUE(is_token_variable_name("DEFAULT_THEME"));
  EXPECT_TRUE(is_token_variable_name("fontSizes"));
  EXPECT_TRUE(is_token_variable_name("brandColors"));
  EXPECT_FALSE(is_token_variable_name("props"));
}
