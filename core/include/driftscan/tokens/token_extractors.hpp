// driftscan/tokens/token_extractors.hpp - Per-format design token extraction
//
// Each extractor turns the content of one file into DesignTokens. Extractors
// are pure: they never touch the file system, so the scanner can run them on
// worker threads and tests can feed them literal text.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "driftscan/model/design_token.hpp"

namespace driftscan::tokens
{

/// Per-file inputs shared by every extractor.
struct TokenFileContext
{
  std::string path;  ///< path recorded in token sources (project-relative)
  std::string stem;  ///< file name without extension, e.g. `font-sizes`
  Timestamp scanned_at{};
};

/**
 * Assemble a token: id from (source, id_name), typed value, aliases.
 *
 * @param display_name Name shown to users (`--color-primary`, `gray.50`)
 * @param id_name Name folded into the id (`color-primary` for CSS)
 */
[[nodiscard]] DesignToken make_design_token(
  TokenSource source, std::string display_name, std::string_view id_name, TokenCategory category,
  std::string_view raw_value, Timestamp scanned_at);

// ============================================================================
// JSON
// ============================================================================

/**
 * Extract tokens from a JSON token document.
 *
 * Object documents are walked recursively; a node holding `value` or `$value`
 * is a token named by its dotted path. Array documents list token names and
 * take their category from the file stem.
 *
 * @throws nlohmann::json::parse_error on malformed JSON
 */
[[nodiscard]] std::vector<DesignToken> extract_json_tokens(
  std::string_view content, const TokenFileContext & ctx);

// ============================================================================
// CSS / SCSS
// ============================================================================

/**
 * Extract `--name` custom properties and `$name` SCSS variables.
 *
 * @param css_variable_prefix When non-empty, only custom properties whose name
 *        starts with it (leading `--` ignored) are kept. SCSS variables are
 *        never filtered.
 */
[[nodiscard]] std::vector<DesignToken> extract_css_tokens(
  std::string_view content, const TokenFileContext & ctx, std::string_view css_variable_prefix);

// ============================================================================
// TypeScript / JavaScript
// ============================================================================

/// A string-literal union such as `type ButtonVariant = 'primary' | 'ghost';`
struct UnionType
{
  std::string name;
  std::vector<std::string> members;  ///< string-literal members in source order
  uint32_t line = 0;
};

/// Object literal assigned to a token-like variable or passed to defineTokens.
struct TokenObject
{
  std::string type_name;  ///< variable name or `defineTokens.<group>`
  std::string group;      ///< name used for the category hint
  std::string body;       ///< object text without the outer braces
  bool semantic = false;  ///< came from defineSemanticTokens
  uint32_t line = 0;
};

/// True for type names ending in Variant, Color, Size, Style, Theme, Type, ...
[[nodiscard]] bool is_token_type_name(std::string_view name);

/// True for variable names such as `colors`, `fontSizes`, `DEFAULT_THEME`.
[[nodiscard]] bool is_token_variable_name(std::string_view name);

/// String-literal unions with a token-like name, in source order.
[[nodiscard]] std::vector<UnionType> find_union_types(std::string_view content);

/// `defineTokens.x({...})`, `defineSemanticTokens.x({...})` and
/// `export const tokenLike = {...}` objects, in source order.
[[nodiscard]] std::vector<TokenObject> find_token_objects(std::string_view content);

[[nodiscard]] std::vector<DesignToken> extract_ts_tokens(
  std::string_view content, const TokenFileContext & ctx);

}  // namespace driftscan::tokens
