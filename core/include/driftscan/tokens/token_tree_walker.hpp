// driftscan/tokens/token_tree_walker.hpp - Literal tree -> token candidates
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "driftscan/model/design_token.hpp"
#include "driftscan/text/literal_parser.hpp"

namespace driftscan::tokens
{

/// A terminal value found while walking an object literal.
struct TokenCandidate
{
  std::string name;   ///< dotted path, e.g. `gray.50` or `dark.0`
  std::string value;  ///< unquoted value text
  TokenCategory category = TokenCategory::Other;
  std::optional<std::string> description;
};

struct WalkOptions
{
  /// Accept `{ value: { _light: "...", _dark: "..." } }` and use the light branch.
  bool semantic = false;
};

/**
 * Walk parsed object-literal entries and collect terminal token values.
 *
 * Each entry is classified in priority order:
 *   1. `{ value: "..." }`                         terminal
 *   2. `{ value: { _light: "..." } }`              terminal (semantic mode only)
 *   3. quoted string                               terminal
 *   4. template literal                            terminal
 *   5. `identifier(number)` or a numeric literal   terminal
 *   6. array of quoted strings                     one terminal per element
 *   7. nested object                               recurse with `prefix.key`
 *
 * Keys `value`, `description`, `type`, `$value`, `$type` are skipped unless
 * their raw value itself looks like a token.
 *
 * @param entries Entries of the current object body
 * @param prefix Dotted path of the current object ("" at the root)
 * @param hint Category implied by the enclosing group, Other when unknown
 */
[[nodiscard]] std::vector<TokenCandidate> walk_token_tree(
  const std::vector<text::LiteralEntry> & entries, std::string_view prefix, TokenCategory hint,
  const WalkOptions & options = {});

}  // namespace driftscan::tokens
