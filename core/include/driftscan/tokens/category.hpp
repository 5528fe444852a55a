// driftscan/tokens/category.hpp - Token category inference and value normalization
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "driftscan/model/design_token.hpp"

namespace driftscan::tokens
{

/**
 * Infer a category from a token name, then from its value.
 *
 * Name checks run in a fixed order over the lower-cased name and the first
 * match wins:
 *   color|background|fill -> color
 *   spacing|gap|margin|padding -> spacing
 *   font|text|typography -> typography
 *   shadow|elevation -> shadow
 *   border|radius -> border
 *   size|width|height -> sizing
 *   animation|duration|timing -> motion
 * Otherwise values starting with `#`, `rgb` or `hsl` are colors and values
 * like `16px` / `1rem` / `2em` are spacing. Everything else is other.
 */
[[nodiscard]] TokenCategory infer_category(std::string_view name, std::string_view value);

/// Map a JSON `type` / `$type` string to a category.
[[nodiscard]] TokenCategory normalize_category(std::string_view type);

/**
 * Category implied by a group name such as a variable (`DEFAULT_COLORS`), a
 * `defineTokens.<group>` selector or a token file stem (`font-sizes`).
 */
[[nodiscard]] TokenCategory category_for_group(std::string_view group);

/// Lower-case a `#rgb[a]` / `#rrggbb[aa]` literal; other input is unchanged.
[[nodiscard]] std::string normalize_color(std::string_view value);

/// True for hex / rgb() / hsl() color literals.
[[nodiscard]] bool looks_like_color(std::string_view value);

/**
 * Build the typed value for a token.
 *
 * Colors become ColorValue (hex lower-cased), spacing and sizing values of
 * the form `<number>[px|rem|em]` become SpacingValue (unit defaults to px),
 * everything else is kept raw.
 */
[[nodiscard]] TokenValue parse_token_value(TokenCategory category, std::string_view raw);

/**
 * Reference names inside a value: `{colors.gray.50}` yields `colors.gray.50`,
 * `var(--brand, #fff)` yields `--brand`.
 */
[[nodiscard]] std::vector<std::string> extract_aliases(std::string_view raw);

}  // namespace driftscan::tokens
