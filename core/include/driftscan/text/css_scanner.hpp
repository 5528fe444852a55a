// driftscan/text/css_scanner.hpp - Character-level CSS/SCSS scanning primitives
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace driftscan::text
{

enum class CssDialect : uint8_t {
  Css,   ///< `--name: value;`
  Scss,  ///< `$name: value;`
};

/**
 * A custom property (or SCSS variable) found in a stylesheet.
 *
 * `name` excludes the `--` / `$` sigil. `line` is 1-based in the original text.
 */
struct CssDeclaration
{
  std::string name;
  std::string value;
  uint32_t line = 0;
};

/**
 * Blank out every `/ * ... * /` region, keeping its newlines.
 *
 * The result has exactly the same line structure as the input, so line numbers
 * computed against the original text stay valid for matches in the result.
 * An unterminated comment blanks to end of input.
 */
[[nodiscard]] std::string strip_css_comments(std::string_view source);

/**
 * Extract a declaration value starting right after its `name:` delimiter.
 *
 * Skips leading whitespace, then consumes until `;` or `}` found outside a
 * quoted string at parenthesis depth 0. A quote is escaped when the previous
 * character is a backslash. Returns the trimmed value, or nullopt when the
 * value is empty.
 */
[[nodiscard]] std::optional<std::string> extract_value(std::string_view text, size_t start);

/**
 * Find every `--name:` (Css) or `$name:` (Scss) declaration.
 *
 * Matching runs over the comment-stripped text; line numbers count newlines in
 * the original. Declarations without a value are skipped.
 */
[[nodiscard]] std::vector<CssDeclaration> scan_custom_properties(
  std::string_view source, CssDialect dialect);

}  // namespace driftscan::text
