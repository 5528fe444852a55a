// driftscan/text/literal_parser.hpp - Eval-free JS/TS object-literal parser
//
// Turns the inner text of an object literal into ordered (key, raw value)
// pairs. Values are kept as source text; nested objects and arrays are kept
// whole so a caller can recurse with parse_entries() on their bodies.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace driftscan::text
{

/// Shape of a raw value, decided by its first significant character.
enum class LiteralKind {
  String,    ///< '...' or "..."
  Template,  ///< `...`
  Object,    ///< { ... }
  Array,     ///< [ ... ]
  Other,     ///< identifiers, numbers, calls such as rem(12)
};

struct LiteralEntry
{
  std::string key;  ///< unquoted key text
  std::string raw;  ///< value source text, trimmed, quotes kept
  LiteralKind kind = LiteralKind::Other;

  [[nodiscard]] bool operator==(const LiteralEntry & other) const
  {
    return key == other.key && raw == other.raw && kind == other.kind;
  }
};

/**
 * Parse the body of an object literal (outer braces already removed).
 *
 * Duplicate keys are all retained in source order. Entries whose key cannot
 * be read (spreads, computed keys, shorthand properties) are skipped.
 */
[[nodiscard]] std::vector<LiteralEntry> parse_entries(std::string_view body);

/**
 * Index of the delimiter closing the one at `open_pos`.
 *
 * `text[open_pos]` must be one of `{ [ (`; quoted regions are skipped.
 * Returns nullopt for an unbalanced region.
 */
[[nodiscard]] std::optional<size_t> find_matching_close(std::string_view text, size_t open_pos);

/// Region `{...}` / `[...]` / `(...)` starting at `open_pos`, delimiters included.
[[nodiscard]] std::optional<std::string_view> extract_balanced(
  std::string_view text, size_t open_pos);

/// Inner text of a region produced by extract_balanced().
[[nodiscard]] std::string_view strip_delimiters(std::string_view region) noexcept;

/**
 * Split the inner text of an array literal at top-level commas.
 *
 * Elements are trimmed; empty elements (trailing commas) are dropped.
 */
[[nodiscard]] std::vector<std::string_view> split_top_level(std::string_view body);

}  // namespace driftscan::text
