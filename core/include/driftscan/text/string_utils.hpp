// driftscan/text/string_utils.hpp - Small string helpers shared by the scanners
#pragma once

#include <string>
#include <string_view>

namespace driftscan::text
{

[[nodiscard]] std::string_view trim(std::string_view s) noexcept;
[[nodiscard]] std::string to_lower(std::string_view s);

[[nodiscard]] inline bool starts_with(std::string_view s, std::string_view prefix) noexcept
{
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

[[nodiscard]] inline bool ends_with(std::string_view s, std::string_view suffix) noexcept
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

[[nodiscard]] inline bool contains(std::string_view s, std::string_view needle) noexcept
{
  return s.find(needle) != std::string_view::npos;
}

/// True when `s` is wrapped in matching '…', "…" or `…` quotes.
[[nodiscard]] bool is_quoted(std::string_view s) noexcept;

/// Strip one level of matching quotes; other input is returned unchanged.
[[nodiscard]] std::string_view unquote(std::string_view s) noexcept;

/**
 * `MyButton` -> `my-button`, `HTMLWidget` -> `html-widget`.
 *
 * Inserts a dash between a lower-case letter and an upper-case one, and before
 * the last capital of a capital run that is followed by a lower-case letter.
 */
[[nodiscard]] std::string to_kebab_case(std::string_view name);

/// `my-fancy-card` -> `MyFancyCard`.
[[nodiscard]] std::string pascal_case_from_tag(std::string_view tag);

}  // namespace driftscan::text
