// driftscan/tokens/category.cpp - Category inference and value normalization
#include "driftscan/tokens/category.hpp"

#include <cctype>
#include <cstdlib>
#include <initializer_list>

#include "driftscan/text/string_utils.hpp"

namespace driftscan::tokens
{

namespace
{

using text::contains;
using text::starts_with;

bool contains_any(std::string_view haystack, std::initializer_list<std::string_view> needles)
{
  for (const auto n : needles) {
    if (contains(haystack, n)) return true;
  }
  return false;
}

bool is_digit(char c) noexcept { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_hex_digit(char c) noexcept { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

/// `^\d+(px|rem|em)$`
bool is_integer_length(std::string_view v)
{
  size_t i = 0;
  while (i < v.size() && is_digit(v[i])) ++i;
  if (i == 0) return false;
  const auto unit = v.substr(i);
  return unit == "px" || unit == "rem" || unit == "em";
}

bool is_hex_color(std::string_view v)
{
  if (v.size() < 4 || v.size() > 9 || v[0] != '#') return false;
  for (size_t i = 1; i < v.size(); ++i) {
    if (!is_hex_digit(v[i])) return false;
  }
  return true;
}

}  // namespace

TokenCategory infer_category(std::string_view name, std::string_view value)
{
  const std::string n = text::to_lower(name);

  if (contains_any(n, {"color", "background", "fill"})) return TokenCategory::Color;
  if (contains_any(n, {"spacing", "gap", "margin", "padding"})) return TokenCategory::Spacing;
  if (contains_any(n, {"font", "text", "typography"})) return TokenCategory::Typography;
  if (contains_any(n, {"shadow", "elevation"})) return TokenCategory::Shadow;
  if (contains_any(n, {"border", "radius"})) return TokenCategory::Border;
  if (contains_any(n, {"size", "width", "height"})) return TokenCategory::Sizing;
  if (contains_any(n, {"animation", "duration", "timing"})) return TokenCategory::Motion;

  const std::string v = text::to_lower(value);
  if (starts_with(v, "#") || starts_with(v, "rgb") || starts_with(v, "hsl")) {
    return TokenCategory::Color;
  }
  if (is_integer_length(v)) return TokenCategory::Spacing;

  return TokenCategory::Other;
}

TokenCategory normalize_category(std::string_view type)
{
  const std::string t = text::to_lower(type);
  if (t == "color" || t == "colors" || t == "colour" || t == "colours") return TokenCategory::Color;
  if (t == "spacing" || t == "space") return TokenCategory::Spacing;
  if (t == "typography" || t == "font") return TokenCategory::Typography;
  if (t == "shadow" || t == "boxshadow") return TokenCategory::Shadow;
  if (t == "border" || t == "borderradius") return TokenCategory::Border;
  if (t == "sizing" || t == "size") return TokenCategory::Sizing;
  if (t == "motion" || t == "animation" || t == "duration") return TokenCategory::Motion;
  return TokenCategory::Other;
}

TokenCategory category_for_group(std::string_view group)
{
  const std::string g = text::to_lower(group);
  if (contains(g, "radii")) return TokenCategory::Border;
  if (contains_any(g, {"zindex", "z-index", "zindices"})) return TokenCategory::Other;
  return infer_category(g, "");
}

std::string normalize_color(std::string_view value)
{
  if (is_hex_color(value)) return text::to_lower(value);
  return std::string(value);
}

bool looks_like_color(std::string_view value)
{
  const std::string v = text::to_lower(text::trim(value));
  return is_hex_color(v) || starts_with(v, "rgb(") || starts_with(v, "rgba(") ||
         starts_with(v, "hsl(") || starts_with(v, "hsla(");
}

TokenValue parse_token_value(TokenCategory category, std::string_view raw)
{
  const std::string_view v = text::trim(raw);

  if (category == TokenCategory::Color) {
    return ColorValue{normalize_color(v)};
  }

  if (category == TokenCategory::Spacing || category == TokenCategory::Sizing) {
    // ^(\d+(?:\.\d+)?)(px|rem|em)?$
    size_t i = 0;
    while (i < v.size() && is_digit(v[i])) ++i;
    size_t number_end = i;
    if (i > 0 && i < v.size() && v[i] == '.') {
      size_t j = i + 1;
      while (j < v.size() && is_digit(v[j])) ++j;
      if (j > i + 1) number_end = j;
    }
    if (number_end > 0) {
      const auto unit = v.substr(number_end);
      const std::string number(v.substr(0, number_end));
      if (unit.empty() || unit == "px") {
        return SpacingValue{std::strtod(number.c_str(), nullptr), SpacingUnit::Px};
      }
      if (unit == "rem") return SpacingValue{std::strtod(number.c_str(), nullptr), SpacingUnit::Rem};
      if (unit == "em") return SpacingValue{std::strtod(number.c_str(), nullptr), SpacingUnit::Em};
    }
  }

  return RawValue{std::string(v)};
}

std::vector<std::string> extract_aliases(std::string_view raw)
{
  std::vector<std::string> out;
  const std::string_view v = text::unquote(text::trim(raw));

  if (v.size() > 2 && v.front() == '{' && v.back() == '}') {
    const auto inner = text::trim(v.substr(1, v.size() - 2));
    if (!inner.empty() && inner.find_first_of("{}:, ") == std::string_view::npos) {
      out.emplace_back(inner);
    }
    return out;
  }

  size_t pos = 0;
  while ((pos = v.find("var(", pos)) != std::string_view::npos) {
    size_t i = pos + 4;
    while (i < v.size() && std::isspace(static_cast<unsigned char>(v[i])) != 0) ++i;
    const size_t begin = i;
    while (i < v.size() && v[i] != ',' && v[i] != ')' &&
           std::isspace(static_cast<unsigned char>(v[i])) == 0) {
      ++i;
    }
    const auto name = v.substr(begin, i - begin);
    if (starts_with(name, "--")) out.emplace_back(name);
    pos = i;
  }
  return out;
}

}  // namespace driftscan::tokens
