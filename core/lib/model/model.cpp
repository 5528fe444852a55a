// driftscan/model/model.cpp - Enum spellings and small model helpers
#include <fmt/core.h>

#include "driftscan/model/component.hpp"
#include "driftscan/model/design_token.hpp"

namespace driftscan
{

namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::string_view to_string(TokenCategory c) noexcept
{
  switch (c) {
    case TokenCategory::Color:
      return "color";
    case TokenCategory::Spacing:
      return "spacing";
    case TokenCategory::Typography:
      return "typography";
    case TokenCategory::Shadow:
      return "shadow";
    case TokenCategory::Border:
      return "border";
    case TokenCategory::Sizing:
      return "sizing";
    case TokenCategory::Motion:
      return "motion";
    case TokenCategory::Other:
      return "other";
  }
  return "other";
}

std::optional<TokenCategory> token_category_from_string(std::string_view s) noexcept
{
  static constexpr TokenCategory k_all[] = {
    TokenCategory::Color,  TokenCategory::Spacing, TokenCategory::Typography,
    TokenCategory::Shadow, TokenCategory::Border,  TokenCategory::Sizing,
    TokenCategory::Motion, TokenCategory::Other,
  };
  for (const auto c : k_all) {
    if (to_string(c) == s) return c;
  }
  return std::nullopt;
}

std::string_view to_string(SpacingUnit u) noexcept
{
  switch (u) {
    case SpacingUnit::Px:
      return "px";
    case SpacingUnit::Rem:
      return "rem";
    case SpacingUnit::Em:
      return "em";
  }
  return "px";
}

std::string value_text(const TokenValue & v)
{
  return std::visit(
    Overloaded{
      [](const ColorValue & c) { return c.hex; },
      [](const SpacingValue & s) { return fmt::format("{}{}", s.value, to_string(s.unit)); },
      [](const RawValue & r) { return r.value; },
    },
    v);
}

std::string_view source_kind(const TokenSource & s) noexcept
{
  switch (s.index()) {
    case 0:
      return "json";
    case 1:
      return "css";
    default:
      return "typescript";
  }
}

const std::string & source_path(const TokenSource & s) noexcept
{
  return std::visit([](const auto & src) -> const std::string & { return src.path; }, s);
}

uint32_t source_line(const TokenSource & s) noexcept
{
  if (const auto * css = std::get_if<CssSource>(&s)) return css->line;
  if (const auto * ts = std::get_if<TypeScriptSource>(&s)) return ts->line;
  return 0;
}

// ============================================================================
// Component enums
// ============================================================================

std::string_view to_string(Framework f) noexcept
{
  switch (f) {
    case Framework::Lit:
      return "lit";
    case Framework::Stencil:
      return "stencil";
    case Framework::Fast:
      return "fast";
    case Framework::Vanilla:
      return "vanilla";
    case Framework::Haunted:
      return "haunted";
    case Framework::Hybrids:
      return "hybrids";
    case Framework::StencilFunctional:
      return "stencil-functional";
  }
  return "vanilla";
}

std::optional<Framework> framework_from_string(std::string_view s) noexcept
{
  static constexpr Framework k_all[] = {
    Framework::Lit,     Framework::Stencil, Framework::Fast,
    Framework::Vanilla, Framework::Haunted, Framework::Hybrids,
    Framework::StencilFunctional,
  };
  for (const auto f : k_all) {
    if (to_string(f) == s) return f;
  }
  return std::nullopt;
}

std::string_view to_string(ShadowMode m) noexcept
{
  return m == ShadowMode::Shadow ? "shadow" : "scoped";
}

}  // namespace driftscan
