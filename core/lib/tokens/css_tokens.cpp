// driftscan/tokens/css_tokens.cpp - CSS custom properties and SCSS variables
#include <utility>

#include "driftscan/text/css_scanner.hpp"
#include "driftscan/text/string_utils.hpp"
#include "driftscan/tokens/category.hpp"
#include "driftscan/tokens/token_extractors.hpp"

namespace driftscan::tokens
{

std::vector<DesignToken> extract_css_tokens(
  std::string_view content, const TokenFileContext & ctx, std::string_view css_variable_prefix)
{
  std::vector<DesignToken> out;

  std::string_view prefix = css_variable_prefix;
  if (text::starts_with(prefix, "--")) prefix.remove_prefix(2);

  for (const auto & decl : text::scan_custom_properties(content, text::CssDialect::Css)) {
    if (!prefix.empty() && !text::starts_with(decl.name, prefix)) continue;
    const auto category = infer_category(decl.name, decl.value);
    out.push_back(make_design_token(
      CssSource{ctx.path, decl.line}, "--" + decl.name, decl.name, category, decl.value,
      ctx.scanned_at));
  }

  for (const auto & decl : text::scan_custom_properties(content, text::CssDialect::Scss)) {
    const auto category = infer_category(decl.name, decl.value);
    out.push_back(make_design_token(
      CssSource{ctx.path, decl.line}, "$" + decl.name, decl.name, category, decl.value,
      ctx.scanned_at));
  }

  return out;
}

}  // namespace driftscan::tokens
