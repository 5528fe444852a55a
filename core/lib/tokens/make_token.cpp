// driftscan/tokens/make_token.cpp - Shared DesignToken assembly
#include <utility>

#include "driftscan/model/identity.hpp"
#include "driftscan/tokens/category.hpp"
#include "driftscan/tokens/token_extractors.hpp"

namespace driftscan::tokens
{

DesignToken make_design_token(
  TokenSource source, std::string display_name, std::string_view id_name, TokenCategory category,
  std::string_view raw_value, Timestamp scanned_at)
{
  DesignToken token;
  token.id = make_token_id(source, id_name);
  token.name = std::move(display_name);
  token.category = category;
  token.value = parse_token_value(category, raw_value);
  token.source = std::move(source);
  token.aliases = extract_aliases(raw_value);
  token.scanned_at = scanned_at;
  return token;
}

}  // namespace driftscan::tokens
