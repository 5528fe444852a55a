// driftscan/text/string_utils.cpp - String helper implementation
#include "driftscan/text/string_utils.hpp"

#include <cctype>

namespace driftscan::text
{

namespace
{

bool is_lower(char c) noexcept { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_upper(char c) noexcept { return std::isupper(static_cast<unsigned char>(c)) != 0; }

}  // namespace

std::string_view trim(std::string_view s) noexcept
{
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
  return s.substr(b, e - b);
}

std::string to_lower(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

bool is_quoted(std::string_view s) noexcept
{
  if (s.size() < 2) return false;
  const char q = s.front();
  return (q == '"' || q == '\'' || q == '`') && s.back() == q;
}

std::string_view unquote(std::string_view s) noexcept
{
  return is_quoted(s) ? s.substr(1, s.size() - 2) : s;
}

std::string to_kebab_case(std::string_view name)
{
  std::string out;
  out.reserve(name.size() + 4);
  for (size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (i > 0 && is_upper(c)) {
      const char prev = name[i - 1];
      const bool after_lower = is_lower(prev);
      const bool ends_capital_run =
        is_upper(prev) && i + 1 < name.size() && is_lower(name[i + 1]);
      if (after_lower || ends_capital_run) {
        out += '-';
      }
    }
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string pascal_case_from_tag(std::string_view tag)
{
  std::string out;
  bool upper_next = true;
  for (const char c : tag) {
    if (c == '-' || c == '_' || c == '.') {
      upper_next = true;
      continue;
    }
    out += upper_next ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
    upper_next = false;
  }
  return out;
}

}  // namespace driftscan::text
