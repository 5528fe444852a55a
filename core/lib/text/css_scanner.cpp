// driftscan/text/css_scanner.cpp - CSS/SCSS scanning primitives
#include "driftscan/text/css_scanner.hpp"

#include <cctype>

#include "driftscan/basic/source_manager.hpp"
#include "driftscan/text/string_utils.hpp"

namespace driftscan::text
{

namespace
{

bool is_name_char(char c) noexcept
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
}

/// Try to match `<sigil><name>\s*:` at `pos`; on success return the name and
/// set `value_start` to the offset right after the colon.
std::optional<std::string_view> match_declaration_start(
  std::string_view text, size_t pos, CssDialect dialect, size_t & value_start)
{
  size_t i = pos;
  if (dialect == CssDialect::Css) {
    if (i + 1 >= text.size() || text[i] != '-' || text[i + 1] != '-') return std::nullopt;
    i += 2;
  } else {
    if (text[i] != '$') return std::nullopt;
    i += 1;
  }

  const size_t name_begin = i;
  while (i < text.size() && is_name_char(text[i])) ++i;
  if (i == name_begin) return std::nullopt;
  const size_t name_end = i;

  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) ++i;
  if (i >= text.size() || text[i] != ':') return std::nullopt;

  value_start = i + 1;
  return text.substr(name_begin, name_end - name_begin);
}

}  // namespace

std::string strip_css_comments(std::string_view source)
{
  std::string out;
  out.reserve(source.size());

  size_t i = 0;
  while (i < source.size()) {
    if (source[i] == '/' && i + 1 < source.size() && source[i + 1] == '*') {
      out += "  ";
      size_t j = i + 2;
      while (j < source.size() && !(source[j] == '*' && j + 1 < source.size() && source[j + 1] == '/')) {
        out += source[j] == '\n' ? '\n' : ' ';
        ++j;
      }
      if (j < source.size()) {
        out += "  ";
        j += 2;
      }
      i = j;
    } else {
      out += source[i];
      ++i;
    }
  }
  return out;
}

std::optional<std::string> extract_value(std::string_view text, size_t start)
{
  size_t i = start;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) ++i;

  const size_t begin = i;
  int paren_depth = 0;
  char in_string = '\0';

  for (; i < text.size(); ++i) {
    const char c = text[i];

    if (in_string != '\0') {
      if (c == in_string && text[i - 1] != '\\') {
        in_string = '\0';
      }
      continue;
    }

    if (c == '"' || c == '\'') {
      in_string = c;
    } else if (c == '(') {
      ++paren_depth;
    } else if (c == ')') {
      --paren_depth;
    } else if ((c == ';' || c == '}') && paren_depth == 0) {
      break;
    }
  }

  const std::string_view value = trim(text.substr(begin, i - begin));
  if (value.empty()) return std::nullopt;
  return std::string(value);
}

std::vector<CssDeclaration> scan_custom_properties(std::string_view source, CssDialect dialect)
{
  const std::string stripped = strip_css_comments(source);
  const std::string_view text(stripped);

  std::vector<CssDeclaration> out;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t value_start = 0;
    const auto name = match_declaration_start(text, pos, dialect, value_start);
    if (!name) {
      ++pos;
      continue;
    }

    if (auto value = extract_value(text, value_start)) {
      out.push_back(CssDeclaration{std::string(*name), std::move(*value), line_number_at(source, pos)});
    }
    // Resume after the delimiter, not after the value.
    pos = value_start;
  }
  return out;
}

}  // namespace driftscan::text
