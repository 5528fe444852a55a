// driftscan/text/literal_parser.cpp - Object-literal entry parser
#include "driftscan/text/literal_parser.hpp"

#include <cctype>

#include "driftscan/text/string_utils.hpp"

namespace driftscan::text
{

namespace
{

bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool is_key_char(char c) noexcept
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

bool is_quote(char c) noexcept { return c == '"' || c == '\'' || c == '`'; }

/// Offset just past the quote closing the one at `pos` (or end of text).
size_t skip_quoted(std::string_view text, size_t pos) noexcept
{
  const char q = text[pos];
  for (size_t i = pos + 1; i < text.size(); ++i) {
    if (text[i] == q && text[i - 1] != '\\') return i + 1;
  }
  return text.size();
}

/// True when the quoted run [pos, end) ends on its own unescaped quote.
bool is_closed_quote(std::string_view text, size_t pos, size_t end) noexcept
{
  return end - pos >= 2 && text[end - 1] == text[pos] && text[end - 2] != '\\';
}

/// Offset just past a `//` or `/* */` comment at `pos`, or `pos` if none.
size_t skip_comment(std::string_view text, size_t pos) noexcept
{
  if (pos + 1 >= text.size() || text[pos] != '/') return pos;
  if (text[pos + 1] == '/') {
    const size_t nl = text.find('\n', pos + 2);
    return nl == std::string_view::npos ? text.size() : nl + 1;
  }
  if (text[pos + 1] == '*') {
    const size_t close = text.find("*/", pos + 2);
    return close == std::string_view::npos ? text.size() : close + 2;
  }
  return pos;
}

/// Skip whitespace, commas and comments between entries.
size_t skip_separators(std::string_view text, size_t i) noexcept
{
  while (i < text.size()) {
    if (is_space(text[i]) || text[i] == ',') {
      ++i;
      continue;
    }
    const size_t after = skip_comment(text, i);
    if (after == i) break;
    i = after;
  }
  return i;
}

size_t skip_blank(std::string_view text, size_t i) noexcept
{
  while (i < text.size()) {
    if (is_space(text[i])) {
      ++i;
      continue;
    }
    const size_t after = skip_comment(text, i);
    if (after == i) break;
    i = after;
  }
  return i;
}

/**
 * Scan forward until a comma at nesting depth 0 (or a closing brace at depth 0
 * when `stop_at_brace`). Returns the offset of that delimiter.
 */
size_t scan_to_top_level(std::string_view text, size_t i, bool stop_at_brace) noexcept
{
  int depth = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (is_quote(c)) {
      i = skip_quoted(text, i);
      continue;
    }
    if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      if (depth == 0) {
        if (c == '}' && stop_at_brace) return i;
        ++i;
        continue;
      }
      --depth;
    } else if (c == ',' && depth == 0) {
      return i;
    }
    ++i;
  }
  return i;
}

}  // namespace

std::optional<size_t> find_matching_close(std::string_view text, size_t open_pos)
{
  if (open_pos >= text.size()) return std::nullopt;
  const char open = text[open_pos];
  char close = '\0';
  switch (open) {
    case '{':
      close = '}';
      break;
    case '[':
      close = ']';
      break;
    case '(':
      close = ')';
      break;
    default:
      return std::nullopt;
  }

  int depth = 0;
  size_t i = open_pos;
  while (i < text.size()) {
    const char c = text[i];
    if (is_quote(c)) {
      i = skip_quoted(text, i);
      continue;
    }
    const size_t after_comment = skip_comment(text, i);
    if (after_comment != i) {
      i = after_comment;
      continue;
    }
    if (c == open) {
      ++depth;
    } else if (c == close) {
      --depth;
      if (depth == 0) return i;
    }
    ++i;
  }
  return std::nullopt;
}

std::optional<std::string_view> extract_balanced(std::string_view text, size_t open_pos)
{
  const auto close = find_matching_close(text, open_pos);
  if (!close) return std::nullopt;
  return text.substr(open_pos, *close - open_pos + 1);
}

std::string_view strip_delimiters(std::string_view region) noexcept
{
  if (region.size() < 2) return {};
  return region.substr(1, region.size() - 2);
}

std::vector<std::string_view> split_top_level(std::string_view body)
{
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < body.size()) {
    const size_t end = scan_to_top_level(body, i, /*stop_at_brace*/ false);
    const auto element = trim(body.substr(i, end - i));
    if (!element.empty()) out.push_back(element);
    i = end + 1;
  }
  return out;
}

std::vector<LiteralEntry> parse_entries(std::string_view body)
{
  std::vector<LiteralEntry> entries;
  size_t i = 0;
  const size_t n = body.size();

  while (true) {
    i = skip_separators(body, i);
    if (i >= n) break;

    // --- key ---
    std::string key;
    const char first = body[i];
    if (first == '"' || first == '\'') {
      const size_t end = skip_quoted(body, i);
      key = std::string(unquote(body.substr(i, end - i)));
      i = end;
    } else if (is_key_char(first)) {
      const size_t begin = i;
      while (i < n && is_key_char(body[i])) ++i;
      key = std::string(body.substr(begin, i - begin));
    } else {
      i = scan_to_top_level(body, i, /*stop_at_brace*/ false) + 1;
      continue;
    }

    i = skip_blank(body, i);
    if (i >= n || body[i] != ':') {
      i = scan_to_top_level(body, i, /*stop_at_brace*/ false) + 1;
      continue;
    }
    i = skip_blank(body, i + 1);
    if (i >= n) break;

    // --- value ---
    LiteralEntry entry;
    entry.key = std::move(key);
    const char c = body[i];
    size_t end = i;
    if (c == '"' || c == '\'' || c == '`') {
      // An unterminated string runs to the end of the body and is not a literal.
      end = skip_quoted(body, i);
      if (!is_closed_quote(body, i, end)) {
        entry.kind = LiteralKind::Other;
      } else {
        entry.kind = c == '`' ? LiteralKind::Template : LiteralKind::String;
      }
    } else if (c == '{' || c == '[') {
      const auto close = find_matching_close(body, i);
      end = close ? *close + 1 : n;
      entry.kind = c == '{' ? LiteralKind::Object : LiteralKind::Array;
    } else {
      end = scan_to_top_level(body, i, /*stop_at_brace*/ true);
      entry.kind = LiteralKind::Other;
    }

    entry.raw = std::string(trim(body.substr(i, end - i)));
    entries.push_back(std::move(entry));

    // Discard trailing text such as `as const` up to the next entry.
    i = end < n && body[end] == ',' ? end + 1 : scan_to_top_level(body, end, false) + 1;
  }

  return entries;
}

}  // namespace driftscan::text
