// driftscan/tokens/ts_tokens.cpp - Union types and token objects in TS/JS sources
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include "driftscan/basic/source_manager.hpp"
#include "driftscan/text/literal_parser.hpp"
#include "driftscan/text/string_utils.hpp"
#include "driftscan/tokens/category.hpp"
#include "driftscan/tokens/token_extractors.hpp"
#include "driftscan/tokens/token_tree_walker.hpp"

namespace driftscan::tokens
{

namespace
{

bool is_ident_start(char c) noexcept
{
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

bool is_ident_char(char c) noexcept
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

size_t skip_ws(std::string_view s, size_t i)
{
  while (i < s.size() && is_space(s[i])) ++i;
  return i;
}

/// Skip spaces and tabs but stop at a newline.
size_t skip_inline_ws(std::string_view s, size_t i)
{
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r')) ++i;
  return i;
}

std::string_view read_ident(std::string_view s, size_t & i)
{
  const size_t begin = i;
  if (i < s.size() && is_ident_start(s[i])) {
    ++i;
    while (i < s.size() && is_ident_char(s[i])) ++i;
  }
  return s.substr(begin, i - begin);
}

/// True when `word` occurs at `pos` as a whole identifier (not a member access).
bool keyword_at(std::string_view s, size_t pos, std::string_view word)
{
  if (s.compare(pos, word.size(), word) != 0) return false;
  if (pos > 0 && (is_ident_char(s[pos - 1]) || s[pos - 1] == '.')) return false;
  const size_t end = pos + word.size();
  return end >= s.size() || !is_ident_char(s[end]);
}

/// Index just past the quote closing the string that opens at `i`.
size_t skip_string(std::string_view s, size_t i)
{
  const char quote = s[i++];
  while (i < s.size()) {
    if (s[i] == '\\') {
      i += 2;
      continue;
    }
    if (s[i] == quote) return i + 1;
    ++i;
  }
  return s.size();
}

/**
 * Blank `//` and `/ * * /` comments, keeping newlines and offsets.
 *
 * Quoted strings and template literals are left untouched so URLs such as
 * `'https://...'` survive.
 */
std::string strip_js_comments(std::string_view source)
{
  std::string out(source);
  size_t i = 0;
  while (i < out.size()) {
    const char c = out[i];
    if (c == '"' || c == '\'' || c == '`') {
      i = skip_string(out, i);
      continue;
    }
    if (c == '/' && i + 1 < out.size() && out[i + 1] == '/') {
      while (i < out.size() && out[i] != '\n') out[i++] = ' ';
      continue;
    }
    if (c == '/' && i + 1 < out.size() && out[i + 1] == '*') {
      const auto close = out.find("*/", i + 2);
      const size_t end = close == std::string::npos ? out.size() : close + 2;
      for (; i < end; ++i) {
        if (out[i] != '\n') out[i] = ' ';
      }
      continue;
    }
    ++i;
  }
  return out;
}

/// Skip a non-string union member: up to `|` or `;` at bracket depth 0, or a line end.
size_t skip_type_member(std::string_view s, size_t i)
{
  int depth = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '"' || c == '\'' || c == '`') {
      i = skip_string(s, i);
      continue;
    }
    if (c == '(' || c == '[' || c == '{' || c == '<') {
      ++depth;
    } else if ((c == ')' || c == ']' || c == '}') || (c == '>' && i > 0 && s[i - 1] != '=')) {
      if (depth == 0) return i;
      --depth;
    } else if (depth == 0 && (c == '|' || c == ';' || c == '\n' || c == ',' || c == '=')) {
      return i;
    }
    ++i;
  }
  return i;
}

/// Parse `'a' | 'b' | Other` starting after `=`; returns string members only.
std::vector<std::string> parse_union_members(std::string_view s, size_t i)
{
  std::vector<std::string> members;
  i = skip_ws(s, i);
  if (i < s.size() && s[i] == '|') i = skip_ws(s, i + 1);

  while (i < s.size()) {
    if (s[i] == '\'' || s[i] == '"') {
      const size_t end = skip_string(s, i);
      members.emplace_back(s.substr(i + 1, end - i - 2));
      i = end;
    } else {
      const size_t end = skip_type_member(s, i);
      if (end == i) break;
      i = end;
    }

    i = skip_inline_ws(s, i);
    if (i < s.size() && s[i] == '\n') {
      const size_t next = skip_ws(s, i);
      if (next >= s.size() || s[next] != '|') break;
      i = next;
    }
    if (i >= s.size() || s[i] != '|') break;
    i = skip_ws(s, i + 1);
  }
  return members;
}

constexpr std::array<std::string_view, 12> kTypeSuffixes = {
  "variant", "color", "size", "style", "theme", "type",
  "severity", "status", "state", "intent", "appearance", "scheme",
};

constexpr std::array<std::string_view, 22> kTokenVariableNames = {
  "colors",       "spacing",     "space",       "typography",     "shadows",    "radii",
  "radius",       "zindex",      "zindices",    "breakpoints",    "theme",      "tokens",
  "palette",      "durations",   "easings",     "animations",     "letterspacings",
  "lineheights",  "fontsizes",   "fontweights", "fonts",          "sizes",
};

/// Vendor spellings such as DEFAULT_THEME, defaultColors, semanticTokens.
constexpr std::array<std::string_view, 4> kTokenVariableSuffixes = {
  "theme",
  "colors",
  "tokens",
  "palette",
};

std::string normalize_variable_name(std::string_view name)
{
  std::string out;
  out.reserve(name.size());
  for (const char c : name) {
    if (c == '_' || c == '-') continue;
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

void find_define_calls(std::string_view s, std::vector<std::pair<size_t, TokenObject>> & out)
{
  for (const std::string_view callee : {std::string_view("defineTokens"),
                                        std::string_view("defineSemanticTokens")}) {
    size_t pos = 0;
    while ((pos = s.find(callee, pos)) != std::string_view::npos) {
      const size_t at = pos;
      pos += callee.size();
      if (!keyword_at(s, at, callee) || pos >= s.size() || s[pos] != '.') continue;

      size_t i = pos + 1;
      const auto group = read_ident(s, i);
      if (group.empty()) continue;
      i = skip_ws(s, i);
      if (i >= s.size() || s[i] != '(') continue;
      i = skip_ws(s, i + 1);
      if (i >= s.size() || s[i] != '{') continue;

      const auto region = text::extract_balanced(s, i);
      if (!region) continue;

      TokenObject obj;
      obj.type_name = std::string(callee) + "." + std::string(group);
      obj.group = std::string(group);
      obj.body = std::string(text::strip_delimiters(*region));
      obj.semantic = callee == "defineSemanticTokens";
      out.emplace_back(at, std::move(obj));
      pos = i + region->size();
    }
  }
}

/// Skip a `: Type` annotation up to the `=` at depth 0.
size_t skip_annotation(std::string_view s, size_t i)
{
  int depth = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '(' || c == '[' || c == '{' || c == '<') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}' || (c == '>' && i > 0 && s[i - 1] != '=')) {
      --depth;
    } else if (c == '=' && depth == 0) {
      return i;
    } else if (c == ';' && depth == 0) {
      return s.size();
    }
    ++i;
  }
  return i;
}

void find_exported_objects(std::string_view s, std::vector<std::pair<size_t, TokenObject>> & out)
{
  size_t pos = 0;
  while ((pos = s.find("export", pos)) != std::string_view::npos) {
    const size_t at = pos;
    pos += 6;
    if (!keyword_at(s, at, "export")) continue;

    size_t i = skip_ws(s, pos);
    if (!keyword_at(s, i, "const")) continue;
    i = skip_ws(s, i + 5);
    const auto name = read_ident(s, i);
    if (name.empty() || !is_token_variable_name(name)) continue;

    i = skip_ws(s, i);
    if (i < s.size() && s[i] == ':') i = skip_annotation(s, i + 1);
    if (i >= s.size() || s[i] != '=') continue;
    i = skip_ws(s, i + 1);
    if (i >= s.size() || s[i] != '{') continue;

    const auto region = text::extract_balanced(s, i);
    if (!region) continue;

    TokenObject obj;
    obj.type_name = std::string(name);
    obj.group = std::string(name);
    obj.body = std::string(text::strip_delimiters(*region));
    out.emplace_back(at, std::move(obj));
    pos = i + region->size();
  }
}

}  // namespace

bool is_token_type_name(std::string_view name)
{
  const std::string lower = text::to_lower(name);
  return std::any_of(kTypeSuffixes.begin(), kTypeSuffixes.end(), [&](std::string_view suffix) {
    return text::ends_with(lower, suffix);
  });
}

bool is_token_variable_name(std::string_view name)
{
  const std::string n = normalize_variable_name(name);
  if (std::find(kTokenVariableNames.begin(), kTokenVariableNames.end(), n) !=
      kTokenVariableNames.end()) {
    return true;
  }
  return std::any_of(
    kTokenVariableSuffixes.begin(), kTokenVariableSuffixes.end(),
    [&](std::string_view suffix) { return text::ends_with(n, suffix); });
}

std::vector<UnionType> find_union_types(std::string_view content)
{
  const std::string stripped = strip_js_comments(content);
  const std::string_view s = stripped;

  std::vector<UnionType> out;
  size_t pos = 0;
  while ((pos = s.find("type", pos)) != std::string_view::npos) {
    const size_t at = pos;
    pos += 4;
    if (!keyword_at(s, at, "type")) continue;

    size_t i = skip_ws(s, pos);
    const auto name = read_ident(s, i);
    if (name.empty() || !is_token_type_name(name)) continue;

    i = skip_ws(s, i);
    if (i < s.size() && s[i] == '<') {
      const auto close = s.find('>', i);
      if (close == std::string_view::npos) continue;
      i = skip_ws(s, close + 1);
    }
    if (i >= s.size() || s[i] != '=' || (i + 1 < s.size() && (s[i + 1] == '=' || s[i + 1] == '>'))) {
      continue;
    }

    auto members = parse_union_members(s, i + 1);
    if (members.empty()) continue;

    UnionType u;
    u.name = std::string(name);
    u.members = std::move(members);
    u.line = line_number_at(content, at);
    out.push_back(std::move(u));
  }
  return out;
}

std::vector<TokenObject> find_token_objects(std::string_view content)
{
  const std::string stripped = strip_js_comments(content);

  std::vector<std::pair<size_t, TokenObject>> found;
  find_define_calls(stripped, found);
  find_exported_objects(stripped, found);
  std::stable_sort(found.begin(), found.end(), [](const auto & a, const auto & b) {
    return a.first < b.first;
  });

  std::vector<TokenObject> out;
  out.reserve(found.size());
  for (auto & [offset, obj] : found) {
    obj.line = line_number_at(content, offset);
    out.push_back(std::move(obj));
  }
  return out;
}

std::vector<DesignToken> extract_ts_tokens(std::string_view content, const TokenFileContext & ctx)
{
  std::vector<DesignToken> out;

  for (const auto & u : find_union_types(content)) {
    for (const auto & member : u.members) {
      auto token = make_design_token(
        TypeScriptSource{ctx.path, u.name, u.line}, member, member, infer_category(u.name, member),
        member, ctx.scanned_at);
      token.metadata["description"] = "Value from " + u.name + " union type";
      out.push_back(std::move(token));
    }
  }

  for (const auto & obj : find_token_objects(content)) {
    WalkOptions options;
    options.semantic = obj.semantic;
    const auto candidates = walk_token_tree(
      text::parse_entries(obj.body), "", category_for_group(obj.group), options);
    for (const auto & c : candidates) {
      auto token = make_design_token(
        TypeScriptSource{ctx.path, obj.type_name, obj.line}, c.name, c.name, c.category, c.value,
        ctx.scanned_at);
      if (c.description) token.metadata["description"] = *c.description;
      out.push_back(std::move(token));
    }
  }

  return out;
}

}  // namespace driftscan::tokens
