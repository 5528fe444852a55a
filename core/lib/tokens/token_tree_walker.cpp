// driftscan/tokens/token_tree_walker.cpp - Literal tree -> token candidates
#include "driftscan/tokens/token_tree_walker.hpp"

#include <cctype>
#include <string>
#include <utility>

#include "driftscan/text/string_utils.hpp"
#include "driftscan/tokens/category.hpp"

namespace driftscan::tokens
{

namespace
{

using text::LiteralEntry;
using text::LiteralKind;

bool is_meta_key(std::string_view key)
{
  return key == "value" || key == "description" || key == "type" || key == "$value" ||
         key == "$type";
}

bool is_ident_start(char c) noexcept
{
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

bool is_ident_char(char c) noexcept
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

/// `-?\d+(\.\d+)?`
bool is_number(std::string_view s)
{
  size_t i = 0;
  if (i < s.size() && s[i] == '-') ++i;
  const size_t digits_begin = i;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0) ++i;
  if (i == digits_begin) return false;
  if (i < s.size() && s[i] == '.') {
    const size_t frac_begin = ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0) ++i;
    if (i == frac_begin) return false;
  }
  return i == s.size();
}

/// `identifier(number)`, e.g. `rem(12)` or `px(4)`
bool is_unit_call(std::string_view s)
{
  if (s.empty() || !is_ident_start(s[0]) || s.back() != ')') return false;
  size_t i = 1;
  while (i < s.size() && is_ident_char(s[i])) ++i;
  if (i >= s.size() || s[i] != '(') return false;
  return is_number(text::trim(s.substr(i + 1, s.size() - i - 2)));
}

const LiteralEntry * find_entry(const std::vector<LiteralEntry> & entries, std::string_view key)
{
  for (const auto & e : entries) {
    if (e.key == key) return &e;
  }
  return nullptr;
}

std::vector<LiteralEntry> object_entries(const LiteralEntry & entry)
{
  return text::parse_entries(text::strip_delimiters(entry.raw));
}

/// Value of a `{ value: "..." }` wrapper, if `entries` is one.
std::optional<std::string> wrapped_value(const std::vector<LiteralEntry> & entries)
{
  const auto * v = find_entry(entries, "value");
  if (v == nullptr) return std::nullopt;
  if (v->kind == LiteralKind::String || v->kind == LiteralKind::Template) {
    return std::string(text::unquote(v->raw));
  }
  if (v->kind == LiteralKind::Other && is_number(v->raw)) return v->raw;
  return std::nullopt;
}

/// Light branch of a `{ value: { _light: "...", _dark: "..." } }` wrapper.
std::optional<std::string> semantic_value(const std::vector<LiteralEntry> & entries)
{
  const auto * v = find_entry(entries, "value");
  if (v == nullptr || v->kind != LiteralKind::Object) return std::nullopt;
  const auto branches = object_entries(*v);
  const auto * light = find_entry(branches, "_light");
  if (light == nullptr) return std::nullopt;
  if (light->kind != LiteralKind::String && light->kind != LiteralKind::Template) {
    return std::nullopt;
  }
  return std::string(text::unquote(light->raw));
}

std::optional<std::string> description_of(const std::vector<LiteralEntry> & entries)
{
  const auto * d = find_entry(entries, "description");
  if (d == nullptr || d->kind != LiteralKind::String) return std::nullopt;
  return std::string(text::unquote(d->raw));
}

/// A meta key is still walked when its own value looks like a token.
bool looks_like_token_value(const LiteralEntry & entry)
{
  if (entry.kind == LiteralKind::Array) return true;
  if (entry.kind == LiteralKind::Object) {
    return find_entry(object_entries(entry), "value") != nullptr;
  }
  if (entry.kind == LiteralKind::String) {
    const auto v = text::unquote(entry.raw);
    return !v.empty() && v[0] == '#' && looks_like_color(v);
  }
  return false;
}

TokenCategory resolve_category(
  TokenCategory hint, std::string_view full_name, std::string_view key, std::string_view value)
{
  if (hint != TokenCategory::Other) return hint;
  const auto by_path = infer_category(full_name, value);
  if (by_path != TokenCategory::Other) return by_path;
  return infer_category(key, value);
}

std::string join_path(std::string_view prefix, std::string_view key)
{
  if (prefix.empty()) return std::string(key);
  std::string out(prefix);
  out += '.';
  out += key;
  return out;
}

class Walker
{
public:
  explicit Walker(const WalkOptions & options) : options_(options) {}

  void walk(
    const std::vector<LiteralEntry> & entries, std::string_view prefix, TokenCategory hint)
  {
    for (const auto & entry : entries) {
      if (is_meta_key(entry.key) && !looks_like_token_value(entry)) continue;
      visit(entry, join_path(prefix, entry.key), hint);
    }
  }

  std::vector<TokenCandidate> take() && { return std::move(out_); }

private:
  void emit(
    std::string name, std::string_view key, std::string value, TokenCategory hint,
    std::optional<std::string> description = std::nullopt)
  {
    TokenCandidate c;
    c.category = resolve_category(hint, name, key, value);
    c.name = std::move(name);
    c.value = std::move(value);
    c.description = std::move(description);
    out_.push_back(std::move(c));
  }

  void visit(const LiteralEntry & entry, std::string full_name, TokenCategory hint)
  {
    switch (entry.kind) {
      case LiteralKind::Object: {
        const auto inner = object_entries(entry);
        if (auto v = wrapped_value(inner)) {
          emit(std::move(full_name), entry.key, std::move(*v), hint, description_of(inner));
          return;
        }
        if (options_.semantic) {
          if (auto v = semantic_value(inner)) {
            emit(std::move(full_name), entry.key, std::move(*v), hint, description_of(inner));
            return;
          }
        }
        const auto child_hint =
          hint != TokenCategory::Other ? hint : category_for_group(entry.key);
        walk(inner, full_name, child_hint);
        return;
      }
      case LiteralKind::String:
      case LiteralKind::Template:
        emit(std::move(full_name), entry.key, std::string(text::unquote(entry.raw)), hint);
        return;
      case LiteralKind::Other:
        if (is_unit_call(entry.raw) || is_number(entry.raw)) {
          emit(std::move(full_name), entry.key, entry.raw, hint);
        }
        return;
      case LiteralKind::Array:
        visit_array(entry, full_name, hint);
        return;
    }
  }

  void visit_array(const LiteralEntry & entry, const std::string & full_name, TokenCategory hint)
  {
    const auto elements = text::split_top_level(text::strip_delimiters(entry.raw));
    if (elements.empty()) return;
    for (const auto e : elements) {
      if (!text::is_quoted(e)) return;
    }
    for (size_t i = 0; i < elements.size(); ++i) {
      std::string value(text::unquote(elements[i]));
      const auto element_hint = looks_like_color(value) ? TokenCategory::Color : hint;
      emit(join_path(full_name, std::to_string(i)), entry.key, std::move(value), element_hint);
    }
  }

  const WalkOptions & options_;
  std::vector<TokenCandidate> out_;
};

}  // namespace

std::vector<TokenCandidate> walk_token_tree(
  const std::vector<text::LiteralEntry> & entries, std::string_view prefix, TokenCategory hint,
  const WalkOptions & options)
{
  Walker walker(options);
  walker.walk(entries, prefix, hint);
  return std::move(walker).take();
}

}  // namespace driftscan::tokens
