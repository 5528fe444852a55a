// driftscan/components/jsdoc.cpp - JSDoc tag parsing for component docs
#include "driftscan/components/jsdoc.hpp"

#include <cctype>

#include "driftscan/text/string_utils.hpp"

namespace driftscan::components
{

namespace
{

bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

/// `{...}` at the front of `s`, nesting-aware; advances past it.
std::optional<std::string> read_braced(std::string_view & s)
{
  s = text::trim(s);
  if (s.empty() || s.front() != '{') return std::nullopt;
  int depth = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '{') ++depth;
    if (s[i] == '}' && --depth == 0) {
      std::string inner(text::trim(s.substr(1, i - 1)));
      s = text::trim(s.substr(i + 1));
      return inner;
    }
  }
  return std::nullopt;
}

std::string_view read_word(std::string_view & s)
{
  s = text::trim(s);
  size_t i = 0;
  while (i < s.size() && !is_space(s[i])) ++i;
  const auto word = s.substr(0, i);
  s = text::trim(s.substr(i));
  return word;
}

/// Remaining text with an optional leading `-` removed.
std::optional<std::string> read_description(std::string_view s)
{
  s = text::trim(s);
  if (!s.empty() && s.front() == '-') s = text::trim(s.substr(1));
  if (s.empty()) return std::nullopt;
  return std::string(s);
}

bool ends_in_punctuation(std::string_view name)
{
  if (name.empty()) return false;
  switch (name.back()) {
    case '.':
    case ',':
    case ';':
    case ':':
    case '!':
    case '?':
      return true;
    default:
      return false;
  }
}

std::string_view strip_comment_markers(std::string_view comment)
{
  comment = text::trim(comment);
  if (text::starts_with(comment, "/**")) {
    comment.remove_prefix(3);
  } else if (text::starts_with(comment, "/*")) {
    comment.remove_prefix(2);
  }
  if (text::ends_with(comment, "*/")) comment.remove_suffix(2);
  return comment;
}

}  // namespace

std::vector<JsDocTag> split_jsdoc_tags(std::string_view comment)
{
  std::vector<JsDocTag> tags;
  const auto body = strip_comment_markers(comment);

  size_t pos = 0;
  while (pos <= body.size()) {
    const auto nl = body.find('\n', pos);
    const auto end = nl == std::string_view::npos ? body.size() : nl;
    auto line = text::trim(body.substr(pos, end - pos));
    while (!line.empty() && line.front() == '*') line.remove_prefix(1);
    line = text::trim(line);

    if (!line.empty() && line.front() == '@') {
      line.remove_prefix(1);
      JsDocTag tag;
      tag.name = std::string(read_word(line));
      tag.body = std::string(line);
      tags.push_back(std::move(tag));
    } else if (!line.empty() && !tags.empty()) {
      auto & b = tags.back().body;
      if (!b.empty()) b += ' ';
      b += line;
    }

    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }
  return tags;
}

std::optional<JsDocEvent> parse_fires_tag(std::string_view body)
{
  JsDocEvent ev;
  ev.type = read_braced(body);
  const auto name = read_word(body);
  if (name.empty() || name == "-" || ends_in_punctuation(name)) return std::nullopt;
  ev.name = std::string(name);
  if (!ev.type) ev.type = read_braced(body);
  ev.description = read_description(body);
  return ev;
}

std::optional<JsDocSlot> parse_slot_tag(std::string_view body)
{
  JsDocSlot slot;
  body = text::trim(body);
  if (body.empty() || body.front() == '-') {
    slot.description = read_description(body);
    return slot;
  }
  const auto name = read_word(body);
  if (ends_in_punctuation(name)) return std::nullopt;
  slot.name = std::string(name);
  slot.description = read_description(body);
  return slot;
}

std::optional<JsDocCssProperty> parse_css_property_tag(std::string_view body)
{
  JsDocCssProperty prop;
  prop.syntax = read_braced(body);

  body = text::trim(body);
  if (!body.empty() && body.front() == '[') {
    const auto close = body.find(']');
    if (close == std::string_view::npos) return std::nullopt;
    const auto inner = body.substr(1, close - 1);
    const auto eq = inner.find('=');
    prop.name = std::string(text::trim(inner.substr(0, eq)));
    if (eq != std::string_view::npos) {
      prop.default_value = std::string(text::trim(inner.substr(eq + 1)));
    }
    body = body.substr(close + 1);
  } else {
    prop.name = std::string(read_word(body));
  }

  if (prop.name.empty() || prop.name == "-" || ends_in_punctuation(prop.name)) return std::nullopt;
  if (!prop.syntax) prop.syntax = read_braced(body);
  prop.description = read_description(body);
  return prop;
}

std::optional<JsDocCssPart> parse_css_part_tag(std::string_view body)
{
  JsDocCssPart part;
  const auto name = read_word(body);
  if (name.empty() || name == "-" || ends_in_punctuation(name)) return std::nullopt;
  part.name = std::string(name);
  part.description = read_description(body);
  return part;
}

JsDocInfo parse_jsdoc(std::string_view comment)
{
  JsDocInfo info;
  for (const auto & tag : split_jsdoc_tags(comment)) {
    const std::string name = text::to_lower(tag.name);
    if (name == "deprecated") {
      info.deprecated = true;
    } else if (name == "summary") {
      if (auto d = read_description(tag.body)) info.summary = std::move(d);
    } else if (name == "fires" || name == "event") {
      if (auto ev = parse_fires_tag(tag.body)) info.events.push_back(std::move(*ev));
    } else if (name == "slot") {
      if (auto s = parse_slot_tag(tag.body)) info.slots.push_back(std::move(*s));
    } else if (name == "cssproperty" || name == "cssprop") {
      if (auto p = parse_css_property_tag(tag.body)) info.css_properties.push_back(std::move(*p));
    } else if (name == "csspart") {
      if (auto p = parse_css_part_tag(tag.body)) info.css_parts.push_back(std::move(*p));
    }
  }
  return info;
}

void apply_jsdoc(const JsDocInfo & info, ComponentMetadata & metadata)
{
  metadata.deprecated = metadata.deprecated || info.deprecated;
  if (info.summary) metadata.summary = info.summary;
  metadata.events.insert(metadata.events.end(), info.events.begin(), info.events.end());
  metadata.slots.insert(metadata.slots.end(), info.slots.begin(), info.slots.end());
  metadata.css_properties.insert(
    metadata.css_properties.end(), info.css_properties.begin(), info.css_properties.end());
  metadata.css_parts.insert(metadata.css_parts.end(), info.css_parts.begin(), info.css_parts.end());
}

}  // namespace driftscan::components
