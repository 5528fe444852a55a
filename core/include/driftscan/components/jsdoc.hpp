// driftscan/components/jsdoc.hpp - JSDoc tag parsing for component docs
//
// Tags are parsed permissively: type-first (`{Type} name`) and name-first
// forms, with or without a `-` before the description. A tag whose name
// ends in sentence punctuation is prose, not a declaration, and is dropped.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "driftscan/model/component.hpp"

namespace driftscan::components
{

struct JsDocTag
{
  std::string name;  ///< tag name without `@`, as written
  std::string body;  ///< remaining text, continuation lines joined by spaces
};

struct JsDocInfo
{
  bool deprecated = false;
  std::optional<std::string> summary;
  std::vector<JsDocEvent> events;
  std::vector<JsDocSlot> slots;
  std::vector<JsDocCssProperty> css_properties;
  std::vector<JsDocCssPart> css_parts;
};

/// Split a `/** ... */` block into its tags.
[[nodiscard]] std::vector<JsDocTag> split_jsdoc_tags(std::string_view comment);

/// `@fires` / `@event`
[[nodiscard]] std::optional<JsDocEvent> parse_fires_tag(std::string_view body);
/// `@slot`; an empty name is the default slot.
[[nodiscard]] std::optional<JsDocSlot> parse_slot_tag(std::string_view body);
/// `@cssProperty` / `@cssProp`, including the `[--name=default]` form.
[[nodiscard]] std::optional<JsDocCssProperty> parse_css_property_tag(std::string_view body);
/// `@cssPart`
[[nodiscard]] std::optional<JsDocCssPart> parse_css_part_tag(std::string_view body);

[[nodiscard]] JsDocInfo parse_jsdoc(std::string_view comment);

/// Copy the parsed documentation into component metadata.
void apply_jsdoc(const JsDocInfo & info, ComponentMetadata & metadata);

}  // namespace driftscan::components
