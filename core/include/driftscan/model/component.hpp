// driftscan/model/component.hpp - Component data model
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "driftscan/model/design_token.hpp"

namespace driftscan
{

enum class Framework : uint8_t {
  Lit,
  Stencil,
  Fast,
  Vanilla,
  Haunted,
  Hybrids,
  StencilFunctional,
};

/// "lit", "stencil", "fast", "vanilla", "haunted", "hybrids", "stencil-functional"
[[nodiscard]] std::string_view to_string(Framework f) noexcept;
[[nodiscard]] std::optional<Framework> framework_from_string(std::string_view s) noexcept;

struct ComponentSource
{
  Framework framework = Framework::Lit;
  std::string path;
  std::string export_name;
  std::string tag_name;
  uint32_t line = 0;
};

/**
 * A component property, state field or event.
 *
 * The property options (mutable/reflect/attribute) and event options
 * (event_name/bubbles/composed/cancelable) are set only where the source
 * declares them.
 */
struct PropDefinition
{
  std::string name;
  std::string type = "unknown";
  bool required = false;
  std::optional<std::string> default_value;
  std::optional<std::string> description;

  std::optional<bool> is_mutable;
  std::optional<bool> reflect;
  std::optional<std::string> attribute;

  std::optional<std::string> event_name;
  std::optional<bool> bubbles;
  std::optional<bool> composed;
  std::optional<bool> cancelable;
};

// ============================================================================
// Metadata
// ============================================================================

struct ReactiveController
{
  std::string property;
  std::string controller_type;
};

/// @query / @queryAll / @queryAsync / @queryAssignedElements / @queryAssignedNodes
struct ElementQuery
{
  std::string decorator;
  std::string property;
  std::optional<std::string> selector;
  std::optional<bool> cache;
  std::optional<std::string> slot;
  std::optional<bool> flatten;
};

struct JsDocEvent
{
  std::string name;
  std::optional<std::string> type;
  std::optional<std::string> description;
};

struct JsDocSlot
{
  std::string name;  ///< empty for the default slot
  std::optional<std::string> description;
};

struct JsDocCssProperty
{
  std::string name;
  std::optional<std::string> syntax;
  std::optional<std::string> default_value;
  std::optional<std::string> description;
};

struct JsDocCssPart
{
  std::string name;
  std::optional<std::string> description;
};

enum class ShadowMode : uint8_t {
  Shadow,
  Scoped,
};

[[nodiscard]] std::string_view to_string(ShadowMode m) noexcept;

/// A single styleUrl / joined styleUrls array, or a platform-keyed map.
using StyleUrls = std::variant<std::string, std::map<std::string, std::string>>;

struct ComponentMetadata
{
  bool deprecated = false;
  std::vector<std::string> tags;

  // Stencil
  std::optional<std::vector<std::string>> watchers;
  std::optional<std::vector<std::string>> methods;
  std::optional<std::vector<std::string>> listeners;
  std::optional<bool> form_associated;
  std::optional<bool> has_element;
  std::optional<ShadowMode> shadow_mode;
  std::optional<std::vector<std::string>> assets_dirs;
  std::optional<StyleUrls> style_urls;

  // Lit
  std::vector<ReactiveController> controllers;
  std::vector<ElementQuery> queries;

  // JSDoc
  std::optional<std::string> summary;
  std::vector<JsDocEvent> events;
  std::vector<JsDocSlot> slots;
  std::vector<JsDocCssProperty> css_properties;
  std::vector<JsDocCssPart> css_parts;
};

// ============================================================================
// Component
// ============================================================================

struct Component
{
  std::string id;
  std::string name;
  ComponentSource source;
  std::vector<PropDefinition> props;
  std::vector<std::string> variants;
  std::vector<std::string> tokens;
  std::vector<std::string> dependencies;
  ComponentMetadata metadata;
  Timestamp scanned_at{};
};

}  // namespace driftscan
