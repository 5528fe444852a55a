// driftscan/components/stencil.cpp - Stencil component extraction
#include "driftscan/components/extractors.hpp"
#include "driftscan/text/string_utils.hpp"

namespace driftscan::components
{

namespace
{

const Decorator * component_decorator(const ClassInfo & cls)
{
  for (const auto & d : cls.decorators) {
    if (d.is_call && d.name == "Component") return &d;
  }
  return nullptr;
}

/// String array literal, non-string elements skipped.
std::vector<std::string> string_array(Node n, const SourceManager & sm)
{
  std::vector<std::string> out;
  n = unwrap_expression(n);
  if (!n.is("array")) return out;
  for (const auto & e : n.named_children()) {
    if (auto s = string_value(e, sm)) out.push_back(std::move(*s));
  }
  return out;
}

std::optional<StyleUrls> read_style_urls(Node config, const SourceManager & sm)
{
  if (auto single = string_value(object_value(config, "styleUrl", sm), sm)) {
    return StyleUrls{std::move(*single)};
  }
  const Node urls = unwrap_expression(object_value(config, "styleUrls", sm));
  if (urls.is("array")) {
    std::string joined;
    for (const auto & url : string_array(urls, sm)) {
      if (!joined.empty()) joined += ',';
      joined += url;
    }
    return StyleUrls{std::move(joined)};
  }
  if (urls.is("object")) {
    std::map<std::string, std::string> by_mode;
    for (const auto & c : urls.named_children()) {
      if (!c.is("pair")) continue;
      if (auto v = string_value(c.child_by_field("value"), sm)) by_mode[pair_key(c, sm)] = *v;
    }
    return StyleUrls{std::move(by_mode)};
  }
  return std::nullopt;
}

void read_component_config(Node config, ComponentMetadata & md, const SourceManager & sm)
{
  if (config.is_null()) return;

  if (bool_value(object_value(config, "formAssociated", sm)).value_or(false)) {
    md.form_associated = true;
  }
  if (bool_value(object_value(config, "shadow", sm)).value_or(false)) {
    md.shadow_mode = ShadowMode::Shadow;
  } else if (bool_value(object_value(config, "scoped", sm)).value_or(false)) {
    md.shadow_mode = ShadowMode::Scoped;
  }
  if (const Node dirs = object_value(config, "assetsDirs", sm); !dirs.is_null()) {
    md.assets_dirs = string_array(dirs, sm);
  }
  md.style_urls = read_style_urls(config, sm);
}

std::optional<std::string> first_string_arg(const Decorator & d, const SourceManager & sm)
{
  if (!d.is_call || d.args.empty()) return std::nullopt;
  return string_value(d.args.front(), sm);
}

void read_prop_options(const Decorator & d, PropDefinition & p, const SourceManager & sm)
{
  const Node options = decorator_options(d);
  if (options.is_null()) return;
  p.is_mutable = bool_value(object_value(options, "mutable", sm));
  p.reflect = bool_value(object_value(options, "reflect", sm));
  p.attribute = string_value(object_value(options, "attribute", sm), sm);
}

PropDefinition event_prop(const ClassMember & m, const Decorator & d, const SourceManager & sm)
{
  PropDefinition p;
  p.name = m.name;
  p.type = "EventEmitter";
  p.description = "Stencil event";
  const Node options = decorator_options(d);
  if (!options.is_null()) {
    p.event_name = string_value(object_value(options, "eventName", sm), sm);
    p.bubbles = bool_value(object_value(options, "bubbles", sm));
    p.composed = bool_value(object_value(options, "composed", sm));
    p.cancelable = bool_value(object_value(options, "cancelable", sm));
  }
  return p;
}

}  // namespace

std::optional<Component> extract_stencil(const ClassInfo & cls, const ExtractContext & ctx)
{
  const auto & sm = ctx.sm;
  const Decorator * decorator = component_decorator(cls);
  if (decorator == nullptr) return std::nullopt;

  const Node config = decorator_options(*decorator);
  auto tag = string_value(object_value(config, "tag", sm), sm);
  Component c = make_class_component(
    Framework::Stencil, cls, tag ? std::move(*tag) : text::to_kebab_case(cls.name), ctx);

  std::vector<PropDefinition> props;
  std::vector<PropDefinition> states;
  std::vector<PropDefinition> events;
  std::vector<std::string> watchers;
  std::vector<std::string> methods;
  std::vector<std::string> listeners;
  bool has_element = false;

  for (const auto & m : cls.members) {
    if (m.is_method) {
      for (const auto & d : m.decorators) {
        if (d.name == "Watch") {
          if (auto s = first_string_arg(d, sm)) watchers.push_back(std::move(*s));
        } else if (d.name == "Listen") {
          if (auto s = first_string_arg(d, sm)) listeners.push_back(std::move(*s));
        } else if (d.name == "Method") {
          methods.push_back(m.name);
        }
      }
      continue;
    }

    if (const Decorator * d = find_decorator(m.decorators, "Prop")) {
      PropDefinition p = field_prop(m, sm);
      read_prop_options(*d, p, sm);
      props.push_back(std::move(p));
    } else if (find_decorator(m.decorators, "State") != nullptr) {
      PropDefinition p = field_prop(m, sm);
      p.required = false;
      p.description = "Internal state";
      states.push_back(std::move(p));
    } else if (const Decorator * ev = find_decorator(m.decorators, "Event")) {
      events.push_back(event_prop(m, *ev, sm));
    } else if (find_decorator(m.decorators, "Element") != nullptr) {
      has_element = true;
    }
  }

  c.props = std::move(props);
  c.props.insert(c.props.end(), states.begin(), states.end());
  c.props.insert(c.props.end(), events.begin(), events.end());

  auto & md = c.metadata;
  if (!watchers.empty()) md.watchers = std::move(watchers);
  if (!methods.empty()) md.methods = std::move(methods);
  if (!listeners.empty()) md.listeners = std::move(listeners);
  if (has_element) md.has_element = true;
  read_component_config(config, md, sm);
  return c;
}

}  // namespace driftscan::components
