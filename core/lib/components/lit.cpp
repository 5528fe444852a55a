// driftscan/components/lit.cpp - Lit element extraction
#include <array>

#include "driftscan/components/extractors.hpp"
#include "driftscan/components/jsdoc.hpp"
#include "driftscan/text/string_utils.hpp"

namespace driftscan::components
{

namespace
{

constexpr std::array<std::string_view, 3> kPropertyDecorators = {
  "property", "state", "internalProperty"};

constexpr std::array<std::string_view, 5> kQueryDecorators = {
  "query", "queryAll", "queryAsync", "queryAssignedElements", "queryAssignedNodes"};

template <size_t N>
const Decorator * find_any(
  const std::vector<Decorator> & decorators, const std::array<std::string_view, N> & names)
{
  for (const auto & d : decorators) {
    if (!d.is_call) continue;
    for (const auto name : names) {
      if (d.name == name) return &d;
    }
  }
  return nullptr;
}

/// Record `attribute` and `reflect` from a property options object.
void read_property_options(Node options, PropDefinition & p, const SourceManager & sm)
{
  if (options.is_null()) return;
  if (const Node attr = object_value(options, "attribute", sm); !attr.is_null()) {
    if (auto s = string_value(attr, sm)) {
      p.attribute = std::move(s);
    } else if (auto b = bool_value(attr)) {
      p.attribute = *b ? "true" : "false";
    }
  }
  if (auto b = bool_value(object_value(options, "reflect", sm))) p.reflect = b;
}

PropDefinition decorated_prop(
  const ClassMember & member, const Decorator & d, const SourceManager & sm)
{
  PropDefinition p = field_prop(member, sm);
  const Node options = decorator_options(d);
  if (const Node type = object_value(options, "type", sm); !type.is_null()) {
    p.type = std::string(type.text(sm));
  }
  read_property_options(options, p, sm);
  return p;
}

/// Object literal of `static properties = {...}` or `static get properties() { return {...}; }`.
Node static_properties_object(const ClassMember & member)
{
  if (!member.is_static || member.name != "properties") return Node();
  if (!member.is_method) {
    const Node v = unwrap_expression(member.value);
    return v.is("object") ? v : Node();
  }
  if (!member.is_getter) return Node();
  const Node body = member.node.child_by_field("body");
  for (const auto & stmt : body.named_children()) {
    if (!stmt.is("return_statement")) continue;
    const Node v = unwrap_expression(stmt.named_child(0));
    return v.is("object") ? v : Node();
  }
  return Node();
}

std::vector<PropDefinition> static_props(Node object, const SourceManager & sm)
{
  std::vector<PropDefinition> props;
  for (const auto & c : object.named_children()) {
    if (!c.is("pair")) continue;
    PropDefinition p;
    p.name = pair_key(c, sm);
    const Node config = unwrap_expression(c.child_by_field("value"));
    if (config.is("object")) {
      if (const Node type = object_value(config, "type", sm); !type.is_null()) {
        p.type = std::string(type.text(sm));
      }
      read_property_options(config, p, sm);
    }
    props.push_back(std::move(p));
  }
  return props;
}

/// `new FooController(this, ...)`
std::optional<ReactiveController> controller_of(const ClassMember & member, const SourceManager & sm)
{
  const Node v = unwrap_expression(member.value);
  if (!v.is("new_expression")) return std::nullopt;
  const Node ctor = v.child_by_field("constructor");
  if (!ctor.is("identifier")) return std::nullopt;
  const auto type = ctor.text(sm);
  if (!text::ends_with(type, "Controller")) return std::nullopt;
  const auto args = call_arguments(v);
  if (args.empty() || !args.front().is("this")) return std::nullopt;
  return ReactiveController{member.name, std::string(type)};
}

ElementQuery read_query(const ClassMember & member, const Decorator & d, const SourceManager & sm)
{
  ElementQuery q;
  q.decorator = d.name;
  q.property = member.name;

  if (d.name == "queryAssignedElements" || d.name == "queryAssignedNodes") {
    const Node options = decorator_options(d);
    q.slot = string_value(object_value(options, "slot", sm), sm);
    q.flatten = bool_value(object_value(options, "flatten", sm));
    q.selector = string_value(object_value(options, "selector", sm), sm);
    return q;
  }

  if (!d.args.empty()) q.selector = string_value(d.args[0], sm);
  if (d.args.size() > 1) q.cache = bool_value(d.args[1]);
  return q;
}

std::optional<std::string> decorator_tag(const ClassInfo & cls, const SourceManager & sm)
{
  const Decorator * d = find_decorator(cls.decorators, "customElement");
  if (d == nullptr || !d->is_call || d->args.empty()) return std::nullopt;
  return string_value(d->args.front(), sm);
}

}  // namespace

std::optional<Component> extract_lit(const ClassInfo & cls, const ExtractContext & ctx)
{
  const auto & sm = ctx.sm;

  const Decorator * custom_element = find_decorator(cls.decorators, "customElement");
  const bool decorated = custom_element != nullptr && custom_element->is_call;
  const auto defined = ctx.regs.custom_elements.find(cls.name);
  const bool registered = !cls.anonymous && defined != ctx.regs.custom_elements.end();

  if (!extends_element(cls, sm) && !decorated && !registered && !cls.defined_tag) {
    return std::nullopt;
  }

  std::string tag;
  if (auto t = decorator_tag(cls, sm)) {
    tag = std::move(*t);
  } else if (registered) {
    tag = defined->second;
  } else if (cls.defined_tag) {
    tag = *cls.defined_tag;
  } else {
    tag = text::to_kebab_case(cls.name);
  }

  Component c = make_class_component(Framework::Lit, cls, std::move(tag), ctx);

  std::vector<PropDefinition> static_list;
  for (const auto & m : cls.members) {
    if (const Node obj = static_properties_object(m); !obj.is_null()) {
      auto props = static_props(obj, sm);
      static_list.insert(static_list.end(), props.begin(), props.end());
      continue;
    }
    if (m.is_method) continue;

    if (const Decorator * d = find_any(m.decorators, kPropertyDecorators)) {
      c.props.push_back(decorated_prop(m, *d, sm));
    }
    if (auto ctrl = controller_of(m, sm)) {
      c.metadata.controllers.push_back(std::move(*ctrl));
    }
    if (const Decorator * d = find_any(m.decorators, kQueryDecorators)) {
      c.metadata.queries.push_back(read_query(m, *d, sm));
    }
  }
  // Decorated properties come first, then the static declaration.
  c.props.insert(c.props.end(), static_list.begin(), static_list.end());

  if (const auto doc = leading_jsdoc(cls.node, sm)) {
    apply_jsdoc(parse_jsdoc(*doc), c.metadata);
  }
  return c;
}

}  // namespace driftscan::components
