// driftscan/components/functional.cpp - Function-style component definitions
//
// Haunted functions, hybrids `define()` objects and Stencil functional
// components are not classes, so they are found by separate passes over the
// whole tree rather than by class dispatch.
//
#include <map>

#include "driftscan/components/extractors.hpp"
#include "driftscan/components/jsdoc.hpp"
#include "driftscan/model/identity.hpp"
#include "driftscan/text/string_utils.hpp"

namespace driftscan::components
{

namespace
{

Component make_component(
  Framework framework, std::string name, std::string tag, uint32_t line, const ExtractContext & ctx)
{
  Component c;
  c.name = std::move(name);
  c.source.framework = framework;
  c.source.path = ctx.path;
  c.source.export_name = c.name;
  c.source.tag_name = std::move(tag);
  c.source.line = line;
  c.id = make_component_id(c.source);
  c.scanned_at = ctx.scanned_at;
  return c;
}

Node export_root(Node decl)
{
  const Node parent = decl.parent();
  return parent.is("export_statement") ? parent : decl;
}

bool is_deprecated(Node decl, const SourceManager & sm)
{
  const auto doc = leading_jsdoc(decl, sm);
  return doc && parse_jsdoc(*doc).deprecated;
}

// ============================================================================
// Haunted
// ============================================================================

/// Object pattern of the first parameter, or a null node.
Node first_parameter_pattern(Node fn)
{
  const Node params = fn.child_by_field("parameters");
  if (params.is_null()) return Node();
  Node first = params.named_child(0);
  if (first.is("required_parameter") || first.is("optional_parameter")) {
    first = first.child_by_field("pattern");
  }
  return first.is("object_pattern") ? first : Node();
}

std::vector<PropDefinition> destructured_props(Node pattern, const SourceManager & sm)
{
  std::vector<PropDefinition> props;
  for (const auto & c : pattern.named_children()) {
    PropDefinition p;
    if (c.is("shorthand_property_identifier_pattern")) {
      p.name = node_text(c, sm);
      p.required = true;
    } else if (c.is("object_assignment_pattern")) {
      p.name = node_text(c.child_by_field("left"), sm);
      p.default_value = node_text(c.child_by_field("right"), sm);
    } else if (c.is("pair_pattern")) {
      p.name = pair_key(c, sm);
      const Node value = c.child_by_field("value");
      if (value.is("assignment_pattern")) {
        p.default_value = node_text(value.child_by_field("right"), sm);
      } else {
        p.required = true;
      }
    } else {
      continue;
    }
    props.push_back(std::move(p));
  }
  return props;
}

Component haunted_component(
  Node decl, Node fn, std::string name, const std::string & tag, const ExtractContext & ctx)
{
  const Node root = export_root(decl);
  Component c = make_component(Framework::Haunted, std::move(name), tag, root.start_line(), ctx);
  if (const Node pattern = first_parameter_pattern(fn); !pattern.is_null()) {
    c.props = destructured_props(pattern, ctx.sm);
  }
  c.metadata.deprecated = is_deprecated(decl, ctx.sm);
  return c;
}

// ============================================================================
// Stencil functional
// ============================================================================

/// `FunctionalComponent<Props>` annotation -> "Props"; nullopt when the
/// annotation is not a FunctionalComponent.
std::optional<std::string> functional_props_type(Node type_annotation, const SourceManager & sm)
{
  const Node type = type_annotation.named_child(0);
  if (!type.is("generic_type")) return std::nullopt;
  if (node_text(type.child_by_field("name"), sm) != "FunctionalComponent") return std::nullopt;
  const Node args = type.child_by_field("type_arguments");
  const Node first = args.is_null() ? Node() : args.named_child(0);
  return node_text(first, sm);
}

/// Interface and object-type alias bodies by name.
std::map<std::string, Node> collect_prop_types(Node root, const SourceManager & sm)
{
  std::map<std::string, Node> types;
  for_each_node(root, [&](Node n) {
    if (n.is("interface_declaration")) {
      types.emplace(node_text(n.child_by_field("name"), sm), n.child_by_field("body"));
    } else if (n.is("type_alias_declaration")) {
      const Node value = n.child_by_field("value");
      if (value.is("object_type")) types.emplace(node_text(n.child_by_field("name"), sm), value);
    }
  });
  return types;
}

std::vector<PropDefinition> signature_props(Node body, const SourceManager & sm)
{
  std::vector<PropDefinition> props;
  for (const auto & c : body.named_children()) {
    if (!c.is("property_signature")) continue;
    PropDefinition p;
    p.name = node_text(c.child_by_field("name"), sm);
    if (auto type = annotation_text(c.child_by_field("type"), sm)) p.type = std::move(*type);
    p.required = !c.has_token("?");
    props.push_back(std::move(p));
  }
  return props;
}

}  // namespace

std::vector<Component> extract_haunted(Node root, const ExtractContext & ctx)
{
  std::vector<Component> out;
  if (ctx.regs.haunted.empty()) return out;
  const auto & sm = ctx.sm;

  for_each_node(root, [&](Node n) {
    if (n.is("function_declaration")) {
      auto name = node_text(n.child_by_field("name"), sm);
      const auto it = ctx.regs.haunted.find(name);
      if (it != ctx.regs.haunted.end()) {
        out.push_back(haunted_component(n, n, std::move(name), it->second, ctx));
      }
      return;
    }
    // const Fn = ({ a }) => html`...`
    if (!n.is("lexical_declaration")) return;
    for (const auto & d : n.named_children()) {
      if (!d.is("variable_declarator")) continue;
      const Node value = unwrap_expression(d.child_by_field("value"));
      if (!value.is("arrow_function") && !value.is("function_expression") &&
          !value.is("function")) {
        continue;
      }
      auto name = node_text(d.child_by_field("name"), sm);
      const auto it = ctx.regs.haunted.find(name);
      if (it != ctx.regs.haunted.end()) {
        out.push_back(haunted_component(n, value, std::move(name), it->second, ctx));
      }
    }
  });
  return out;
}

std::vector<Component> extract_hybrids(const ExtractContext & ctx)
{
  std::vector<Component> out;
  const auto & sm = ctx.sm;

  for (const auto & def : ctx.regs.hybrids) {
    auto tag = string_value(object_value(def.object, "tag", sm), sm);
    if (!tag) continue;

    std::string name;
    if (const Node targs = def.call.child_by_field("type_arguments"); !targs.is_null()) {
      name = node_text(targs.named_child(0), sm);
    }
    if (name.empty()) name = text::pascal_case_from_tag(*tag);

    Component c =
      make_component(Framework::Hybrids, std::move(name), *tag, def.call.start_line(), ctx);
    for (const auto & entry : def.object.named_children()) {
      std::string key;
      if (entry.is("pair")) {
        key = pair_key(entry, sm);
      } else if (entry.is("shorthand_property_identifier") || entry.is("method_definition")) {
        key = entry.is("method_definition") ? node_text(entry.child_by_field("name"), sm)
                                            : node_text(entry, sm);
      } else {
        continue;
      }
      if (key == "tag" || key == "render") continue;
      PropDefinition p;
      p.name = std::move(key);
      c.props.push_back(std::move(p));
    }
    out.push_back(std::move(c));
  }
  return out;
}

std::vector<Component> extract_stencil_functional(Node root, const ExtractContext & ctx)
{
  std::vector<Component> out;
  const auto & sm = ctx.sm;
  std::map<std::string, Node> prop_types;
  bool types_collected = false;

  for_each_node(root, [&](Node n) {
    if (!n.is("lexical_declaration") || !n.parent().is("export_statement")) return;
    for (const auto & d : n.named_children()) {
      if (!d.is("variable_declarator")) continue;
      const auto props_type = functional_props_type(d.child_by_field("type"), sm);
      if (!props_type) continue;

      if (!types_collected) {
        prop_types = collect_prop_types(root, sm);
        types_collected = true;
      }

      Component c = make_component(
        Framework::StencilFunctional, node_text(d.child_by_field("name"), sm), std::string(),
        n.parent().start_line(), ctx);
      if (const auto it = prop_types.find(*props_type); it != prop_types.end()) {
        c.props = signature_props(it->second, sm);
      }
      c.metadata.deprecated = is_deprecated(n, sm);
      out.push_back(std::move(c));
    }
  });
  return out;
}

}  // namespace driftscan::components
