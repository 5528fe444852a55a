// driftscan/components/class_info.cpp - Class shape shared by the class extractors
#include "driftscan/components/extractors.hpp"
#include "driftscan/components/jsdoc.hpp"
#include "driftscan/model/identity.hpp"
#include "driftscan/text/string_utils.hpp"

namespace driftscan::components
{

namespace
{

Node extends_expression(Node class_node)
{
  for (const auto & c : class_node.named_children()) {
    if (!c.is("class_heritage")) continue;
    for (const auto & h : c.named_children()) {
      if (h.is("extends_clause")) {
        const Node value = h.child_by_field("value");
        return value.is_null() ? h.named_child(0) : value;
      }
      if (!h.is("implements_clause")) return h;
    }
  }
  return Node();
}

std::vector<ClassMember> read_members(Node body, const SourceManager & sm)
{
  std::vector<ClassMember> members;
  std::vector<Decorator> pending;

  for (const auto & c : body.named_children()) {
    if (c.is("decorator")) {
      pending.push_back(read_decorator(c, sm));
      continue;
    }
    const bool is_field = c.is("public_field_definition");
    const bool is_method = c.is("method_definition");
    if (!is_field && !is_method) continue;

    ClassMember m;
    m.node = c;
    m.name = node_text(c.child_by_field("name"), sm);
    m.decorators = std::move(pending);
    pending.clear();
    for (auto & d : decorators_of(c, sm)) m.decorators.push_back(std::move(d));
    m.is_method = is_method;
    m.is_static = c.has_token("static");
    m.is_getter = is_method && c.has_token("get");
    m.is_optional = c.has_token("?");
    if (is_field) {
      m.type = c.child_by_field("type");
      m.value = c.child_by_field("value");
    }
    members.push_back(std::move(m));
  }
  return members;
}

bool element_like(Node e, const SourceManager & sm)
{
  e = unwrap_expression(e);
  if (e.is("identifier")) return text::ends_with(e.text(sm), "Element");
  if (e.is("member_expression")) {
    return text::ends_with(e.child_by_field("property").text(sm), "Element");
  }
  if (e.is("call_expression")) {
    // Mixins: SignalWatcher(LitElement), Localized(Base(LitElement))
    for (const auto & arg : call_arguments(e)) {
      if (element_like(arg, sm)) return true;
    }
  }
  return false;
}

}  // namespace

ClassInfo read_class(Node class_node, const SourceManager & sm)
{
  ClassInfo info;
  info.node = class_node;

  const Node parent = class_node.parent();
  info.decl_root = parent.is("export_statement") ? parent : class_node;

  info.name = node_text(class_node.child_by_field("name"), sm);
  info.anonymous = info.name.empty();

  if (parent.is("export_statement")) info.decorators = decorators_of(parent, sm);
  for (auto & d : decorators_of(class_node, sm)) info.decorators.push_back(std::move(d));

  info.heritage = extends_expression(class_node);
  info.members = read_members(class_node.child_by_field("body"), sm);
  return info;
}

bool extends_element(const ClassInfo & cls, const SourceManager & sm)
{
  return !cls.heritage.is_null() && element_like(cls.heritage, sm);
}

bool extends_exactly(const ClassInfo & cls, std::string_view base, const SourceManager & sm)
{
  const Node e = unwrap_expression(cls.heritage);
  if (e.is("identifier")) return e.text(sm) == base;
  if (e.is("member_expression")) return e.child_by_field("property").text(sm) == base;
  return false;
}

PropDefinition field_prop(const ClassMember & member, const SourceManager & sm)
{
  PropDefinition p;
  p.name = member.name;
  if (auto type = annotation_text(member.type, sm)) p.type = std::move(*type);
  p.required = member.value.is_null() && !member.is_optional;
  if (!member.value.is_null()) p.default_value = std::string(member.value.text(sm));
  return p;
}

Component make_class_component(
  Framework framework, const ClassInfo & cls, std::string tag, const ExtractContext & ctx)
{
  Component c;
  c.name = cls.name;
  c.source.framework = framework;
  c.source.path = ctx.path;
  c.source.export_name = cls.name;
  c.source.tag_name = std::move(tag);
  c.source.line = cls.decl_root.start_line();
  c.id = make_component_id(c.source);
  c.scanned_at = ctx.scanned_at;

  if (const auto doc = leading_jsdoc(cls.node, ctx.sm)) {
    c.metadata.deprecated = parse_jsdoc(*doc).deprecated;
  }
  return c;
}

}  // namespace driftscan::components
