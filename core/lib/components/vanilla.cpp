// driftscan/components/vanilla.cpp - Plain custom element extraction
#include "driftscan/components/extractors.hpp"

namespace driftscan::components
{

namespace
{

/// Array literal of `static get observedAttributes() { return [...]; }` or
/// `static observedAttributes = [...]`.
Node observed_attributes(const ClassMember & member)
{
  if (!member.is_static || member.name != "observedAttributes") return Node();
  if (!member.is_method) {
    const Node v = unwrap_expression(member.value);
    return v.is("array") ? v : Node();
  }
  if (!member.is_getter) return Node();
  for (const auto & stmt : member.node.child_by_field("body").named_children()) {
    if (!stmt.is("return_statement")) continue;
    const Node v = unwrap_expression(stmt.named_child(0));
    return v.is("array") ? v : Node();
  }
  return Node();
}

}  // namespace

std::optional<Component> extract_vanilla(const ClassInfo & cls, const ExtractContext & ctx)
{
  const auto & sm = ctx.sm;
  if (!extends_exactly(cls, "HTMLElement", sm)) return std::nullopt;

  std::string tag;
  if (cls.defined_tag) {
    tag = *cls.defined_tag;
  } else {
    const auto it = ctx.regs.custom_elements.find(cls.name);
    if (it == ctx.regs.custom_elements.end()) return std::nullopt;
    tag = it->second;
  }

  Component c = make_class_component(Framework::Vanilla, cls, std::move(tag), ctx);
  for (const auto & m : cls.members) {
    const Node attrs = observed_attributes(m);
    if (attrs.is_null()) continue;
    for (const auto & e : attrs.named_children()) {
      auto name = string_value(e, sm);
      if (!name) continue;
      PropDefinition p;
      p.name = std::move(*name);
      p.type = "string";
      c.props.push_back(std::move(p));
    }
  }
  return c;
}

}  // namespace driftscan::components
