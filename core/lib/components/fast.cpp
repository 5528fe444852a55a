// driftscan/components/fast.cpp - FAST element extraction
#include "driftscan/components/extractors.hpp"
#include "driftscan/text/string_utils.hpp"

namespace driftscan::components
{

namespace
{

/// `@customElement('x-el')` or `@customElement({ name: 'x-el', ... })`
std::optional<std::string> decorator_name(const Decorator & d, const SourceManager & sm)
{
  if (d.args.empty()) return std::nullopt;
  if (auto s = string_value(d.args.front(), sm)) return s;
  return string_value(object_value(d.args.front(), "name", sm), sm);
}

}  // namespace

std::optional<Component> extract_fast(const ClassInfo & cls, const ExtractContext & ctx)
{
  const auto & sm = ctx.sm;

  const Decorator * decorator = find_decorator(cls.decorators, "customElement");
  if (decorator != nullptr && !decorator->is_call) decorator = nullptr;
  const auto reg = ctx.regs.fast.find(cls.name);
  const bool registered = !cls.anonymous && reg != ctx.regs.fast.end();

  // NOTE: extending FASTElement alone marks a base class, not an element.
  if (decorator == nullptr && !registered) return std::nullopt;

  std::optional<std::string> tag;
  if (decorator != nullptr) tag = decorator_name(*decorator, sm);
  if (!tag && registered) tag = reg->second.name;
  Component c = make_class_component(
    Framework::Fast, cls, tag ? std::move(*tag) : text::to_kebab_case(cls.name), ctx);

  for (const auto & m : cls.members) {
    if (m.is_method || m.is_static) continue;
    if (const Decorator * attr = find_decorator(m.decorators, "attr")) {
      PropDefinition p = field_prop(m, sm);
      const Node options = decorator_options(*attr);
      p.attribute = string_value(object_value(options, "attribute", sm), sm);
      const auto mode = string_value(object_value(options, "mode", sm), sm);
      if (mode && *mode == "reflect") p.reflect = true;
      c.props.push_back(std::move(p));
    } else if (find_decorator(m.decorators, "observable") != nullptr) {
      c.props.push_back(field_prop(m, sm));
    }
  }
  return c;
}

}  // namespace driftscan::components
