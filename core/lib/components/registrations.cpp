// driftscan/components/registrations.cpp - File-wide element registration calls
#include "driftscan/components/registrations.hpp"

namespace driftscan::components
{

namespace
{

/// `customElements` or `window.customElements`
bool is_custom_elements(Node n, const SourceManager & sm)
{
  if (n.is("identifier")) return n.text(sm) == "customElements";
  if (n.is("member_expression")) {
    return n.child_by_field("property").text(sm) == "customElements";
  }
  return false;
}

std::optional<std::string> definition_name(Node object, const SourceManager & sm)
{
  return string_value(object_value(object, "name", sm), sm);
}

class RegistrationCollector
{
public:
  RegistrationCollector(const SourceManager & sm, Registrations & out) : sm_(sm), out_(out) {}

  void visit(Node n)
  {
    if (!n.is("call_expression")) return;
    const Node fn = n.child_by_field("function");
    const auto args = call_arguments(n);

    if (fn.is("member_expression")) {
      visit_member_call(fn, args);
    } else if (fn.is("identifier") && fn.text(sm_) == "define") {
      visit_hybrids_define(n, args);
    }
  }

private:
  void visit_member_call(Node fn, const std::vector<Node> & args)
  {
    const Node object = fn.child_by_field("object");
    const auto method = fn.child_by_field("property").text(sm_);

    if (is_custom_elements(object, sm_)) {
      if (method == "define") visit_custom_elements_define(args);
      return;
    }
    if (!object.is("identifier")) return;
    const std::string receiver(object.text(sm_));

    if (method == "compose") {
      FastRegistration reg;
      if (!args.empty()) reg.name = definition_name(args[0], sm_);
      out_.fast.emplace(receiver, std::move(reg));
      return;
    }

    if (method != "define" || args.empty()) return;

    if (receiver == "FASTElement") {
      const Node cls = unwrap_expression(args[0]);
      if (!cls.is("identifier")) return;
      FastRegistration reg;
      if (args.size() > 1) reg.name = definition_name(args[1], sm_);
      out_.fast.emplace(std::string(cls.text(sm_)), std::move(reg));
      return;
    }

    // `MyElement.define({ name: 'my-element' })`
    if (auto name = definition_name(args[0], sm_)) {
      out_.fast.emplace(receiver, FastRegistration{std::move(name)});
    }
  }

  void visit_custom_elements_define(const std::vector<Node> & args)
  {
    if (args.size() < 2) return;
    auto tag = string_value(args[0], sm_);
    if (!tag) return;

    const Node target = unwrap_expression(args[1]);
    if (target.is("identifier")) {
      out_.custom_elements.emplace(std::string(target.text(sm_)), *tag);
    } else if (target.is("class")) {
      out_.anonymous.push_back(AnonymousDefinition{std::move(*tag), target});
    } else if (target.is("call_expression")) {
      // customElements.define('x-el', component(Fn))
      const Node callee = target.child_by_field("function");
      const auto inner = call_arguments(target);
      if (callee.is("identifier") && callee.text(sm_) == "component" && !inner.empty() &&
          inner[0].is("identifier")) {
        out_.haunted.emplace(std::string(inner[0].text(sm_)), *tag);
      }
    }
  }

  void visit_hybrids_define(Node call, const std::vector<Node> & args)
  {
    if (args.empty()) return;
    const Node object = unwrap_expression(args[0]);
    if (!object.is("object")) return;
    if (!string_value(object_value(object, "tag", sm_), sm_)) return;
    out_.hybrids.push_back(HybridsDefinition{call, object});
  }

  const SourceManager & sm_;
  Registrations & out_;
};

}  // namespace

Registrations collect_registrations(Node root, const SourceManager & sm)
{
  Registrations regs;
  RegistrationCollector collector(sm, regs);
  for_each_node(root, [&](Node n) { collector.visit(n); });
  return regs;
}

}  // namespace driftscan::components
