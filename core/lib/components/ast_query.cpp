// driftscan/components/ast_query.cpp - Small queries over the TypeScript CST
#include "driftscan/components/ast_query.hpp"

#include "driftscan/text/string_utils.hpp"

namespace driftscan::components
{

std::optional<std::string> string_value(Node n, const SourceManager & sm)
{
  if (n.is_null()) return std::nullopt;
  if (n.is("string")) {
    return std::string(text::unquote(n.text(sm)));
  }
  if (n.is("template_string")) {
    for (const auto & c : n.named_children()) {
      if (c.is("template_substitution")) return std::nullopt;
    }
    return std::string(text::unquote(n.text(sm)));
  }
  return std::nullopt;
}

std::optional<bool> bool_value(Node n)
{
  if (n.is("true")) return true;
  if (n.is("false")) return false;
  return std::nullopt;
}

std::string node_text(Node n, const SourceManager & sm)
{
  if (n.is_null()) return {};
  return std::string(n.text(sm));
}

std::string pair_key(Node pair, const SourceManager & sm)
{
  const Node key = pair.child_by_field("key");
  if (key.is("string")) return std::string(text::unquote(key.text(sm)));
  return node_text(key, sm);
}

Node object_value(Node object, std::string_view key, const SourceManager & sm)
{
  object = unwrap_expression(object);
  if (!object.is("object")) return Node();
  for (const auto & c : object.named_children()) {
    if (c.is("pair") && pair_key(c, sm) == key) return c.child_by_field("value");
  }
  return Node();
}

std::vector<Node> call_arguments(Node call)
{
  std::vector<Node> out;
  const Node args = call.child_by_field("arguments");
  if (args.is_null()) return out;
  for (const auto & c : args.named_children()) {
    if (!c.is("comment")) out.push_back(c);
  }
  return out;
}

Node unwrap_expression(Node n)
{
  while (!n.is_null() &&
         (n.is("parenthesized_expression") || n.is("as_expression") ||
          n.is("satisfies_expression") || n.is("non_null_expression"))) {
    n = n.named_child(0);
  }
  return n;
}

// ============================================================================
// Decorators
// ============================================================================

Decorator read_decorator(Node decorator, const SourceManager & sm)
{
  Decorator d;
  d.node = decorator;

  Node expr = decorator.named_child(0);
  if (expr.is("call_expression")) {
    d.is_call = true;
    d.args = call_arguments(expr);
    expr = expr.child_by_field("function");
  }
  if (expr.is("identifier")) {
    d.name = node_text(expr, sm);
  } else if (expr.is("member_expression")) {
    d.name = node_text(expr.child_by_field("property"), sm);
  }
  return d;
}

std::vector<Decorator> decorators_of(Node n, const SourceManager & sm)
{
  std::vector<Decorator> out;
  if (n.is_null()) return out;
  for (const auto & c : n.named_children()) {
    if (c.is("decorator")) out.push_back(read_decorator(c, sm));
  }
  return out;
}

const Decorator * find_decorator(const std::vector<Decorator> & decorators, std::string_view name)
{
  for (const auto & d : decorators) {
    if (d.name == name) return &d;
  }
  return nullptr;
}

Node decorator_options(const Decorator & d)
{
  if (d.args.empty()) return Node();
  const Node first = unwrap_expression(d.args.front());
  return first.is("object") ? first : Node();
}

// ============================================================================
// Declarations
// ============================================================================

std::optional<std::string_view> leading_jsdoc(Node decl, const SourceManager & sm)
{
  for (Node n = decl; !n.is_null(); n = n.parent()) {
    Node prev = n.prev_named_sibling();
    while (prev.is("decorator")) prev = prev.prev_named_sibling();
    if (prev.is("comment")) {
      const auto t = prev.text(sm);
      if (text::starts_with(t, "/**")) return t;
      return std::nullopt;
    }
    if (!prev.is_null()) return std::nullopt;
    // Only climb out of wrappers that start with the declaration itself.
    const Node parent = n.parent();
    if (!parent.is("export_statement")) return std::nullopt;
  }
  return std::nullopt;
}

std::optional<std::string> annotation_text(Node type_annotation, const SourceManager & sm)
{
  if (type_annotation.is_null()) return std::nullopt;
  const Node type = type_annotation.named_child(0);
  if (type.is_null()) return std::nullopt;
  return std::string(type.text(sm));
}

}  // namespace driftscan::components
