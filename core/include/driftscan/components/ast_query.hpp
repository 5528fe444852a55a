// driftscan/components/ast_query.hpp - Small queries over the TypeScript CST
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "driftscan/basic/source_manager.hpp"
#include "driftscan/syntax/ts_ll.hpp"

namespace driftscan::components
{

using ts_ll::Node;

/**
 * Pre-order walk over every node below (and including) `root`.
 *
 * `fn(Node)` is called once per node, named and anonymous alike.
 */
template <class Fn>
void for_each_node(Node root, Fn && fn)
{
  if (root.is_null()) return;
  ts_ll::Cursor cursor(root);
  for (;;) {
    fn(cursor.current_node());
    if (cursor.goto_first_child()) continue;
    for (;;) {
      if (cursor.goto_next_sibling()) break;
      if (!cursor.goto_parent()) return;
    }
  }
}

/// Unquoted value of a `string` node or a substitution-free template string.
[[nodiscard]] std::optional<std::string> string_value(Node n, const SourceManager & sm);

/// `true` / `false` literal value.
[[nodiscard]] std::optional<bool> bool_value(Node n);

/// Text of an identifier-like node (identifier, property_identifier, type_identifier).
[[nodiscard]] std::string node_text(Node n, const SourceManager & sm);

/// Key text of a `pair`, quoted keys unquoted.
[[nodiscard]] std::string pair_key(Node pair, const SourceManager & sm);

/// Value node of `key` in an `object` node, or a null node.
[[nodiscard]] Node object_value(Node object, std::string_view key, const SourceManager & sm);

/// Named children of an `arguments` node.
[[nodiscard]] std::vector<Node> call_arguments(Node call);

/// Strip a trailing `as const` / `satisfies T` / parentheses around an expression.
[[nodiscard]] Node unwrap_expression(Node n);

// ============================================================================
// Decorators
// ============================================================================

/// A decorator reduced to its callee name and (for `@x(...)`) its arguments.
struct Decorator
{
  Node node;
  std::string name;  ///< `property`, `Prop`, `customElement`, ...
  bool is_call = false;
  std::vector<Node> args;
};

[[nodiscard]] Decorator read_decorator(Node decorator, const SourceManager & sm);

/// Decorator children of `n` (in source order).
[[nodiscard]] std::vector<Decorator> decorators_of(Node n, const SourceManager & sm);

/// First decorator named `name`, or nullptr.
[[nodiscard]] const Decorator * find_decorator(
  const std::vector<Decorator> & decorators, std::string_view name);

/// Object literal passed as the first decorator argument, or a null node.
[[nodiscard]] Node decorator_options(const Decorator & d);

// ============================================================================
// Declarations
// ============================================================================

/// `/** ... */` comment immediately preceding `decl`, if any.
[[nodiscard]] std::optional<std::string_view> leading_jsdoc(Node decl, const SourceManager & sm);

/// Text of the type in a `type_annotation` node (without the colon).
[[nodiscard]] std::optional<std::string> annotation_text(Node type_annotation, const SourceManager & sm);

}  // namespace driftscan::components
