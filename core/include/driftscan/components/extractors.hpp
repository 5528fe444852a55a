// driftscan/components/extractors.hpp - Per-framework component extractors
//
// Each class extractor is a pure accept/reject test plus extraction: it
// returns nullopt when the class does not satisfy that framework's
// recognition rule. The detector decides which extractor runs.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "driftscan/basic/source_manager.hpp"
#include "driftscan/components/ast_query.hpp"
#include "driftscan/components/registrations.hpp"
#include "driftscan/model/component.hpp"

namespace driftscan::components
{

struct ExtractContext
{
  const SourceManager & sm;
  const Registrations & regs;
  std::string path;  ///< path recorded in component sources
  Timestamp scanned_at{};
};

// ============================================================================
// Classes
// ============================================================================

/// A class member with the decorators that apply to it.
struct ClassMember
{
  Node node;
  std::string name;
  std::vector<Decorator> decorators;
  bool is_method = false;
  bool is_static = false;
  bool is_getter = false;
  bool is_optional = false;  ///< `name?: T`
  Node type;                 ///< type_annotation, may be null
  Node value;                ///< initializer, may be null
};

struct ClassInfo
{
  Node node;       ///< class_declaration, abstract_class_declaration or class
  Node decl_root;  ///< enclosing export_statement, or `node`
  std::string name;
  bool anonymous = false;
  std::optional<std::string> defined_tag;  ///< tag of an anonymous customElements.define
  std::vector<Decorator> decorators;       ///< class and export-statement decorators
  Node heritage;                           ///< `extends` expression, may be null
  std::vector<ClassMember> members;
};

/// Read a class declaration or class expression.
[[nodiscard]] ClassInfo read_class(Node class_node, const SourceManager & sm);

/// Class `extends` a name ending in `Element` (directly or through a mixin call).
[[nodiscard]] bool extends_element(const ClassInfo & cls, const SourceManager & sm);

/// Class `extends` exactly `base`.
[[nodiscard]] bool extends_exactly(
  const ClassInfo & cls, std::string_view base, const SourceManager & sm);

/**
 * Prop for a decorated field: type from the annotation (else "unknown"),
 * required unless initialised or marked optional, default = initializer text.
 */
[[nodiscard]] PropDefinition field_prop(const ClassMember & member, const SourceManager & sm);

/// Component shell with id, source and JSDoc-derived deprecation filled in.
[[nodiscard]] Component make_class_component(
  Framework framework, const ClassInfo & cls, std::string tag, const ExtractContext & ctx);

[[nodiscard]] std::optional<Component> extract_lit(
  const ClassInfo & cls, const ExtractContext & ctx);
[[nodiscard]] std::optional<Component> extract_stencil(
  const ClassInfo & cls, const ExtractContext & ctx);
[[nodiscard]] std::optional<Component> extract_fast(
  const ClassInfo & cls, const ExtractContext & ctx);
[[nodiscard]] std::optional<Component> extract_vanilla(
  const ClassInfo & cls, const ExtractContext & ctx);

// ============================================================================
// Non-class definitions
// ============================================================================

/// Functions registered through `customElements.define(tag, component(Fn))`.
[[nodiscard]] std::vector<Component> extract_haunted(Node root, const ExtractContext & ctx);

/// `define({ tag, ...props })` calls.
[[nodiscard]] std::vector<Component> extract_hybrids(const ExtractContext & ctx);

/// `export const X: FunctionalComponent<Props> = ...`
[[nodiscard]] std::vector<Component> extract_stencil_functional(
  Node root, const ExtractContext & ctx);

}  // namespace driftscan::components
