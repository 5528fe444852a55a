// driftscan/components/registrations.hpp - File-wide element registration calls
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "driftscan/components/ast_query.hpp"

namespace driftscan::components
{

/// `customElements.define('tag', class extends X { ... })`
struct AnonymousDefinition
{
  std::string tag;
  Node class_node;  ///< the `class` expression
};

/// A FAST registration without a decorator.
struct FastRegistration
{
  std::optional<std::string> name;  ///< `name` from the definition object, if given
};

/// `define({ tag: 'x-el', ... })` from hybrids.
struct HybridsDefinition
{
  Node call;
  Node object;
};

/**
 * Every registration call in one file, collected in a single pass.
 *
 * Maps are keyed by the registered class or function identifier.
 */
struct Registrations
{
  std::map<std::string, std::string> custom_elements;  ///< class -> tag
  std::vector<AnonymousDefinition> anonymous;
  std::map<std::string, FastRegistration> fast;  ///< compose() / define() receivers
  std::map<std::string, std::string> haunted;    ///< function -> tag
  std::vector<HybridsDefinition> hybrids;
};

[[nodiscard]] Registrations collect_registrations(Node root, const SourceManager & sm);

}  // namespace driftscan::components
