// driftscan/components/component_detector.hpp - Web component detection for one file
//
// Dispatch order, per file:
//   1. Sniff the framework from the file text (or take the configured hint).
//   2. Each class declaration goes to the sniffed framework's extractor
//      (vanilla when nothing was sniffed). A rejected class that is
//      registered with customElements.define() is offered to vanilla.
//   3. Stencil functional, Haunted and hybrids passes always run.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "driftscan/model/component.hpp"
#include "driftscan/syntax/ts_ll.hpp"

namespace driftscan::components
{

/// First framework whose marker occurs in `content`, in the order
/// Lit, Stencil, FAST, Haunted, hybrids.
[[nodiscard]] std::optional<Framework> sniff_framework(std::string_view content);

struct DetectOptions
{
  std::string path;  ///< path recorded in component sources
  ts_ll::Grammar grammar = ts_ll::Grammar::TypeScript;
  std::optional<Framework> framework;  ///< overrides the sniff when set
  Timestamp scanned_at{};
};

/**
 * Detect every component defined in one source file.
 *
 * Syntax errors do not fail detection: tree-sitter recovers and the
 * detector works on whatever it recognises.
 *
 * @throws ScanFailure when the parser produces no tree at all
 */
[[nodiscard]] std::vector<Component> detect_components(
  std::string_view content, const DetectOptions & options);

}  // namespace driftscan::components
