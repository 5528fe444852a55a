// driftscan/components/component_detector.cpp - Web component detection for one file
#include "driftscan/components/component_detector.hpp"

#include <spdlog/spdlog.h>

#include <array>

#include "driftscan/basic/scan_error.hpp"
#include "driftscan/components/extractors.hpp"
#include "driftscan/text/string_utils.hpp"

namespace driftscan::components
{

namespace
{

constexpr std::array<std::string_view, 10> kLitMarkers = {
  "'lit'",      "\"lit\"",      "'lit/",     "\"lit/", "'lit-element",
  "\"lit-element", "'lit-html", "\"lit-html", "@lit/", "LitElement",
};

template <size_t N>
bool contains_any(std::string_view content, const std::array<std::string_view, N> & markers)
{
  for (const auto m : markers) {
    if (text::contains(content, m)) return true;
  }
  return false;
}

using ClassExtractor = std::optional<Component> (*)(const ClassInfo &, const ExtractContext &);

ClassExtractor extractor_for(std::optional<Framework> framework)
{
  if (!framework) return &extract_vanilla;
  switch (*framework) {
    case Framework::Lit:
      return &extract_lit;
    case Framework::Stencil:
      return &extract_stencil;
    case Framework::Fast:
      return &extract_fast;
    default:
      return &extract_vanilla;
  }
}

class ClassDispatcher
{
public:
  ClassDispatcher(const ExtractContext & ctx, ClassExtractor extractor)
  : ctx_(ctx), extractor_(extractor)
  {
  }

  void visit(Node n, std::vector<Component> & out)
  {
    if (n.is("class_declaration") || n.is("abstract_class_declaration")) {
      dispatch(read_class(n, ctx_.sm), out);
    } else if (n.is("class")) {
      // Class expressions count only when handed straight to customElements.define().
      for (const auto & def : ctx_.regs.anonymous) {
        if (def.class_node.start_byte() != n.start_byte()) continue;
        ClassInfo cls = read_class(n, ctx_.sm);
        cls.defined_tag = def.tag;
        if (cls.name.empty()) cls.name = text::pascal_case_from_tag(def.tag);
        dispatch(cls, out);
        break;
      }
    }
  }

private:
  void dispatch(const ClassInfo & cls, std::vector<Component> & out)
  {
    if (cls.name.empty()) return;
    if (auto c = extractor_(cls, ctx_)) {
      out.push_back(std::move(*c));
      return;
    }
    const bool defined = cls.defined_tag || ctx_.regs.custom_elements.count(cls.name) > 0;
    if (extractor_ != &extract_vanilla && defined) {
      if (auto c = extract_vanilla(cls, ctx_)) out.push_back(std::move(*c));
    }
  }

  const ExtractContext & ctx_;
  ClassExtractor extractor_;
};

}  // namespace

std::optional<Framework> sniff_framework(std::string_view content)
{
  if (contains_any(content, kLitMarkers)) return Framework::Lit;
  if (text::contains(content, "@stencil/core")) return Framework::Stencil;
  if (text::contains(content, "@microsoft/fast-element")) return Framework::Fast;
  if (text::contains(content, "haunted")) return Framework::Haunted;
  if (text::contains(content, "hybrids")) return Framework::Hybrids;
  return std::nullopt;
}

std::vector<Component> detect_components(std::string_view content, const DetectOptions & options)
{
  const SourceManager sm{std::string(content)};

  ts_ll::Parser parser(options.grammar);
  const ts_ll::Tree tree = parser.parse_string(sm.source());
  if (tree.is_null()) throw ScanFailure("TypeScript parser produced no syntax tree");
  const Node root = tree.root_node();
  if (root.has_error()) {
    spdlog::debug("{}: syntax errors, detecting on the recovered tree", options.path);
  }

  const auto framework = options.framework ? options.framework : sniff_framework(content);
  const Registrations regs = collect_registrations(root, sm);
  const ExtractContext ctx{sm, regs, options.path, options.scanned_at};

  std::vector<Component> out;
  ClassDispatcher dispatcher(ctx, extractor_for(framework));
  for_each_node(root, [&](Node n) { dispatcher.visit(n, out); });

  const auto append = [&out](std::vector<Component> && found) {
    for (auto & c : found) out.push_back(std::move(c));
  };
  append(extract_stencil_functional(root, ctx));
  append(extract_haunted(root, ctx));
  append(extract_hybrids(ctx));

  spdlog::debug(
    "{}: {} component(s), framework {}", options.path, out.size(),
    framework ? to_string(*framework) : std::string_view("none"));
  return out;
}

}  // namespace driftscan::components
