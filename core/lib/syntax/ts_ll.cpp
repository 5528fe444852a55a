// driftscan/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "driftscan/syntax/ts_ll.hpp"

#include "driftscan/basic/scan_error.hpp"

namespace driftscan::ts_ll
{

Grammar grammar_for_path(const std::filesystem::path & path)
{
  const auto ext = path.extension();
  if (ext == ".tsx" || ext == ".jsx") return Grammar::Tsx;
  return Grammar::TypeScript;
}

std::vector<Node> Node::named_children() const
{
  std::vector<Node> out;
  const uint32_t n = named_child_count();
  out.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    out.push_back(named_child(i));
  }
  return out;
}

bool Node::has_token(std::string_view token) const noexcept
{
  const uint32_t n = child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const Node c = child(i);
    if (!c.is_named() && c.kind() == token) return true;
  }
  return false;
}

Parser::Parser(Grammar grammar)
{
  parser_ = ts_parser_new();
  if (!parser_) throw ScanFailure("ts_parser_new() failed");

  const TSLanguage * lang =
    grammar == Grammar::Tsx ? tree_sitter_tsx() : tree_sitter_typescript();

  // NOTE: This must be checked even in Release builds; a grammar built for a
  // different tree-sitter ABI is rejected here.
  if (!lang || !ts_parser_set_language(parser_, lang)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw ScanFailure("ts_parser_set_language() failed for the TypeScript grammar");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

Tree Parser::parse_string(std::string_view source) const
{
  // Tree-sitter consumes bytes; the grammar expects UTF-8.
  return Tree(ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())));
}

}  // namespace driftscan::ts_ll
