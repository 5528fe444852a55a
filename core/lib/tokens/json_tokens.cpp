// driftscan/tokens/json_tokens.cpp - JSON token documents
#include <nlohmann/json.hpp>
#include <utility>

#include "driftscan/tokens/category.hpp"
#include "driftscan/tokens/token_extractors.hpp"

namespace driftscan::tokens
{

namespace
{

using Json = nlohmann::ordered_json;

const Json * member(const Json & obj, const char * key)
{
  const auto it = obj.find(key);
  return it == obj.end() ? nullptr : &*it;
}

/// Style Dictionary `{ value }` or W3C `{ $value }` node.
bool is_token_node(const Json & node)
{
  return node.is_object() && (node.contains("value") || node.contains("$value"));
}

std::string scalar_text(const Json & v)
{
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

class JsonTokenWalker
{
public:
  explicit JsonTokenWalker(const TokenFileContext & ctx) : ctx_(ctx) {}

  void walk_object(const Json & obj, const std::string & prefix)
  {
    for (const auto & [key, value] : obj.items()) {
      const std::string name = prefix.empty() ? key : prefix + "." + key;
      if (is_token_node(value)) {
        add_token(name, value);
      } else if (value.is_object()) {
        walk_object(value, name);
      }
    }
  }

  void walk_name_list(const Json & arr)
  {
    const auto category = category_for_group(ctx_.stem);
    for (const auto & element : arr) {
      if (!element.is_string()) continue;
      const auto name = element.get<std::string>();
      auto token = make_design_token(
        JsonSource{ctx_.path, name}, name, name, category, name, ctx_.scanned_at);
      // Name lists carry no values.
      token.value = RawValue{name};
      out_.push_back(std::move(token));
    }
  }

  std::vector<DesignToken> take() && { return std::move(out_); }

private:
  void add_token(const std::string & name, const Json & node)
  {
    const Json * raw = member(node, "value");
    if (raw == nullptr || raw->is_null()) raw = member(node, "$value");
    if (raw == nullptr || raw->is_null()) return;
    const auto value = scalar_text(*raw);

    const Json * type = member(node, "type");
    if (type == nullptr || !type->is_string()) type = member(node, "$type");
    const auto category = (type != nullptr && type->is_string())
                            ? normalize_category(type->get<std::string>())
                            : infer_category(name, value);

    auto token = make_design_token(
      JsonSource{ctx_.path, name}, name, name, category, value, ctx_.scanned_at);

    const Json * description = member(node, "description");
    if (description == nullptr) description = member(node, "$description");
    if (description != nullptr && description->is_string()) {
      token.metadata["description"] = description->get<std::string>();
    }
    out_.push_back(std::move(token));
  }

  const TokenFileContext & ctx_;
  std::vector<DesignToken> out_;
};

}  // namespace

std::vector<DesignToken> extract_json_tokens(std::string_view content, const TokenFileContext & ctx)
{
  const auto doc = Json::parse(content.begin(), content.end());

  JsonTokenWalker walker(ctx);
  if (doc.is_array()) {
    walker.walk_name_list(doc);
  } else if (doc.is_object()) {
    walker.walk_object(doc, "");
  }
  return std::move(walker).take();
}

}  // namespace driftscan::tokens
