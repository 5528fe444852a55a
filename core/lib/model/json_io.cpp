// driftscan/model/json_io.cpp - JSON serialization implementation
//
#include "driftscan/model/json_io.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace driftscan
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

template <class T>
void put_opt(json & j, const char * key, const std::optional<T> & v)
{
  if (v) j[key] = *v;
}

template <class T>
void get_opt(const json & j, const char * key, std::optional<T> & out)
{
  if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
}

json j_value(const TokenValue & v)
{
  if (const auto * c = std::get_if<ColorValue>(&v)) {
    return json{{"type", "color"}, {"hex", c->hex}};
  }
  if (const auto * s = std::get_if<SpacingValue>(&v)) {
    return json{{"type", "spacing"}, {"value", s->value}, {"unit", to_string(s->unit)}};
  }
  return json{{"type", "raw"}, {"value", std::get<RawValue>(v).value}};
}

TokenValue value_from_json(const json & j)
{
  const auto type = j.at("type").get<std::string>();
  if (type == "color") return ColorValue{j.at("hex").get<std::string>()};
  if (type == "spacing") {
    const auto unit = j.at("unit").get<std::string>();
    SpacingUnit u = SpacingUnit::Px;
    if (unit == "rem") u = SpacingUnit::Rem;
    if (unit == "em") u = SpacingUnit::Em;
    return SpacingValue{j.at("value").get<double>(), u};
  }
  return RawValue{j.at("value").get<std::string>()};
}

json j_source(const TokenSource & s)
{
  if (const auto * js = std::get_if<JsonSource>(&s)) {
    return json{{"type", "json"}, {"path", js->path}, {"key", js->key}};
  }
  if (const auto * css = std::get_if<CssSource>(&s)) {
    return json{{"type", "css"}, {"path", css->path}, {"line", css->line}};
  }
  const auto & ts = std::get<TypeScriptSource>(s);
  return json{{"type", "typescript"}, {"path", ts.path}, {"typeName", ts.type_name}, {"line", ts.line}};
}

TokenSource source_from_json(const json & j)
{
  const auto type = j.at("type").get<std::string>();
  if (type == "json") return JsonSource{j.at("path").get<std::string>(), j.at("key").get<std::string>()};
  if (type == "css") return CssSource{j.at("path").get<std::string>(), j.at("line").get<uint32_t>()};
  if (type == "typescript") {
    return TypeScriptSource{
      j.at("path").get<std::string>(), j.at("typeName").get<std::string>(),
      j.at("line").get<uint32_t>()};
  }
  throw std::invalid_argument("unknown token source type: " + type);
}

json j_prop(const PropDefinition & p)
{
  json j{{"name", p.name}, {"type", p.type}, {"required", p.required}};
  put_opt(j, "defaultValue", p.default_value);
  put_opt(j, "description", p.description);
  put_opt(j, "mutable", p.is_mutable);
  put_opt(j, "reflect", p.reflect);
  put_opt(j, "attribute", p.attribute);
  put_opt(j, "eventName", p.event_name);
  put_opt(j, "bubbles", p.bubbles);
  put_opt(j, "composed", p.composed);
  put_opt(j, "cancelable", p.cancelable);
  return j;
}

PropDefinition prop_from_json(const json & j)
{
  PropDefinition p;
  p.name = j.at("name").get<std::string>();
  p.type = j.at("type").get<std::string>();
  p.required = j.at("required").get<bool>();
  get_opt(j, "defaultValue", p.default_value);
  get_opt(j, "description", p.description);
  get_opt(j, "mutable", p.is_mutable);
  get_opt(j, "reflect", p.reflect);
  get_opt(j, "attribute", p.attribute);
  get_opt(j, "eventName", p.event_name);
  get_opt(j, "bubbles", p.bubbles);
  get_opt(j, "composed", p.composed);
  get_opt(j, "cancelable", p.cancelable);
  return p;
}

json j_metadata(const ComponentMetadata & m)
{
  json j{{"deprecated", m.deprecated}, {"tags", m.tags}};
  put_opt(j, "watchers", m.watchers);
  put_opt(j, "methods", m.methods);
  put_opt(j, "listeners", m.listeners);
  put_opt(j, "formAssociated", m.form_associated);
  put_opt(j, "hasElement", m.has_element);
  if (m.shadow_mode) j["shadowMode"] = to_string(*m.shadow_mode);
  put_opt(j, "assetsDirs", m.assets_dirs);
  if (m.style_urls) {
    if (const auto * single = std::get_if<std::string>(&*m.style_urls)) {
      j["styleUrls"] = *single;
    } else {
      j["styleUrls"] = std::get<std::map<std::string, std::string>>(*m.style_urls);
    }
  }

  if (!m.controllers.empty()) {
    json arr = json::array();
    for (const auto & c : m.controllers) {
      arr.push_back(json{{"property", c.property}, {"type", c.controller_type}});
    }
    j["controllers"] = std::move(arr);
  }
  if (!m.queries.empty()) {
    json arr = json::array();
    for (const auto & q : m.queries) {
      json e{{"decorator", q.decorator}, {"property", q.property}};
      put_opt(e, "selector", q.selector);
      put_opt(e, "cache", q.cache);
      put_opt(e, "slot", q.slot);
      put_opt(e, "flatten", q.flatten);
      arr.push_back(std::move(e));
    }
    j["queries"] = std::move(arr);
  }

  put_opt(j, "summary", m.summary);
  if (!m.events.empty()) {
    json arr = json::array();
    for (const auto & e : m.events) {
      json o{{"name", e.name}};
      put_opt(o, "type", e.type);
      put_opt(o, "description", e.description);
      arr.push_back(std::move(o));
    }
    j["events"] = std::move(arr);
  }
  if (!m.slots.empty()) {
    json arr = json::array();
    for (const auto & s : m.slots) {
      json o{{"name", s.name}};
      put_opt(o, "description", s.description);
      arr.push_back(std::move(o));
    }
    j["slots"] = std::move(arr);
  }
  if (!m.css_properties.empty()) {
    json arr = json::array();
    for (const auto & p : m.css_properties) {
      json o{{"name", p.name}};
      put_opt(o, "syntax", p.syntax);
      put_opt(o, "default", p.default_value);
      put_opt(o, "description", p.description);
      arr.push_back(std::move(o));
    }
    j["cssProperties"] = std::move(arr);
  }
  if (!m.css_parts.empty()) {
    json arr = json::array();
    for (const auto & p : m.css_parts) {
      json o{{"name", p.name}};
      put_opt(o, "description", p.description);
      arr.push_back(std::move(o));
    }
    j["cssParts"] = std::move(arr);
  }
  return j;
}

ComponentMetadata metadata_from_json(const json & j)
{
  ComponentMetadata m;
  m.deprecated = j.value("deprecated", false);
  if (j.contains("tags")) m.tags = j.at("tags").get<std::vector<std::string>>();
  get_opt(j, "watchers", m.watchers);
  get_opt(j, "methods", m.methods);
  get_opt(j, "listeners", m.listeners);
  get_opt(j, "formAssociated", m.form_associated);
  get_opt(j, "hasElement", m.has_element);
  if (j.contains("shadowMode")) {
    m.shadow_mode = j.at("shadowMode").get<std::string>() == "scoped" ? ShadowMode::Scoped
                                                                      : ShadowMode::Shadow;
  }
  get_opt(j, "assetsDirs", m.assets_dirs);
  if (j.contains("styleUrls")) {
    const auto & s = j.at("styleUrls");
    if (s.is_string()) {
      m.style_urls = s.get<std::string>();
    } else {
      m.style_urls = s.get<std::map<std::string, std::string>>();
    }
  }

  if (j.contains("controllers")) {
    for (const auto & c : j.at("controllers")) {
      m.controllers.push_back(
        ReactiveController{c.at("property").get<std::string>(), c.at("type").get<std::string>()});
    }
  }
  if (j.contains("queries")) {
    for (const auto & e : j.at("queries")) {
      ElementQuery q;
      q.decorator = e.at("decorator").get<std::string>();
      q.property = e.at("property").get<std::string>();
      get_opt(e, "selector", q.selector);
      get_opt(e, "cache", q.cache);
      get_opt(e, "slot", q.slot);
      get_opt(e, "flatten", q.flatten);
      m.queries.push_back(std::move(q));
    }
  }

  get_opt(j, "summary", m.summary);
  if (j.contains("events")) {
    for (const auto & e : j.at("events")) {
      JsDocEvent ev;
      ev.name = e.at("name").get<std::string>();
      get_opt(e, "type", ev.type);
      get_opt(e, "description", ev.description);
      m.events.push_back(std::move(ev));
    }
  }
  if (j.contains("slots")) {
    for (const auto & e : j.at("slots")) {
      JsDocSlot s;
      s.name = e.at("name").get<std::string>();
      get_opt(e, "description", s.description);
      m.slots.push_back(std::move(s));
    }
  }
  if (j.contains("cssProperties")) {
    for (const auto & e : j.at("cssProperties")) {
      JsDocCssProperty p;
      p.name = e.at("name").get<std::string>();
      get_opt(e, "syntax", p.syntax);
      get_opt(e, "default", p.default_value);
      get_opt(e, "description", p.description);
      m.css_properties.push_back(std::move(p));
    }
  }
  if (j.contains("cssParts")) {
    for (const auto & e : j.at("cssParts")) {
      JsDocCssPart p;
      p.name = e.at("name").get<std::string>();
      get_opt(e, "description", p.description);
      m.css_parts.push_back(std::move(p));
    }
  }
  return m;
}

}  // namespace

// ============================================================================
// Timestamps
// ============================================================================

std::string format_timestamp(Timestamp t)
{
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(t.time_since_epoch()).count();
  const std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  return fmt::format(
    "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
    tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms % 1000));
}

Timestamp parse_timestamp(std::string_view s)
{
  std::tm tm{};
  int millis = 0;
  const std::string buf(s);
  const int n = std::sscanf(
    buf.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis);
  if (n < 6) {
    throw std::invalid_argument("invalid timestamp: " + buf);
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  const std::time_t secs = timegm(&tm);
  return Timestamp(std::chrono::seconds(secs)) + std::chrono::milliseconds(millis);
}

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const DesignToken & token)
{
  json metadata = json::object();
  for (const auto & [k, v] : token.metadata) metadata[k] = v;

  return json{
    {"id", token.id},
    {"name", token.name},
    {"category", to_string(token.category)},
    {"value", j_value(token.value)},
    {"source", j_source(token.source)},
    {"aliases", token.aliases},
    {"usedBy", token.used_by},
    {"metadata", std::move(metadata)},
    {"scannedAt", format_timestamp(token.scanned_at)}};
}

nlohmann::json to_json(const Component & component)
{
  json props = json::array();
  for (const auto & p : component.props) props.push_back(j_prop(p));

  const auto & src = component.source;
  return json{
    {"id", component.id},
    {"name", component.name},
    {"source",
     {{"type", to_string(src.framework)},
      {"path", src.path},
      {"exportName", src.export_name},
      {"tagName", src.tag_name},
      {"line", src.line}}},
    {"props", std::move(props)},
    {"variants", component.variants},
    {"tokens", component.tokens},
    {"dependencies", component.dependencies},
    {"metadata", j_metadata(component.metadata)},
    {"scannedAt", format_timestamp(component.scanned_at)}};
}

nlohmann::json to_json(const ScanError & error)
{
  return json{{"file", error.file}, {"message", error.message}, {"code", to_string(error.code)}};
}

nlohmann::json to_json(const RawSignal & signal)
{
  json metadata = json::object();
  for (const auto & [k, v] : signal.metadata) metadata[k] = v;

  return json{
    {"id", signal.id},
    {"type", to_string(signal.type)},
    {"value", signal.value},
    {"location", {{"path", signal.location.path}, {"line", signal.location.line}}},
    {"context",
     {{"fileType", signal.context.file_type},
      {"framework", signal.context.framework},
      {"scope", signal.context.scope},
      {"isTokenized", signal.context.is_tokenized}}},
    {"metadata", std::move(metadata)}};
}

DesignToken token_from_json(const nlohmann::json & j)
{
  DesignToken t;
  t.id = j.at("id").get<std::string>();
  t.name = j.at("name").get<std::string>();
  const auto category = token_category_from_string(j.at("category").get<std::string>());
  t.category = category.value_or(TokenCategory::Other);
  t.value = value_from_json(j.at("value"));
  t.source = source_from_json(j.at("source"));
  t.aliases = j.at("aliases").get<std::vector<std::string>>();
  t.used_by = j.at("usedBy").get<std::vector<std::string>>();
  t.metadata = j.at("metadata").get<std::map<std::string, std::string>>();
  t.scanned_at = parse_timestamp(j.at("scannedAt").get<std::string>());
  return t;
}

Component component_from_json(const nlohmann::json & j)
{
  Component c;
  c.id = j.at("id").get<std::string>();
  c.name = j.at("name").get<std::string>();

  const auto & src = j.at("source");
  const auto framework = framework_from_string(src.at("type").get<std::string>());
  if (!framework) {
    throw std::invalid_argument("unknown component source type");
  }
  c.source.framework = *framework;
  c.source.path = src.at("path").get<std::string>();
  c.source.export_name = src.at("exportName").get<std::string>();
  c.source.tag_name = src.at("tagName").get<std::string>();
  c.source.line = src.at("line").get<uint32_t>();

  for (const auto & p : j.at("props")) c.props.push_back(prop_from_json(p));
  c.variants = j.at("variants").get<std::vector<std::string>>();
  c.tokens = j.at("tokens").get<std::vector<std::string>>();
  c.dependencies = j.at("dependencies").get<std::vector<std::string>>();
  c.metadata = metadata_from_json(j.at("metadata"));
  c.scanned_at = parse_timestamp(j.at("scannedAt").get<std::string>());
  return c;
}

}  // namespace driftscan
