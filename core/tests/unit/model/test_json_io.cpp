#include <gtest/gtest.h>

#include "driftscan/model/json_io.hpp"

using namespace driftscan;

namespace
{

const Timestamp kStamp = Timestamp(std::chrono::seconds(1700000000)) + std::chrono::milliseconds(250);

}  // namespace

TEST(ModelJson, Timestamps)
{
  EXPECT_EQ(format_timestamp(kStamp), "2023-11-14T22:13:20.250Z");
  EXPECT_EQ(parse_timestamp("2023-11-14T22:13:20.250Z"), kStamp);
  EXPECT_EQ(parse_timestamp("2023-11-14T22:13:20Z"), kStamp - std::chrono::milliseconds(250));
  EXPECT_THROW((void)parse_timestamp("yesterday"), std::invalid_argument);
}

TEST(ModelJson, TokenShape)
{
  DesignToken t;
  t.id = "css:a.css:gap";
  t.name = "--gap";
  t.category = TokenCategory::Spacing;
  t.value = SpacingValue{8, SpacingUnit::Px};
  t.source = CssSource{"a.css", 4};
  t.metadata["description"] = "Gap";
  t.scanned_at = kStamp;

  const auto j = to_json(t);
  EXPECT_EQ(j.at("category"), "spacing");
  EXPECT_EQ(j.at("value").at("type"), "spacing");
  EXPECT_EQ(j.at("value").at("unit"), "px");
  EXPECT_EQ(j.at("source").at("type"), "css");
  EXPECT_EQ(j.at("source").at("line"), 4);
  EXPECT_EQ(j.at("metadata").at("description"), "Gap");
  EXPECT_TRUE(j.at("usedBy").is_array());
  EXPECT_EQ(j.at("scannedAt"), "2023-11-14T22:13:20.250Z");

  const auto back = token_from_json(j);
  EXPECT_EQ(back.id, t.id);
  EXPECT_EQ(back.category, TokenCategory::Spacing);
  EXPECT_EQ(std::get<CssSource>(back.source).line, 4u);
  EXPECT_EQ(value_text(back.value), value_text(t.value));
  EXPECT_EQ(back.scanned_at, kStamp);
}

TEST(ModelJson, ComponentOptionalFieldsOmittedWhenUnset)
{
  Component c;
  c.id = "lit:a.ts:A";
  c.name = "A";
  c.source.framework = Framework::Lit;
  c.source.path = "a.ts";
  c.source.export_name = "A";
  c.source.tag_name = "a-el";
  c.source.line = 2;
  PropDefinition p;
  p.name = "size";
  c.props.push_back(p);

  const auto j = to_json(c);
  EXPECT_EQ(j.at("source").at("type"), "lit");
  EXPECT_EQ(j.at("source").at("tagName"), "a-el");
  const auto & prop = j.at("props").at(0);
  EXPECT_EQ(prop.at("type"), "unknown");
  EXPECT_FALSE(prop.contains("defaultValue"));
  EXPECT_FALSE(prop.contains("reflect"));
  EXPECT_FALSE(j.at("metadata").contains("watchers"));
  EXPECT_FALSE(j.at("metadata").contains("controllers"));
}

TEST(ModelJson, ComponentMetadataSurvivesRoundTrip)
{
  Component c;
  c.id = "stencil:a.ts:A";
  c.name = "A";
  c.source.framework = Framework::Stencil;
  c.metadata.watchers = std::vector<std::string>{"value"};
  c.metadata.shadow_mode = ShadowMode::Scoped;
  c.metadata.style_urls = std::map<std::string, std::string>{{"ios", "a.css"}};
  c.metadata.queries.push_back(ElementQuery{"query", "btn", "#b", true, std::nullopt, std::nullopt});
  c.metadata.css_properties.push_back(JsDocCssProperty{"--x", std::nullopt, "0", std::nullopt});

  const auto back = component_from_json(to_json(c));
  EXPECT_EQ(back.source.framework, Framework::Stencil);
  EXPECT_EQ(back.metadata.watchers, c.metadata.watchers);
  EXPECT_EQ(back.metadata.shadow_mode, ShadowMode::Scoped);
  EXPECT_EQ(
    (std::get<std::map<std::string, std::string>>(*back.metadata.style_urls).at("ios")), "a.css");
  ASSERT_EQ(back.metadata.queries.size(), 1u);
  EXPECT_EQ(back.metadata.queries[0].cache, true);
  ASSERT_EQ(back.metadata.css_properties.size(), 1u);
  EXPECT_EQ(back.metadata.css_properties[0].default_value, "0");
}

TEST(ModelJson, MalformedRecordsThrow)
{
  nlohmann::json bad_source = to_json(DesignToken{});
  bad_source["source"]["type"] = "yaml";
  EXPECT_THROW((void)token_from_json(bad_source), std::invalid_argument);

  EXPECT_THROW((void)token_from_json(nlohmann::json::object()), nlohmann::json::exception);

  nlohmann::json bad_framework = to_json(Component{});
  bad_framework["source"]["type"] = "react";
  EXPECT_THROW((void)component_from_json(bad_framework), std::invalid_argument);
}

TEST(ModelJson, ScanErrorShape)
{
  const auto j = to_json(ScanError{"tokens/bad.json", "oops", ScanErrorCode::JsonParseError});
  EXPECT_EQ(j.at("file"), "tokens/bad.json");
  EXPECT_EQ(j.at("message"), "oops");
  EXPECT_EQ(j.at("code"), "JSON_PARSE_ERROR");
}
