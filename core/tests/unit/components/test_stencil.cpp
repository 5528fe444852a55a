#include <gtest/gtest.h>

#include "driftscan/test_support/test_helpers.hpp"

using namespace driftscan;
using driftscan::test_support::detect;
using driftscan::test_support::find_component;
using driftscan::test_support::find_prop;

namespace
{

constexpr std::string_view kCard = R"(import { Component, Prop, State, Event, EventEmitter, Element } from '@stencil/core';

@Component({
  tag: 'my-card',
  styleUrls: ['card.css', 'card.ios.css'],
  shadow: true,
  formAssociated: true,
  assetsDirs: ['assets'],
})
export class MyCard {
  @Element() el: HTMLElement;
  @Prop({ mutable: true, reflect: true }) heading: string;
  @Prop() subtitle?: string;
  @Prop({ attribute: 'max-items' }) maxItems = 5;
  @State() open = false;
  @Event({ eventName: 'cardClosed', bubbles: true, composed: false }) closed: EventEmitter<void>;
  @Event() opened: EventEmitter;

  @Watch('heading')
  headingChanged() {}

  @Listen('keydown')
  onKey() {}

  @Method()
  async toggle() {}

  render() {
    return null;
  }
}
)";

}  // namespace

TEST(ComponentsStencil, ComponentDecorator)
{
  const auto components = detect(kCard, std::nullopt, "src/my-card.ts");
  ASSERT_EQ(components.size(), 1u);
  const auto & c = components[0];

  EXPECT_EQ(c.id, "stencil:src/my-card.ts:MyCard");
  EXPECT_EQ(c.source.framework, Framework::Stencil);
  EXPECT_EQ(c.source.tag_name, "my-card");
  EXPECT_EQ(c.source.line, 3u);

  ASSERT_EQ(c.props.size(), 6u);
  EXPECT_EQ(c.props[0].name, "heading");
  EXPECT_EQ(c.props[1].name, "subtitle");
  EXPECT_EQ(c.props[2].name, "maxItems");
  EXPECT_EQ(c.props[3].name, "open");
  EXPECT_EQ(c.props[4].name, "closed");
  EXPECT_EQ(c.props[5].name, "opened");
}

TEST(ComponentsStencil, PropOptions)
{
  const auto components = detect(kCard, std::nullopt, "src/my-card.ts");
  ASSERT_EQ(components.size(), 1u);
  const auto & c = components[0];

  const auto * heading = find_prop(c, "heading");
  ASSERT_NE(heading, nullptr);
  EXPECT_EQ(heading->type, "string");
  EXPECT_TRUE(heading->required);
  EXPECT_EQ(heading->is_mutable, true);
  EXPECT_EQ(heading->reflect, true);
  EXPECT_FALSE(heading->attribute.has_value());

  const auto * subtitle = find_prop(c, "subtitle");
  ASSERT_NE(subtitle, nullptr);
  EXPECT_FALSE(subtitle->required);

  const auto * max_items = find_prop(c, "maxItems");
  ASSERT_NE(max_items, nullptr);
  EXPECT_EQ(max_items->attribute, "max-items");
  EXPECT_EQ(max_items->default_value, "5");
  EXPECT_FALSE(max_items->is_mutable.has_value());

  const auto * open = find_prop(c, "open");
  ASSERT_NE(open, nullptr);
  EXPECT_FALSE(open->required);
  EXPECT_EQ(open->description, "Internal state");
}

TEST(ComponentsStencil, Events)
{
  const auto components = detect(kCard, std::nullopt, "src/my-card.ts");
  ASSERT_EQ(components.size(), 1u);

  const auto * closed = find_prop(components[0], "closed");
  ASSERT_NE(closed, nullptr);
  EXPECT_EQ(closed->type, "EventEmitter");
  EXPECT_EQ(closed->description, "Stencil event");
  EXPECT_EQ(closed->event_name, "cardClosed");
  EXPECT_EQ(closed->bubbles, true);
  EXPECT_EQ(closed->composed, false);
  EXPECT_FALSE(closed->cancelable.has_value());

  const auto * opened = find_prop(components[0], "opened");
  ASSERT_NE(opened, nullptr);
  EXPECT_FALSE(opened->event_name.has_value());
}

TEST(ComponentsStencil, Metadata)
{
  const auto components = detect(kCard, std::nullopt, "src/my-card.ts");
  ASSERT_EQ(components.size(), 1u);
  const auto & md = components[0].metadata;

  EXPECT_EQ(md.watchers, std::vector<std::string>{"heading"});
  EXPECT_EQ(md.listeners, std::vector<std::string>{"keydown"});
  EXPECT_EQ(md.methods, std::vector<std::string>{"toggle"});
  EXPECT_EQ(md.has_element, true);
  EXPECT_EQ(md.form_associated, true);
  EXPECT_EQ(md.shadow_mode, ShadowMode::Shadow);
  EXPECT_EQ(md.assets_dirs, std::vector<std::string>{"assets"});
  ASSERT_TRUE(md.style_urls.has_value());
  EXPECT_EQ(std::get<std::string>(*md.style_urls), "card.css,card.ios.css");
}

TEST(ComponentsStencil, ScopedWithPlatformStyleUrls)
{
  const auto components = detect(R"(import { Component } from '@stencil/core';
@Component({ scoped: true, styleUrls: { ios: 'a.ios.css', md: 'a.md.css' } })
export class XScoped {}
)");
  ASSERT_EQ(components.size(), 1u);
  const auto & md = components[0].metadata;
  EXPECT_EQ(components[0].source.tag_name, "x-scoped");
  EXPECT_EQ(md.shadow_mode, ShadowMode::Scoped);
  ASSERT_TRUE(md.style_urls.has_value());
  const auto & by_mode = std::get<std::map<std::string, std::string>>(*md.style_urls);
  EXPECT_EQ(by_mode.at("ios"), "a.ios.css");
  EXPECT_EQ(by_mode.at("md"), "a.md.css");

  // Unset options stay unset.
  EXPECT_FALSE(md.form_associated.has_value());
  EXPECT_FALSE(md.watchers.has_value());
  EXPECT_FALSE(md.has_element.has_value());
}

TEST(ComponentsStencil, SingleStyleUrl)
{
  const auto components = detect(R"(import { Component } from '@stencil/core';
@Component({ tag: 'x-one', styleUrl: 'one.css', formAssociated: false })
export class One {}
)");
  ASSERT_EQ(components.size(), 1u);
  const auto & md = components[0].metadata;
  EXPECT_EQ(std::get<std::string>(*md.style_urls), "one.css");
  EXPECT_FALSE(md.form_associated.has_value());
  EXPECT_FALSE(md.shadow_mode.has_value());
}

TEST(ComponentsStencil, RequiresCallShapedComponentDecorator)
{
  const auto components = detect(R"(import { Component } from '@stencil/core';
@Component
export class Bare {}
export class Undecorated {}
)");
  EXPECT_TRUE(components.empty());
}

TEST(ComponentsStencil, DefinedElementFallsBackToVanilla)
{
  const auto components = detect(R"(import { Component } from '@stencil/core';
class Plain extends HTMLElement {
  static get observedAttributes() { return ['size']; }
}
customElements.define('plain-el', Plain);
)");
  ASSERT_EQ(components.size(), 1u);
  EXPECT_EQ(components[0].source.framework, Framework::Vanilla);
  EXPECT_EQ(components[0].source.tag_name, "plain-el");
  EXPECT_NE(find_component(components, "Plain"), nullptr);
}
