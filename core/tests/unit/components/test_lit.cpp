#include <gtest/gtest.h>

#include "driftscan/test_support/test_helpers.hpp"

using namespace driftscan;
using driftscan::test_support::detect;
using driftscan::test_support::find_component;
using driftscan::test_support::find_prop;

namespace
{

constexpr std::string_view kDecorated = R"(import { LitElement, html } from 'lit';
import { customElement, property, state, query } from 'lit/decorators.js';

/**
 * A button.
 * @summary Clickable button
 * @fires {CustomEvent} press - Fired on press
 * @slot - Label content
 * @cssprop [--btn-bg=#fff] - Background
 * @csspart base - The base
 */
@customElement('my-button')
export class MyButton extends LitElement {
  @property({ type: String, reflect: true }) variant = 'primary';
  @property({ attribute: 'is-open' }) open?: boolean;
  @property() label: string;
  @state() private pressed = false;
  @query('#base', true) base!: HTMLElement;
  private hover = new HoverController(this, { delay: 10 });

  render() {
    return html`<button>${this.label}</button>`;
  }
}
)";

}  // namespace

TEST(ComponentsLit, DecoratedElement)
{
  const auto components = detect(kDecorated);
  ASSERT_EQ(components.size(), 1u);
  const auto & c = components[0];

  EXPECT_EQ(c.name, "MyButton");
  EXPECT_EQ(c.id, "lit:src/element.ts:MyButton");
  EXPECT_EQ(c.source.framework, Framework::Lit);
  EXPECT_EQ(c.source.tag_name, "my-button");
  EXPECT_EQ(c.source.export_name, "MyButton");
  EXPECT_EQ(c.source.line, 12u);
  EXPECT_FALSE(c.metadata.deprecated);

  ASSERT_EQ(c.props.size(), 4u);

  const auto * variant = find_prop(c, "variant");
  ASSERT_NE(variant, nullptr);
  EXPECT_EQ(variant->type, "String");
  EXPECT_FALSE(variant->required);
  EXPECT_EQ(variant->default_value, "'primary'");
  EXPECT_EQ(variant->reflect, true);

  const auto * open = find_prop(c, "open");
  ASSERT_NE(open, nullptr);
  EXPECT_EQ(open->type, "boolean");
  EXPECT_FALSE(open->required);
  EXPECT_EQ(open->attribute, "is-open");

  const auto * label = find_prop(c, "label");
  ASSERT_NE(label, nullptr);
  EXPECT_EQ(label->type, "string");
  EXPECT_TRUE(label->required);

  const auto * pressed = find_prop(c, "pressed");
  ASSERT_NE(pressed, nullptr);
  EXPECT_EQ(pressed->type, "unknown");
  EXPECT_EQ(pressed->default_value, "false");

  ASSERT_EQ(c.metadata.controllers.size(), 1u);
  EXPECT_EQ(c.metadata.controllers[0].property, "hover");
  EXPECT_EQ(c.metadata.controllers[0].controller_type, "HoverController");

  ASSERT_EQ(c.metadata.queries.size(), 1u);
  EXPECT_EQ(c.metadata.queries[0].decorator, "query");
  EXPECT_EQ(c.metadata.queries[0].property, "base");
  EXPECT_EQ(c.metadata.queries[0].selector, "#base");
  EXPECT_EQ(c.metadata.queries[0].cache, true);
}

TEST(ComponentsLit, JsDocMetadata)
{
  const auto components = detect(kDecorated);
  ASSERT_EQ(components.size(), 1u);
  const auto & md = components[0].metadata;

  EXPECT_EQ(md.summary, "Clickable button");
  ASSERT_EQ(md.events.size(), 1u);
  EXPECT_EQ(md.events[0].name, "press");
  EXPECT_EQ(md.events[0].type, "CustomEvent");
  ASSERT_EQ(md.slots.size(), 1u);
  EXPECT_EQ(md.slots[0].name, "");
  ASSERT_EQ(md.css_properties.size(), 1u);
  EXPECT_EQ(md.css_properties[0].default_value, "#fff");
  ASSERT_EQ(md.css_parts.size(), 1u);
  EXPECT_EQ(md.css_parts[0].name, "base");
}

TEST(ComponentsLit, RegisteredWithCustomElementsDefine)
{
  const auto components = detect(
    "import { LitElement } from 'lit';\n"
    "class Foo extends LitElement {}\n"
    "customElements.define('foo-bar', Foo);\n");
  ASSERT_EQ(components.size(), 1u);
  EXPECT_EQ(components[0].name, "Foo");
  EXPECT_EQ(components[0].source.tag_name, "foo-bar");
  EXPECT_EQ(components[0].source.line, 2u);
}

TEST(ComponentsLit, TagFallsBackToKebabCase)
{
  const auto components = detect(
    "import { LitElement } from 'lit';\n"
    "export class FancyCard extends LitElement {}\n");
  ASSERT_EQ(components.size(), 1u);
  EXPECT_EQ(components[0].source.tag_name, "fancy-card");
}

TEST(ComponentsLit, StaticPropertiesFollowDecoratedOnes)
{
  const auto components = detect(R"(import { LitElement } from 'lit';
export class CounterEl extends LitElement {
  static properties = {
    count: { type: Number, reflect: true },
    label: { attribute: false },
  };
  @property() extra = 1;
}
)");
  ASSERT_EQ(components.size(), 1u);
  const auto & props = components[0].props;
  ASSERT_EQ(props.size(), 3u);
  EXPECT_EQ(props[0].name, "extra");
  EXPECT_EQ(props[1].name, "count");
  EXPECT_EQ(props[1].type, "Number");
  EXPECT_EQ(props[1].reflect, true);
  EXPECT_FALSE(props[1].required);
  EXPECT_EQ(props[2].name, "label");
  EXPECT_EQ(props[2].type, "unknown");
  EXPECT_EQ(props[2].attribute, "false");
}

TEST(ComponentsLit, StaticPropertiesGetter)
{
  const auto components = detect(R"(import { LitElement } from 'lit';
class GetterEl extends LitElement {
  static get properties() {
    return { name: { type: String } };
  }
}
)");
  ASSERT_EQ(components.size(), 1u);
  ASSERT_EQ(components[0].props.size(), 1u);
  EXPECT_EQ(components[0].props[0].name, "name");
  EXPECT_EQ(components[0].props[0].type, "String");
}

TEST(ComponentsLit, MixinBaseAndAssignedQueries)
{
  const auto components = detect(R"(import { LitElement } from 'lit';
export class Mixed extends SignalWatcher(LitElement) {
  @queryAssignedElements({ slot: 'list', flatten: true }) items!: Array<HTMLElement>;
}
)");
  ASSERT_EQ(components.size(), 1u);
  ASSERT_EQ(components[0].metadata.queries.size(), 1u);
  const auto & q = components[0].metadata.queries[0];
  EXPECT_EQ(q.decorator, "queryAssignedElements");
  EXPECT_EQ(q.slot, "list");
  EXPECT_EQ(q.flatten, true);
  EXPECT_FALSE(q.selector.has_value());
}

TEST(ComponentsLit, AnonymousClassExpression)
{
  const auto components = detect(
    "import { LitElement } from 'lit';\n"
    "customElements.define('x-anon', class extends LitElement {});\n");
  ASSERT_EQ(components.size(), 1u);
  EXPECT_EQ(components[0].name, "XAnon");
  EXPECT_EQ(components[0].source.tag_name, "x-anon");
  EXPECT_EQ(components[0].source.framework, Framework::Lit);
}

TEST(ComponentsLit, PlainClassesIgnored)
{
  const auto components = detect(
    "import { LitElement } from 'lit';\n"
    "export class Helper {}\n"
    "export class Store extends Base {}\n");
  EXPECT_TRUE(components.empty());
}

TEST(ComponentsLit, DeprecatedTag)
{
  const auto components = detect(
    "import { LitElement } from 'lit';\n"
    "/**\n"
    " * @deprecated use new-el\n"
    " */\n"
    "export class OldEl extends LitElement {}\n"
    "export class NewEl extends LitElement {}\n");
  ASSERT_EQ(components.size(), 2u);
  EXPECT_TRUE(find_component(components, "OldEl")->metadata.deprecated);
  EXPECT_FALSE(find_component(components, "NewEl")->metadata.deprecated);
}
