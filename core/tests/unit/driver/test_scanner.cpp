#include <gtest/gtest.h>

#include <fmt/core.h>

#include "driftscan/driver/scan_cache.hpp"
#include "driftscan/driver/scanner.hpp"
#include "driftscan/test_support/test_helpers.hpp"

using namespace driftscan;
using driftscan::test_support::TempDir;

namespace
{

ScanConfig config_for(const TempDir & dir, std::optional<size_t> concurrency = std::nullopt)
{
  ScanConfig config;
  config.project_root = dir.path;
  config.concurrency = concurrency;
  return config;
}

std::vector<std::string> ids(const std::vector<DesignToken> & tokens)
{
  std::vector<std::string> out;
  for (const auto & t : tokens) out.push_back(t.id);
  return out;
}

/// Serves every file from a store holding unreadable entries.
class CorruptCache : public ScanCache
{
public:
  CacheCheckResult check_files(
    const std::vector<std::string> & paths, std::string_view /*source_type*/) override
  {
    CacheCheckResult r;
    for (const auto & p : paths) {
      r.cached_files.push_back(p);
      r.cached_entries.emplace(p, nlohmann::json::array({{{"id", 42}}}));
    }
    return r;
  }

  void store_result(const std::string &, std::string_view, nlohmann::json) override { ++stored; }

  int stored = 0;
};

}  // namespace

TEST(DriverScanner, ConfigValidation)
{
  EXPECT_THROW((void)TokenScanner(ScanConfig{}), std::invalid_argument);

  ScanConfig zero;
  zero.project_root = "/tmp";
  zero.concurrency = 0;
  EXPECT_THROW((void)ComponentScanner(zero), std::invalid_argument);
}

TEST(DriverScanner, RelativeSourcePath)
{
  EXPECT_EQ(relative_source_path("/p/src/a.ts", "/p"), "src/a.ts");
  EXPECT_EQ(relative_source_path("/elsewhere/a.ts", "/p"), "/elsewhere/a.ts");
}

TEST(DriverScanner, MixedTokenSources)
{
  TempDir dir;
  const auto json = dir.write("tokens/colors.json", R"({"brand": {"value": "#FF0000"}})");
  const auto css = dir.write("styles/theme.css", ":root {\n  --gap: 8px;\n}\n");
  const auto ts = dir.write("src/variants.ts", "export type ButtonVariant = 'solid' | 'ghost';\n");
  const auto readme = dir.write("README.md", "# tokens\n");

  const TokenScanner scanner(config_for(dir));
  const auto result = scanner.scan({json, css, ts, readme});

  EXPECT_TRUE(result.errors.empty());
  EXPECT_FALSE(result.cache_stats.has_value());
  EXPECT_EQ(result.stats.files_scanned, 4u);
  EXPECT_EQ(result.stats.items_found, 4u);
  EXPECT_GE(result.stats.duration_ms, 0);

  ASSERT_EQ(result.items.size(), 4u);
  EXPECT_EQ(result.items[0].id, "json:tokens/colors.json:brand");
  EXPECT_EQ(result.items[1].id, "css:styles/theme.css:gap");
  EXPECT_EQ(source_line(result.items[1].source), 2u);
  EXPECT_EQ(result.items[2].name, "solid");

  ASSERT_EQ(result.signals.size(), 4u);
  EXPECT_EQ(result.signals[0].type, SignalType::TokenDefinition);
  EXPECT_EQ(result.signals[0].location.path, "tokens/colors.json");
}

TEST(DriverScanner, FailuresAreCollectedPerFile)
{
  TempDir dir;
  const auto good = dir.write("a.css", ":root { --a: 1px; }");
  const auto broken = dir.write("tokens/broken.json", "{ \"a\": ");
  const auto missing = dir.path / "nowhere.ts";

  const TokenScanner scanner(config_for(dir));
  const auto result = scanner.scan({broken, good, missing});

  ASSERT_EQ(result.items.size(), 1u);
  ASSERT_EQ(result.errors.size(), 2u);
  EXPECT_EQ(result.errors.all()[0].file, "tokens/broken.json");
  EXPECT_EQ(result.errors.all()[0].code, ScanErrorCode::JsonParseError);
  EXPECT_EQ(result.errors.all()[1].file, "nowhere.ts");
  EXPECT_EQ(result.errors.all()[1].code, ScanErrorCode::TsParseError);

  // The missing file was never opened.
  EXPECT_EQ(result.stats.files_scanned, 2u);
}

TEST(DriverScanner, FirstRecordWinsAndDuplicatePathsCollapse)
{
  TempDir dir;
  const auto css = dir.write("theme.scss", "$gap: 2px;\n:root { --gap: 1px; }\n");

  const TokenScanner scanner(config_for(dir));
  const auto result = scanner.scan({css, dir.path / "." / "theme.scss"});

  ASSERT_EQ(result.items.size(), 1u);
  EXPECT_EQ(result.items[0].name, "--gap");
  EXPECT_EQ(result.stats.files_scanned, 1u);
}

TEST(DriverScanner, OrderIndependentOfWorkerCount)
{
  TempDir dir;
  std::vector<std::filesystem::path> files;
  for (int i = 0; i < 24; ++i) {
    files.push_back(dir.write(
      fmt::format("t{:02}.json", i), fmt::format(R"({{"size-{}": {{"value": "{}px"}}}})", i, i)));
  }

  const auto serial = TokenScanner(config_for(dir, 1)).scan(files);
  const auto parallel = TokenScanner(config_for(dir, 6)).scan(files);
  ASSERT_EQ(serial.items.size(), 24u);
  EXPECT_EQ(ids(serial.items), ids(parallel.items));
  EXPECT_EQ(serial.items[5].name, "size-5");
}

TEST(DriverScanner, FilesOverrideResolvedAgainstRoot)
{
  TempDir dir;
  dir.write("tokens/a.json", R"({"a": {"value": "1"}})");
  const auto ignored = dir.write("tokens/b.json", R"({"b": {"value": "2"}})");

  auto config = config_for(dir);
  config.files = {"tokens/a.json"};
  const auto result = TokenScanner(config).scan({ignored});
  ASSERT_EQ(result.items.size(), 1u);
  EXPECT_EQ(result.items[0].name, "a");
}

TEST(DriverScanner, CssPrefixFromConfig)
{
  TempDir dir;
  const auto css = dir.write("t.css", ":root { --ds-a: 1px; --x-b: 2px; }");
  auto config = config_for(dir);
  config.css_variable_prefix = "--ds-";
  const auto result = TokenScanner(config).scan({css});
  ASSERT_EQ(result.items.size(), 1u);
  EXPECT_EQ(result.items[0].name, "--ds-a");
}

TEST(DriverScanner, CacheHitsSkipParsing)
{
  TempDir dir;
  const auto a = dir.write("a.css", ":root { --a: 1px; }");
  const auto b = dir.write("b.css", ":root { --b: 2px; }");

  MemoryScanCache cache;
  const TokenScanner scanner(config_for(dir), &cache);

  const auto first = scanner.scan({a, b});
  ASSERT_TRUE(first.cache_stats.has_value());
  EXPECT_EQ(first.cache_stats->hits, 0u);
  EXPECT_EQ(first.cache_stats->misses, 2u);
  EXPECT_EQ(cache.size(), 2u);

  dir.write("b.css", ":root { --b: 3px; --c: 4px; }");
  const auto second = scanner.scan({a, b});
  EXPECT_EQ(second.cache_stats->hits, 1u);
  EXPECT_EQ(second.cache_stats->misses, 1u);
  EXPECT_EQ(second.stats.files_scanned, 2u);
  ASSERT_EQ(second.items.size(), 3u);
  EXPECT_EQ(second.items[0].id, first.items[0].id);
  EXPECT_EQ(value_text(second.items[1].value), "3px");
}

TEST(DriverScanner, CorruptCacheEntriesAreMisses)
{
  TempDir dir;
  const auto a = dir.write("a.css", ":root { --a: 1px; }");

  CorruptCache cache;
  const auto result = TokenScanner(config_for(dir), &cache).scan({a});
  ASSERT_EQ(result.items.size(), 1u);
  EXPECT_EQ(result.cache_stats->hits, 0u);
  EXPECT_EQ(result.cache_stats->misses, 1u);
  EXPECT_EQ(cache.stored, 1);
  EXPECT_TRUE(result.errors.empty());
}

TEST(DriverScanner, ComponentScan)
{
  TempDir dir;
  const auto el = dir.write(
    "src/my-button.ts",
    "import { LitElement } from 'lit';\n"
    "export class MyButton extends LitElement {}\n");
  const auto css = dir.write("src/styles.css", ":root { --a: 1px; }");

  const ComponentScanner scanner(config_for(dir));
  const auto result = scanner.scan({el, css});
  EXPECT_EQ(result.stats.files_scanned, 2u);
  ASSERT_EQ(result.items.size(), 1u);
  EXPECT_EQ(result.items[0].source.path, "src/my-button.ts");
  EXPECT_EQ(result.items[0].id, "lit:src/my-button.ts:MyButton");

  ASSERT_EQ(result.signals.size(), 1u);
  EXPECT_EQ(result.signals[0].type, SignalType::ComponentDef);
  EXPECT_EQ(result.signals[0].context.framework, "lit");
}

TEST(DriverScanner, FrameworkHintReachesDetector)
{
  TempDir dir;
  const auto el = dir.write("src/card.ts", "export class Card extends BaseElement {}\n");

  EXPECT_TRUE(ComponentScanner(config_for(dir)).scan({el}).items.empty());

  auto config = config_for(dir);
  config.framework = Framework::Lit;
  const auto hinted = ComponentScanner(config).scan({el});
  ASSERT_EQ(hinted.items.size(), 1u);
  EXPECT_EQ(hinted.items[0].source.framework, Framework::Lit);
}

TEST(DriverScanner, ResultJson)
{
  TempDir dir;
  const auto a = dir.write("a.css", ":root { --a: 1px; }");
  const auto broken = dir.write("b.json", "[");

  MemoryScanCache cache;
  const auto j = to_json(TokenScanner(config_for(dir), &cache).scan({a, broken}));
  EXPECT_EQ(j.at("items").size(), 1u);
  EXPECT_EQ(j.at("errors").at(0).at("code"), "JSON_PARSE_ERROR");
  EXPECT_EQ(j.at("stats").at("filesScanned"), 2);
  EXPECT_EQ(j.at("stats").at("itemsFound"), 1);
  EXPECT_TRUE(j.at("stats").contains("durationMs"));
  EXPECT_EQ(j.at("cacheStats").at("misses"), 2);
  EXPECT_EQ(j.at("signals").size(), 1u);
}
