// driftscan/test_support/test_helpers.hpp - helpers for unit tests
//
// Component detection on an in-memory source, and a scratch directory that
// removes itself, for tests that go through the file system.
//
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "driftscan/components/component_detector.hpp"

namespace driftscan::test_support
{

[[nodiscard]] inline std::vector<Component> detect(
  std::string_view src, std::optional<Framework> framework = std::nullopt,
  std::string path = "src/element.ts")
{
  components::DetectOptions options;
  options.grammar = ts_ll::grammar_for_path(path);
  options.path = std::move(path);
  options.framework = framework;
  return components::detect_components(src, options);
}

[[nodiscard]] inline const Component * find_component(
  const std::vector<Component> & components, std::string_view name)
{
  for (const auto & c : components) {
    if (c.name == name) return &c;
  }
  return nullptr;
}

[[nodiscard]] inline const PropDefinition * find_prop(const Component & c, std::string_view name)
{
  for (const auto & p : c.props) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

struct TempDir
{
  std::filesystem::path path;

  TempDir()
  {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = std::filesystem::temp_directory_path() /
           ("driftscan_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Write `content` to `rel` (parents created) and return the absolute path.
  std::filesystem::path write(const std::filesystem::path & rel, std::string_view content) const
  {
    const auto file = path / rel;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file;
  }
};

}  // namespace driftscan::test_support
