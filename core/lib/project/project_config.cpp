// driftscan/project/project_config.cpp - Project configuration implementation
//
#include "driftscan/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace driftscan
{

bool parse_framework_hint(const std::string & value, std::optional<Framework> & out)
{
  if (value == "auto") {
    out.reset();
    return true;
  }
  const auto fw = framework_from_string(value);
  if (!fw || *fw == Framework::StencilFunctional) return false;
  out = fw;
  return true;
}

ScanConfig to_scan_config(const ProjectConfig & config)
{
  ScanConfig scan;
  scan.project_root = config.project_root;
  scan.files = config.files;
  scan.css_variable_prefix = config.css_variable_prefix;
  scan.framework = config.framework;
  scan.concurrency = config.concurrency;
  return scan;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  const fs::path config_dir = fs::absolute(config_path).parent_path();
  ProjectConfig config;
  config.project_root = config_dir;

  // An empty document is a valid, all-defaults configuration.
  if (root.IsNull()) return ConfigLoadResult::ok(std::move(config));
  if (!root.IsMap()) return ConfigLoadResult::fail("configuration must be a map");

  try {
    if (root["projectRoot"]) {
      const fs::path p = root["projectRoot"].as<std::string>();
      config.project_root = (p.is_absolute() ? p : config_dir / p).lexically_normal();
    }

    if (root["files"]) {
      if (!root["files"].IsSequence()) {
        return ConfigLoadResult::fail("files must be a list");
      }
      for (const auto & f : root["files"]) {
        config.files.emplace_back(f.as<std::string>());
      }
    }

    if (root["cssVariablePrefix"]) {
      config.css_variable_prefix = root["cssVariablePrefix"].as<std::string>();
    }

    if (root["framework"]) {
      const auto value = root["framework"].as<std::string>();
      if (!parse_framework_hint(value, config.framework)) {
        return ConfigLoadResult::fail(
          "invalid framework: '" + value +
          "' (must be auto, lit, stencil, fast, vanilla, haunted or hybrids)");
      }
    }

    if (root["concurrency"]) {
      const int n = root["concurrency"].as<int>();
      if (n < 1) {
        return ConfigLoadResult::fail("concurrency must be at least 1");
      }
      config.concurrency = static_cast<size_t>(n);
    }

    if (root["cache"]) {
      config.cache = root["cache"].as<bool>();
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace driftscan
