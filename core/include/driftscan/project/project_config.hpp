// driftscan/project/project_config.hpp - Project configuration (drift-scan.yaml)
//
// Parses and validates drift-scan.yaml project configuration files.
// Used by the CLI; library callers can build a ScanConfig directly.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "driftscan/driver/scanner.hpp"
#include "driftscan/model/component.hpp"

namespace driftscan
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (drift-scan.yaml).
 */
struct ProjectConfig
{
  /// Root that reported paths are relative to (absolute after loading)
  std::filesystem::path project_root;

  /// Explicit file list, relative to project_root
  std::vector<std::filesystem::path> files;

  /// Keep only CSS custom properties with this prefix
  std::string css_variable_prefix;

  /// Framework hint; nullopt for "auto"
  std::optional<Framework> framework;

  /// Worker count; adaptive when unset
  std::optional<size_t> concurrency;

  /// Attach the in-memory content-hash cache
  bool cache = false;
};

/// Scanner configuration for a loaded project.
[[nodiscard]] ScanConfig to_scan_config(const ProjectConfig & config);

// ============================================================================
// Configuration Loading Result
// ============================================================================

/// Outcome of load_project_config(); failures carry a one-line message.
struct ConfigLoadResult
{
  /// Valid only when `success` is set
  ProjectConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg) { return {std::move(cfg), true, {}}; }
  static ConfigLoadResult fail(std::string msg) { return {ProjectConfig{}, false, std::move(msg)}; }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a drift-scan.yaml file.
 *
 * `projectRoot` is resolved against the directory holding the file and
 * defaults to that directory.
 *
 * @param config_path Path to drift-scan.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to drift-scan.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Parse a `framework` setting: "auto" -> nullopt, unknown spelling -> false.
[[nodiscard]] bool parse_framework_hint(const std::string & value, std::optional<Framework> & out);

inline constexpr const char * k_project_config_file_name = "drift-scan.yaml";

}  // namespace driftscan
