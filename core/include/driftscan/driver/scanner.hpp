// driftscan/driver/scanner.hpp - Token and component scanners
//
// A scan reads each file on a worker, extracts its items into a per-file
// result, and merges the results single-threaded in submission order. The
// first record with a given id wins, so the output is deterministic for a
// given file list whatever the worker count.
//
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "driftscan/basic/scan_error.hpp"
#include "driftscan/model/component.hpp"
#include "driftscan/model/design_token.hpp"
#include "driftscan/signals/signal.hpp"

namespace driftscan
{

class ScanCache;

// ============================================================================
// Configuration
// ============================================================================

struct ScanConfig
{
  /// Root that `source.path` values are made relative to.
  std::filesystem::path project_root;

  /// When non-empty, replaces the file list passed to scan(). Relative
  /// entries are resolved against `project_root`.
  std::vector<std::filesystem::path> files;

  /// Only CSS custom properties starting with this prefix are kept.
  std::string css_variable_prefix;

  /// Overrides framework sniffing for component scans.
  std::optional<Framework> framework;

  /// Worker count; adaptive when unset.
  std::optional<size_t> concurrency;
};

// ============================================================================
// Results
// ============================================================================

struct ScanStats
{
  size_t files_scanned = 0;
  size_t items_found = 0;
  int64_t duration_ms = 0;
};

struct CacheStats
{
  size_t hits = 0;
  size_t misses = 0;
};

template <class T>
struct ScanResult
{
  std::vector<T> items;
  ErrorBag errors;
  ScanStats stats;
  std::optional<CacheStats> cache_stats;  ///< set only when a cache is attached
  std::vector<RawSignal> signals;
};

using TokenScanResult = ScanResult<DesignToken>;
using ComponentScanResult = ScanResult<Component>;

[[nodiscard]] nlohmann::json to_json(const ScanStats & stats);
[[nodiscard]] nlohmann::json to_json(const TokenScanResult & result);
[[nodiscard]] nlohmann::json to_json(const ComponentScanResult & result);

/// `file` relative to `root` in generic form; the absolute path when `file`
/// lies outside `root`.
[[nodiscard]] std::string relative_source_path(
  const std::filesystem::path & file, const std::filesystem::path & root);

// ============================================================================
// Scanners
// ============================================================================

/**
 * Extracts design tokens from JSON, CSS/SCSS and TypeScript/JavaScript files.
 *
 * Files with other extensions are counted as scanned and produce nothing.
 */
class TokenScanner
{
public:
  /// @throws std::invalid_argument for an empty project root or zero concurrency
  explicit TokenScanner(ScanConfig config, ScanCache * cache = nullptr);

  [[nodiscard]] TokenScanResult scan(const std::vector<std::filesystem::path> & files) const;

  [[nodiscard]] const ScanConfig & config() const noexcept { return config_; }

private:
  ScanConfig config_;
  ScanCache * cache_ = nullptr;
};

/**
 * Detects web components in TypeScript/JavaScript files.
 */
class ComponentScanner
{
public:
  /// @throws std::invalid_argument for an empty project root or zero concurrency
  explicit ComponentScanner(ScanConfig config, ScanCache * cache = nullptr);

  [[nodiscard]] ComponentScanResult scan(const std::vector<std::filesystem::path> & files) const;

  [[nodiscard]] const ScanConfig & config() const noexcept { return config_; }

private:
  ScanConfig config_;
  ScanCache * cache_ = nullptr;
};

}  // namespace driftscan
