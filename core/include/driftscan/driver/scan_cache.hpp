// driftscan/driver/scan_cache.hpp - Content-hash keyed scan result cache
//
// The scanners treat the cache as an opaque store: they ask which files can
// be served from it before parsing and hand back fresh results afterwards.
// A scan produces identical items with or without a cache attached.
//
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace driftscan
{

/// 64-bit FNV-1a over raw bytes.
[[nodiscard]] uint64_t fnv1a_64(std::string_view data) noexcept;

struct CacheCheckResult
{
  std::vector<std::string> files_to_scan;
  std::vector<std::string> cached_files;
  std::map<std::string, nlohmann::json> cached_entries;  ///< file -> stored items
};

class ScanCache
{
public:
  virtual ~ScanCache() = default;

  /**
   * Split `paths` into files that must be parsed and files whose stored
   * items are still valid for their current content.
   *
   * @param source_type "tokens" or "components"
   */
  [[nodiscard]] virtual CacheCheckResult check_files(
    const std::vector<std::string> & paths, std::string_view source_type) = 0;

  /// Record the items produced for `file` (a JSON array).
  virtual void store_result(
    const std::string & file, std::string_view source_type, nlohmann::json items) = 0;
};

/**
 * In-process cache keyed by `<source_type>:<path>` and the FNV-1a hash of
 * the file content at store time. Thread-safe.
 */
class MemoryScanCache : public ScanCache
{
public:
  [[nodiscard]] CacheCheckResult check_files(
    const std::vector<std::string> & paths, std::string_view source_type) override;

  void store_result(
    const std::string & file, std::string_view source_type, nlohmann::json items) override;

  [[nodiscard]] size_t size() const;
  void clear();

private:
  struct Entry
  {
    uint64_t hash = 0;
    nlohmann::json items;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace driftscan
