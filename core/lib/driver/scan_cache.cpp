// driftscan/driver/scan_cache.cpp - Content-hash keyed scan result cache
#include "driftscan/driver/scan_cache.hpp"

#include <fstream>
#include <optional>
#include <sstream>

namespace driftscan
{

namespace
{

std::optional<std::string> read_file(const std::string & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string cache_key(std::string_view source_type, const std::string & path)
{
  std::string key(source_type);
  key += ':';
  key += path;
  return key;
}

}  // namespace

uint64_t fnv1a_64(std::string_view data) noexcept
{
  uint64_t hash = 14695981039346656037ULL;
  for (const char c : data) {
    hash ^= static_cast<unsigned char>(c);
    hash *= 1099511628211ULL;
  }
  return hash;
}

CacheCheckResult MemoryScanCache::check_files(
  const std::vector<std::string> & paths, std::string_view source_type)
{
  CacheCheckResult result;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto & path : paths) {
    const auto it = entries_.find(cache_key(source_type, path));
    const auto content = it == entries_.end() ? std::nullopt : read_file(path);
    if (!content || fnv1a_64(*content) != it->second.hash) {
      result.files_to_scan.push_back(path);
      continue;
    }
    result.cached_files.push_back(path);
    result.cached_entries.emplace(path, it->second.items);
  }
  return result;
}

void MemoryScanCache::store_result(
  const std::string & file, std::string_view source_type, nlohmann::json items)
{
  const auto content = read_file(file);
  if (!content) return;
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[cache_key(source_type, file)] = Entry{fnv1a_64(*content), std::move(items)};
}

size_t MemoryScanCache::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void MemoryScanCache::clear()
{
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

}  // namespace driftscan
