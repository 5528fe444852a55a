// driftscan/driver/scanner.cpp - Token and component scanners
#include "driftscan/driver/scanner.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "driftscan/components/component_detector.hpp"
#include "driftscan/driver/scan_cache.hpp"
#include "driftscan/driver/worker_pool.hpp"
#include "driftscan/model/identity.hpp"
#include "driftscan/model/json_io.hpp"
#include "driftscan/text/string_utils.hpp"
#include "driftscan/tokens/token_extractors.hpp"

namespace driftscan
{

namespace fs = std::filesystem;

namespace
{

struct FileJob
{
  fs::path file;        ///< absolute, normalised
  std::string display;  ///< path recorded in sources and errors
};

template <class T>
struct FileOutcome
{
  std::vector<T> items;
  std::optional<ScanError> error;
  bool opened = false;
  bool from_cache = false;
};

std::string read_source(const fs::path & file)
{
  std::ifstream in(file, std::ios::binary);
  if (!in) throw ScanFailure(fmt::format("cannot open {}", file.string()));
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string extension_of(const fs::path & file) { return text::to_lower(file.extension().string()); }

bool is_script(const std::string & ext)
{
  return ext == ".ts" || ext == ".tsx" || ext == ".js" || ext == ".jsx" || ext == ".mjs";
}

void validate(const ScanConfig & config)
{
  if (config.project_root.empty()) throw std::invalid_argument("project root must not be empty");
  if (config.concurrency && *config.concurrency == 0) {
    throw std::invalid_argument("concurrency must be at least 1");
  }
}

/// Absolute file list with duplicates removed (first occurrence kept).
std::vector<FileJob> resolve_files(const ScanConfig & config, const std::vector<fs::path> & files)
{
  const fs::path root = fs::absolute(config.project_root).lexically_normal();
  const auto & list = config.files.empty() ? files : config.files;

  std::vector<FileJob> jobs;
  std::unordered_set<std::string> seen;
  for (const auto & f : list) {
    const fs::path abs = (f.is_absolute() ? f : root / f).lexically_normal();
    if (!seen.insert(abs.string()).second) continue;
    jobs.push_back(FileJob{abs, relative_source_path(abs, root)});
  }
  return jobs;
}

// ============================================================================
// Per-kind policies
// ============================================================================

struct TokenPolicy
{
  using Item = DesignToken;
  static constexpr std::string_view kSourceType = "tokens";

  static std::vector<Item> extract(
    const std::string & content, const FileJob & job, const ScanConfig & config, Timestamp now)
  {
    const tokens::TokenFileContext ctx{job.display, job.file.stem().string(), now};
    const auto ext = extension_of(job.file);
    if (ext == ".json") return tokens::extract_json_tokens(content, ctx);
    if (ext == ".css" || ext == ".scss") {
      return tokens::extract_css_tokens(content, ctx, config.css_variable_prefix);
    }
    if (is_script(ext)) return tokens::extract_ts_tokens(content, ctx);
    return {};
  }

  static Item from_json(const nlohmann::json & j) { return token_from_json(j); }

  static void emit(const Item & token, SignalEmitter & emitter)
  {
    emitter.emit_token_definition(
      source_path(token.source), source_line(token.source), token.name, value_text(token.value));
  }
};

struct ComponentPolicy
{
  using Item = Component;
  static constexpr std::string_view kSourceType = "components";

  static std::vector<Item> extract(
    const std::string & content, const FileJob & job, const ScanConfig & config, Timestamp now)
  {
    if (!is_script(extension_of(job.file))) return {};
    components::DetectOptions options;
    options.path = job.display;
    options.grammar = ts_ll::grammar_for_path(job.file);
    options.framework = config.framework;
    options.scanned_at = now;
    return components::detect_components(content, options);
  }

  static Item from_json(const nlohmann::json & j) { return component_from_json(j); }

  static void emit(const Item & c, SignalEmitter & emitter)
  {
    emitter.emit_component_def(c.source.path, c.source.line, c.name, to_string(c.source.framework));
  }
};

template <class Policy>
FileOutcome<typename Policy::Item> scan_file(
  const FileJob & job, const ScanConfig & config, Timestamp now)
{
  FileOutcome<typename Policy::Item> out;
  try {
    const std::string content = read_source(job.file);
    out.opened = true;
    out.items = Policy::extract(content, job, config, now);
    spdlog::debug("{}: {} item(s)", job.display, out.items.size());
  } catch (const std::exception & e) {
    spdlog::warn("{}: {}", job.display, e.what());
    out.items.clear();
    out.error = ScanError{job.display, e.what(), error_code_for_path(job.file)};
  }
  return out;
}

/// Cached items for one file; nullopt when the entry does not deserialise.
template <class Policy>
std::optional<std::vector<typename Policy::Item>> decode_cached(
  const nlohmann::json & entry, const FileJob & job)
{
  try {
    std::vector<typename Policy::Item> items;
    for (const auto & j : entry) items.push_back(Policy::from_json(j));
    return items;
  } catch (const nlohmann::json::exception & e) {
    spdlog::debug("{}: discarding cache entry: {}", job.display, e.what());
  } catch (const std::invalid_argument & e) {
    spdlog::debug("{}: discarding cache entry: {}", job.display, e.what());
  }
  return std::nullopt;
}

template <class Policy>
ScanResult<typename Policy::Item> run_scan(
  const ScanConfig & config, ScanCache * cache, const std::vector<fs::path> & files)
{
  using Item = typename Policy::Item;
  const auto started = std::chrono::steady_clock::now();
  const Timestamp now = std::chrono::system_clock::now();

  const auto jobs = resolve_files(config, files);
  std::vector<FileOutcome<Item>> outcomes(jobs.size());
  std::vector<size_t> to_parse;

  ScanResult<Item> result;
  if (cache != nullptr) {
    std::vector<std::string> paths;
    paths.reserve(jobs.size());
    for (const auto & job : jobs) paths.push_back(job.file.string());

    const auto check = cache->check_files(paths, Policy::kSourceType);
    CacheStats stats;
    for (size_t i = 0; i < jobs.size(); ++i) {
      const auto it = check.cached_entries.find(paths[i]);
      if (it != check.cached_entries.end()) {
        if (auto items = decode_cached<Policy>(it->second, jobs[i])) {
          outcomes[i].items = std::move(*items);
          outcomes[i].opened = true;
          outcomes[i].from_cache = true;
          ++stats.hits;
          continue;
        }
      }
      to_parse.push_back(i);
    }
    stats.misses = to_parse.size();
    result.cache_stats = stats;
  } else {
    for (size_t i = 0; i < jobs.size(); ++i) to_parse.push_back(i);
  }

  if (!to_parse.empty()) {
    WorkerPool pool(adaptive_concurrency(to_parse.size(), config.concurrency));
    std::vector<std::future<FileOutcome<Item>>> pending;
    pending.reserve(to_parse.size());
    for (const size_t i : to_parse) {
      pending.push_back(
        pool.submit([&job = jobs[i], &config, now]() { return scan_file<Policy>(job, config, now); }));
    }
    // Collected in submission order, not completion order.
    for (size_t k = 0; k < to_parse.size(); ++k) outcomes[to_parse[k]] = pending[k].get();
  }

  DedupMap<Item> merged;
  SignalAggregator signals;
  for (size_t i = 0; i < jobs.size(); ++i) {
    auto & outcome = outcomes[i];
    if (outcome.opened) ++result.stats.files_scanned;
    if (outcome.error) {
      result.errors.add(std::move(*outcome.error));
      continue;
    }

    if (cache != nullptr && !outcome.from_cache) {
      nlohmann::json stored = nlohmann::json::array();
      for (const auto & item : outcome.items) stored.push_back(to_json(item));
      cache->store_result(jobs[i].file.string(), Policy::kSourceType, std::move(stored));
    }

    SignalEmitter emitter;
    for (const auto & item : outcome.items) Policy::emit(item, emitter);
    signals.add_emitter(jobs[i].display, std::move(emitter));
    merged.insert_all(std::move(outcome.items));
  }

  result.items = std::move(merged).take();
  result.signals = signals.all_signals();
  result.stats.items_found = result.items.size();
  result.stats.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started)
                               .count();

  spdlog::debug(
    "{} scan: {} file(s), {} item(s), {} error(s) in {} ms", Policy::kSourceType,
    result.stats.files_scanned, result.stats.items_found, result.errors.size(),
    result.stats.duration_ms);
  return result;
}

template <class T>
nlohmann::json result_to_json(const ScanResult<T> & result)
{
  nlohmann::json j;
  j["items"] = nlohmann::json::array();
  for (const auto & item : result.items) j["items"].push_back(to_json(item));
  j["errors"] = nlohmann::json::array();
  for (const auto & err : result.errors) j["errors"].push_back(to_json(err));
  j["stats"] = to_json(result.stats);
  if (result.cache_stats) {
    j["cacheStats"] = {{"hits", result.cache_stats->hits}, {"misses", result.cache_stats->misses}};
  }
  j["signals"] = nlohmann::json::array();
  for (const auto & s : result.signals) j["signals"].push_back(to_json(s));
  return j;
}

}  // namespace

std::string relative_source_path(const fs::path & file, const fs::path & root)
{
  const fs::path rel = file.lexically_relative(root);
  if (rel.empty() || *rel.begin() == "..") return file.generic_string();
  return rel.generic_string();
}

nlohmann::json to_json(const ScanStats & stats)
{
  return {
    {"filesScanned", stats.files_scanned},
    {"itemsFound", stats.items_found},
    {"durationMs", stats.duration_ms},
  };
}

nlohmann::json to_json(const TokenScanResult & result) { return result_to_json(result); }
nlohmann::json to_json(const ComponentScanResult & result) { return result_to_json(result); }

// ============================================================================
// Scanners
// ============================================================================

TokenScanner::TokenScanner(ScanConfig config, ScanCache * cache)
: config_(std::move(config)), cache_(cache)
{
  validate(config_);
}

TokenScanResult TokenScanner::scan(const std::vector<fs::path> & files) const
{
  return run_scan<TokenPolicy>(config_, cache_, files);
}

ComponentScanner::ComponentScanner(ScanConfig config, ScanCache * cache)
: config_(std::move(config)), cache_(cache)
{
  validate(config_);
}

ComponentScanResult ComponentScanner::scan(const std::vector<fs::path> & files) const
{
  return run_scan<ComponentPolicy>(config_, cache_, files);
}

}  // namespace driftscan
