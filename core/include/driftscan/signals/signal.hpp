// driftscan/signals/signal.hpp - Raw drift signals and their collectors
//
// Scanners emit lightweight observations while extracting. One SignalEmitter
// is filled per file; a SignalAggregator merges the emitters of a scan.
//
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace driftscan
{

enum class SignalType : uint8_t {
  TokenDefinition,
  ComponentDef,
};

/// "token-definition" / "component-def"
[[nodiscard]] std::string_view to_string(SignalType t) noexcept;

struct SignalLocation
{
  std::string path;
  uint32_t line = 0;
};

struct SignalContext
{
  std::string file_type;  ///< "css", "scss", "json", "ts", "tsx", ...
  std::string framework;  ///< component framework or "tokens"
  std::string scope;      ///< "global" | "component" | "inline"
  bool is_tokenized = false;
};

struct RawSignal
{
  std::string id;
  SignalType type = SignalType::TokenDefinition;
  std::string value;
  SignalLocation location;
  SignalContext context;
  std::map<std::string, std::string> metadata;
};

/// `<type>:<path>:<line>:<value>`
[[nodiscard]] std::string make_signal_id(
  SignalType type, std::string_view path, uint32_t line, std::string_view value);

/// File type label derived from a path's extension.
[[nodiscard]] std::string signal_file_type(std::string_view path);

// ============================================================================
// SignalEmitter
// ============================================================================

/**
 * Collects the signals of one file; the first signal with a given id wins.
 */
class SignalEmitter
{
public:
  void emit(RawSignal signal);

  [[nodiscard]] const std::vector<RawSignal> & signals() const noexcept { return signals_; }
  [[nodiscard]] std::vector<RawSignal> signals_by_type(SignalType type) const;
  [[nodiscard]] std::map<SignalType, size_t> counts() const;
  [[nodiscard]] bool empty() const noexcept { return signals_.empty(); }

  void clear();

  // Convenience builders

  void emit_token_definition(
    std::string_view path, uint32_t line, std::string_view name, std::string_view value);
  void emit_component_def(
    std::string_view path, uint32_t line, std::string_view name, std::string_view framework);

private:
  std::vector<RawSignal> signals_;
  std::unordered_map<std::string, size_t> index_;
};

// ============================================================================
// SignalAggregator
// ============================================================================

struct SignalStats
{
  size_t total = 0;
  std::map<SignalType, size_t> by_type;
};

/**
 * Merges per-file emitters in the order they are added.
 */
class SignalAggregator
{
public:
  void add_emitter(std::string key, SignalEmitter emitter);

  /// All signals, deduplicated by id across emitters (first wins).
  [[nodiscard]] std::vector<RawSignal> all_signals() const;
  [[nodiscard]] std::vector<RawSignal> signals_by_type(SignalType type) const;
  [[nodiscard]] SignalStats stats() const;
  [[nodiscard]] size_t emitter_count() const noexcept { return emitters_.size(); }

  void clear() { emitters_.clear(); }

private:
  std::vector<std::pair<std::string, SignalEmitter>> emitters_;
};

}  // namespace driftscan
