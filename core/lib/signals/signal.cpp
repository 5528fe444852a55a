// driftscan/signals/signal.cpp - Signal emitter and aggregator
#include "driftscan/signals/signal.hpp"

#include <fmt/core.h>

#include <unordered_set>

#include "driftscan/text/string_utils.hpp"

namespace driftscan
{

std::string_view to_string(SignalType t) noexcept
{
  switch (t) {
    case SignalType::TokenDefinition:
      return "token-definition";
    case SignalType::ComponentDef:
      return "component-def";
  }
  return "token-definition";
}

std::string make_signal_id(
  SignalType type, std::string_view path, uint32_t line, std::string_view value)
{
  return fmt::format("{}:{}:{}:{}", to_string(type), path, line, value);
}

std::string signal_file_type(std::string_view path)
{
  static constexpr std::string_view k_known[] = {"tsx", "jsx", "ts",   "js",   "mjs",
                                                 "css", "scss", "less", "json", "html"};
  const auto dot = path.rfind('.');
  if (dot != std::string_view::npos) {
    const std::string ext = text::to_lower(path.substr(dot + 1));
    for (const auto k : k_known) {
      if (ext == k) return ext;
    }
  }
  return "ts";
}

// ============================================================================
// SignalEmitter
// ============================================================================

void SignalEmitter::emit(RawSignal signal)
{
  if (index_.count(signal.id) != 0) return;
  index_.emplace(signal.id, signals_.size());
  signals_.push_back(std::move(signal));
}

std::vector<RawSignal> SignalEmitter::signals_by_type(SignalType type) const
{
  std::vector<RawSignal> out;
  for (const auto & s : signals_) {
    if (s.type == type) out.push_back(s);
  }
  return out;
}

std::map<SignalType, size_t> SignalEmitter::counts() const
{
  std::map<SignalType, size_t> out;
  for (const auto & s : signals_) {
    ++out[s.type];
  }
  return out;
}

void SignalEmitter::clear()
{
  signals_.clear();
  index_.clear();
}

void SignalEmitter::emit_token_definition(
  std::string_view path, uint32_t line, std::string_view name, std::string_view value)
{
  RawSignal s;
  s.type = SignalType::TokenDefinition;
  s.id = make_signal_id(s.type, path, line, name);
  s.value = fmt::format("{}: {}", name, value);
  s.location = SignalLocation{std::string(path), line};
  s.context = SignalContext{signal_file_type(path), "tokens", "global", true};
  s.metadata["tokenName"] = std::string(name);
  s.metadata["tokenValue"] = std::string(value);
  emit(std::move(s));
}

void SignalEmitter::emit_component_def(
  std::string_view path, uint32_t line, std::string_view name, std::string_view framework)
{
  RawSignal s;
  s.type = SignalType::ComponentDef;
  s.id = make_signal_id(s.type, path, line, name);
  s.value = std::string(name);
  s.location = SignalLocation{std::string(path), line};
  s.context = SignalContext{signal_file_type(path), std::string(framework), "global", false};
  s.metadata["componentName"] = std::string(name);
  emit(std::move(s));
}

// ============================================================================
// SignalAggregator
// ============================================================================

void SignalAggregator::add_emitter(std::string key, SignalEmitter emitter)
{
  emitters_.emplace_back(std::move(key), std::move(emitter));
}

std::vector<RawSignal> SignalAggregator::all_signals() const
{
  std::vector<RawSignal> out;
  std::unordered_set<std::string> seen;
  for (const auto & [key, emitter] : emitters_) {
    for (const auto & s : emitter.signals()) {
      if (seen.insert(s.id).second) out.push_back(s);
    }
  }
  return out;
}

std::vector<RawSignal> SignalAggregator::signals_by_type(SignalType type) const
{
  std::vector<RawSignal> out;
  for (auto & s : all_signals()) {
    if (s.type == type) out.push_back(std::move(s));
  }
  return out;
}

SignalStats SignalAggregator::stats() const
{
  SignalStats st;
  for (const auto & s : all_signals()) {
    ++st.total;
    ++st.by_type[s.type];
  }
  return st;
}

}  // namespace driftscan
