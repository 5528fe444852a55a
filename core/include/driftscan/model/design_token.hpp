// driftscan/model/design_token.hpp - DesignToken data model
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace driftscan
{

// ============================================================================
// Category
// ============================================================================

enum class TokenCategory : uint8_t {
  Color,
  Spacing,
  Typography,
  Shadow,
  Border,
  Sizing,
  Motion,
  Other,
};

[[nodiscard]] std::string_view to_string(TokenCategory c) noexcept;

/// Inverse of to_string(); nullopt for an unknown spelling.
[[nodiscard]] std::optional<TokenCategory> token_category_from_string(std::string_view s) noexcept;

// ============================================================================
// Value
// ============================================================================

enum class SpacingUnit : uint8_t {
  Px,
  Rem,
  Em,
};

[[nodiscard]] std::string_view to_string(SpacingUnit u) noexcept;

struct ColorValue
{
  std::string hex;
};

struct SpacingValue
{
  double value = 0.0;
  SpacingUnit unit = SpacingUnit::Px;
};

struct RawValue
{
  std::string value;
};

using TokenValue = std::variant<ColorValue, SpacingValue, RawValue>;

/// Display form of a value: hex, "<n><unit>", or the raw text.
[[nodiscard]] std::string value_text(const TokenValue & v);

// ============================================================================
// Source
// ============================================================================

struct JsonSource
{
  std::string path;
  std::string key;
};

struct CssSource
{
  std::string path;
  uint32_t line = 0;
};

struct TypeScriptSource
{
  std::string path;
  std::string type_name;
  uint32_t line = 0;
};

using TokenSource = std::variant<JsonSource, CssSource, TypeScriptSource>;

/// "json" / "css" / "typescript"
[[nodiscard]] std::string_view source_kind(const TokenSource & s) noexcept;
[[nodiscard]] const std::string & source_path(const TokenSource & s) noexcept;
/// Declaration line; 0 for JSON sources.
[[nodiscard]] uint32_t source_line(const TokenSource & s) noexcept;

// ============================================================================
// DesignToken
// ============================================================================

using Timestamp = std::chrono::system_clock::time_point;

struct DesignToken
{
  std::string id;
  std::string name;
  TokenCategory category = TokenCategory::Other;
  TokenValue value = RawValue{};
  TokenSource source = JsonSource{};
  std::vector<std::string> aliases;
  std::vector<std::string> used_by;
  std::map<std::string, std::string> metadata;
  Timestamp scanned_at{};
};

}  // namespace driftscan
