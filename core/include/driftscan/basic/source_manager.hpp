// driftscan/basic/source_manager.hpp - Source text, byte ranges and line lookup
//
// Every extractor reports 1-based line numbers against the original file text.
// SourceManager owns the text of a parsed file; line_number_at() serves the
// text scanners that work on plain string views.
//
#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace driftscan
{

// ============================================================================
// SourceRange - Half-open byte range [begin, end)
// ============================================================================

class SourceRange
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr uint32_t begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_ != k_invalid_offset && end_ != k_invalid_offset && begin_ <= end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept { return is_valid() ? end_ - begin_ : 0; }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  uint32_t begin_ = k_invalid_offset;
  uint32_t end_ = k_invalid_offset;
};

// ============================================================================
// SourceManager
// ============================================================================

/**
 * Owns the text of one scanned file and hands out byte-range slices of it.
 */
class SourceManager
{
public:
  SourceManager() = default;
  explicit SourceManager(std::string source) : source_(std::move(source)) {}

  [[nodiscard]] std::string_view source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }

  /// Empty for an invalid range; a range running past the end is clipped.
  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept
  {
    if (!range.is_valid() || range.begin() >= source_.size()) return {};
    const auto end = std::min<size_t>(range.end(), source_.size());
    return std::string_view(source_).substr(range.begin(), end - range.begin());
  }

private:
  std::string source_;
};

/// 1-based line of `offset` in `text`, counting '\n' before it.
[[nodiscard]] uint32_t line_number_at(std::string_view text, size_t offset) noexcept;

}  // namespace driftscan
