// driftscan/basic/scan_error.hpp - Per-file scan failures
#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace driftscan
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Error code surfaced for a file that could not be scanned.
 *
 * The code is chosen by the failing file's extension, not by the failure.
 */
enum class ScanErrorCode : uint8_t {
  ParseError,
  JsonParseError,
  CssParseError,
  TsParseError,
};

/// Wire spelling: "PARSE_ERROR", "JSON_PARSE_ERROR", ...
[[nodiscard]] std::string_view to_string(ScanErrorCode code) noexcept;

/// Map a file extension to the code reported when that file fails.
[[nodiscard]] ScanErrorCode error_code_for_path(const std::filesystem::path & path);

struct ScanError
{
  std::string file;
  std::string message;
  ScanErrorCode code = ScanErrorCode::ParseError;
};

/**
 * Thrown by extractors for a failure confined to one file.
 *
 * The scanner converts it (and any other std::exception) into a ScanError.
 */
class ScanFailure : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// ============================================================================
// ErrorBag
// ============================================================================

class ErrorBag
{
public:
  ErrorBag() = default;

  void report(std::string file, std::string message, ScanErrorCode code);

  /// Record a failure with the code derived from the file's extension.
  void report_for_file(const std::filesystem::path & file, std::string message);

  void add(ScanError && err);
  void add(const ScanError & err);

  void merge(ErrorBag && other);
  void merge(const ErrorBag & other);

  [[nodiscard]] const std::vector<ScanError> & all() const { return errors_; }
  [[nodiscard]] bool empty() const { return errors_.empty(); }
  [[nodiscard]] size_t size() const { return errors_.size(); }

  [[nodiscard]] auto begin() const { return errors_.begin(); }
  [[nodiscard]] auto end() const { return errors_.end(); }

private:
  std::vector<ScanError> errors_;
};

}  // namespace driftscan
