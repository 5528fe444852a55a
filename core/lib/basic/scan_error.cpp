// driftscan/basic/scan_error.cpp - Scan error bag implementation
#include "driftscan/basic/scan_error.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace driftscan
{

std::string_view to_string(ScanErrorCode code) noexcept
{
  switch (code) {
    case ScanErrorCode::ParseError:
      return "PARSE_ERROR";
    case ScanErrorCode::JsonParseError:
      return "JSON_PARSE_ERROR";
    case ScanErrorCode::CssParseError:
      return "CSS_PARSE_ERROR";
    case ScanErrorCode::TsParseError:
      return "TS_PARSE_ERROR";
  }
  return "PARSE_ERROR";
}

ScanErrorCode error_code_for_path(const std::filesystem::path & path)
{
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (ext == ".json") return ScanErrorCode::JsonParseError;
  if (ext == ".css" || ext == ".scss") return ScanErrorCode::CssParseError;
  if (ext == ".ts" || ext == ".tsx" || ext == ".js" || ext == ".jsx" || ext == ".mjs") {
    return ScanErrorCode::TsParseError;
  }
  return ScanErrorCode::ParseError;
}

// ============================================================================
// ErrorBag
// ============================================================================

void ErrorBag::report(std::string file, std::string message, ScanErrorCode code)
{
  errors_.push_back(ScanError{std::move(file), std::move(message), code});
}

void ErrorBag::report_for_file(const std::filesystem::path & file, std::string message)
{
  report(file.string(), std::move(message), error_code_for_path(file));
}

void ErrorBag::add(ScanError && err) { errors_.push_back(std::move(err)); }

void ErrorBag::add(const ScanError & err) { errors_.push_back(err); }

void ErrorBag::merge(ErrorBag && other)
{
  errors_.insert(
    errors_.end(), std::make_move_iterator(other.errors_.begin()),
    std::make_move_iterator(other.errors_.end()));
  other.errors_.clear();
}

void ErrorBag::merge(const ErrorBag & other)
{
  errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
}

}  // namespace driftscan
