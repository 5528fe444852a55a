// driftscan/basic/error_printer.hpp
//
// Prints scan errors in a compiler-like format:
//   error[JSON_PARSE_ERROR]: [json.exception.parse_error.101] ...
//     --> tokens/broken.json
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "driftscan/basic/scan_error.hpp"

namespace driftscan
{

class ErrorPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit ErrorPrinter(std::ostream & os, bool use_color = true);

  void print(const ScanError & err);

  /// Print every error followed by a one-line count summary.
  void print_all(const ErrorBag & errors);

private:
  void print_header(const ScanError & err);
  [[nodiscard]] std::string_view gutter_arrow() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace driftscan
