// driftscan/basic/error_printer.cpp - Compiler-style scan error output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "driftscan/basic/error_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace driftscan
{

ErrorPrinter::ErrorPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void ErrorPrinter::print(const ScanError & err)
{
  print_header(err);

  std::string filename = err.file;
  std::error_code ec;
  const auto rel = std::filesystem::relative(err.file, std::filesystem::current_path(), ec);
  if (!ec && !rel.empty()) {
    filename = rel.generic_string();
  }
  fmt::print(os_, "{} {}\n\n", gutter_arrow(), filename);
}

void ErrorPrinter::print_all(const ErrorBag & errors)
{
  for (const auto & e : errors) {
    print(e);
  }
  if (errors.empty()) return;

  const std::string summary = fmt::format(
    "{} file{} could not be scanned", errors.size(), errors.size() == 1 ? "" : "s");
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << summary << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", summary);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void ErrorPrinter::print_header(const ScanError & err)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << "error"
        << "[" << to_string(err.code) << "]" << rang::fg::reset << ": " << err.message
        << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "error[{}]: {}\n", to_string(err.code), err.message);
  }
}

std::string_view ErrorPrinter::gutter_arrow() const { return "  -->"; }

}  // namespace driftscan
