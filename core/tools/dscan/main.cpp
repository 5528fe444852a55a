// dscan - Design token and web component scanner
//
// Usage:
//   dscan tokens [options] [FILE...]
//   dscan components [options] [FILE...]
//
#include <fmt/format.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "driftscan/basic/error_printer.hpp"
#include "driftscan/basic/logging.hpp"
#include "driftscan/driver/scan_cache.hpp"
#include "driftscan/driver/scanner.hpp"
#include "driftscan/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_scan_errors = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "drift scan v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options] [FILE...]\n\n"
            << "Commands:\n"
            << "  tokens                   Extract design tokens (JSON, CSS/SCSS, TS/JS)\n"
            << "  components               Detect web components (TS/JS)\n\n"
            << "Options:\n"
            << "  --config <file>          Use this drift-scan.yaml\n"
            << "  --root <dir>             Project root for reported paths\n"
            << "  --prefix <prefix>        Keep only CSS custom properties with this prefix\n"
            << "  --framework <name>       auto|lit|stencil|fast|vanilla|haunted|hybrids\n"
            << "  -j <n>                   Number of worker threads\n"
            << "  --json                   Print the full result as JSON\n"
            << "  -v, --verbose            Debug logging\n"
            << "  -h, --help               Show this help message\n";
}

void print_summary(const driftscan::TokenScanResult & result)
{
  for (const auto & t : result.items) {
    const auto & src = t.source;
    std::cout << fmt::format(
      "{:<40} {:<11} {:<24} {}:{}\n", t.name, driftscan::to_string(t.category),
      driftscan::value_text(t.value), driftscan::source_path(src), driftscan::source_line(src));
  }
  std::cout << fmt::format(
    "{} token(s) in {} file(s), {} ms\n", result.stats.items_found, result.stats.files_scanned,
    result.stats.duration_ms);
}

void print_summary(const driftscan::ComponentScanResult & result)
{
  for (const auto & c : result.items) {
    std::cout << fmt::format(
      "{:<32} {:<19} <{}> {} prop(s)  {}:{}\n", c.name, driftscan::to_string(c.source.framework),
      c.source.tag_name, c.props.size(), c.source.path, c.source.line);
  }
  std::cout << fmt::format(
    "{} component(s) in {} file(s), {} ms\n", result.stats.items_found,
    result.stats.files_scanned, result.stats.duration_ms);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string config_path;
  std::string root;
  std::optional<std::string> prefix;
  std::optional<std::string> framework;
  std::optional<std::string> jobs;
  std::vector<std::string> files;
  bool json = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--config" || arg == "--root" || arg == "--prefix" || arg == "--framework" ||
        arg == "-j") {
      if (!has_value) {
        args.error = "missing value for " + arg;
        return args;
      }
      const std::string value = argv[++i];
      if (arg == "--config") {
        args.config_path = value;
      } else if (arg == "--root") {
        args.root = value;
      } else if (arg == "--prefix") {
        args.prefix = value;
      } else if (arg == "--framework") {
        args.framework = value;
      } else {
        args.jobs = value;
      }
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
      return args;
    } else {
      args.files.push_back(arg);
    }
  }

  return args;
}

/// Project configuration from --config, drift-scan.yaml above the working
/// directory, or defaults; then command-line overrides.
std::optional<driftscan::ProjectConfig> resolve_config(const CommandArgs & args)
{
  driftscan::ProjectConfig config;
  config.project_root = fs::current_path();

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = driftscan::find_project_config(fs::current_path());
  }

  if (config_path) {
    const auto loaded = driftscan::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return std::nullopt;
    }
    config = loaded.config;
  }

  if (!args.root.empty()) config.project_root = fs::absolute(args.root);
  if (args.prefix) config.css_variable_prefix = *args.prefix;
  if (args.framework && !driftscan::parse_framework_hint(*args.framework, config.framework)) {
    std::cerr << "error: invalid framework '" << *args.framework << "'\n";
    return std::nullopt;
  }
  if (args.jobs) {
    int n = 0;
    try {
      n = std::stoi(*args.jobs);
    } catch (const std::logic_error &) {
      n = 0;
    }
    if (n < 1) {
      std::cerr << "error: -j expects a positive number, got '" << *args.jobs << "'\n";
      return std::nullopt;
    }
    config.concurrency = static_cast<size_t>(n);
  }
  return config;
}

// ============================================================================
// Commands
// ============================================================================

template <class Scanner>
int run_command(const CommandArgs & args, bool use_color)
{
  const auto config = resolve_config(args);
  if (!config) return k_exit_usage;

  std::vector<fs::path> files;
  for (const auto & f : args.files) files.push_back(fs::absolute(f));
  if (files.empty() && config->files.empty()) {
    std::cerr << "error: no input files\n";
    return k_exit_usage;
  }

  std::unique_ptr<driftscan::MemoryScanCache> cache;
  if (config->cache) cache = std::make_unique<driftscan::MemoryScanCache>();

  std::optional<Scanner> scanner;
  try {
    scanner.emplace(driftscan::to_scan_config(*config), cache.get());
  } catch (const std::invalid_argument & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_usage;
  }

  const auto result = scanner->scan(files);

  if (args.json) {
    std::cout << driftscan::to_json(result).dump(2) << "\n";
  } else {
    print_summary(result);
  }

  if (!result.errors.empty()) {
    driftscan::ErrorPrinter printer(std::cerr, use_color);
    printer.print_all(result.errors);
    return k_exit_scan_errors;
  }
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  const bool use_color = isatty(fileno(stderr)) != 0;
  driftscan::init_logging(
    args.verbose ? spdlog::level::debug : spdlog::level::warn, use_color);

  if (args.command == "tokens") {
    return run_command<driftscan::TokenScanner>(args, use_color);
  }

  if (args.command == "components") {
    return run_command<driftscan::ComponentScanner>(args, use_color);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
