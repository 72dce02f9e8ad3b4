// wirec - Wire declaration checker Command Line Interface
//
// Usage:
//   wirec check [manifest.json | --project] [--format text|json] [--no-color]
//   wirec loopbacks <manifest.json>
//   wirec init <project-name>
//
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "wire_check/basic/diagnostic_json.hpp"
#include "wire_check/basic/diagnostic_printer.hpp"
#include "wire_check/driver/checker.hpp"
#include "wire_check/driver/manifest.hpp"
#include "wire_check/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Wire declaration checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [manifest.json]      Check port and loopback declarations\n"
            << "  loopbacks <manifest.json>  Print classified loopbacks as JSON\n"
            << "  init <project-name>        Initialize a new project\n\n"
            << "Options:\n"
            << "  --project                  Check the project from wirec.yaml\n"
            << "  --format <text|json>       Diagnostic output format\n"
            << "  --no-color                 Disable colored output\n"
            << "  --max-alias-depth <n>      Bound on nested alias expansion\n"
            << "  -v, --verbose              Verbose output\n"
            << "  -h, --help                 Show this help message\n";
}

void print_text_diagnostics(const wire_check::CheckResult & result, bool use_color)
{
  wire_check::DiagnosticPrinter printer(std::cerr, use_color);

  for (const auto & module : result.modules) {
    printer.print_all(module.diagnostics, module.origin());
  }

  // Project-level errors are not attached to a module
  if (result.modules.empty()) {
    printer.print_all(result.diagnostics, "project");
  }
}

void print_json_diagnostics(const wire_check::CheckResult & result)
{
  nlohmann::json modules = nlohmann::json::array();
  for (const auto & module : result.modules) {
    modules.push_back(
      {{"module", module.module_name},
       {"path", module.source_path.string()},
       {"diagnostics", wire_check::to_json(module.diagnostics)}});
  }

  const nlohmann::json out{
    {"success", result.success},
    {"modules", modules},
    {"diagnostics", wire_check::to_json(result.diagnostics)}};
  std::cout << out.dump(2) << "\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::optional<std::string> format;
  std::optional<size_t> max_alias_depth;
  bool use_project = false;
  bool no_color = false;
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
    std::string arg = argv[i];

    if (arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      } else {
        args.error = "--format requires a value";
      }
    } else if (arg == "--max-alias-depth") {
      if (i + 1 < argc) {
        const std::string value = argv[++i];
        char * end = nullptr;
        const long long depth = std::strtoll(value.c_str(), &end, 10);
        if (end == value.c_str() || *end != '\0' || depth <= 0) {
          args.error = "invalid --max-alias-depth: '" + value + "'";
        } else {
          args.max_alias_depth = static_cast<size_t>(depth);
        }
      } else {
        args.error = "--max-alias-depth requires a value";
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  wire_check::CheckOptions options;
  options.verbose = args.verbose;
  options.max_alias_depth = args.max_alias_depth;

  wire_check::OutputConfig output;
  wire_check::CheckResult result;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find wirec.yaml
    auto config_path = wire_check::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no wirec.yaml found in current directory or parents\n";
      return 1;
    }

    const auto config_result = wire_check::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }
    output = config_result.config.output;

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << "\n";
    }

    result = wire_check::Checker::check_project(config_result.config, options);
  } else {
    // Single manifest mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    result = wire_check::Checker::check_file(input_path, options);
  }

  if (args.format) {
    if (*args.format == "json") {
      output.format = wire_check::OutputFormat::Json;
    } else if (*args.format == "text") {
      output.format = wire_check::OutputFormat::Text;
    } else {
      std::cerr << "error: invalid --format '" << *args.format << "' (must be text or json)\n";
      return 1;
    }
  }
  if (args.no_color) {
    output.color = wire_check::ColorMode::Never;
  }

  if (output.format == wire_check::OutputFormat::Json) {
    print_json_diagnostics(result);
    return result.success ? 0 : 1;
  }

  if (!result.diagnostics.empty()) {
    bool use_color = false;
    switch (output.color) {
      case wire_check::ColorMode::Auto:
        // Detect if terminal supports colors (simple check for TTY)
        use_color = isatty(fileno(stderr)) != 0;
        break;
      case wire_check::ColorMode::Always:
        use_color = true;
        break;
      case wire_check::ColorMode::Never:
        use_color = false;
        break;
    }
    print_text_diagnostics(result, use_color);
  }

  if (result.success) {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
    return 0;
  }

  return 1;
}

int cmd_loopbacks(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: manifest file required\n";
    std::cerr << "usage: wirec loopbacks <manifest.json>\n";
    return 1;
  }

  wire_check::CheckOptions options;
  options.verbose = args.verbose;
  options.max_alias_depth = args.max_alias_depth;

  const auto result = wire_check::Checker::check_file(fs::absolute(args.input_file), options);
  if (!result.success) {
    print_text_diagnostics(result, !args.no_color && isatty(fileno(stderr)) != 0);
    return 1;
  }

  nlohmann::json out = nlohmann::json::array();
  for (const auto & decl : result.loopbacks) {
    out.push_back(wire_check::loopback_to_json(decl));
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: wirec init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir);

    // Create wirec.yaml
    std::ofstream config(project_dir / wire_check::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "checker:\n"
           << "  manifests:\n"
           << "    - './ports.json'\n"
           << "  max_alias_depth: 64\n\n"
           << "output:\n"
           << "  format: 'text'\n"
           << "  color: 'auto'\n";
    config.close();

    // Create an example manifest
    std::ofstream manifest(project_dir / "ports.json");
    manifest << "{\n"
             << "  \"module\": \"Main\",\n"
             << "  \"ports\": [\n"
             << "    {\"name\": \"clicks\", \"direction\": \"input\",\n"
             << "     \"type\": {\"app\": \"Stream\", \"args\": [\"Int\"]}}\n"
             << "  ],\n"
             << "  \"loopbacks\": []\n"
             << "}\n";
    manifest.close();

    std::cout << "Initialized new wirec project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  wirec check\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "loopbacks") {
    return cmd_loopbacks(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
