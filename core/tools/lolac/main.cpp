// lolac - Stream specification analyzer command line interface
//
// Usage:
//   lolac check <spec.json> [--config lolac.yaml] [--source spec.lola]
//   lolac ir <spec.json> [-o out.json]
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "lola/basic/diagnostic_printer.hpp"
#include "lola/basic/source_manager.hpp"
#include "lola/driver/compiler.hpp"
#include "lola/ir/ir_json.hpp"
#include "lola/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "lolac v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <spec.json> [options]\n\n"
            << "Commands:\n"
            << "  check <spec.json>        Analyze a specification\n"
            << "  ir <spec.json>           Analyze and dump the IR as JSON\n\n"
            << "Options:\n"
            << "  -o, --output <path>      IR output file, '-' for stdout (default: output.ir_dir)\n"
            << "  --config <lolac.yaml>    Configuration file (default: search upward)\n"
            << "  --source <spec.lola>     Source text for diagnostic context\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string config_path;
  std::string source_path;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
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

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--source") {
      if (i + 1 < argc) {
        args.source_path = argv[++i];
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Shared Steps
// ============================================================================

/// Explicit --config, else lolac.yaml above the input, else defaults.
std::optional<lola::ProjectConfig> load_config(const CommandArgs & args, const fs::path & input)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = lola::find_project_config(input.parent_path());
  }

  if (!config_path) {
    if (args.verbose) {
      std::cerr << "No " << lola::k_project_config_file_name << " found, using defaults\n";
    }
    lola::ProjectConfig defaults;
    defaults.project_root = fs::current_path();
    return defaults;
  }

  const auto config_result = lola::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  return config_result.config;
}

std::optional<lola::SourceManager> load_source(const CommandArgs & args)
{
  if (args.source_path.empty()) {
    return std::nullopt;
  }
  std::ifstream file(args.source_path, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "warning: cannot read source file: " << args.source_path << "\n";
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return lola::SourceManager(fs::path(args.source_path), buffer.str());
}

void print_diagnostics(const CommandArgs & args, const lola::CompileResult & result)
{
  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  lola::DiagnosticPrinter printer(std::cerr, use_color);
  if (const lola::StreamGraph * graph = result.graph.get()) {
    printer.set_stream_namer([graph](uint32_t id) { return std::string(graph->name_of(id)); });
  }

  const auto source = load_source(args);
  printer.print_all(result.diagnostics, source ? &*source : nullptr);
  printer.print_summary(result.diagnostics);
}

std::optional<lola::CompileResult> run_analysis(
  const CommandArgs & args, std::optional<lola::ProjectConfig> & config, bool build_ir)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: lolac " << args.command << " <spec.json>\n";
    return std::nullopt;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  config = load_config(args, input_path);
  if (!config) {
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Analyzing: " << input_path.string() << "\n";
  }

  lola::CompileOptions options;
  options.analysis = config->analysis;
  options.build_ir = build_ir;
  auto result = lola::Compiler::analyze_file(input_path, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(args, result);
  }
  if (args.verbose && result.graph) {
    std::cerr << "Streams: " << result.graph->streams().size()
              << ", references: " << result.graph->references().size() << "\n";
  }
  return std::optional<lola::CompileResult>(std::move(result));
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  std::optional<lola::ProjectConfig> config;
  const auto result = run_analysis(args, config, false);
  if (!result) {
    return 1;
  }

  if (result->success) {
    std::cout << args.input_file << ": OK\n";
    return 0;
  }
  return 1;
}

int cmd_ir(const CommandArgs & args)
{
  std::optional<lola::ProjectConfig> config;
  const auto result = run_analysis(args, config, true);
  if (!result) {
    return 1;
  }
  if (!result->success || !result->ir) {
    return 1;
  }

  const std::string text = lola::IrJsonSerializer::serialize(*result->ir);

  if (args.output_path == "-") {
    std::cout << text << "\n";
    return 0;
  }

  const fs::path output_path =
    !args.output_path.empty()
      ? fs::path(args.output_path)
      : lola::resolve_ir_dir(*config) / (fs::path(args.input_file).stem().string() + ".ir.json");

  try {
    if (!output_path.parent_path().empty()) {
      fs::create_directories(output_path.parent_path());
    }
  } catch (const fs::filesystem_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::ofstream out(output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << output_path.string() << "\n";
    return 1;
  }
  out << text << "\n";
  std::cerr << "Generated: " << output_path.string() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "ir") {
    return cmd_ir(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
