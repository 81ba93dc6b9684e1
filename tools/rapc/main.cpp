// rapc - Rapter Compiler Command Line Interface
//
// Usage:
//   rapc build [file.rapt] [-o out.c] [-I dir]...
//   rapc check [file.rapt] [-I dir]...
//   rapc tokens <file.rapt>
//   rapc dump-ast <file.rapt>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/format.h>

#include "rapter/ast/json_visitor.hpp"
#include "rapter/basic/diagnostic_printer.hpp"
#include "rapter/driver/compiler.hpp"
#include "rapter/project/project_config.hpp"
#include "rapter/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Rapter Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [file.rapt]        Compile a file or project to C\n"
            << "  check [file.rapt]        Parse and type check only (no codegen)\n"
            << "  tokens <file.rapt>       Print the token stream\n"
            << "  dump-ast <file.rapt>     Print the AST as JSON\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output C file\n"
            << "  -I <dir>                 Add a module search directory (repeatable)\n"
            << "  --diagnostics-format <f> Diagnostic output: text (default) or json\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

enum class DiagnosticsFormat { Text, Json };

void print_diagnostics(
  const rapter::DiagnosticBag & diagnostics, const rapter::SourceRegistry & sources,
  DiagnosticsFormat format)
{
  if (format == DiagnosticsFormat::Json) {
    rapter::DiagnosticPrinter printer(std::cout, false);
    printer.print_json(diagnostics, sources);
    return;
  }

  // Colors only when writing to a terminal
  const bool use_color = isatty(fileno(stderr)) != 0;
  rapter::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::vector<std::string> module_paths;
  DiagnosticsFormat diagnostics_format = DiagnosticsFormat::Text;
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

    auto value = [&](std::string & out) {
      if (i + 1 < argc) {
        out = argv[++i];
      } else {
        args.error = "missing value for " + arg;
      }
    };

    if (arg == "-o" || arg == "--output") {
      value(args.output_path);
    } else if (arg == "-I") {
      std::string dir;
      value(dir);
      if (!dir.empty()) args.module_paths.push_back(std::move(dir));
    } else if (arg.rfind("-I", 0) == 0 && arg.size() > 2) {
      args.module_paths.push_back(arg.substr(2));
    } else if (arg == "--diagnostics-format") {
      std::string format;
      value(format);
      if (format == "json") {
        args.diagnostics_format = DiagnosticsFormat::Json;
      } else if (format == "text") {
        args.diagnostics_format = DiagnosticsFormat::Text;
      } else if (args.error.empty()) {
        args.error = "unknown diagnostics format '" + format + "' (expected text or json)";
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else if (args.error.empty()) {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// ============================================================================
// Commands
// ============================================================================

int cmd_compile(const CommandArgs & args, rapter::CompileMode mode)
{
  const bool building = mode == rapter::CompileMode::Build;

  rapter::CompileOptions options;
  options.mode = mode;
  if (!args.output_path.empty()) {
    options.output = fs::absolute(args.output_path);
  }
  for (const auto & dir : args.module_paths) {
    options.module_paths.push_back(fs::absolute(dir));
  }

  rapter::CompileResult result;
  std::string label;

  if (args.input_file.empty()) {
    // Project mode: find rapter.yaml
    auto config_path = rapter::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << rapter::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = rapter::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    label = config_result.config.package.name.empty() ? "project"
                                                        : config_result.config.package.name;
    if (args.verbose) {
      std::cerr << (building ? "Building" : "Checking") << " project: " << label << " ("
                << config_path->string() << ")\n";
    }

    result = rapter::Compiler::compile_project(config_result.config, options);
  } else {
    const fs::path input_path = fs::absolute(args.input_file);
    label = args.input_file;

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << (building ? "Building" : "Checking") << ": " << input_path.string() << "\n";
    }

    result = rapter::Compiler::compile_file(input_path, options);
  }

  if (args.verbose && result.module_graph) {
    for (const auto * module : result.module_graph->dependency_order()) {
      std::cerr << "  module " << module->name << "\n";
    }
  }

  if (!result.diagnostics.empty() || args.diagnostics_format == DiagnosticsFormat::Json) {
    print_diagnostics(result.diagnostics, result.module_graph->sources(), args.diagnostics_format);
  }

  if (!result.success) {
    return 1;
  }

  if (building) {
    for (const auto & file : result.generated_files) {
      std::cerr << "Generated: " << file.string() << "\n";
    }
  } else if (args.diagnostics_format == DiagnosticsFormat::Text) {
    std::cout << label << ": OK\n";
  }
  return 0;
}

int cmd_tokens(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: rapc tokens <file.rapt>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  auto text = read_file(input_path);
  if (!text) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return 1;
  }

  rapter::SourceRegistry sources;
  rapter::DiagnosticBag diags;
  const rapter::FileId file_id = sources.register_file(input_path, std::move(*text));

  for (const auto & token : rapter::tokenize(sources, file_id, diags)) {
    const auto pos = sources.get_line_column(token.range.get_begin());
    std::cout << fmt::format(
      "{}:{}\t{}\t'{}'\n", pos.line, pos.column, rapter::syntax::to_string(token.kind),
      token.text);
  }

  if (!diags.empty()) {
    print_diagnostics(diags, sources, args.diagnostics_format);
  }
  return diags.has_errors() ? 1 : 0;
}

int cmd_dump_ast(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: rapc dump-ast <file.rapt>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  auto text = read_file(input_path);
  if (!text) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return 1;
  }

  rapter::SourceRegistry sources;
  rapter::AstContext ast;
  rapter::TypeContext types;
  rapter::DiagnosticBag diags;
  const rapter::ParseOutput parsed =
    rapter::parse_source(sources, input_path, std::move(*text), ast, types, diags);

  if (parsed.program) {
    std::cout << rapter::to_json(parsed.program).dump(2) << "\n";
  }

  if (!diags.empty()) {
    print_diagnostics(diags, sources, args.diagnostics_format);
  }
  return diags.has_errors() ? 1 : 0;
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

  if (args.command == "build") {
    return cmd_compile(args, rapter::CompileMode::Build);
  }

  if (args.command == "check") {
    return cmd_compile(args, rapter::CompileMode::Check);
  }

  if (args.command == "tokens") {
    return cmd_tokens(args);
  }

  if (args.command == "dump-ast") {
    return cmd_dump_ast(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
