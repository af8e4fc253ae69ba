// awkcheck - AWK static checker command line interface
//
// Usage:
//   awkcheck [options] file.awk...
//
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include "awkls/basic/diagnostic_printer.hpp"
#include "awkls/basic/log.hpp"
#include "awkls/basic/uri.hpp"
#include "awkls/config/settings.hpp"
#include "awkls/lsp/local_file_system.hpp"
#include "awkls/sema/workspace.hpp"
#include "awkls/syntax/lexer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "awkcheck - AWK static checker\n\n"
            << "Usage: " << program_name << " [options] file.awk...\n\n"
            << "Options:\n"
            << "  --mode <gawk|awk>        Language mode (default: gawk)\n"
            << "  --config <awkls.yaml>    Settings file (default: searched upward)\n"
            << "  -I <dir>                 Add an include search directory (repeatable)\n"
            << "  --max <n>                Maximum diagnostics per file\n"
            << "  --no-color               Disable colored output\n"
            << "  --tokens                 Print the token stream instead of checking\n"
            << "  -v, --verbose            Log analysis progress to stderr\n"
            << "  -h, --help               Show this help message\n";
}

/// Keeps the latest diagnostics published for each document
class CollectingSink : public awkls::DiagnosticSink
{
public:
  void publish(const std::string & uri, const std::vector<awkls::Diagnostic> & diagnostics) override
  {
    latest_[uri] = diagnostics;
  }

  [[nodiscard]] const std::map<std::string, std::vector<awkls::Diagnostic>> & latest() const
  {
    return latest_;
  }

private:
  std::map<std::string, std::vector<awkls::Diagnostic>> latest_;
};

std::optional<std::string> read_file_to_string(const std::string & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

std::string display_name(const std::string & path)
{
  std::error_code ec;
  auto rel = fs::relative(path, fs::current_path(), ec);
  return ec || rel.empty() ? path : rel.string();
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::vector<std::string> files;
  std::vector<std::string> include_dirs;
  std::optional<std::string> mode;
  std::optional<std::string> config_path;
  std::optional<uint32_t> max_problems;
  bool no_color = false;
  bool dump_tokens = false;
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

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 < argc) {
        return std::string(argv[++i]);
      }
      args.error = "missing value for " + arg;
      return std::nullopt;
    };

    if (arg == "--mode") {
      args.mode = value();
    } else if (arg == "--config") {
      args.config_path = value();
    } else if (arg == "-I") {
      if (auto dir = value()) {
        args.include_dirs.push_back(*dir);
      }
    } else if (arg.size() > 2 && arg.compare(0, 2, "-I") == 0) {
      args.include_dirs.push_back(arg.substr(2));
    } else if (arg == "--max") {
      if (auto n = value()) {
        args.max_problems = static_cast<uint32_t>(std::strtoul(n->c_str(), nullptr, 10));
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "--tokens") {
      args.dump_tokens = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option: " + arg;
    } else {
      args.files.push_back(arg);
    }
  }

  if (args.error.empty() && args.files.empty() && !args.show_help) {
    args.error = "no input files";
  }
  return args;
}

// ============================================================================
// Commands
// ============================================================================

std::optional<awkls::Settings> load_settings(const CommandArgs & args)
{
  awkls::Settings settings = awkls::default_settings();

  std::optional<fs::path> config = args.config_path;
  if (!config) {
    config = awkls::find_settings_file(fs::current_path());
  }
  if (config) {
    const auto result = awkls::load_settings_file(*config);
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
      return std::nullopt;
    }
    settings = result.settings;
  }

  if (args.mode) {
    if (*args.mode != "gawk" && *args.mode != "awk") {
      std::cerr << "error: invalid mode '" << *args.mode << "' (must be 'gawk' or 'awk')\n";
      return std::nullopt;
    }
    settings.gawk = *args.mode == "gawk";
  }
  if (!args.include_dirs.empty()) {
    settings.include_path.insert(
      settings.include_path.begin(), args.include_dirs.begin(), args.include_dirs.end());
  }
  if (args.max_problems && *args.max_problems > 0) {
    settings.max_number_of_problems = *args.max_problems;
  }
  return settings;
}

int cmd_tokens(const CommandArgs & args)
{
  const auto settings = load_settings(args);
  if (!settings) {
    return 1;
  }

  int status = 0;
  for (const auto & file : args.files) {
    const auto text = read_file_to_string(file);
    if (!text) {
      std::cerr << "error: cannot read " << file << "\n";
      status = 1;
      continue;
    }
    awkls::syntax::Lexer lexer(*text, settings->gawk);
    for (const auto & tok : lexer.lex_all()) {
      fmt::print(
        std::cout, "{}:{}:{}: {} '{}'\n", file, tok.position.line + 1, tok.position.character + 1,
        awkls::syntax::to_string(tok.kind),
        tok.kind == awkls::syntax::TokenKind::Newline ? "\\n" : std::string(tok.text));
    }
  }
  return status;
}

int cmd_check(const CommandArgs & args)
{
  auto settings = load_settings(args);
  if (!settings) {
    return 1;
  }

  auto logger = awkls::init_logging(
    args.verbose ? spdlog::level::debug : spdlog::level::warn);

  awkls::lsp::LocalFileSystem file_system;
  CollectingSink sink;
  awkls::Workspace workspace(file_system, sink, *settings, logger);

  std::map<std::string, std::string> texts;
  for (const auto & file : args.files) {
    const std::string path = fs::absolute(file).lexically_normal().string();
    auto text = read_file_to_string(path);
    if (!text) {
      std::cerr << "error: cannot read " << file << "\n";
      return 1;
    }
    const std::string uri = awkls::path_to_file_uri(path);
    texts[uri] = *text;
    workspace.change_document(uri, std::move(*text));
    while (file_system.has_pending()) {
      file_system.poll();
    }
  }

  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  awkls::DiagnosticPrinter printer(std::cerr, use_color);

  size_t errors = 0;
  size_t warnings = 0;
  for (const auto & [uri, diags] : sink.latest()) {
    if (diags.empty() || workspace.find_document(uri) == nullptr) {
      continue;
    }
    const auto path = awkls::file_uri_to_path(uri).value_or(uri);
    auto it = texts.find(uri);
    std::optional<std::string> text =
      it != texts.end() ? std::optional<std::string>(it->second) : read_file_to_string(path);
    const awkls::SourceManager source(text.value_or(std::string()));
    printer.print_all(diags, display_name(path), source);

    for (const auto & d : diags) {
      if (d.severity == awkls::Severity::Error) {
        ++errors;
      } else if (d.severity == awkls::Severity::Warning) {
        ++warnings;
      }
    }
  }

  if (errors > 0 || warnings > 0) {
    fmt::print(std::cerr, "{} error(s), {} warning(s)\n", errors, warnings);
  }
  return errors > 0 ? 1 : 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  try {
    const CommandArgs args = parse_args(argc, argv);

    if (args.show_help) {
      print_usage(argv[0]);
      return 0;
    }
    if (!args.error.empty()) {
      std::cerr << "error: " << args.error << "\n\n";
      print_usage(argv[0]);
      return 1;
    }

    if (args.dump_tokens) {
      return cmd_tokens(args);
    }
    return cmd_check(args);
  } catch (const std::exception & e) {
    std::cerr << "fatal error: " << e.what() << "\n";
    return 1;
  }
}
