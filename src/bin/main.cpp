#include <oag/codegen.hpp>
#include <oag/config.hpp>
#include <oag/cpp_writer.hpp>
#include <oag/declaration_synthesizer.hpp>
#include <oag/document_loader.hpp>
#include <oag/naming.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_codegen = 4;

struct cli_options {
  std::string document_file;
  std::string output_dir = ".";
  std::string config_file;
  std::optional<std::string> cpp_namespace;
  std::optional<std::string> file_stem;
  std::optional<oag::naming_style> naming;
  bool file_per_type = false;
  bool mutable_arrays = false;
  bool mutable_maps = false;
  bool no_default_non_nullable = false;
  bool no_default_values = false;
  bool no_doc_comments = false;
  bool no_header = false;
  bool list_outputs = false;
  bool strict = false;
  bool quiet = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: oag [options] <openapi.yaml|openapi.json>\n"
     << "\n"
     << "Options:\n"
     << "  -o <dir>                  Output directory (default: current "
        "directory)\n"
     << "  -n <namespace>            C++ namespace (default: api)\n"
     << "  -c <config.json>          Configuration file\n"
     << "  --stem <name>             Base name of the generated header "
        "(default: schemas)\n"
     << "  --file-per-type           Generate one header per declaration\n"
     << "  --naming <style>          pascal, camel or snake (default: "
        "pascal)\n"
     << "  --mutable-arrays          Generate mutable collections\n"
     << "  --mutable-maps            Generate mutable maps\n"
     << "  --no-default-non-nullable Keep optional members with defaults "
        "nullable\n"
     << "  --no-default-values       Value-initialize members instead of "
        "using schema defaults\n"
     << "  --no-doc-comments         Omit descriptions from the output\n"
     << "  --no-header               Omit the generated-file comment\n"
     << "  --list-outputs            Print expected output filenames and "
        "exit\n"
     << "  --strict                  Exit with an error when any warning "
        "was reported\n"
     << "  --quiet                   Do not print warnings\n"
     << "  -h, --help                Show this help message\n"
     << "  --version                 Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "oag " << OAG_VERSION << "\n";
}

static std::string
option_value(int argc, char* argv[], int& i, const std::string& arg) {
  if (i + 1 >= argc) {
    std::cerr << "oag: " << arg << " requires an argument\n";
    std::exit(exit_usage);
  }
  return argv[++i];
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-o") {
      opts.output_dir = option_value(argc, argv, i, arg);
    } else if (arg == "-n") {
      opts.cpp_namespace = option_value(argc, argv, i, arg);
    } else if (arg == "-c") {
      opts.config_file = option_value(argc, argv, i, arg);
    } else if (arg == "--stem") {
      opts.file_stem = option_value(argc, argv, i, arg);
      if (opts.file_stem->empty()) {
        std::cerr << "oag: --stem must not be empty\n";
        std::exit(exit_usage);
      }
    } else if (arg == "--naming") {
      auto style = option_value(argc, argv, i, arg);
      try {
        opts.naming = oag::parse_naming_style(style);
      } catch (const std::invalid_argument& e) {
        std::cerr << "oag: " << e.what() << "\n";
        std::exit(exit_usage);
      }
    } else if (arg == "--file-per-type") {
      opts.file_per_type = true;
    } else if (arg == "--mutable-arrays") {
      opts.mutable_arrays = true;
    } else if (arg == "--mutable-maps") {
      opts.mutable_maps = true;
    } else if (arg == "--no-default-non-nullable") {
      opts.no_default_non_nullable = true;
    } else if (arg == "--no-default-values") {
      opts.no_default_values = true;
    } else if (arg == "--no-doc-comments") {
      opts.no_doc_comments = true;
    } else if (arg == "--no-header") {
      opts.no_header = true;
    } else if (arg == "--list-outputs") {
      opts.list_outputs = true;
    } else if (arg == "--strict") {
      opts.strict = true;
    } else if (arg == "--quiet") {
      opts.quiet = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "oag: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    } else if (!opts.document_file.empty()) {
      std::cerr << "oag: only one input document is accepted\n";
      std::exit(exit_usage);
    } else {
      opts.document_file = arg;
    }
  }

  return opts;
}

// Command-line flags override the configuration file.
static void
apply_overrides(const cli_options& opts, oag::configuration& config) {
  auto& gen = config.generator;
  auto& emit = config.emission;
  if (opts.naming) gen.naming = *opts.naming;
  if (opts.mutable_arrays) gen.mutable_collections = true;
  if (opts.mutable_maps) gen.mutable_maps = true;
  if (opts.no_default_non_nullable) gen.default_non_nullable = false;
  if (opts.no_default_values) gen.propagate_defaults = false;
  if (opts.cpp_namespace) emit.cpp_namespace = *opts.cpp_namespace;
  if (opts.file_stem) emit.file_stem = *opts.file_stem;
  if (opts.file_per_type) emit.mode = oag::output_mode::file_per_type;
  if (opts.no_doc_comments) emit.doc_comments = false;
  if (opts.no_header) emit.file_header = false;
}

static int
run(const cli_options& opts) {
  oag::configuration config;
  if (!opts.config_file.empty()) {
    try {
      config = oag::load_options_file(opts.config_file);
    } catch (const std::invalid_argument& e) {
      std::cerr << "oag: error loading config " << opts.config_file << ": "
                << e.what() << "\n";
      return exit_parse;
    } catch (const std::runtime_error& e) {
      std::cerr << "oag: " << e.what() << "\n";
      return exit_io;
    }
  }
  apply_overrides(opts, config);

  // Load the document
  oag::schema_set schemas;
  try {
    schemas = oag::load_document_file(opts.document_file);
  } catch (const oag::document_error& e) {
    std::cerr << "oag: error parsing document " << opts.document_file << ": "
              << e.what() << "\n";
    return exit_parse;
  } catch (const std::runtime_error& e) {
    std::cerr << "oag: " << e.what() << "\n";
    return exit_io;
  }

  // Synthesize declarations and lower them to C++
  oag::synthesis_result result;
  std::vector<oag::cpp_file> files;
  try {
    oag::declaration_synthesizer synthesizer(schemas, config.generator);
    result = synthesizer.synthesize();
    oag::codegen gen(result, config.types, config.emission);
    files = gen.generate();
  } catch (const std::exception& e) {
    std::cerr << "oag: code generation error: " << e.what() << "\n";
    return exit_codegen;
  }

  if (!opts.quiet) {
    for (const auto& d : result.diagnostics)
      std::cerr << "oag: warning: " << oag::format_diagnostic(d) << "\n";
  }

  // --list-outputs: print filenames and exit
  if (opts.list_outputs) {
    for (const auto& file : files)
      std::cout << file.filename << "\n";
    return exit_success;
  }

  std::error_code ec;
  fs::create_directories(opts.output_dir, ec);
  if (ec) {
    std::cerr << "oag: cannot create directory: " << opts.output_dir << ": "
              << ec.message() << "\n";
    return exit_io;
  }

  oag::cpp_writer writer;
  for (const auto& file : files) {
    auto path = fs::path(opts.output_dir) / file.filename;
    std::ofstream out(path);
    if (!out) {
      std::cerr << "oag: cannot write file: " << path.string() << "\n";
      return exit_io;
    }
    out << writer.write(file);
  }

  if (opts.strict && !result.diagnostics.empty()) {
    std::cerr << "oag: " << result.diagnostics.size()
              << " warning(s) reported with --strict\n";
    return exit_codegen;
  }

  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.document_file.empty()) {
    std::cerr << "oag: no input document\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
