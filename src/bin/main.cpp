#include <thriftgen/codegen.hpp>
#include <thriftgen/cpp_writer.hpp>
#include <thriftgen/expat_reader.hpp>
#include <thriftgen/schema_loader.hpp>
#include <thriftgen/test_data_interpreter.hpp>
#include <thriftgen/type_map.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_codegen = 4;

struct cli_options {
  std::string schema_file;
  std::string output_dir = ".";
  std::string test_data_dir;
  std::string type_map_file;
  bool show_help = false;
  bool show_version = false;
  bool list_outputs = false;
  bool verbose = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: thriftgen [options] <schema.xml>\n"
     << "       thriftgen sample --type <name> [options] <schema.xml>\n"
     << "\n"
     << "Options:\n"
     << "  -o <dir>          Main module output directory (default: current "
        "directory)\n"
     << "  -d <dir>          Test-data module output directory (default: -o)\n"
     << "  -t <file>         Type map override file\n"
     << "  --list-outputs    Print main module paths and exit\n"
     << "  -v, --verbose     Report every file written\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "thriftgen " << THRIFTGEN_VERSION << "\n";
}

static std::string
next_arg(int argc, char* argv[], int& i, const char* prefix) {
  if (i + 1 >= argc) {
    std::cerr << prefix << ": " << argv[i] << " requires an argument\n";
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

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
      continue;
    }

    if (arg == "-o") {
      opts.output_dir = next_arg(argc, argv, i, "thriftgen");
      continue;
    }

    if (arg == "-d") {
      opts.test_data_dir = next_arg(argc, argv, i, "thriftgen");
      continue;
    }

    if (arg == "-t") {
      opts.type_map_file = next_arg(argc, argv, i, "thriftgen");
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "thriftgen: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.schema_file.empty()) {
      std::cerr << "thriftgen: only one schema document may be given\n";
      std::exit(exit_usage);
    }
    opts.schema_file = arg;
  }

  if (opts.test_data_dir.empty()) opts.test_data_dir = opts.output_dir;
  return opts;
}

static std::string
read_file(const std::string& path, const char* prefix) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << prefix << ": cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Exits with exit_parse on malformed input.
static thriftgen::file_group
load_schema(const std::string& file, const char* prefix) {
  std::string xml = read_file(file, prefix);
  try {
    thriftgen::expat_reader reader(xml);
    thriftgen::schema_loader loader;
    return loader.load(reader);
  } catch (const std::exception& e) {
    std::cerr << prefix << ": error loading schema " << file << ": "
              << e.what() << "\n";
    std::exit(exit_parse);
  }
}

static bool
write_units(const std::vector<thriftgen::generated_unit>& units,
            const std::string& dir, bool verbose) {
  thriftgen::cpp_writer writer;
  for (const auto& unit : units) {
    const auto& file = unit.file();
    auto path = fs::path(dir) / file.filename;
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      std::cerr << "thriftgen: cannot create directory: "
                << path.parent_path().string() << ": " << ec.message() << "\n";
      return false;
    }
    std::ofstream out(path);
    if (!out) {
      std::cerr << "thriftgen: cannot write file: " << path.string() << "\n";
      return false;
    }
    out << writer.write(file);
    if (verbose) std::cerr << "thriftgen: wrote " << path.string() << "\n";
  }
  return true;
}

static int
run(const cli_options& opts) {
  auto group = load_schema(opts.schema_file, "thriftgen");

  // Load type map
  auto types = thriftgen::type_map::defaults();
  if (!opts.type_map_file.empty()) {
    std::string xml = read_file(opts.type_map_file, "thriftgen");
    try {
      thriftgen::expat_reader reader(xml);
      auto overrides = thriftgen::type_map::load(reader);
      types.merge(overrides);
    } catch (const std::exception& e) {
      std::cerr << "thriftgen: error loading type map " << opts.type_map_file
                << ": " << e.what() << "\n";
      return exit_parse;
    }
  }

  // Generate code
  thriftgen::codegen_result result;
  try {
    thriftgen::codegen gen(group, types);
    result = gen.generate();
  } catch (const std::exception& e) {
    std::cerr << "thriftgen: code generation error: " << e.what() << "\n";
    return exit_codegen;
  }

  if (auto collision = result.collision()) {
    std::cerr << "thriftgen: " << collision->message() << "\n";
    return exit_codegen;
  }

  // --list-outputs: print main module paths and exit
  if (opts.list_outputs) {
    for (const auto& unit : result.modules.units)
      std::cout << unit.file().filename << "\n";
    return exit_success;
  }

  if (!write_units(result.modules.units, opts.output_dir, opts.verbose) ||
      !write_units(result.test_data.units, opts.test_data_dir, opts.verbose))
    return exit_io;

  return exit_success;
}

// ---------------------------------------------------------------------------
// sample subcommand
// ---------------------------------------------------------------------------

struct sample_options {
  std::string type_name;
  std::string schema_file;
  std::size_t count = 1;
  thriftgen::generation_context context;
  bool raw = false;
  bool show_help = false;
};

static void
print_sample_usage(std::ostream& os) {
  os << "Usage: thriftgen sample --type <name> [options] <schema.xml>\n"
     << "\n"
     << "Options:\n"
     << "  --type <name>     Output name of a data entity (required)\n"
     << "  --count <N>       Number of instances (default: 1)\n"
     << "  --seed <N>        Random seed (default: 0)\n"
     << "  --max-depth <N>   Record nesting bound (default: 6)\n"
     << "  --max-size <N>    Container and string length bound (default: 4)\n"
     << "  --raw             Print instances without applying defaults\n"
     << "  -h, --help        Show this help message\n";
}

static std::uint64_t
parse_count(const std::string& text, const std::string& option) {
  std::uint64_t n = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
  if (ec == std::errc() && end == text.data() + text.size()) return n;
  std::cerr << "thriftgen sample: " << option
            << " expects a non-negative integer, got '" << text << "'\n";
  std::exit(exit_usage);
}

static sample_options
parse_sample_args(int argc, char* argv[]) {
  sample_options opts;
  const char* prefix = "thriftgen sample";

  // argv[0] is "thriftgen", argv[1] is "sample", start at 2
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--type") {
      opts.type_name = next_arg(argc, argv, i, prefix);
      continue;
    }

    if (arg == "--count") {
      opts.count = parse_count(next_arg(argc, argv, i, prefix), arg);
      continue;
    }

    if (arg == "--seed") {
      opts.context.seed = parse_count(next_arg(argc, argv, i, prefix), arg);
      continue;
    }

    if (arg == "--max-depth") {
      opts.context.max_depth =
          parse_count(next_arg(argc, argv, i, prefix), arg);
      continue;
    }

    if (arg == "--max-size") {
      opts.context.max_size =
          parse_count(next_arg(argc, argv, i, prefix), arg);
      continue;
    }

    if (arg == "--raw") {
      opts.raw = true;
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "thriftgen sample: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.schema_file = arg;
  }

  return opts;
}

static int
run_sample(const sample_options& opts) {
  auto group = load_schema(opts.schema_file, "thriftgen sample");

  try {
    thriftgen::test_data_interpreter interpreter(group);
    if (!interpreter.contains(opts.type_name)) {
      std::cerr << "thriftgen sample: no data entity named '"
                << opts.type_name << "'\n";
      return exit_codegen;
    }

    auto gen = interpreter.get_generator(opts.type_name, opts.context);
    thriftgen::draw_state state(opts.context);
    for (std::size_t i = 0; i < opts.count; ++i) {
      auto v = gen(state);
      if (!opts.raw)
        v = interpreter.apply_defaults(opts.type_name, std::move(v),
                                       opts.context);
      std::cout << thriftgen::to_string(v) << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "thriftgen sample: generation error: " << e.what() << "\n";
    return exit_codegen;
  }

  return exit_success;
}

int
main(int argc, char* argv[]) {
  if (argc >= 2 && std::string(argv[1]) == "sample") {
    auto opts = parse_sample_args(argc, argv);

    if (opts.show_help) {
      print_sample_usage(std::cerr);
      return exit_success;
    }

    if (opts.type_name.empty()) {
      std::cerr << "thriftgen sample: --type is required\n";
      print_sample_usage(std::cerr);
      return exit_usage;
    }

    if (opts.schema_file.empty()) {
      std::cerr << "thriftgen sample: no input file\n";
      print_sample_usage(std::cerr);
      return exit_usage;
    }

    return run_sample(opts);
  }

  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.schema_file.empty()) {
    std::cerr << "thriftgen: no input file\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
