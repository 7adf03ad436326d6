#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "rxmap/app/Runner.hpp"
#include "rxmap/config/IniConfig.hpp"

namespace fs = std::filesystem;

namespace {

struct Cli {
  fs::path config;
  bool validate_config = false;
  bool debug = false;
};

void print_usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0 << " --config <path> [--validate-config] [--debug]\n"
      << "       " << argv0 << " --version\n"
      << "\n"
      << "Builds LAMMPS fix bond/react pre/post templates and the map file for one\n"
      << "reaction from a pre-reaction and a post-reaction structure.\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli cli;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--version") {
      std::cout << RXMAP_VERSION_STR << "\n";
      std::exit(0);
    } else if (a == "--config") {
      if (i + 1 >= argc) throw std::runtime_error("--config requires a value");
      cli.config = fs::path(argv[++i]);
    } else if (a == "--validate-config") {
      cli.validate_config = true;
    } else if (a == "--debug") {
      cli.debug = true;
    } else {
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  if (cli.config.empty()) {
    throw std::runtime_error("--config is required (see --help)");
  }
  return cli;
}

} // namespace

int main(int argc, char** argv) {
  try {
    Cli cli = parse_cli(argc, argv);

    rxmap::IniConfig cfg(cli.config);
    rxmap::Runner runner(cfg, cli.debug);
    if (cli.validate_config) {
      return runner.validate_config();
    }
    return runner.run();

  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
