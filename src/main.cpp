#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#if defined(MFNAM_HAS_OPENMP) && MFNAM_HAS_OPENMP
#include <omp.h>
#endif

#include "mfnam/app/Loader.hpp"
#include "mfnam/config/IniConfig.hpp"
#include "mfnam/config/LoadOptions.hpp"
#include "mfnam/output/LoadReport.hpp"
#include "mfnam/packages/PackageRegistry.hpp"
#include "mfnam/util/Parse.hpp"

#ifndef MFNAM_VERSION_STR
#define MFNAM_VERSION_STR "0.0.0"
#endif

namespace fs = std::filesystem;

namespace {

struct Cli {
  fs::path config;
  mfnam::LoadOptions opts;
  bool have_namefile = false;
  bool list_packages = false;
};

void print_usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0 << " --config <path>\n"
      << "       " << argv0 << " --namefile <path> [--ws DIR] [--model-version mf2005] [--exe-name NAME]\n"
      << "              [--load-only A,B,...] [--verbose] [--write-to DIR] [--threads N] [--report FILE]\n"
      << "       " << argv0 << " --list-packages\n"
      << "       " << argv0 << " --version\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli cli;
  auto& req = cli.opts.request;
  auto value = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) throw std::runtime_error(flag + " requires a value");
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--version") {
      std::cout << MFNAM_VERSION_STR << "\n";
      std::exit(0);
    } else if (a == "--config") {
      cli.config = fs::path(value(i, a));
    } else if (a == "--namefile") {
      req.name_file = value(i, a);
      cli.have_namefile = true;
    } else if (a == "--ws") {
      req.model_ws = value(i, a);
    } else if (a == "--model-version") {
      req.version = value(i, a);
    } else if (a == "--exe-name") {
      req.exe_name = value(i, a);
    } else if (a == "--load-only") {
      req.load_only = mfnam::split_list(value(i, a));
    } else if (a == "--verbose" || a == "-v") {
      req.verbose = true;
    } else if (a == "--write-to") {
      cli.opts.output_ws = fs::path(value(i, a));
    } else if (a == "--threads") {
      cli.opts.threads = std::stoi(value(i, a));
      if (cli.opts.threads < 1) throw std::runtime_error("--threads must be >= 1");
    } else if (a == "--report") {
      cli.opts.report = fs::path(value(i, a));
    } else if (a == "--list-packages") {
      cli.list_packages = true;
    } else {
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  if (!cli.list_packages && cli.config.empty() && !cli.have_namefile) {
    throw std::runtime_error("--config or --namefile is required (or use --list-packages)");
  }
  if (!cli.config.empty() && cli.have_namefile) {
    throw std::runtime_error("--config and --namefile are mutually exclusive");
  }
  return cli;
}

} // namespace

int main(int argc, char** argv) {
  try {
    Cli cli = parse_cli(argc, argv);

    if (cli.list_packages) {
      for (const auto& t : mfnam::PackageRegistry::builtin().registered_types()) {
        std::cout << t << "\n";
      }
      return 0;
    }

    mfnam::LoadOptions opts = cli.config.empty() ? std::move(cli.opts)
                                                 : mfnam::LoadOptions::from_ini(mfnam::IniConfig(cli.config));

#if defined(MFNAM_HAS_OPENMP) && MFNAM_HAS_OPENMP
    if (opts.threads > 1) omp_set_num_threads(opts.threads);
#endif

    mfnam::LoadResult res = mfnam::load_model(opts.request);
    std::cout << res.model.name() << ": " << res.model.describe() << "\n";
    std::cout << "  loaded:     " << res.loaded.size() << " file(s)\n";
    std::cout << "  not loaded: " << res.not_loaded.size() << " file(s)\n";
    for (const auto& f : res.not_loaded) std::cout << "    " << f.filename().string() << "\n";

    // Report describes the model as loaded, before any workspace change.
    if (opts.report) {
      mfnam::output::write_load_report_json(*opts.report, res);
    }
    if (opts.output_ws) {
      res.model.set_write_threads(opts.threads);
      res.model.change_model_ws(*opts.output_ws);
      res.model.write_input();
      std::cout << "  written to: " << res.model.model_ws().string() << "\n";
    }
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
