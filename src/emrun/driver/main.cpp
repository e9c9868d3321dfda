#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <system_error>

#include "commands.hpp"
#include "emrun/config/runner_config.hpp"
#include "logging.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace {

namespace fs = std::filesystem;

// Defaults when no emrun.toml is found, the file's values otherwise.
auto LoadRunnerConfig() -> emrun::Result<emrun::config::RunnerConfig> {
  auto config_path = emrun::config::FindConfig();
  if (!config_path) {
    return emrun::config::RunnerConfig{};
  }
  return emrun::config::LoadConfig(*config_path);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("emrun", "0.1.0");
  program.add_description(
      "Capture, decode and merge requirement coverage from embedded test runs");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log phases and debug output");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Capture one test run and write its coverage");
  run_cmd.add_argument("--symbols")
      .required()
      .help("Symbol table (JSON) of the firmware under test");
  run_cmd.add_argument("--capture").help(
      "Raw capture file (reads from the RTT port when omitted)");
  run_cmd.add_argument("--port").scan<'i', int>().help(
      "RTT server port (default from emrun.toml, else 19021)");
  run_cmd.add_argument("--run-id").help("Run identifier");
  run_cmd.add_argument("--external").help("External coverage artifact");
  run_cmd.add_argument("--external-format")
      .help("Format of the external artifact: json or lcov");
  run_cmd.add_argument("--output").help(
      "Document path (default <output_dir>/<run-id>.json)");
  run_cmd.add_argument("--timeout").scan<'i', int>().help(
      "Stop capturing after this many seconds");

  // Subcommand: matrix
  argparse::ArgumentParser matrix_cmd("matrix");
  matrix_cmd.add_description("Decode several capture files in parallel");
  matrix_cmd.add_argument("--symbols")
      .required()
      .help("Symbol table (JSON) shared by all captures");
  matrix_cmd.add_argument("captures").remaining().help("Raw capture files");

  // Subcommand: collect
  argparse::ArgumentParser collect_cmd("collect");
  collect_cmd.add_description(
      "Merge coverage documents (default: those listed in the manifest)");
  collect_cmd.add_argument("--output")
      .default_value(std::string("coverage.json"))
      .help("Aggregate document path");
  collect_cmd.add_argument("documents").remaining().help(
      "Coverage documents to merge");

  program.add_subparser(run_cmd);
  program.add_subparser(matrix_cmd);
  program.add_subparser(collect_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    emrun::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before looking for emrun.toml
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      emrun::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  auto config = LoadRunnerConfig();
  if (!config) {
    emrun::driver::PrintDiagnostic(config.error());
    return 1;
  }

  bool verbose = program.get<bool>("--verbose");
  emrun::driver::InitializeLogging(verbose ? "debug" : config->log_level);
  emrun::driver::VerboseLogger logger(verbose);

  int exit_code = 0;
  try {
    if (program.is_subcommand_used("run")) {
      exit_code = emrun::driver::RunCommand(run_cmd, *config, logger);
    } else if (program.is_subcommand_used("matrix")) {
      exit_code = emrun::driver::MatrixCommand(matrix_cmd, *config, logger);
    } else if (program.is_subcommand_used("collect")) {
      exit_code = emrun::driver::CollectCommand(collect_cmd, *config, logger);
    } else {
      // No subcommand provided
      std::cout << program;
    }
  } catch (const std::exception& e) {
    emrun::driver::PrintError(e.what());
    exit_code = 1;
  }

  if (logger.Verbose()) {
    logger.PrintPhaseSummary();
  }
  emrun::driver::ShutdownLogging();
  return exit_code;
}
