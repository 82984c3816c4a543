#include <argparse/argparse.hpp>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"

namespace fs = std::filesystem;

auto main(int argc, char* argv[]) -> int {
  // Results go to stdout; logging goes to stderr.
  spdlog::set_default_logger(spdlog::stderr_color_mt("hailstone"));
  spdlog::set_pattern("[%n][%l] %v");

  argparse::ArgumentParser program("hailstone", "0.1.0");
  program.add_description(
      "Collatz-type orbit simulator with first-drop classification");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Simulate and classify a batch of start values");
  hailstone::driver::AddRuleFlags(run_cmd);
  run_cmd.add_argument("--total")
      .scan<'u', uint64_t>()
      .help("Exclusive upper bound of start values (uses hailstone.toml)");
  run_cmd.add_argument("--db").help("SQLite file to store the records in");
  run_cmd.add_argument("--csv").help("Write stop coordinates as CSV");

  // Subcommand: orbit
  argparse::ArgumentParser orbit_cmd("orbit");
  orbit_cmd.add_description("Simulate one start value and print its record");
  hailstone::driver::AddRuleFlags(orbit_cmd);
  orbit_cmd.add_argument("start").scan<'u', uint64_t>().help("Start value");

  // Subcommand: compare
  argparse::ArgumentParser compare_cmd("compare");
  compare_cmd.add_description("Compare the orbits of several start values");
  hailstone::driver::AddRuleFlags(compare_cmd);
  compare_cmd.add_argument("starts")
      .nargs(argparse::nargs_pattern::at_least_one)
      .scan<'u', uint64_t>()
      .help("Start values");

  // Subcommand: sequences
  argparse::ArgumentParser sequences_cmd("sequences");
  sequences_cmd.add_description(
      "Print allowable dropping times and admissible terms");
  sequences_cmd.add_argument("--terms")
      .default_value(std::size_t{20})
      .scan<'u', std::size_t>()
      .help("Number of terms");

  // Subcommand: rules
  argparse::ArgumentParser rules_cmd("rules");
  rules_cmd.add_description("List built-in rules");

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create a starter hailstone.toml");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing hailstone.toml");

  program.add_subparser(run_cmd);
  program.add_subparser(orbit_cmd);
  program.add_subparser(compare_cmd);
  program.add_subparser(sequences_cmd);
  program.add_subparser(rules_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    hailstone::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (program.get<bool>("--verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      hailstone::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("run")) {
    return hailstone::driver::RunCommand(run_cmd);
  }
  if (program.is_subcommand_used("orbit")) {
    return hailstone::driver::OrbitCommand(orbit_cmd);
  }
  if (program.is_subcommand_used("compare")) {
    return hailstone::driver::CompareCommand(compare_cmd);
  }
  if (program.is_subcommand_used("sequences")) {
    return hailstone::driver::SequencesCommand(sequences_cmd);
  }
  if (program.is_subcommand_used("rules")) {
    return hailstone::driver::RulesCommand(rules_cmd);
  }
  if (program.is_subcommand_used("init")) {
    return hailstone::driver::InitCommand(init_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
