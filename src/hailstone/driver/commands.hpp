#pragma once

#include <argparse/argparse.hpp>

namespace hailstone::driver {

// Adds --rule, -p, --seed and --max-iterations.
void AddRuleFlags(argparse::ArgumentParser& cmd);

auto RunCommand(const argparse::ArgumentParser& cmd) -> int;
auto OrbitCommand(const argparse::ArgumentParser& cmd) -> int;
auto CompareCommand(const argparse::ArgumentParser& cmd) -> int;
auto SequencesCommand(const argparse::ArgumentParser& cmd) -> int;
auto RulesCommand(const argparse::ArgumentParser& cmd) -> int;
auto InitCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace hailstone::driver
