#include "commands.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <fmt/ranges.h>

#include "hailstone/classify/classification_state.hpp"
#include "hailstone/common/diagnostic.hpp"
#include "hailstone/common/list_compare.hpp"
#include "hailstone/config/project_config.hpp"
#include "hailstone/orbit/batch.hpp"
#include "hailstone/orbit/orbit_record.hpp"
#include "hailstone/orbit/simulator.hpp"
#include "hailstone/plot/point_builder.hpp"
#include "hailstone/rule/builtin_rules.hpp"
#include "hailstone/sequence/admissible.hpp"
#include "hailstone/sequence/dropping_time.hpp"
#include "hailstone/store/record_store.hpp"
#include "print.hpp"

namespace hailstone::driver {

namespace fs = std::filesystem;

namespace {

// Rule and batch settings after merging hailstone.toml with CLI flags.
// CLI values override the config file.
struct Settings {
  std::string rule_name = std::string(rule::kClassicRuleName);
  rule::RuleOptions options;
  std::optional<uint64_t> total;
  std::optional<fs::path> store_path;
};

auto LoadOptionalConfig() -> Result<std::optional<config::ProjectConfig>> {
  auto config_path = config::FindConfig();
  if (!config_path) {
    return std::nullopt;
  }
  auto config = config::LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::move(*config);
}

auto ResolveSettings(const argparse::ArgumentParser& cmd) -> Result<Settings> {
  auto config = LoadOptionalConfig();
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }

  Settings settings;
  if (*config) {
    const auto& project = **config;
    settings.rule_name = project.rule;
    settings.total = project.total;
    settings.options.probability =
        project.probability.value_or(rule::kDefaultProbability);
    settings.options.seed = project.seed;
    settings.options.max_iterations = project.max_iterations;
    settings.store_path = project.store_path;
  }

  if (auto name = cmd.present<std::string>("--rule")) {
    settings.rule_name = *name;
  }
  if (auto p = cmd.present<double>("-p")) {
    settings.options.probability = *p;
  }
  if (auto seed = cmd.present<uint64_t>("--seed")) {
    settings.options.seed = *seed;
  }
  if (auto cap = cmd.present<std::size_t>("--max-iterations")) {
    settings.options.max_iterations = *cap;
  }
  return settings;
}

auto FormatOptional(const auto& value) -> std::string {
  if (!value) {
    return "-";
  }
  return fmt::format("{}", *value);
}

auto FormatCounts(const orbit::OpCounts& counts) -> std::string {
  std::vector<std::string> pairs;
  for (const auto& [op_id, count] : counts) {
    pairs.push_back(fmt::format("{}={}", op_id, count));
  }
  return fmt::format("{}", fmt::join(pairs, ", "));
}

void PrintRecord(const orbit::OrbitRecord& record) {
  fmt::print("start:        {}\n", record.start);
  fmt::print("first drop:   {}\n", FormatOptional(record.first_drop_length));
  fmt::print("stop mod:     {}\n", FormatOptional(record.stop_mod));
  fmt::print("stop index:   {}\n", FormatOptional(record.stop_index));
  fmt::print("first orbit:  [{}]\n", fmt::join(record.first_orbit, ", "));
  fmt::print(
      "total orbit:  [{}] ({} values)\n", fmt::join(record.total_orbit, ", "),
      record.total_orbit.size());
  fmt::print("first ops:    {}\n", FormatCounts(record.first_op_counts));
  fmt::print("total ops:    {}\n", FormatCounts(record.total_op_counts));
}

auto WriteStopCsv(
    const std::vector<orbit::OrbitRecord>& records, const fs::path& path)
    -> Result<void> {
  auto classified = plot::ClassifiedOnly(records);
  std::vector<std::string> labels;
  labels.reserve(classified.size());
  for (const auto& record : classified) {
    labels.push_back(fmt::format("n={}", record.start));
  }

  auto scatter = plot::BuildScatter(classified, plot::StopCoordinates, labels);
  if (!scatter) {
    return std::unexpected(std::move(scatter.error()));
  }
  return plot::WriteScatterCsv(*scatter, path);
}

}  // namespace

void AddRuleFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--rule").help(
      "Rule name: m3a1 (default), m3a3, m3a5 or probabilistic");
  cmd.add_argument("-p", "--probability")
      .scan<'g', double>()
      .help("Probability of 3v+1 for the probabilistic rule (default 0.5)");
  cmd.add_argument("--seed")
      .scan<'u', uint64_t>()
      .help("Seed for the probabilistic rule");
  cmd.add_argument("--max-iterations")
      .scan<'u', std::size_t>()
      .help("Cap on orbit length, counting the start value");
}

auto RunCommand(const argparse::ArgumentParser& cmd) -> int {
  auto settings = ResolveSettings(cmd);
  if (!settings) {
    PrintDiagnostic(settings.error());
    return 1;
  }
  if (auto total = cmd.present<uint64_t>("--total")) {
    settings->total = *total;
  }
  if (auto db = cmd.present<std::string>("--db")) {
    settings->store_path = fs::path(*db);
  }
  if (!settings->total) {
    PrintError("no total given (use --total or hailstone.toml)");
    return 1;
  }

  auto rule = rule::MakeRule(settings->rule_name, settings->options);
  if (!rule) {
    PrintDiagnostic(rule.error());
    return 1;
  }

  auto state = classify::ClassificationState::Build((*rule)->Name());
  auto batch = orbit::RunBatch(*settings->total, **rule, state);

  std::size_t classified = 0;
  for (const auto& record : batch.records) {
    if (record.IsClassified()) {
      ++classified;
    }
  }
  fmt::print(
      "rule {}: {} records for starts [{}, {}), {} classified\n",
      (*rule)->Name(), batch.records.size(), (*rule)->MinStart(),
      *settings->total, classified);
  if (batch.error) {
    PrintWarning(
        fmt::format("batch stopped early: {}", batch.error->primary.message));
  }

  if (settings->store_path) {
    auto store = store::RecordStore::Open(*settings->store_path);
    if (!store) {
      PrintDiagnostic(store.error());
      return 1;
    }
    if (auto stored = store->PutAll(batch.records); !stored) {
      PrintDiagnostic(stored.error());
      return 1;
    }
    fmt::print(
        "stored {} records in {}\n", batch.records.size(),
        settings->store_path->string());
  }

  if (auto csv = cmd.present<std::string>("--csv")) {
    if (auto written = WriteStopCsv(batch.records, *csv); !written) {
      PrintDiagnostic(written.error());
      return 1;
    }
    fmt::print("wrote stop coordinates to {}\n", *csv);
  }
  return 0;
}

auto OrbitCommand(const argparse::ArgumentParser& cmd) -> int {
  auto settings = ResolveSettings(cmd);
  if (!settings) {
    PrintDiagnostic(settings.error());
    return 1;
  }

  auto rule = rule::MakeRule(settings->rule_name, settings->options);
  if (!rule) {
    PrintDiagnostic(rule.error());
    return 1;
  }

  auto start = cmd.get<uint64_t>("start");
  auto state = classify::ClassificationState::Build((*rule)->Name());
  auto record = orbit::SimulateOrbit(start, **rule, &state);
  if (!record) {
    PrintDiagnostic(record.error());
    return 1;
  }
  PrintRecord(*record);
  return 0;
}

auto CompareCommand(const argparse::ArgumentParser& cmd) -> int {
  auto settings = ResolveSettings(cmd);
  if (!settings) {
    PrintDiagnostic(settings.error());
    return 1;
  }

  auto rule = rule::MakeRule(settings->rule_name, settings->options);
  if (!rule) {
    PrintDiagnostic(rule.error());
    return 1;
  }

  auto starts = cmd.get<std::vector<uint64_t>>("starts");
  std::vector<std::vector<Value>> first_orbits;
  std::vector<std::vector<Value>> total_orbits;
  for (uint64_t start : starts) {
    auto record = orbit::SimulateOrbit(start, **rule);
    if (!record) {
      PrintDiagnostic(record.error());
      return 1;
    }
    first_orbits.push_back(std::move(record->first_orbit));
    total_orbits.push_back(std::move(record->total_orbit));
  }

  fmt::print(
      "common values in total orbits: {}\n",
      common::CountCommonElements(total_orbits));
  fmt::print(
      "common values in first orbits: {}\n",
      common::CountCommonElements(first_orbits));

  auto matching = common::CountMatchingIndexes(total_orbits);
  if (matching) {
    fmt::print("matching positions in total orbits: {}\n", *matching);
  } else {
    fmt::print("matching positions in total orbits: -\n");
    PrintWarning(matching.error().primary.message);
  }
  return 0;
}

auto SequencesCommand(const argparse::ArgumentParser& cmd) -> int {
  auto terms = cmd.get<std::size_t>("--terms");

  std::vector<BigInt> admissible;
  try {
    admissible =
        sequence::GenerateAdmissibleTerms(terms, rule::kClassicRuleName);
  } catch (const std::exception& e) {
    PrintError(e.what());
    return 1;
  }
  auto dropping_times =
      sequence::GenerateDroppingTimes(terms, rule::kClassicRuleName);

  fmt::print("{:>5} {:>13} {}\n", "k", "dropping time", "admissible");
  for (std::size_t i = 0; i < terms; ++i) {
    fmt::print(
        "{:>5} {:>13} {}\n", i + 1, dropping_times[i], admissible[i].str());
  }
  return 0;
}

auto RulesCommand(const argparse::ArgumentParser& /*cmd*/) -> int {
  for (std::string_view name : rule::BuiltinRuleNames()) {
    auto rule = rule::MakeRule(name, {.seed = 0});
    if (!rule) {
      PrintDiagnostic(rule.error());
      return 1;
    }
    fmt::print(
        "{}{}\n", (*rule)->Describe(),
        rule::IsClassificationEligible(name) ? " [classified]" : "");
  }
  return 0;
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  bool force = cmd.get<bool>("--force");
  fs::path config_path = fs::current_path() / config::kConfigFileName;

  if (fs::exists(config_path) && !force) {
    PrintError(
        fmt::format(
            "{} already exists (use --force to overwrite)",
            config::kConfigFileName));
    return 1;
  }

  std::ofstream out(config_path);
  if (!out) {
    PrintError(fmt::format("cannot write '{}'", config_path.string()));
    return 1;
  }
  out << config::StarterConfig();
  fmt::print("Created {}\n", config::kConfigFileName);
  return 0;
}

}  // namespace hailstone::driver
