#pragma once

#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace hailstone::test {

// Exit status and interleaved stdout/stderr of one hailstone invocation
struct CliResult {
  int exit_code;
  std::string output;

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(const std::string& text) const -> bool {
    return output.find(text) != std::string::npos;
  }
};

// Runs the built hailstone binary inside a scratch directory that is
// created per test and removed afterwards. Config lookup walks up from the
// working directory, so tests that need hailstone.toml write it here.
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;
  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // hailstone.toml with only a [batch] section
  void WriteBatchToml(const std::string& rule, uint64_t total);

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;
  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path hailstone_bin_;
};

}  // namespace hailstone::test
