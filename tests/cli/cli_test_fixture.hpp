#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <string_view>

namespace enumkit::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(std::string_view text) const -> bool {
    return output.find(text) != std::string::npos;
  }
};

// Runs the enumkit binary inside a private temporary directory.
//
// The binary is taken from $ENUMKIT_BIN, falling back to the path the build
// configured.
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(std::initializer_list<std::string> args) -> CliResult;

  // Run enumkit from a directory below the test directory
  auto RunIn(
      const std::filesystem::path& relative_dir,
      std::initializer_list<std::string> args) -> CliResult;

  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // enumkit.toml with the two enums used throughout the CLI tests:
  // Permissions (flags 1, 2, 4, 8) and Offset (signed -5, 0, 10).
  void WriteSampleConfig();

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path enumkit_bin_;
};

}  // namespace enumkit::test
