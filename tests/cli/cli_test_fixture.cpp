#include "tests/cli/cli_test_fixture.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <utility>

#ifndef ENUMKIT_DEFAULT_BIN
#define ENUMKIT_DEFAULT_BIN "enumkit"
#endif

namespace enumkit::test {
namespace {

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// Execute command and capture combined stdout/stderr
auto ExecuteCommand(const std::string& cmd) -> std::pair<int, std::string> {
  std::string output;
  std::array<char, 4096> buffer{};

  FILE* pipe = popen(cmd.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, "Failed to execute command"};
  }

  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    output += buffer.data();
  }

  int status = pclose(pipe);
  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  return {exit_code, output};
}

}  // namespace

void CliTestFixture::SetUp() {
  auto tmp = std::filesystem::temp_directory_path();
  test_dir_ = tmp / ("enumkit_cli_test_" + GenerateRandomSuffix());
  std::filesystem::create_directories(test_dir_);

  const char* bin = std::getenv("ENUMKIT_BIN");
  enumkit_bin_ = bin != nullptr ? bin : ENUMKIT_DEFAULT_BIN;
}

void CliTestFixture::TearDown() {
  if (!test_dir_.empty() && std::filesystem::exists(test_dir_)) {
    std::filesystem::remove_all(test_dir_);
  }
}

auto CliTestFixture::Run(std::initializer_list<std::string> args)
    -> CliResult {
  return RunIn(".", args);
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& relative_dir,
    std::initializer_list<std::string> args) -> CliResult {
  auto working_dir = test_dir_ / relative_dir;
  std::ostringstream cmd;
  cmd << "cd '" << working_dir.string() << "' && '" << enumkit_bin_.string()
      << "'";
  for (const auto& arg : args) {
    cmd << " '" << arg << "'";
  }
  cmd << " 2>&1";

  auto [exit_code, output] = ExecuteCommand(cmd.str());
  return CliResult{.exit_code = exit_code, .output = output};
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  if (!out) {
    throw std::runtime_error("Failed to create file: " + full_path.string());
  }
  out << content;
}

void CliTestFixture::WriteSampleConfig() {
  WriteFile(
      "enumkit.toml",
      R"([registry]
log_level = "warn"

[[enum]]
name = "Permissions"
width = 4
flags = true
values = [1, 2, 4, 8]
names = ["Read", "Write", "Execute", "Delete"]

[[enum]]
name = "Offset"
width = 4
signed = true
values = [10, -5, 0]
names = ["Forward", "Back", "None"]
)");
}

}  // namespace enumkit::test
