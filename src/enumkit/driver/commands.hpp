#pragma once

#include <argparse/argparse.hpp>

namespace enumkit::driver {

// Flags shared by every subcommand (--config, --verbose).
void AddCommonFlags(argparse::ArgumentParser& cmd);

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int;
auto QueryCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace enumkit::driver
