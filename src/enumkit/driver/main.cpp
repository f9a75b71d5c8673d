#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>
#include <string>

#include "commands.hpp"
#include "print.hpp"

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("enumkit", "0.1.0");
  program.add_description("Inspect enumerations described in enumkit.toml");

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Register every configured enum and print it");
  enumkit::driver::AddCommonFlags(dump_cmd);

  // Subcommand: query
  argparse::ArgumentParser query_cmd("query");
  query_cmd.add_description("Answer one question about a configured enum");
  enumkit::driver::AddCommonFlags(query_cmd);
  query_cmd.add_argument("type").help("Enum name");
  query_cmd.add_argument("op").help(
      "Operation: valid, index, at, next, last or bits");
  query_cmd.add_argument("value").help(
      "Value (decimal or 0x hex); an index for 'at'");

  program.add_subparser(dump_cmd);
  program.add_subparser(query_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& e) {
    enumkit::driver::PrintError(e.what());
    std::cerr << program;
    return 1;
  }

  try {
    if (program.is_subcommand_used("dump")) {
      return enumkit::driver::DumpCommand(dump_cmd);
    }
    if (program.is_subcommand_used("query")) {
      return enumkit::driver::QueryCommand(query_cmd);
    }
  } catch (const std::exception& e) {
    enumkit::driver::PrintError(e.what());
    return 1;
  }

  std::cerr << program;
  return 1;
}
