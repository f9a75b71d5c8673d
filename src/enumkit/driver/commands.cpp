#include "commands.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "enumkit/config/tool_config.hpp"
#include "enumkit/flags/flag_iterator.hpp"
#include "enumkit/query/query.hpp"
#include "enumkit/registry/type_descriptor.hpp"
#include "enumkit/registry/type_record.hpp"
#include "enumkit/registry/type_registry.hpp"
#include "print.hpp"

namespace enumkit::driver {

namespace {

namespace fs = std::filesystem;

// Resolve and load the config, then apply its log level. --verbose wins over
// the configured level.
auto LoadToolConfig(const argparse::ArgumentParser& cmd)
    -> std::optional<config::ToolConfig> {
  std::optional<fs::path> path;
  if (auto explicit_path = cmd.present<std::string>("--config")) {
    path = fs::path(*explicit_path);
  } else {
    path = config::FindConfig();
  }
  if (!path) {
    PrintError(
        fmt::format(
            "no {} found in this directory or any parent (use --config)",
            config::kConfigFileName));
    return std::nullopt;
  }

  auto loaded = config::LoadConfig(*path);
  if (!loaded) {
    PrintError(loaded.error());
    return std::nullopt;
  }

  spdlog::set_level(spdlog::level::from_str(loaded->log_level));
  if (cmd.get<bool>("--verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }
  spdlog::debug("loaded {} ({} enums)", path->string(), loaded->enums.size());
  return loaded;
}

// Register every configured enum. Returns the number of failures; each one is
// reported. A repeated name keeps the first definition and warns.
auto RegisterAll(
    const config::ToolConfig& config, registry::TypeRegistry& registry)
    -> int {
  int failures = 0;
  for (const registry::TypeDescriptor& desc : config.enums) {
    if (registry.LookupIndex(desc.ResolvedIdentity()).IsValid()) {
      PrintWarning(
          fmt::format(
              "enum '{}' is defined more than once, keeping the first "
              "definition",
              desc.name));
      continue;
    }
    auto index = registry.GetOrCreateRecord(desc);
    if (!index) {
      PrintError(index.error().detail);
      ++failures;
    }
  }
  return failures;
}

auto FormatValue(const registry::TypeRecord& record, int64_t value)
    -> std::string {
  std::string text = record.IsFlag()
                         ? fmt::format("{:#x}", static_cast<uint64_t>(value))
                         : fmt::format("{}", value);
  auto name = query::NameOf(
      record, query::MakeValue(record, static_cast<uint64_t>(value)));
  if (!name.empty()) {
    text += fmt::format(" {}", name);
  }
  return text;
}

}  // namespace

void AddCommonFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--config").help(
      "Path to enumkit.toml (searched upward from CWD if omitted)");
  cmd.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");
}

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadToolConfig(cmd);
  if (!config) {
    return 1;
  }

  registry::TypeRegistry registry(config->registry);
  int failures = RegisterAll(*config, registry);

  registry.ForEachRecord([](const registry::TypeRecord& record) {
    fmt::print("{}", FormatRecord(record));
  });
  return failures == 0 ? 0 : 1;
}

auto QueryCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadToolConfig(cmd);
  if (!config) {
    return 1;
  }

  registry::TypeRegistry registry(config->registry);
  if (RegisterAll(*config, registry) != 0) {
    return 1;
  }

  auto type_name = cmd.get<std::string>("type");
  auto op = cmd.get<std::string>("op");

  registry::TypeIndex index =
      registry.LookupIndex(registry::HashTypeName(type_name));
  const registry::TypeRecord& record = registry.GetRecord(index);
  if (record.IsSentinel()) {
    PrintError(fmt::format("unknown enum '{}'", type_name));
    return 1;
  }

  auto operand_text = cmd.present<std::string>("value");
  if (!operand_text) {
    PrintError(fmt::format("operation '{}' needs a value", op));
    return 1;
  }
  auto operand = config::ParseRawValue(*operand_text);
  if (!operand) {
    PrintError(fmt::format("cannot parse value '{}'", *operand_text));
    return 1;
  }

  if (op == "at") {
    auto position = static_cast<int32_t>(
        std::clamp<int64_t>(
            static_cast<int64_t>(*operand), INT32_MIN, INT32_MAX));
    fmt::print("{}\n", FormatValue(record, query::ValueAt(record, position)));
    return 0;
  }

  query::EnumValue value = query::MakeValue(record, *operand);
  if (op == "valid") {
    fmt::print("{}\n", query::IsValid(record, value));
    return 0;
  }
  if (op == "index") {
    fmt::print("{}\n", query::IndexOf(record, value));
    return 0;
  }
  if (op == "next") {
    fmt::print("{}\n", FormatValue(record, query::Next(record, value)));
    return 0;
  }
  if (op == "last") {
    fmt::print("{}\n", FormatValue(record, query::Last(record, value)));
    return 0;
  }
  if (op == "bits") {
    flags::FlagIterator bits(value.mask);
    while (auto bit = bits.TryTakeNext()) {
      fmt::print(
          "{}\n", FormatValue(record, static_cast<int64_t>(*bit)));
    }
    return 0;
  }

  PrintError(
      fmt::format(
          "unknown operation '{}', use valid, index, at, next, last or bits",
          op));
  return 1;
}

}  // namespace enumkit::driver
