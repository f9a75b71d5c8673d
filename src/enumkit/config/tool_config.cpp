#include "enumkit/config/tool_config.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace enumkit::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

auto ParseRegistrySection(
    const toml::table& tbl, std::string_view source, ToolConfig& config)
    -> std::expected<void, std::string> {
  auto section = tbl["registry"];
  if (!section) {
    return {};
  }

  if (auto segment_node = section["segment_records"]) {
    auto records = segment_node.value<int64_t>();
    if (!records || *records < 1 || *records > UINT32_MAX) {
      return std::unexpected(
          fmt::format(
              "{}: 'registry.segment_records' must be an integer in [1, {}]",
              source, UINT32_MAX));
    }
    config.registry.segment_records = static_cast<uint32_t>(*records);
  }

  if (auto level_node = section["log_level"]) {
    auto level = level_node.value<std::string>();
    if (!level || !IsKnownLogLevel(*level)) {
      return std::unexpected(
          fmt::format(
              "{}: 'registry.log_level' must be one of trace, debug, info, "
              "warn, error, critical, off",
              source));
    }
    config.log_level = *level;
  }
  return {};
}

auto ParseEnumEntry(
    const toml::table& entry, size_t position, std::string_view source)
    -> std::expected<registry::TypeDescriptor, std::string> {
  auto fail = [&](std::string_view what) {
    return std::unexpected(
        fmt::format("{}: [[enum]] #{}: {}", source, position + 1, what));
  };

  registry::TypeDescriptor desc;

  auto name = entry["name"].value<std::string>();
  if (!name || name->empty()) {
    return fail("missing required field 'name'");
  }
  desc.name = *name;

  auto width = entry["width"].value<int64_t>();
  if (!width || *width <= 0 || *width > UINT32_MAX) {
    return fail("missing or invalid field 'width'");
  }
  desc.size = static_cast<uint32_t>(*width);
  desc.is_signed = entry["signed"].value_or(false);
  desc.is_flags = entry["flags"].value_or(false);

  const toml::array* values = entry["values"].as_array();
  if (values == nullptr) {
    return fail("missing required array 'values'");
  }
  for (const toml::node& node : *values) {
    if (node.is_integer()) {
      desc.raw_values.push_back(
          static_cast<uint64_t>(node.as_integer()->get()));
      continue;
    }
    if (node.is_string()) {
      const std::string& text = node.as_string()->get();
      auto raw = ParseRawValue(text);
      if (!raw) {
        return fail(fmt::format("cannot parse value '{}'", text));
      }
      desc.raw_values.push_back(*raw);
      continue;
    }
    return fail("'values' must hold integers or integer strings");
  }

  if (const toml::array* names = entry["names"].as_array()) {
    for (const toml::node& node : *names) {
      auto value_name = node.value<std::string>();
      if (!value_name) {
        return fail("'names' must hold strings");
      }
      desc.value_names.push_back(*value_name);
    }
  }
  return desc;
}

auto ParseTable(const toml::table& tbl, std::string_view source)
    -> std::expected<ToolConfig, std::string> {
  ToolConfig config;

  if (auto result = ParseRegistrySection(tbl, source, config); !result) {
    return std::unexpected(result.error());
  }

  auto enums_node = tbl["enum"];
  if (!enums_node) {
    return config;
  }
  const toml::array* enums = enums_node.as_array();
  if (enums == nullptr) {
    return std::unexpected(
        fmt::format("{}: 'enum' must be an array of tables", source));
  }

  for (size_t i = 0; i < enums->size(); ++i) {
    const toml::table* entry = enums->get(i)->as_table();
    if (entry == nullptr) {
      return std::unexpected(
          fmt::format("{}: [[enum]] #{} is not a table", source, i + 1));
    }
    auto desc = ParseEnumEntry(*entry, i, source);
    if (!desc) {
      return std::unexpected(desc.error());
    }
    config.enums.push_back(std::move(*desc));
  }
  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path)
    -> std::expected<ToolConfig, std::string> {
  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        fmt::format(
            "failed to parse {}: {}", config_path.string(), e.description()));
  }

  auto config = ParseTable(tbl, config_path.string());
  if (config) {
    config->root_dir = config_path.parent_path();
  }
  return config;
}

auto ParseConfig(std::string_view text, std::string_view source)
    -> std::expected<ToolConfig, std::string> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        fmt::format("failed to parse {}: {}", source, e.description()));
  }
  return ParseTable(tbl, source);
}

auto ParseRawValue(std::string_view text) -> std::optional<uint64_t> {
  bool negative = false;
  if (text.starts_with('-')) {
    negative = true;
    text.remove_prefix(1);
  }
  int base = 10;
  if (text.starts_with("0x") || text.starts_with("0X")) {
    base = 16;
    text.remove_prefix(2);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  uint64_t magnitude = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, magnitude, base);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  if (negative) {
    if (magnitude > (1ULL << 63)) {
      return std::nullopt;
    }
    return ~magnitude + 1;
  }
  return magnitude;
}

auto IsKnownLogLevel(std::string_view level) -> bool {
  for (std::string_view known : kLogLevels) {
    if (known == level) {
      return true;
    }
  }
  return false;
}

}  // namespace enumkit::config
