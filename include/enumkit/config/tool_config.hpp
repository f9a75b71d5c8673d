#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "enumkit/registry/type_descriptor.hpp"
#include "enumkit/registry/type_registry.hpp"

namespace enumkit::config {

inline constexpr std::string_view kConfigFileName = "enumkit.toml";

struct ToolConfig {
  registry::RegistryOptions registry;
  std::string log_level = "warn";
  std::vector<registry::TypeDescriptor> enums;

  // Directory where enumkit.toml was found
  std::filesystem::path root_dir;
};

// Search for enumkit.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse an enumkit.toml file.
// Returns an error message on parse errors, unknown log levels, or malformed
// [[enum]] entries. Descriptor contents (widths, fit of values) are left to
// the registry to validate.
auto LoadConfig(const std::filesystem::path& config_path)
    -> std::expected<ToolConfig, std::string>;

// Same as LoadConfig for in-memory text; source names the text in messages.
auto ParseConfig(std::string_view text, std::string_view source)
    -> std::expected<ToolConfig, std::string>;

// Decimal (optionally negative) or 0x-prefixed hexadecimal integer as a raw
// 64-bit pattern. Negative numbers are two's complement.
auto ParseRawValue(std::string_view text) -> std::optional<uint64_t>;

auto IsKnownLogLevel(std::string_view level) -> bool;

}  // namespace enumkit::config
