#include "print.hpp"

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>

#include "enumkit/registry/type_record.hpp"

namespace enumkit::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("enumkit", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("enumkit", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

auto FormatRecord(const registry::TypeRecord& record) -> std::string {
  fmt::memory_buffer out;
  fmt::format_to(
      std::back_inserter(out),
      "{} (identity {:#018x}, {} bytes, class {})\n", record.Name(),
      record.Identity(), record.Size(),
      registry::ToString(record.Classification()));
  fmt::format_to(
      std::back_inserter(out),
      "  length {}  min {}  max {}  default {}  all {:#x}\n", record.Length(),
      record.Min(), record.Max(), record.Default(), record.All());

  for (int32_t i = 0; i < record.Length(); ++i) {
    int64_t value = record.Values()[static_cast<size_t>(i)];
    std::string_view name = record.NameAt(i);
    if (record.IsFlag()) {
      fmt::format_to(
          std::back_inserter(out), "  [{}] {:#x}", i,
          static_cast<uint64_t>(value));
    } else {
      fmt::format_to(std::back_inserter(out), "  [{}] {}", i, value);
    }
    if (!name.empty()) {
      fmt::format_to(std::back_inserter(out), " {}", name);
    }
    out.push_back('\n');
  }
  return fmt::to_string(out);
}

}  // namespace enumkit::driver
