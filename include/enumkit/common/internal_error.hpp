#pragma once

#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace enumkit::common {

// Exception type for broken enumkit invariants (library bugs, not misuse
// that the query path already degrades to "not found").
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format("Internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace enumkit::common
