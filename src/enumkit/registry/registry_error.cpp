#include "enumkit/registry/registry_error.hpp"

#include <utility>

#include <fmt/format.h>

namespace enumkit::registry {

RegistryException::RegistryException(RegistryError error)
    : error_(std::move(error)),
      message_(fmt::format("{}: {}", ToString(error_.kind), error_.detail)) {
}

auto ToString(RegistryErrorKind kind) -> const char* {
  switch (kind) {
    case RegistryErrorKind::kInvalidTypeDescriptor:
      return "invalid type descriptor";
  }
  return "unknown registry error";
}

}  // namespace enumkit::registry
