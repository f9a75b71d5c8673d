#pragma once

#include <exception>
#include <string>

namespace enumkit::registry {

enum class RegistryErrorKind {
  kInvalidTypeDescriptor,  // Type cannot be represented as a record
};

// Registration failure. Nothing is published when one is returned.
struct RegistryError {
  RegistryErrorKind kind;
  std::string detail;
};

// Exception wrapper for RegistryError, thrown by the lazily registering typed
// entry points.
class RegistryException final : public std::exception {
 public:
  explicit RegistryException(RegistryError error);

  [[nodiscard]] auto GetError() const -> const RegistryError& {
    return error_;
  }

  [[nodiscard]] auto what() const noexcept -> const char* override {
    return message_.c_str();
  }

 private:
  RegistryError error_;
  std::string message_;
};

auto ToString(RegistryErrorKind kind) -> const char*;

}  // namespace enumkit::registry
