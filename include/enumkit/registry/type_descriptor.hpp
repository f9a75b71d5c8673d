#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "enumkit/common/bit_utils.hpp"

namespace enumkit::registry {

// Registry key of an enumerated type. 0 belongs to the sentinel record.
using TypeIdentity = uint64_t;

inline constexpr TypeIdentity kSentinelIdentity = 0;

// 64-bit FNV-1a of the type name, remapped away from the sentinel identity.
constexpr auto HashTypeName(std::string_view name) -> TypeIdentity {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (char c : name) {
    hash ^= static_cast<uint8_t>(c);
    hash *= 0x100000001b3ULL;
  }
  return hash == kSentinelIdentity ? 1 : hash;
}

// Everything the registry needs to know about one enumerated type.
// raw_values are native bit patterns; for signed storage both the truncated
// and the sign-extended forms are accepted.
struct TypeDescriptor {
  std::string name;
  // Left at kSentinelIdentity to derive it from name.
  TypeIdentity identity = kSentinelIdentity;
  uint32_t size = 0;
  bool is_signed = false;
  bool is_flags = false;
  std::vector<uint64_t> raw_values;
  // Optional display names, parallel to raw_values.
  std::vector<std::string> value_names;

  [[nodiscard]] auto ResolvedIdentity() const -> TypeIdentity {
    return identity != kSentinelIdentity ? identity : HashTypeName(name);
  }
};

// Specialize for each enumeration to be queried through the typed API:
//
//   template <>
//   struct enumkit::registry::EnumTraits<Color> {
//     static constexpr std::array kValues = {Color::kRed, Color::kGreen};
//     static constexpr std::array<std::string_view, 2> kNames = {"Red",
//                                                                "Green"};
//     static constexpr bool kIsFlags = false;
//     static constexpr std::string_view kName = "Color";
//   };
//
// Only kValues is required.
template <typename E>
struct EnumTraits;

template <typename E>
concept RegisteredEnum =
    common::Enumeration<E> && requires { EnumTraits<E>::kValues; };

// Compiler-provided spelling of E, used when EnumTraits<E> has no kName.
template <common::Enumeration E>
constexpr auto TypeName() -> std::string_view {
#if defined(_MSC_VER) && !defined(__clang__)
  std::string_view name = __FUNCSIG__;
  auto start = name.find("TypeName<") + 9;
  auto end = name.rfind(">(void)");
#else
  std::string_view name = __PRETTY_FUNCTION__;
  auto start = name.find("E = ") + 4;
  auto end = name.find_first_of(";]", start);
#endif
  return name.substr(start, end - start);
}

template <RegisteredEnum E>
constexpr auto NameOf() -> std::string_view {
  if constexpr (requires { EnumTraits<E>::kName; }) {
    return EnumTraits<E>::kName;
  } else {
    return TypeName<E>();
  }
}

// The single capability query used to classify a type as flags.
template <RegisteredEnum E>
constexpr auto IsFlagsEnum() -> bool {
  if constexpr (requires { EnumTraits<E>::kIsFlags; }) {
    return EnumTraits<E>::kIsFlags;
  } else {
    return false;
  }
}

template <RegisteredEnum E>
constexpr auto IdentityOf() -> TypeIdentity {
  return HashTypeName(NameOf<E>());
}

template <RegisteredEnum E>
auto DescribeEnum() -> TypeDescriptor {
  using U = std::underlying_type_t<E>;
  using Unsigned = std::make_unsigned_t<U>;

  TypeDescriptor desc{
      .name = std::string(NameOf<E>()),
      .identity = IdentityOf<E>(),
      .size = static_cast<uint32_t>(sizeof(E)),
      .is_signed = std::is_signed_v<U>,
      .is_flags = IsFlagsEnum<E>(),
  };
  desc.raw_values.reserve(EnumTraits<E>::kValues.size());
  for (E value : EnumTraits<E>::kValues) {
    desc.raw_values.push_back(
        static_cast<uint64_t>(static_cast<Unsigned>(static_cast<U>(value))));
  }
  if constexpr (requires { EnumTraits<E>::kNames; }) {
    for (std::string_view value_name : EnumTraits<E>::kNames) {
      desc.value_names.emplace_back(value_name);
    }
  }
  return desc;
}

}  // namespace enumkit::registry
