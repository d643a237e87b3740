#pragma once

#include "tuplekey/base/optional.hpp"

#include <optional>
#include <string_view>

namespace tuplekey {

/// Trait struct for enum types to provide string conversion. Each enum type
/// that needs a printable name specializes this struct, FromString is only
/// required for enums parsed from user input.
template <typename E>
struct EnumTraits {
  static std::string_view ToString(E) {
    static_assert(sizeof(E) == 0, "EnumTraits not specialized for this enum type");
    return {};
  }

  static Optional<E> FromString(std::string_view) {
    static_assert(sizeof(E) == 0, "EnumTraits not specialized for this enum type");
    return std::nullopt;
  }
};

} // namespace tuplekey
