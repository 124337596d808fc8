#pragma once
#include "exceptions.hpp"
#include <array>
#include <cctype>
#include <concepts>
#include <cstddef>
#include <fmt/format.h>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace msx::core {

// One accepted spelling of an enum member. Aliases are extra entries that
// share the value of a canonical entry; the canonical entry comes first.
template <typename E>
struct EnumEntry {
  std::string_view name;
  E value;
};

// Specialize for each enum resolved from text:
//   static constexpr std::string_view type_name;
//   static constexpr std::string_view prefix;   // stripped after normalization
//   static constexpr bool abbrev;               // retry with the first character only
//   static constexpr std::array<EnumEntry<E>, N> entries;
template <typename E>
struct EnumTraits;

template <typename E>
concept ResolvableEnum = std::is_enum_v<E> && requires {
  EnumTraits<E>::type_name;
  EnumTraits<E>::prefix;
  EnumTraits<E>::abbrev;
  EnumTraits<E>::entries;
};

// Upper-case, trim, turn '-' and ' ' into '_', then drop a leading prefix.
[[nodiscard]] auto normalize_enum_name(std::string_view raw, std::string_view prefix = {}) -> std::string;

// Looks `raw` up in `entries` following the lenient text rules. Throws
// InvalidValueError when nothing matches.
template <typename E>
[[nodiscard]] auto resolve_enum(std::span<const EnumEntry<E>> entries, std::string_view raw, std::string_view prefix,
                                bool abbrev, std::string_view type_name = "enum") -> E {
  const std::string name = normalize_enum_name(raw, prefix);

  auto find = [&](std::string_view key) -> std::optional<E> {
    for (const auto& entry : entries) {
      if (entry.name == key) {
        return entry.value;
      }
    }
    return std::nullopt;
  };

  if (auto found = find(name)) {
    return *found;
  }
  if (abbrev && !name.empty()) {
    if (auto found = find(std::string_view(name).substr(0, 1))) {
      return *found;
    }
  }
  throw InvalidValueError(fmt::format("'{}' is not a valid {}", raw, type_name));
}

// Integer lookup by underlying value
template <typename E>
[[nodiscard]] auto resolve_enum(std::span<const EnumEntry<E>> entries, long long raw,
                                std::string_view type_name = "enum") -> E {
  for (const auto& entry : entries) {
    if (static_cast<long long>(entry.value) == raw) {
      return entry.value;
    }
  }
  throw InvalidValueError(fmt::format("{} is not a valid {}", raw, type_name));
}

template <ResolvableEnum E>
[[nodiscard]] auto get_enum(E value) -> E {
  return value;
}

template <ResolvableEnum E, std::integral I>
[[nodiscard]] auto get_enum(I value) -> E {
  using Traits = EnumTraits<E>;
  return resolve_enum<E>(std::span<const EnumEntry<E>>(Traits::entries), static_cast<long long>(value),
                         Traits::type_name);
}

template <ResolvableEnum E>
[[nodiscard]] auto get_enum(std::string_view value) -> E {
  using Traits = EnumTraits<E>;
  return resolve_enum<E>(std::span<const EnumEntry<E>>(Traits::entries), value, Traits::prefix, Traits::abbrev,
                         Traits::type_name);
}

template <ResolvableEnum E>
[[nodiscard]] auto get_enum(const char* value) -> E {
  return get_enum<E>(std::string_view(value));
}

template <ResolvableEnum E>
[[nodiscard]] auto get_enum(const std::string& value) -> E {
  return get_enum<E>(std::string_view(value));
}

// Canonical (first listed) spelling of a member
template <ResolvableEnum E>
[[nodiscard]] auto enum_name(E value) -> std::string_view {
  for (const auto& entry : EnumTraits<E>::entries) {
    if (entry.value == value) {
      return entry.name;
    }
  }
  return {};
}

// Lower-case canonical spelling, as written to model files
template <ResolvableEnum E>
[[nodiscard]] auto enum_key(E value) -> std::string {
  std::string key(enum_name(value));
  for (auto& c : key) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return key;
}

} // namespace msx::core
