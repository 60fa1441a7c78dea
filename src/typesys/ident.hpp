#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "typesys/error.hpp"

namespace st::typesys {

/// ASCII identifier: 1..=32 chars, alphabetic first char, then alphanumerics
/// or `_`.
class Ident {
 public:
  static constexpr std::size_t kMaxLen = 32;

  /// Validate an identifier.
  static auto parse(std::string_view value) -> Expected<Ident>;

  /// Identifier from a literal known to be valid; throws std::invalid_argument
  /// otherwise.
  static auto from(std::string_view value) -> Ident;

  auto str() const -> const std::string& { return value_; }

  auto operator<=>(const Ident&) const = default;

 private:
  explicit Ident(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

using LibName = Ident;
using TypeName = Ident;
using FieldName = Ident;

/// Fully qualified type name `lib.name`. Only used in the symbolic stage and
/// for provenance; never part of a compiled identity.
struct TypeFqn {
  LibName lib;
  TypeName name;

  /// Parse `Lib.Name`.
  static auto parse(std::string_view value) -> Expected<TypeFqn>;

  auto to_string() const -> std::string { return lib.str() + "." + name.str(); }

  auto operator<=>(const TypeFqn&) const = default;
};

/// Length bounds of a list, set or map.
struct Sizing {
  std::uint16_t min = 0;
  std::uint16_t max = 0xFFFF;

  static constexpr auto u8() -> Sizing { return Sizing{0, 0xFF}; }
  static constexpr auto u16() -> Sizing { return Sizing{0, 0xFFFF}; }
  static constexpr auto u8_nonempty() -> Sizing { return Sizing{1, 0xFF}; }
  static constexpr auto fixed(std::uint16_t len) -> Sizing { return Sizing{len, len}; }

  auto is_valid() const -> bool { return min <= max; }

  /// Empty for the default bound, ` ^ min..` or ` ^ min..0xMAX` otherwise.
  auto to_string() const -> std::string;

  auto operator<=>(const Sizing&) const = default;
};

}  // namespace st::typesys

template <>
struct fmt::formatter<st::typesys::Ident> : fmt::formatter<std::string_view> {
  auto format(const st::typesys::Ident& ident, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(ident.str(), ctx);
  }
};

template <>
struct fmt::formatter<st::typesys::TypeFqn> : fmt::formatter<std::string_view> {
  auto format(const st::typesys::TypeFqn& fqn, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(fqn.to_string(), ctx);
  }
};
