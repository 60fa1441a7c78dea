#include "typesys/ident.hpp"

#include <utility>
#include <stdexcept>

namespace st::typesys {
namespace {

auto is_ascii_alpha(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto is_ascii_alnum(char c) -> bool {
  return is_ascii_alpha(c) || (c >= '0' && c <= '9');
}

}  // namespace

auto Ident::parse(std::string_view value) -> Expected<Ident> {
  if (value.empty() || value.size() > kMaxLen) {
    return tl::unexpected(make_error(
        ErrorKind::Transpile,
        fmt::format("identifier '{}' has invalid length {} (expected 1..={})", value, value.size(),
                    kMaxLen)));
  }
  for (char c : value) {
    if (static_cast<unsigned char>(c) > 0x7F) {
      return tl::unexpected(make_error(
          ErrorKind::Transpile, fmt::format("identifier '{}' contains non-ASCII characters", value)));
    }
  }
  if (!is_ascii_alpha(value.front())) {
    return tl::unexpected(make_error(
        ErrorKind::Transpile,
        fmt::format("identifier '{}' must start with alphabetic character and not '{}'", value,
                    value.front())));
  }
  for (char c : value) {
    if (!is_ascii_alnum(c) && c != '_') {
      return tl::unexpected(make_error(
          ErrorKind::Transpile,
          fmt::format("identifier '{}' contains invalid character '{}'", value, c)));
    }
  }
  return Ident(std::string(value));
}

auto Ident::from(std::string_view value) -> Ident {
  auto ident = parse(value);
  if (!ident) {
    throw std::invalid_argument(ident.error().message);
  }
  return std::move(*ident);
}

auto TypeFqn::parse(std::string_view value) -> Expected<TypeFqn> {
  auto dot = value.find('.');
  if (dot == std::string_view::npos) {
    return tl::unexpected(make_error(
        ErrorKind::Transpile, fmt::format("invalid fully qualified type name '{}'", value)));
  }
  auto lib = Ident::parse(value.substr(0, dot));
  if (!lib) {
    return tl::unexpected(lib.error());
  }
  auto name = Ident::parse(value.substr(dot + 1));
  if (!name) {
    return tl::unexpected(name.error());
  }
  return TypeFqn{std::move(*lib), std::move(*name)};
}

auto Sizing::to_string() const -> std::string {
  if (min == 0 && max == 0xFFFF) {
    return {};
  }
  if (max == 0xFFFF) {
    return fmt::format(" ^ {}..", min);
  }
  return fmt::format(" ^ {}..{:#04x}", min, max);
}

}  // namespace st::typesys
