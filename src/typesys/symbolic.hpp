#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "typesys/error.hpp"
#include "typesys/ident.hpp"
#include "typesys/ty.hpp"
#include "typesys/type_lib.hpp"

namespace st::typesys {

/// Reference to a nested type in a symbolic declaration: either a named type
/// (unqualified names refer to the declaring library) or an anonymous type
/// written inline.
class SymRef {
 public:
  struct Named {
    std::optional<LibName> lib;
    TypeName name;

    auto operator==(const Named&) const -> bool = default;
  };

  static auto named(TypeName name) -> SymRef { return SymRef(Named{std::nullopt, std::move(name)}); }
  static auto named(TypeFqn fqn) -> SymRef {
    return SymRef(Named{std::move(fqn.lib), std::move(fqn.name)});
  }
  static auto inline_ty(Ty<SymRef> ty) -> SymRef;

  auto as_named() const -> const Named* { return std::get_if<Named>(&ref_); }
  auto as_inline() const -> const Ty<SymRef>*;

  auto to_string() const -> std::string;

  auto operator==(const SymRef& other) const -> bool;

 private:
  using Inline = std::shared_ptr<const Ty<SymRef>>;

  explicit SymRef(Named named) : ref_(std::move(named)) {}
  explicit SymRef(Inline ty) : ref_(std::move(ty)) {}

  std::variant<Named, Inline> ref_;
};

inline auto SymRef::inline_ty(Ty<SymRef> ty) -> SymRef {
  return SymRef(std::make_shared<const Ty<SymRef>>(std::move(ty)));
}

inline auto SymRef::as_inline() const -> const Ty<SymRef>* {
  const auto* ty = std::get_if<Inline>(&ref_);
  return ty ? ty->get() : nullptr;
}

inline auto SymRef::to_string() const -> std::string {
  if (const auto* named = as_named()) {
    return named->lib ? named->lib->str() + "." + named->name.str() : named->name.str();
  }
  return as_inline()->to_string([](const SymRef& ref) { return ref.to_string(); });
}

inline auto SymRef::operator==(const SymRef& other) const -> bool {
  if (ref_.index() != other.ref_.index()) {
    return false;
  }
  if (const auto* named = as_named()) {
    return *named == *other.as_named();
  }
  return *as_inline() == *other.as_inline();
}

/// Shorthands for writing symbolic declarations. Names passed here are
/// literals and throw std::invalid_argument when malformed.
namespace decl {

/// `Name` or `Lib.Name`.
inline auto named(std::string_view name) -> SymRef {
  auto dot = name.find('.');
  if (dot == std::string_view::npos) {
    return SymRef::named(TypeName::from(name));
  }
  return SymRef::named(TypeFqn{LibName::from(name.substr(0, dot)), TypeName::from(name.substr(dot + 1))});
}

inline auto ref(Ty<SymRef> ty) -> SymRef { return SymRef::inline_ty(std::move(ty)); }
inline auto prim(Primitive prim) -> SymRef { return ref(Ty<SymRef>::primitive(prim)); }
inline auto unit() -> SymRef { return prim(prim::kUnit); }
inline auto u8() -> SymRef { return prim(prim::kU8); }
inline auto u16() -> SymRef { return prim(prim::kU16); }
inline auto u32() -> SymRef { return prim(prim::kU32); }
inline auto u64() -> SymRef { return prim(prim::kU64); }
inline auto byte() -> SymRef { return prim(prim::kByte); }
inline auto unicode() -> SymRef { return ref(Ty<SymRef>::unicode()); }

inline auto array(SymRef ty, std::uint16_t len) -> SymRef {
  return ref(Ty<SymRef>::array(std::move(ty), len));
}
inline auto bytes32() -> SymRef { return array(byte(), 32); }
inline auto list(SymRef ty, Sizing sizing = Sizing::u16()) -> SymRef {
  return ref(Ty<SymRef>::list(std::move(ty), sizing));
}
inline auto set(SymRef ty, Sizing sizing = Sizing::u16()) -> SymRef {
  return ref(Ty<SymRef>::set(std::move(ty), sizing));
}
inline auto map(SymRef key, SymRef value, Sizing sizing = Sizing::u16()) -> SymRef {
  return ref(Ty<SymRef>::map(std::move(key), std::move(value), sizing));
}
inline auto option(SymRef ty) -> SymRef { return ref(Ty<SymRef>::option(std::move(ty))); }
inline auto tuple(std::vector<SymRef> fields) -> SymRef {
  return ref(Ty<SymRef>::tuple(std::move(fields)));
}

/// Indirect reference to a type of the declaring library; the only way to
/// close a cycle.
inline auto recursive(std::string_view name) -> SymRef {
  return ref(Ty<SymRef>(RecursiveNode<SymRef>{named(name)}));
}

inline auto field(std::string_view name, SymRef ty) -> Field<SymRef> {
  return Field<SymRef>{FieldName::from(name), std::move(ty)};
}
inline auto variant(std::string_view name, std::uint8_t tag, SymRef ty) -> Variant<SymRef> {
  return Variant<SymRef>{FieldName::from(name), tag, std::move(ty)};
}
inline auto enum_variant(std::string_view name, std::uint8_t tag) -> EnumVariant {
  return EnumVariant{FieldName::from(name), tag};
}

}  // namespace decl

/// Library after the symbolic stage: every named reference is fully
/// qualified and points into this library or into a declared dependency.
class SymbolicLib {
 public:
  SymbolicLib(LibName name, std::map<LibName, Dependency> dependencies,
              std::map<TypeName, Ty<SymRef>> types)
      : name_(std::move(name)), dependencies_(std::move(dependencies)), types_(std::move(types)) {}

  auto name() const -> const LibName& { return name_; }
  auto dependencies() const -> const std::map<LibName, Dependency>& { return dependencies_; }
  auto types() const -> const std::map<TypeName, Ty<SymRef>>& { return types_; }

  /// Resolve names to semantic ids, producing the compiled library. Every
  /// independent problem is reported.
  auto compile() const -> ExpectedAll<TypeLib>;

  /// `typelib <name>`, `import` lines and `data <Name> :: <expr>` per type.
  auto to_string() const -> std::string;

 private:
  LibName name_;
  std::map<LibName, Dependency> dependencies_;
  std::map<TypeName, Ty<SymRef>> types_;
};

/// Collects symbolic declarations of one library.
class LibBuilder {
 public:
  LibBuilder(LibName name, std::vector<Dependency> dependencies = {});

  /// Record a declaration. Problems are reported by `compile_symbols()`.
  auto transpile(TypeName name, Ty<SymRef> ty) -> LibBuilder&;
  auto transpile(std::string_view name, Ty<SymRef> ty) -> LibBuilder&;

  auto compile_symbols() const -> ExpectedAll<SymbolicLib>;

  /// Both stages.
  auto compile() const -> ExpectedAll<TypeLib>;

 private:
  LibName name_;
  std::vector<Dependency> dependencies_;
  std::vector<std::pair<TypeName, Ty<SymRef>>> declarations_;
  ErrorList pending_;
};

}  // namespace st::typesys
