#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <span>
#include <string>

#include "typesys/confined.hpp"
#include "typesys/error.hpp"
#include "typesys/id.hpp"
#include "typesys/ident.hpp"
#include "typesys/ty.hpp"

namespace st::typesys {

/// Compiled type together with the fully qualified names it was declared
/// under. Anonymous types have no names.
struct SymTy {
  Ty<SemId> ty;
  std::set<TypeFqn> names;

  auto operator==(const SymTy&) const -> bool = default;
};

/// Library another library compiles against: its name, id and the ids of the
/// types it exports.
struct Dependency {
  LibName name;
  TypeLibId id;
  std::map<TypeName, SemId> exports;

  auto operator==(const Dependency&) const -> bool = default;
};

/// Maximum number of members in one library (u16 length prefix).
inline constexpr std::size_t kMaxLibTypes = 0xFFFF;

using LibTypes = ConfinedMap<SemId, SymTy, kMaxLibTypes>;

/// Immutable compiled library. Members reference each other and their
/// dependencies' exports by `SemId` only.
class TypeLib {
 public:
  TypeLib(LibName name, std::map<LibName, TypeLibId> dependencies, LibTypes types);

  auto name() const -> const LibName& { return name_; }
  auto dependencies() const -> const std::map<LibName, TypeLibId>& { return dependencies_; }
  auto types() const -> const LibTypes& { return types_; }
  auto count_types() const -> std::size_t { return types_.size(); }

  /// Named members of this library.
  auto exports() const -> std::map<TypeName, SemId>;

  /// Id of the member declared as `name`, or null.
  auto lookup(const TypeName& name) const -> const SemId*;

  auto id() const -> TypeLibId;

  /// Dependency record for libraries compiled against this one.
  auto to_dependency() const -> Dependency;

  /// `typelib <name> -- <id>`, the `import` lines and one
  /// `data <name|semid> :: <type-expression>` line per member.
  auto to_string() const -> std::string;

  auto encode() const -> Expected<Bytes>;
  static auto decode(std::span<const std::uint8_t> bytes) -> Expected<TypeLib>;

  auto to_armored() const -> Expected<std::string>;
  static auto from_armored(std::string_view text) -> Expected<TypeLib>;

  auto operator==(const TypeLib&) const -> bool = default;

 private:
  LibName name_;
  std::map<LibName, TypeLibId> dependencies_;
  LibTypes types_;
};

}  // namespace st::typesys
