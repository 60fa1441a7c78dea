#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>

#include "typesys/error.hpp"
#include "typesys/id.hpp"
#include "typesys/ident.hpp"
#include "typesys/type_lib.hpp"
#include "typesys/type_system.hpp"

namespace st::typesys {

/// Compiled type system together with the names its members were declared
/// under.
class SymbolicSys {
 public:
  SymbolicSys(TypeSystem system, std::map<TypeFqn, SemId> symbols)
      : system_(std::move(system)), symbols_(std::move(symbols)) {}

  auto system() const -> const TypeSystem& { return system_; }
  auto symbols() const -> const std::map<TypeFqn, SemId>& { return symbols_; }
  auto id() const -> TypeSysId { return system_.id(); }

  auto resolve(const TypeFqn& name) const -> const SemId*;
  /// Resolve `Lib.Name`.
  auto resolve(std::string_view name) const -> const SemId*;

  /// Every name a member was declared under.
  auto names_of(const SemId& id) const -> std::set<TypeFqn>;

  auto lookup(const TypeFqn& name) const -> const Ty<SemId>*;

  /// Like `TypeSystem::to_string()` with members and references shown by
  /// their first declared name where one exists.
  auto to_string() const -> std::string;

 private:
  TypeSystem system_;
  std::map<TypeFqn, SemId> symbols_;
};

struct SystemBuilderConfig {
  /// Fail `finalize()` when a library declares a dependency library that was
  /// never imported.
  bool require_dependencies = true;
};

/// Merges compiled libraries into one complete type system.
class SystemBuilder {
 public:
  explicit SystemBuilder(SystemBuilderConfig config = {}) : config_(config) {}

  /// Merge a library. Nothing is merged when one of its members conflicts
  /// with an already imported type of the same id.
  auto import(const TypeLib& lib) -> Expected<void>;

  auto count_types() const -> std::size_t { return types_.size(); }

  auto finalize() const -> ExpectedAll<TypeSystem>;
  auto finalize_symbolic() const -> ExpectedAll<SymbolicSys>;

 private:
  struct ImportedLib {
    LibName name;
    std::map<LibName, TypeLibId> dependencies;
  };

  SystemBuilderConfig config_;
  std::map<SemId, SymTy> types_;
  std::map<TypeLibId, ImportedLib> libs_;
};

}  // namespace st::typesys
