#include "typesys/symbolic.hpp"

#include <set>

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace st::typesys {
namespace {

// Qualifies every named reference of one declaration and collects the
// problems of its shape.
class Qualifier {
 public:
  Qualifier(const LibName& lib, const std::map<LibName, Dependency>& dependencies,
            const std::set<TypeName>& declared, ErrorList& errors)
      : lib_(lib), dependencies_(dependencies), declared_(declared), errors_(errors) {}

  auto qualify(const Ty<SymRef>& ty, const TypeFqn& context) -> Ty<SymRef> {
    for (auto& problem : check_ty(ty)) {
      fail(fmt::format("type '{}': {}", context, problem));
    }
    return map_refs<SymRef>(
        ty, [&](const SymRef& ref) { return qualify_ref(ref, context); },
        [&](const RecursiveNode<SymRef>& node) { return qualify_recursive(node, context); });
  }

 private:
  auto qualify_ref(const SymRef& ref, const TypeFqn& context) -> SymRef {
    if (const auto* inline_ty = ref.as_inline()) {
      return SymRef::inline_ty(qualify(*inline_ty, context));
    }
    const auto& named = *ref.as_named();
    if (!named.lib || *named.lib == lib_) {
      if (!declared_.contains(named.name)) {
        fail(fmt::format("type '{}' references unknown type '{}'", context, named.name));
      }
      return SymRef::named(TypeFqn{lib_, named.name});
    }
    auto dep = dependencies_.find(*named.lib);
    if (dep == dependencies_.end()) {
      fail(fmt::format("type '{}' references '{}.{}' from undeclared dependency '{}'", context,
                       *named.lib, named.name, *named.lib));
    } else if (!dep->second.exports.contains(named.name)) {
      fail(fmt::format("library '{}' does not export type '{}' referenced from '{}'", *named.lib,
                       named.name, context));
    }
    return SymRef::named(TypeFqn{*named.lib, named.name});
  }

  auto qualify_recursive(const RecursiveNode<SymRef>& node, const TypeFqn& context)
      -> RecursiveNode<SymRef> {
    const auto* named = node.target.as_named();
    if (named == nullptr) {
      fail(fmt::format("recursive reference in '{}' must name a type", context));
      return node;
    }
    if (named->lib && *named->lib != lib_) {
      fail(fmt::format("recursive reference in '{}' to '{}.{}' must target a type of library '{}'",
                       context, *named->lib, named->name, lib_));
      return node;
    }
    if (!declared_.contains(named->name)) {
      fail(fmt::format("type '{}' references unknown type '{}'", context, named->name));
    }
    return RecursiveNode<SymRef>{SymRef::named(TypeFqn{lib_, named->name})};
  }

  auto fail(std::string message) -> void {
    errors_.push_back(make_error(ErrorKind::Transpile, std::move(message)));
  }

  const LibName& lib_;
  const std::map<LibName, Dependency>& dependencies_;
  const std::set<TypeName>& declared_;
  ErrorList& errors_;
};

}  // namespace

LibBuilder::LibBuilder(LibName name, std::vector<Dependency> dependencies)
    : name_(std::move(name)), dependencies_(std::move(dependencies)) {}

auto LibBuilder::transpile(TypeName name, Ty<SymRef> ty) -> LibBuilder& {
  declarations_.emplace_back(std::move(name), std::move(ty));
  return *this;
}

auto LibBuilder::transpile(std::string_view name, Ty<SymRef> ty) -> LibBuilder& {
  auto type_name = TypeName::parse(name);
  if (!type_name) {
    pending_.push_back(make_error(
        ErrorKind::Transpile,
        fmt::format("invalid type name in library '{}': {}", name_, type_name.error().message)));
    return *this;
  }
  return transpile(std::move(*type_name), std::move(ty));
}

auto LibBuilder::compile_symbols() const -> ExpectedAll<SymbolicLib> {
  ErrorList errors = pending_;

  std::map<LibName, Dependency> dependencies;
  for (const auto& dep : dependencies_) {
    if (dep.name == name_) {
      errors.push_back(make_error(ErrorKind::Transpile,
                                  fmt::format("library '{}' cannot depend on itself", name_)));
    } else if (!dependencies.emplace(dep.name, dep).second) {
      errors.push_back(make_error(
          ErrorKind::Transpile,
          fmt::format("library '{}' declares dependency '{}' twice", name_, dep.name)));
    }
  }

  std::set<TypeName> declared;
  for (const auto& [name, ty] : declarations_) {
    declared.insert(name);
  }

  Qualifier qualifier(name_, dependencies, declared, errors);
  std::map<TypeName, Ty<SymRef>> types;
  for (const auto& [name, ty] : declarations_) {
    TypeFqn fqn{name_, name};
    if (types.contains(name)) {
      errors.push_back(
          make_error(ErrorKind::Transpile, fmt::format("type '{}' is declared twice", fqn)));
      continue;
    }
    types.emplace(name, qualifier.qualify(ty, fqn));
  }

  if (!errors.empty()) {
    log::warn("library '{}' has {} transpile error(s)", name_, errors.size());
    return tl::unexpected(std::move(errors));
  }
  log::debug("transpiled library '{}': {} type(s), {} dependenc(ies)", name_, types.size(),
             dependencies.size());
  return SymbolicLib(name_, std::move(dependencies), std::move(types));
}

auto LibBuilder::compile() const -> ExpectedAll<TypeLib> {
  return compile_symbols().and_then([](const SymbolicLib& lib) { return lib.compile(); });
}

auto SymbolicLib::to_string() const -> std::string {
  std::string out = fmt::format("typelib {}\n", name_);
  for (const auto& [dep_name, dep] : dependencies_) {
    out += fmt::format("import {} -- {}\n", dep_name, dep.id);
  }
  out += '\n';
  auto render = [&](const SymRef& ref) -> std::string {
    if (const auto* named = ref.as_named(); named && named->lib && *named->lib == name_) {
      return named->name.str();
    }
    return ref.to_string();
  };
  for (const auto& [name, ty] : types_) {
    out += fmt::format("data {} :: {}\n", name, ty.to_string(render));
  }
  return out;
}

}  // namespace st::typesys
