#include "typesys/builder.hpp"

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace st::typesys {
namespace {

auto join_names(const std::set<TypeFqn>& names) -> std::string {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) out += ", ";
    out += name.to_string();
  }
  return out.empty() ? "anonymous" : out;
}

}  // namespace

auto SymbolicSys::resolve(const TypeFqn& name) const -> const SemId* {
  auto it = symbols_.find(name);
  return it == symbols_.end() ? nullptr : &it->second;
}

auto SymbolicSys::resolve(std::string_view name) const -> const SemId* {
  auto fqn = TypeFqn::parse(name);
  return fqn ? resolve(*fqn) : nullptr;
}

auto SymbolicSys::names_of(const SemId& id) const -> std::set<TypeFqn> {
  std::set<TypeFqn> names;
  for (const auto& [name, member] : symbols_) {
    if (member == id) {
      names.insert(name);
    }
  }
  return names;
}

auto SymbolicSys::lookup(const TypeFqn& name) const -> const Ty<SemId>* {
  const auto* id = resolve(name);
  return id ? system_.get(*id) : nullptr;
}

auto SymbolicSys::to_string() const -> std::string {
  std::map<SemId, std::string> display;
  for (const auto& [name, id] : symbols_) {
    display.emplace(id, name.to_string());
  }
  auto render = [&](const SemId& id) -> std::string {
    auto it = display.find(id);
    return it == display.end() ? id.to_string() : it->second;
  };

  std::string out = fmt::format("typesys -- {}\n\n", system_.id());
  for (const auto& [id, ty] : system_) {
    out += fmt::format("data {} :: {}\n", render(id), ty.to_string(render));
  }
  return out;
}

auto SystemBuilder::import(const TypeLib& lib) -> Expected<void> {
  const auto lib_id = lib.id();
  for (const auto& [id, sym] : lib.types()) {
    auto existing = types_.find(id);
    if (existing != types_.end() && existing->second.ty != sym.ty) {
      log::warn("import of library '{}' rejected: conflicting type {}", lib.name(), id);
      return tl::unexpected(make_error(
          ErrorKind::Collision,
          fmt::format("type {} ({}) of library '{}' differs from the imported type with the same "
                      "id ({})",
                      id, join_names(sym.names), lib.name(), join_names(existing->second.names))));
    }
  }

  for (const auto& [id, sym] : lib.types()) {
    auto [it, inserted] = types_.emplace(id, sym);
    if (!inserted) {
      it->second.names.insert(sym.names.begin(), sym.names.end());
    }
  }
  libs_.insert_or_assign(lib_id, ImportedLib{lib.name(), lib.dependencies()});
  log::debug("imported library '{}' ({}): {} type(s), {} in total", lib.name(), lib_id,
             lib.count_types(), types_.size());
  return {};
}

auto SystemBuilder::finalize() const -> ExpectedAll<TypeSystem> {
  ErrorList errors;
  TypeSystem system;

  for (const auto& [id, sym] : types_) {
    if (auto inserted = system.insert_unchecked(id, sym.ty); !inserted) {
      errors.push_back(inserted.error());
      break;
    }
  }
  for (const auto& [lib_id, lib] : libs_) {
    if (auto inserted = system.insert_lib(lib_id); !inserted) {
      errors.push_back(inserted.error());
      break;
    }
  }

  auto dangling = system.check_completeness();
  errors.insert(errors.end(), dangling.begin(), dangling.end());

  if (config_.require_dependencies) {
    for (const auto& [lib_id, lib] : libs_) {
      for (const auto& [dep_name, dep_id] : lib.dependencies) {
        if (!libs_.contains(dep_id)) {
          errors.push_back(make_error(
              ErrorKind::Completeness,
              fmt::format("library '{}' ({}) required by '{}' was not imported", dep_name, dep_id,
                          lib.name)));
        }
      }
    }
  }

  if (errors.empty()) {
    if (auto bytes = system.encode(); !bytes) {
      errors.push_back(bytes.error());
    }
  }

  if (!errors.empty()) {
    log::warn("type system finalization failed with {} error(s)", errors.size());
    return tl::unexpected(std::move(errors));
  }
  log::debug("finalized type system {}: {} type(s) from {} librar(ies)", system.id(),
             system.count_types(), system.count_libs());
  return system;
}

auto SystemBuilder::finalize_symbolic() const -> ExpectedAll<SymbolicSys> {
  auto system = finalize();
  if (!system) {
    return tl::unexpected(std::move(system.error()));
  }

  ErrorList errors;
  std::map<TypeFqn, SemId> symbols;
  for (const auto& [id, sym] : types_) {
    for (const auto& name : sym.names) {
      auto [it, inserted] = symbols.emplace(name, id);
      if (!inserted && it->second != id) {
        errors.push_back(make_error(
            ErrorKind::Collision,
            fmt::format("name '{}' is declared for both {} and {}", name, it->second, id)));
      }
    }
  }
  if (!errors.empty()) {
    return tl::unexpected(std::move(errors));
  }
  return SymbolicSys(std::move(*system), std::move(symbols));
}

}  // namespace st::typesys
