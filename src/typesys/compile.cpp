#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "common/logging/log.hpp"
#include "typesys/symbolic.hpp"

namespace st::typesys {
namespace {

// Passes over a symbolic library:
//  1. references are checked and cycles through named types are searched
//     following only non-recursive edges; such a cycle has no finite id;
//  2. semantic ids; a recursive node commits the shape of its target, the
//     target's whole reachable structure with every revisit of a type still
//     open on the walk written as a relative back-reference;
//  3. recursive targets are filled in with the now known ids.
class LibCompiler {
 public:
  explicit LibCompiler(const SymbolicLib& lib) : lib_(lib) {}

  auto run() -> ExpectedAll<TypeLib> {
    for (const auto& [name, ty] : lib_.types()) {
      check_named(name);
    }
    if (!errors_.empty()) {
      return tl::unexpected(std::move(errors_));
    }

    for (const auto& [name, ty] : lib_.types()) {
      named_sem_id(name);
    }
    if (!errors_.empty()) {
      return tl::unexpected(std::move(errors_));
    }

    for (auto& entry : entries_) {
      if (entry.recursive_target) {
        const auto* node = entry.ty.get<RecursiveNode<SemId>>();
        entry.ty = Ty<SemId>(RecursiveNode<SemId>{sem_ids_.at(*entry.recursive_target), node->shape});
      }
    }

    return assemble();
  }

 private:
  enum class Mark { Visiting, Done };

  // First byte of a back-reference commitment; type encodings start with a
  // kind byte below it.
  static constexpr std::uint8_t kBackReference = 0xFF;
  static constexpr std::size_t kClosed = std::numeric_limits<std::size_t>::max();

  struct Entry {
    SemId id;
    Ty<SemId> ty;
    std::optional<TypeFqn> name;
    std::optional<TypeName> recursive_target;
  };

  auto fqn(const TypeName& name) const -> TypeFqn { return TypeFqn{lib_.name(), name}; }

  auto is_local(const SymRef::Named& named) const -> bool {
    return !named.lib || *named.lib == lib_.name();
  }

  auto report(ErrorKind kind, std::string message) -> void {
    if (reported_.insert(message).second) {
      errors_.push_back(make_error(kind, std::move(message)));
    }
  }

  auto dependency_id(const SymRef::Named& named, const TypeFqn& context) -> std::optional<SemId> {
    auto dep = lib_.dependencies().find(*named.lib);
    if (dep == lib_.dependencies().end()) {
      report(ErrorKind::Compile, fmt::format("type '{}' references '{}.{}' from undeclared dependency",
                                             context, *named.lib, named.name));
      return std::nullopt;
    }
    auto exported = dep->second.exports.find(named.name);
    if (exported == dep->second.exports.end()) {
      report(ErrorKind::Compile, fmt::format("unresolved type '{}.{}' referenced from '{}'",
                                             *named.lib, named.name, context));
      return std::nullopt;
    }
    return exported->second;
  }

  auto check_named(const TypeName& name) -> void {
    if (auto mark = marks_.find(name); mark != marks_.end()) {
      if (mark->second == Mark::Done) {
        return;
      }
      std::string cycle;
      bool inside = false;
      for (const auto& step : path_) {
        inside = inside || step == name;
        if (inside) {
          cycle += fmt::format("{} -> ", fqn(step));
        }
      }
      report(ErrorKind::Compile,
             fmt::format("cycle through named types without a recursive reference: {}{}", cycle,
                         fqn(name)));
      return;
    }

    marks_[name] = Mark::Visiting;
    path_.push_back(name);
    check_ty_refs(lib_.types().at(name), fqn(name));
    path_.pop_back();
    marks_[name] = Mark::Done;
  }

  auto check_ty_refs(const Ty<SymRef>& ty, const TypeFqn& context) -> void {
    if (const auto* node = ty.get<RecursiveNode<SymRef>>()) {
      check_recursive(*node, context);
      return;
    }
    ty.for_each_child([&](const SymRef& ref) { check_ref(ref, context); });
  }

  auto check_ref(const SymRef& ref, const TypeFqn& context) -> void {
    if (const auto* inline_ty = ref.as_inline()) {
      check_ty_refs(*inline_ty, context);
      return;
    }
    const auto& named = *ref.as_named();
    if (!is_local(named)) {
      dependency_id(named, context);
    } else if (!lib_.types().contains(named.name)) {
      report(ErrorKind::Compile, fmt::format("unresolved type '{}' referenced from '{}'",
                                             fqn(named.name), context));
    } else {
      check_named(named.name);
    }
  }

  auto check_recursive(const RecursiveNode<SymRef>& node, const TypeFqn& context) -> void {
    const auto* named = node.target.as_named();
    if (named == nullptr || !is_local(*named)) {
      report(ErrorKind::Compile,
             fmt::format("recursive reference in '{}' must target a named type of library '{}'",
                         context, lib_.name()));
    } else if (!lib_.types().contains(named->name)) {
      report(ErrorKind::Compile, fmt::format("unresolved type '{}' referenced from '{}'",
                                             fqn(named->name), context));
    }
  }

  // Shape of a named type walked from itself.
  auto root_shape(const TypeName& name) -> ShapeId {
    stack_.clear();
    reach_ = kClosed;
    return named_shape(name);
  }

  auto named_shape(const TypeName& name) -> ShapeId {
    const auto depth = stack_.size();
    for (std::size_t i = 0; i < depth; ++i) {
      if (stack_[i] == name) {
        reach_ = std::min(reach_, i);
        return back_reference(depth - i);
      }
    }
    if (auto closed = closed_shapes_.find(name); closed != closed_shapes_.end()) {
      return closed->second;
    }

    // A walk that never refers back to the type itself or to a type above it
    // saw nothing of a cycle through the type, so its shape is the same from
    // every starting point and is kept.
    const auto outer_reach = reach_;
    reach_ = kClosed;
    stack_.push_back(name);
    auto shape = ty_shape(lib_.types().at(name), fqn(name));
    stack_.pop_back();
    if (reach_ > depth) {
      closed_shapes_.emplace(name, shape);
    }
    reach_ = std::min(outer_reach, reach_);
    return shape;
  }

  auto ref_shape(const SymRef& ref, const TypeFqn& context) -> ShapeId {
    if (const auto* inline_ty = ref.as_inline()) {
      return ty_shape(*inline_ty, context);
    }
    const auto& named = *ref.as_named();
    if (!is_local(named)) {
      // Foreign types are final already: their semantic id stands in for the shape.
      auto id = dependency_id(named, context);
      return id ? ShapeId(id->bytes()) : ShapeId{};
    }
    return named_shape(named.name);
  }

  auto ty_shape(const Ty<SymRef>& ty, const TypeFqn& context) -> ShapeId {
    auto shaped = map_refs<ShapeId>(
        ty, [&](const SymRef& ref) { return ref_shape(ref, context); },
        [&](const RecursiveNode<SymRef>& node) {
          return RecursiveNode<ShapeId>{ref_shape(node.target, context)};
        });
    return compute_shape_id(shaped);
  }

  static auto back_reference(std::size_t distance) -> ShapeId {
    const std::array<std::uint8_t, 3> bytes{kBackReference,
                                            static_cast<std::uint8_t>(distance & 0xFFu),
                                            static_cast<std::uint8_t>((distance >> 8) & 0xFFu)};
    return ShapeId::commit(bytes);
  }

  auto named_sem_id(const TypeName& name) -> SemId {
    if (auto done = sem_ids_.find(name); done != sem_ids_.end()) {
      return done->second;
    }
    auto id = compile_ty(lib_.types().at(name), fqn(name), fqn(name));
    sem_ids_.emplace(name, id);
    return id;
  }

  auto ref_sem_id(const SymRef& ref, const TypeFqn& context) -> SemId {
    if (const auto* inline_ty = ref.as_inline()) {
      return compile_ty(*inline_ty, context, std::nullopt);
    }
    const auto& named = *ref.as_named();
    if (!is_local(named)) {
      return dependency_id(named, context).value_or(SemId{});
    }
    return named_sem_id(named.name);
  }

  auto compile_ty(const Ty<SymRef>& ty, const TypeFqn& context, std::optional<TypeFqn> name)
      -> SemId {
    std::optional<TypeName> recursive_target;
    auto compiled = map_refs<SemId>(
        ty, [&](const SymRef& ref) { return ref_sem_id(ref, context); },
        [&](const RecursiveNode<SymRef>& node) {
          const auto& target = node.target.as_named()->name;
          recursive_target = target;
          return RecursiveNode<SemId>{SemId{}, root_shape(target)};
        });
    auto id = compute_sem_id(compiled);
    entries_.push_back(Entry{id, std::move(compiled), std::move(name), std::move(recursive_target)});
    return id;
  }

  auto assemble() -> ExpectedAll<TypeLib> {
    std::map<SemId, SymTy> staged;
    for (auto& entry : entries_) {
      auto it = staged.find(entry.id);
      if (it == staged.end()) {
        it = staged.emplace(entry.id, SymTy{entry.ty, {}}).first;
      } else if (it->second.ty != entry.ty) {
        report(ErrorKind::Collision,
               fmt::format("semantic id {} is produced by two different types in library '{}'",
                           entry.id, lib_.name()));
        continue;
      }
      if (entry.name) {
        it->second.names.insert(*entry.name);
      }
    }

    LibTypes types;
    for (auto& [id, sym] : staged) {
      auto inserted = types.insert(id, std::move(sym));
      if (!inserted) {
        report(ErrorKind::Compile, fmt::format("library '{}': {}", lib_.name(),
                                               inserted.error().message));
        break;
      }
    }
    if (!errors_.empty()) {
      return tl::unexpected(std::move(errors_));
    }

    std::map<LibName, TypeLibId> dependencies;
    for (const auto& [dep_name, dep] : lib_.dependencies()) {
      dependencies.emplace(dep_name, dep.id);
    }
    return TypeLib(lib_.name(), std::move(dependencies), std::move(types));
  }

  const SymbolicLib& lib_;
  ErrorList errors_;
  std::set<std::string> reported_;
  std::map<TypeName, Mark> marks_;
  std::vector<TypeName> path_;
  std::map<TypeName, ShapeId> closed_shapes_;
  std::vector<TypeName> stack_;
  std::size_t reach_ = kClosed;
  std::map<TypeName, SemId> sem_ids_;
  std::vector<Entry> entries_;
};

}  // namespace

auto SymbolicLib::compile() const -> ExpectedAll<TypeLib> {
  auto lib = LibCompiler(*this).run();
  if (!lib) {
    log::warn("library '{}' failed to compile with {} error(s)", name_, lib.error().size());
    for (const auto& error : lib.error()) {
      log::debug("  {}", error.to_string());
    }
    return lib;
  }
  log::debug("compiled library '{}' into {} type(s), id {}", name_, lib->count_types(), lib->id());
  return lib;
}

}  // namespace st::typesys
