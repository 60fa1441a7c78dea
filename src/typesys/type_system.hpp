#pragma once

#include <cstddef>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "typesys/confined.hpp"
#include "typesys/error.hpp"
#include "typesys/id.hpp"
#include "typesys/ty.hpp"

namespace st::typesys {

class SystemBuilder;

/// Complete, bounded set of compiled types keyed by semantic id.
///
/// Instances come only from `SystemBuilder::finalize()` and `decode()`, both
/// of which verify completeness: every id referenced by a member is itself a
/// member.
class TypeSystem {
 public:
  /// Member count stays below 2^24.
  static constexpr std::size_t kMaxTypes = kU24Max;
  /// Canonical serialized size stays below 2^24 bytes.
  static constexpr std::size_t kMaxSerializedSize = kU24Max;
  static constexpr std::size_t kMaxLibs = 0xFFFF;

  using Types = ConfinedMap<SemId, Ty<SemId>, kMaxTypes>;
  using const_iterator = Types::const_iterator;

  TypeSystem() = default;

  auto get(const SemId& id) const -> const Ty<SemId>* { return types_.find(id); }

  /// Member lookup where absence is an internal fault; throws
  /// std::out_of_range.
  auto at(const SemId& id) const -> const Ty<SemId>&;

  auto contains(const SemId& id) const -> bool { return types_.contains(id); }
  auto count_types() const -> std::size_t { return types_.size(); }
  auto count_libs() const -> std::size_t { return libs_.size(); }
  auto lib_ids() const -> const std::set<TypeLibId>& { return libs_; }
  auto sem_ids() const -> std::vector<SemId>;

  auto begin() const -> const_iterator { return types_.begin(); }
  auto end() const -> const_iterator { return types_.end(); }

  /// Recomputed from the current content on every call.
  auto id() const -> TypeSysId;

  /// One completeness error per dangling reference.
  auto check_completeness() const -> ErrorList;

  auto encode() const -> Expected<Bytes>;
  static auto decode(std::span<const std::uint8_t> bytes) -> Expected<TypeSystem>;

  /// `typesys -- <id>`, a blank line and `data <semid> :: <expr>` per member.
  auto to_string() const -> std::string;

  auto to_armored() const -> Expected<std::string>;
  static auto from_armored(std::string_view text) -> Expected<TypeSystem>;

  auto operator==(const TypeSystem&) const -> bool = default;

 private:
  friend class SystemBuilder;

  auto insert_unchecked(const SemId& id, Ty<SemId> ty) -> Expected<bool> {
    return types_.insert(id, std::move(ty));
  }
  auto insert_lib(const TypeLibId& id) -> Expected<void>;

  Types types_;
  std::set<TypeLibId> libs_;
};

/// Id over the library ids and member ids, both in ascending order.
auto compute_sys_id(const TypeSystem& system) -> TypeSysId;

}  // namespace st::typesys
