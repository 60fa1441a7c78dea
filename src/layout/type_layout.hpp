#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "layout/vesper.hpp"
#include "typesys/builder.hpp"
#include "typesys/error.hpp"
#include "typesys/type_system.hpp"

namespace st::layout {

/// Preorder flattening of one type's composition with explicit depths.
class TypeLayout {
 public:
  TypeLayout() = default;

  static auto from_items(std::vector<LayoutEntry> items) -> TypeLayout;

  auto push(LayoutItem item, std::size_t depth) -> void;

  auto items() const -> const std::vector<LayoutEntry>& { return items_; }
  auto size() const -> std::size_t { return items_.size(); }
  auto empty() const -> bool { return items_.empty(); }

  /// Rebuild the tree. A node at depth d becomes a child of the most recent
  /// node at depth d - 1; depths may never grow by more than one level.
  auto to_vesper() const -> typesys::Expected<Vesper>;

  /// Rendered tree, or the reconstruction error.
  auto to_string() const -> std::string;

  auto operator==(const TypeLayout&) const -> bool = default;

 private:
  std::vector<LayoutEntry> items_;
};

/// Layout of `root` and everything it is composed of. Recursive references
/// are leaves. Throws std::out_of_range when `root` is not a member.
auto flatten(const typesys::TypeSystem& system, const typesys::SemId& root) -> TypeLayout;

/// Same with declared type names; an unknown `root` is a layout error.
auto flatten(const typesys::SymbolicSys& system, const typesys::TypeFqn& root)
    -> typesys::Expected<TypeLayout>;

}  // namespace st::layout
