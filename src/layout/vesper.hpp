#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "typesys/error.hpp"
#include "typesys/id.hpp"

namespace st::layout {

/// One line of a type layout: the name under which the node appears in its
/// parent (field name, `variant#tag`, tuple index, `key`, `value`), a
/// description of the node itself and, when known, its declared type name.
struct LayoutItem {
  std::string name;
  std::string descr;
  std::string type_name;
  typesys::SemId id;

  auto to_string() const -> std::string;

  auto operator==(const LayoutItem&) const -> bool = default;
};

struct LayoutEntry {
  LayoutItem item;
  std::size_t depth = 0;

  auto operator==(const LayoutEntry&) const -> bool = default;
};

/// Reconstructed layout tree.
class Vesper {
 public:
  static constexpr std::size_t kMaxChildren = 0xFF;

  explicit Vesper(LayoutItem item) : item_(std::move(item)) {}

  auto item() const -> const LayoutItem& { return item_; }
  auto children() const -> const std::vector<Vesper>& { return children_; }
  auto child(std::size_t index) -> Vesper& { return children_.at(index); }

  /// Append a child and return its index; fails once the node already has
  /// `kMaxChildren` children.
  auto add_child(Vesper child) -> typesys::Expected<std::size_t>;

  /// Indented rendering, two spaces per level.
  auto to_string() const -> std::string;

  /// Preorder `(item, depth)` sequence with this node at depth 0.
  auto flatten() const -> std::vector<LayoutEntry>;

  auto operator==(const Vesper&) const -> bool = default;

 private:
  auto render(std::string& out, std::size_t depth) const -> void;
  auto flatten_into(std::vector<LayoutEntry>& out, std::size_t depth) const -> void;

  LayoutItem item_;
  std::vector<Vesper> children_;
};

}  // namespace st::layout
